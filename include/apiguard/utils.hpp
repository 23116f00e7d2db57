#pragma once

#include <algorithm>
#include <iostream>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace apiguard {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr bool is_ascii_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        constexpr std::string_view trim_ascii(std::string_view value) noexcept {
            while (!value.empty() && is_ascii_space(value.front())) {
                value.remove_prefix(1U);
            }
            while (!value.empty() && is_ascii_space(value.back())) {
                value.remove_suffix(1U);
            }
            return value;
        }

        // Byte length of the whitespace code point at the start of value, or 0. Covers ASCII whitespace and
        // the UTF-8 encodings of NEL, NBSP, OGHAM SPACE MARK, U+2000..U+200A, LINE/PARAGRAPH SEPARATOR,
        // NNBSP, MMSP and IDEOGRAPHIC SPACE.
        constexpr size_t whitespace_width(std::string_view value) noexcept {
            if (value.empty()) {
                return 0U;
            }
            auto b = [&](size_t i) { return static_cast<unsigned char>(value[i]); };
            if (is_ascii_space(value[0])) {
                return 1U;
            }
            if (value.size() >= 2U && b(0) == 0xC2 && (b(1) == 0x85 || b(1) == 0xA0)) {
                return 2U;
            }
            if (value.size() < 3U) {
                return 0U;
            }
            if (b(0) == 0xE1 && b(1) == 0x9A && b(2) == 0x80) {
                return 3U;
            }
            if (b(0) == 0xE2 && b(1) == 0x80 &&
                ((b(2) >= 0x80 && b(2) <= 0x8A) || b(2) == 0xA8 || b(2) == 0xA9 || b(2) == 0xAF)) {
                return 3U;
            }
            if (b(0) == 0xE2 && b(1) == 0x81 && b(2) == 0x9F) {
                return 3U;
            }
            if (b(0) == 0xE3 && b(1) == 0x80 && b(2) == 0x80) {
                return 3U;
            }
            return 0U;
        }

        // Every run of whitespace becomes one space; leading and trailing runs are dropped.
        inline std::string collapse_whitespace(std::string_view value) {
            std::string out{};
            out.reserve(value.size());
            bool in_space = false;
            while (!value.empty()) {
                if (auto width = whitespace_width(value); width != 0U) {
                    in_space = true;
                    value.remove_prefix(width);
                    continue;
                }
                if (in_space && !out.empty()) {
                    out.push_back(' ');
                }
                in_space = false;
                out.push_back(value.front());
                value.remove_prefix(1U);
            }
            return out;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace apiguard
