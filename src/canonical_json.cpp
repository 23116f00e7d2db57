#include "apiguard/canonical_json.hpp"

#include "apiguard/error.hpp"
#include "apiguard/format.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <string>
#include <string_view>
#include <vector>

using namespace apiguard::literals;

namespace apiguard::canonical {

    namespace detail {

        static constexpr auto hex_digits = std::string_view{"0123456789abcdef"};

        static void encode_integer(int64_t v, std::string& out) {
            std::array<char, 32> buf{};
            auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v);
            if (ec != std::errc{}) {
                throw guard_error(error_kind::serialization_error, "failed to format integer");
            }
            out.append(buf.data(), ptr);
        }

        static void encode_double(double v, std::string& out) {
            if (!std::isfinite(v)) {
                throw guard_error(error_kind::serialization_error, "unsupported JSON value: non-finite number");
            }
            std::array<char, 64> buf{};
            auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v);
            if (ec != std::errc{}) {
                throw guard_error(error_kind::serialization_error, "failed to format number");
            }
            out.append(buf.data(), ptr);
        }

        static void encode_value(const value& v, std::string& out);

        static void encode_object(const object& members, std::string& out) {
            std::vector<const member*> sorted{};
            sorted.reserve(members.size());
            for (const auto& m : members) {
                sorted.push_back(&m);
            }
            std::ranges::sort(sorted, [](const member* lhs, const member* rhs) { return lhs->first < rhs->first; });

            auto duplicate = std::ranges::adjacent_find(
                    sorted, [](const member* lhs, const member* rhs) { return lhs->first == rhs->first; });
            if (duplicate != sorted.end()) {
                throw guard_error(
                        error_kind::serialization_error,
                        "unsupported JSON value: duplicate object key \"{}\""_format((*duplicate)->first));
            }

            out.push_back('{');
            bool first = true;
            for (const auto* m : sorted) {
                if (!first) {
                    out.push_back(',');
                }
                first = false;
                encode_string(m->first, out);
                out.push_back(':');
                encode_value(m->second, out);
            }
            out.push_back('}');
        }

        static void encode_array(const array& items, std::string& out) {
            out.push_back('[');
            for (size_t i = 0U; i < items.size(); ++i) {
                if (i != 0U) {
                    out.push_back(',');
                }
                encode_value(items[i], out);
            }
            out.push_back(']');
        }

        static void encode_value(const value& v, std::string& out) {
            std::visit(
                    [&out](const auto& alt) {
                        using T = std::decay_t<decltype(alt)>;
                        if constexpr (std::is_same_v<T, std::nullptr_t>) {
                            out.append("null");
                        }
                        else if constexpr (std::is_same_v<T, bool>) {
                            out.append(alt ? "true" : "false");
                        }
                        else if constexpr (std::is_same_v<T, int64_t>) {
                            encode_integer(alt, out);
                        }
                        else if constexpr (std::is_same_v<T, double>) {
                            encode_double(alt, out);
                        }
                        else if constexpr (std::is_same_v<T, std::string>) {
                            encode_string(alt, out);
                        }
                        else if constexpr (std::is_same_v<T, array>) {
                            encode_array(alt, out);
                        }
                        else {
                            encode_object(alt, out);
                        }
                    },
                    v.data);
        }

    }  // namespace detail

    void encode_string(std::string_view s, std::string& out) {
        out.reserve(out.size() + s.size() + 2U);
        out.push_back('"');
        for (auto c : s) {
            switch (c) {
                case '"':
                    out.append("\\\"");
                    break;
                case '\\':
                    out.append("\\\\");
                    break;
                case '\n':
                    out.append("\\n");
                    break;
                case '\r':
                    out.append("\\r");
                    break;
                case '\t':
                    out.append("\\t");
                    break;
                case '\b':
                    out.append("\\b");
                    break;
                case '\f':
                    out.append("\\f");
                    break;
                default: {
                    auto byte = static_cast<unsigned char>(c);
                    if (byte < 0x20U) {
                        out.append("\\u00");
                        out.push_back(detail::hex_digits[byte >> 4U]);
                        out.push_back(detail::hex_digits[byte & 0x0FU]);
                    }
                    else {
                        out.push_back(c);
                    }
                    break;
                }
            }
        }
        out.push_back('"');
    }

    std::string encode(const value& v) {
        std::string out{};
        detail::encode_value(v, out);
        return out;
    }

}  // namespace apiguard::canonical
