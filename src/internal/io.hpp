#pragma once

#include "apiguard/error.hpp"
#include "apiguard/format.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace apiguard::internal::io {

    namespace fs = std::filesystem;
    using namespace apiguard::literals;

    inline std::optional<std::string> try_read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            return std::nullopt;
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            return std::nullopt;
        }
        return ss.str();
    }

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw guard_error(error_kind::io_error, "failed to open file for write: {}"_format(path.string()));
        }
        out << text;
        out.flush();
        if (!out) {
            throw guard_error(error_kind::io_error, "failed to write file: {}"_format(path.string()));
        }
    }

    inline void ensure_dir(const fs::path& path) {
        std::error_code ec{};
        fs::create_directories(path, ec);
        if (ec) {
            throw guard_error(
                    error_kind::io_error, "failed to create directory: {}: {}"_format(path.string(), ec.message()));
        }
    }

}  // namespace apiguard::internal::io
