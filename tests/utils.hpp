#pragma once

#include "apiguard/baseline_store.hpp"
#include "apiguard/canonical_json.hpp"
#include "apiguard/cli.hpp"
#include "apiguard/config.hpp"
#include "apiguard/diff.hpp"
#include "apiguard/engine.hpp"
#include "apiguard/error.hpp"
#include "apiguard/exporter.hpp"
#include "apiguard/format.hpp"
#include "apiguard/policy.hpp"
#include "apiguard/snapshot.hpp"
#include "apiguard/symbol_graph.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace apiguard::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            static int counter = 0;
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now << "_" << counter++;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    struct scoped_cwd {
        fs::path original{};

        explicit scoped_cwd(const fs::path& new_cwd) {
            original = fs::current_path();
            fs::current_path(new_cwd);
        }

        ~scoped_cwd() {
            std::error_code ec{};
            fs::current_path(original, ec);
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        if (auto parent = path.parent_path(); !parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out{path, std::ios::binary};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    // Runs fn and returns the guard_error kind it threw, if any.
    template <typename Fn>
    std::optional<error_kind> thrown_kind(Fn&& fn) {
        try {
            std::invoke(std::forward<Fn>(fn));
        } catch (const guard_error& e) {
            return e.kind();
        }
        return std::nullopt;
    }

    struct fake_symbol {
        std::string precise{};
        std::string title{};
        std::string kind{"swift.func"};
        std::optional<std::string> access{"public"};
        std::optional<std::vector<std::string>> spellings{};
    };

    // Symbol graph JSON in the shape the toolchain writes, with the extra keys real exports carry.
    inline std::string make_symbol_graph_json(const std::vector<fake_symbol>& symbols) {
        std::string json = R"({"metadata":{"formatVersion":{"major":0,"minor":6,"patch":0}},)"
                           R"("module":{"name":"Fake"},"symbols":[)";
        for (size_t i = 0U; i < symbols.size(); ++i) {
            const auto& s = symbols[i];
            if (i != 0U) {
                json += ',';
            }
            json += R"({"identifier":{"precise":)";
            canonical::encode_string(s.precise, json);
            json += R"(,"interfaceLanguage":"swift"},"names":{"title":)";
            canonical::encode_string(s.title, json);
            json += R"(},"kind":{"identifier":)";
            canonical::encode_string(s.kind, json);
            json += R"(,"displayName":"Function"})";
            if (s.access) {
                json += R"(,"accessLevel":)";
                canonical::encode_string(*s.access, json);
            }
            if (s.spellings) {
                json += R"(,"declarationFragments":[)";
                for (size_t j = 0U; j < s.spellings->size(); ++j) {
                    if (j != 0U) {
                        json += ',';
                    }
                    json += R"({"kind":"text","spelling":)";
                    canonical::encode_string((*s.spellings)[j], json);
                    json += '}';
                }
                json += ']';
            }
            json += R"(,"pathComponents":[])";
            json += '}';
        }
        json += R"(],"relationships":[]})";
        return json;
    }

    inline snapshot make_snapshot(std::string target, std::vector<std::pair<std::string, std::string>> entries) {
        snapshot snap{};
        snap.target = std::move(target);
        snap.created_at = "2026-01-01T00:00:00Z";
        for (auto& [id, signature] : entries) {
            snap.symbols.insert_or_assign(std::move(id), std::move(signature));
        }
        return snap;
    }

    inline std::string shell_quote(std::string_view value) {
        std::string quoted{"'"};
        for (auto c : value) {
            if (c == '\'') {
                quoted += "'\\''";
            }
            else {
                quoted.push_back(c);
            }
        }
        quoted.push_back('\'');
        return quoted;
    }

    inline std::vector<std::string> shell_command(std::string script) {
        return {"/bin/sh", "-c", std::move(script)};
    }

}  // namespace apiguard::test::detail
