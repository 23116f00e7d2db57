#pragma once

#include "utils.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace apiguard {

    using namespace std::string_view_literals;

    /*
     * APIGuard Config Options
     *
     * Loaded from a JSON file (default .apiguard.json), then overridden from the command line.
     *
     * Tracked surface
     * - targets: Names of the modules whose public API is tracked; one baseline file per target.
     * - mode: Decision policy, "semver" (removals and signature changes fail) or "strict" (any change fails).
     * - fail_on_additions: Under semver, also fail when symbols were added.
     *
     * Storage
     * - baseline_dir: Directory holding one <target>.json baseline per target.
     * - output_dir: Scratch directory; each run copies the raw export to <output_dir>/<target>/.
     *
     * Export collaborator
     * - export_command: argv of the toolchain command that writes the raw symbol exports.
     * - symbol_graph_dir: Directory the export command writes <target>*.symbols.json files into.
     * - export_timeout_ms: Wall-time budget for one export invocation; exceeding it is fatal.
     *
     * Run options (command line only)
     * - output: Report shape ("table" or "json").
     * - verbose: Progress lines on stderr.
     */

    enum class guard_mode { semver, strict };
    enum class output_mode { table, json };

    inline constexpr std::string_view to_string(guard_mode mode) {
        switch (mode) {
            case guard_mode::semver:
                return "semver"sv;
            case guard_mode::strict:
                return "strict"sv;
        }
        return "semver"sv;
    }

    inline constexpr bool try_parse_guard_mode(std::string_view text, guard_mode& out) {
        if (utils::str_case_eq(text, "semver"sv)) {
            out = guard_mode::semver;
            return true;
        }
        if (utils::str_case_eq(text, "strict"sv)) {
            out = guard_mode::strict;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr auto default_config_path = ".apiguard.json"sv;

    struct guard_config {
        std::vector<std::string> targets{};
        guard_mode mode{guard_mode::semver};
        std::filesystem::path baseline_dir{"api-baseline"};
        std::filesystem::path output_dir{".build/apiguard"};
        bool fail_on_additions{false};

        std::vector<std::string> export_command{"swift", "package", "dump-symbol-graph"};
        std::filesystem::path symbol_graph_dir{".build/symbol-graphs"};
        std::chrono::milliseconds export_timeout{600'000};

        output_mode output{output_mode::table};
        bool verbose{false};
    };

    // Throws guard_error (config_not_found, config_invalid).
    guard_config load_config(const std::filesystem::path& path);

    guard_config parse_config(std::string_view json_text, std::string_view origin = "<memory>"sv);

}  // namespace apiguard
