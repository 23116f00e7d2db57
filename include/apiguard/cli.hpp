#pragma once

#include "config.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace apiguard::cli {

    struct cli_options {
        std::filesystem::path config_path{default_config_path};
        bool update{false};
        std::optional<guard_mode> mode{};
        bool fail_on_additions{false};
        std::vector<std::string> targets{};
        output_mode output{output_mode::table};
        bool print_config{false};
        bool verbose{false};
    };

    // Returns an exit code when the process should stop (help, version, invalid arguments).
    std::optional<int> parse_cli(int argc, char** argv, cli_options& opts);

    // Applies command-line overrides; throws guard_error{config_invalid} for an unknown --target.
    void apply_overrides(const cli_options& opts, guard_config& cfg);

    int run(const cli_options& opts, std::ostream& out, std::ostream& err);

}  // namespace apiguard::cli
