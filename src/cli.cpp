#include "apiguard/cli.hpp"

#include "apiguard/engine.hpp"
#include "apiguard/error.hpp"
#include "apiguard/format.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <iostream>
#include <string>
#include <string_view>

using namespace apiguard::literals;

namespace apiguard::cli {

    namespace detail {

        using namespace std::string_view_literals;

        static constexpr auto version = "1.1.0"sv;

        static constexpr auto footer = R"(
modes:
  semver  fail only on breaking changes (removals, signature changes)
  strict  fail on any API change (additions, removals, changes)

workflow:
  1. first run:     apiguard --update   (creates baselines)
  2. CI runs:       apiguard            (compares against baselines)
  3. on API change: apiguard --update && commit

exit codes:
  0  no breaking changes (or baselines updated)
  1  breaking changes detected or error occurred
  2  invalid command line)";

        static void print_config(const guard_config& cfg, std::ostream& os) {
            os << "targets=" << utils::join_with_separator(cfg.targets, ",") << '\n';
            os << "mode=" << to_string(cfg.mode) << '\n';
            os << "fail_on_additions=" << (cfg.fail_on_additions ? "true" : "false") << '\n';
            os << "baseline_dir=" << cfg.baseline_dir.string() << '\n';
            os << "output_dir=" << cfg.output_dir.string() << '\n';
            os << "export_command=" << utils::join_with_separator(cfg.export_command, " ") << '\n';
            os << "symbol_graph_dir=" << cfg.symbol_graph_dir.string() << '\n';
            os << "export_timeout_ms=" << cfg.export_timeout.count() << '\n';
            os << "output=" << to_string(cfg.output) << '\n';
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, cli_options& opts) {
        CLI::App app{"apiguard - block breaking API changes"};
        app.footer(detail::footer);

        bool show_version = false;
        std::string config_arg{opts.config_path.string()};
        std::string mode_arg{};
        std::string output_arg{std::string{to_string(opts.output)}};

        app.add_flag("-v,--version", show_version, "Print version and exit");
        app.add_option("--config", config_arg, "Path to config file (default: .apiguard.json)");
        app.add_flag("--update", opts.update, "Update baseline snapshots with the current API");
        app.add_option("--mode", mode_arg, "Override config mode: semver|strict");
        app.add_flag("--fail-on-additions", opts.fail_on_additions, "Fail on added symbols in semver mode");
        app.add_option("--target", opts.targets, "Restrict the run to these configured targets");
        app.add_option("--output", output_arg, "Report format: table|json");
        app.add_flag("--print-config", opts.print_config, "Print resolved config and exit");
        app.add_flag("--verbose", opts.verbose, "Progress output on stderr");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // --help exits 0; any other parse failure is an invalid command line
            auto code = app.exit(e);
            return std::optional<int>{code == 0 ? 0 : 2};
        }

        if (show_version) {
            std::cout << "apiguard " << detail::version << '\n';
            return std::optional<int>{0};
        }

        if (!mode_arg.empty()) {
            guard_mode mode{};
            if (!try_parse_guard_mode(mode_arg, mode)) {
                std::cerr << "invalid --mode value: " << mode_arg << " (expected semver|strict)\n";
                return std::optional<int>{2};
            }
            opts.mode = mode;
        }
        if (!try_parse_output_mode(output_arg, opts.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{2};
        }
        opts.config_path = config_arg;

        return std::nullopt;
    }

    void apply_overrides(const cli_options& opts, guard_config& cfg) {
        if (opts.mode) {
            cfg.mode = *opts.mode;
        }
        if (opts.fail_on_additions) {
            cfg.fail_on_additions = true;
        }
        if (!opts.targets.empty()) {
            for (const auto& target : opts.targets) {
                if (std::ranges::find(cfg.targets, target) == cfg.targets.end()) {
                    throw guard_error(error_kind::config_invalid, "target not in config: {}"_format(target));
                }
            }
            cfg.targets = opts.targets;
        }
        cfg.output = opts.output;
        cfg.verbose = opts.verbose;
    }

    int run(const cli_options& opts, std::ostream& out, std::ostream& err) {
        guard_config cfg{};
        try {
            cfg = load_config(opts.config_path);
            apply_overrides(opts, cfg);
        } catch (const guard_error& e) {
            err << e.what() << '\n';
            return 1;
        }

        if (opts.print_config) {
            detail::print_config(cfg, out);
            return 0;
        }

        auto result = opts.update ? run_update(cfg) : run_check(cfg);

        if (cfg.output == output_mode::json) {
            out << render_json(result) << '\n';
        }
        else if (result.passed()) {
            out << render_text(result);
        }
        else {
            // failures go to stderr so CI logs surface them
            err << render_text(result);
        }
        return result.passed() ? 0 : 1;
    }

}  // namespace apiguard::cli
