#include "apiguard/config.hpp"

#include "apiguard/error.hpp"
#include "apiguard/format.hpp"

#include "internal/io.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

using namespace apiguard::literals;

namespace apiguard::detail {

    struct persisted_config {
        std::optional<std::vector<std::string>> targets{};
        std::optional<std::string> mode{};
        std::optional<std::string> baseline_dir{};
        std::optional<std::string> output_dir{};
        std::optional<bool> fail_on_additions{};
        std::optional<std::vector<std::string>> export_command{};
        std::optional<std::string> symbol_graph_dir{};
        std::optional<int64_t> export_timeout_ms{};
    };

}  // namespace apiguard::detail

namespace glz {

    template <>
    struct meta<apiguard::detail::persisted_config> {
        using T = apiguard::detail::persisted_config;
        static constexpr auto value =
                object("targets",
                       &T::targets,
                       "mode",
                       &T::mode,
                       "baselineDir",
                       &T::baseline_dir,
                       "outputDir",
                       &T::output_dir,
                       "failOnAdditions",
                       &T::fail_on_additions,
                       "exportCommand",
                       &T::export_command,
                       "symbolGraphDir",
                       &T::symbol_graph_dir,
                       "exportTimeoutMs",
                       &T::export_timeout_ms);
    };

}  // namespace glz

namespace apiguard {

    namespace detail {

        [[noreturn]] static void fail_invalid(std::string_view origin, std::string_view reason) {
            throw guard_error(error_kind::config_invalid, "config decode failed: {}: {}"_format(origin, reason));
        }

        // Target names become file and directory names under baselineDir and outputDir.
        static bool is_plain_target_name(std::string_view name) {
            if (name == "." || name == "..") {
                return false;
            }
            return name.find_first_of("/\\") == std::string_view::npos && !std::filesystem::path{name}.is_absolute();
        }

        static guard_config apply_persisted_config(const persisted_config& data, std::string_view origin) {
            guard_config cfg{};

            if (!data.targets) {
                fail_invalid(origin, "missing required key 'targets'");
            }
            if (data.targets->empty()) {
                fail_invalid(origin, "'targets' must name at least one target");
            }
            for (const auto& target : *data.targets) {
                if (utils::trim_ascii(target).empty()) {
                    fail_invalid(origin, "'targets' contains an empty name");
                }
                if (!is_plain_target_name(target)) {
                    fail_invalid(origin, "target name must be a single path component: {}"_format(target));
                }
            }
            cfg.targets = *data.targets;

            if (data.mode && !try_parse_guard_mode(*data.mode, cfg.mode)) {
                fail_invalid(origin, "invalid mode: {} (expected semver|strict)"_format(*data.mode));
            }
            if (data.baseline_dir) {
                cfg.baseline_dir = *data.baseline_dir;
            }
            if (data.output_dir) {
                cfg.output_dir = *data.output_dir;
            }
            if (data.fail_on_additions) {
                cfg.fail_on_additions = *data.fail_on_additions;
            }
            if (data.export_command) {
                if (data.export_command->empty()) {
                    fail_invalid(origin, "'exportCommand' must not be empty");
                }
                cfg.export_command = *data.export_command;
            }
            if (data.symbol_graph_dir) {
                cfg.symbol_graph_dir = *data.symbol_graph_dir;
            }
            if (data.export_timeout_ms) {
                if (*data.export_timeout_ms <= 0) {
                    fail_invalid(origin, "'exportTimeoutMs' must be positive");
                }
                cfg.export_timeout = std::chrono::milliseconds{*data.export_timeout_ms};
            }
            return cfg;
        }

    }  // namespace detail

    guard_config parse_config(std::string_view json_text, std::string_view origin) {
        detail::persisted_config data{};
        std::string buffer{json_text};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(data, buffer);
        if (ec) {
            detail::fail_invalid(origin, glz::format_error(ec, buffer));
        }
        return detail::apply_persisted_config(data, origin);
    }

    guard_config load_config(const std::filesystem::path& path) {
        std::error_code ec{};
        if (!std::filesystem::is_regular_file(path, ec)) {
            throw guard_error(error_kind::config_not_found, "config not found: {}"_format(path.string()));
        }
        auto text = internal::io::try_read_text_file(path);
        if (!text) {
            throw guard_error(error_kind::config_not_found, "failed to read config: {}"_format(path.string()));
        }
        debug_log("loaded config from ", path.string());
        return parse_config(*text, path.string());
    }

}  // namespace apiguard
