#include "apiguard/engine.hpp"

#include "apiguard/baseline_store.hpp"
#include "apiguard/diff.hpp"
#include "apiguard/exporter.hpp"
#include "apiguard/format.hpp"
#include "apiguard/symbol_graph.hpp"

#include <glaze/glaze.hpp>

#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using namespace apiguard::literals;

namespace apiguard::detail {

    struct json_target_record {
        std::string target{};
        std::string status{};
        std::optional<std::string> outcome{};
        std::optional<size_t> added{};
        std::optional<size_t> removed{};
        std::optional<size_t> changed{};
        std::optional<std::string> baseline_file{};
        std::optional<std::string> error{};
        std::optional<std::string> message{};
        std::optional<std::string> report{};
    };

    struct json_run_record {
        int schema_version{1};
        std::string kind{};
        bool passed{false};
        std::vector<json_target_record> targets{};
    };

}  // namespace apiguard::detail

namespace glz {

    template <>
    struct meta<apiguard::detail::json_target_record> {
        using T = apiguard::detail::json_target_record;
        static constexpr auto value =
                object("target",
                       &T::target,
                       "status",
                       &T::status,
                       "outcome",
                       &T::outcome,
                       "added",
                       &T::added,
                       "removed",
                       &T::removed,
                       "changed",
                       &T::changed,
                       "baseline_file",
                       &T::baseline_file,
                       "error",
                       &T::error,
                       "message",
                       &T::message,
                       "report",
                       &T::report);
    };

    template <>
    struct meta<apiguard::detail::json_run_record> {
        using T = apiguard::detail::json_run_record;
        static constexpr auto value = object(
                "schema_version", &T::schema_version, "kind", &T::kind, "passed", &T::passed, "targets", &T::targets);
    };

}  // namespace glz

namespace apiguard {

    namespace detail {

        static export_request make_export_request(const guard_config& cfg, std::string_view target) {
            return export_request{
                    .target = std::string{target},
                    .command = cfg.export_command,
                    .symbol_graph_dir = cfg.symbol_graph_dir,
                    .output_dir = cfg.output_dir,
                    .timeout = cfg.export_timeout};
        }

        template <typename Step>
        static run_result run_each_target(const guard_config& cfg, run_kind kind, Step&& step) {
            run_result result{};
            result.kind = kind;
            result.targets.reserve(cfg.targets.size());

            for (const auto& target : cfg.targets) {
                target_result entry{};
                entry.target = target;
                try {
                    step(target, entry);
                } catch (const guard_error& e) {
                    entry.status = target_status::errored;
                    entry.error = e.kind();
                    entry.error_message = e.what();
                    if (cfg.verbose) {
                        std::cerr << "target " << target << " failed: " << to_string(e.kind()) << '\n';
                    }
                }
                result.targets.push_back(std::move(entry));
            }
            return result;
        }

    }  // namespace detail

    snapshot produce_snapshot(const guard_config& cfg, std::string_view target) {
        if (cfg.verbose) {
            std::cerr << "exporting " << target << '\n';
        }
        auto export_path = export_symbol_graph(detail::make_export_request(cfg, target));
        return build_snapshot(std::string{target}, export_path);
    }

    fs::path update_baseline(const guard_config& cfg, std::string_view target) {
        auto current = produce_snapshot(cfg, target);
        auto path = save_baseline(current, cfg.baseline_dir);
        if (cfg.verbose) {
            std::cerr << "wrote baseline " << path.string() << '\n';
        }
        return path;
    }

    decision check_target(const guard_config& cfg, std::string_view target) {
        // load before exporting: a missing baseline needs no toolchain run to be reported
        auto baseline = load_baseline(cfg.baseline_dir, target);
        if (cfg.verbose) {
            std::cerr << "loaded baseline " << baseline_path(cfg.baseline_dir, target).string() << '\n';
        }
        auto current = produce_snapshot(cfg, target);
        return evaluate(diff(baseline, current), cfg.mode, cfg.fail_on_additions);
    }

    bool run_result::passed() const noexcept {
        for (const auto& entry : targets) {
            if (entry.status == target_status::failed || entry.status == target_status::errored) {
                return false;
            }
        }
        return true;
    }

    run_result run_check(const guard_config& cfg) {
        return detail::run_each_target(cfg, run_kind::check, [&cfg](const std::string& target, target_result& entry) {
            auto verdict = check_target(cfg, target);
            entry.status = verdict.passed() ? target_status::passed : target_status::failed;
            entry.verdict = std::move(verdict);
        });
    }

    run_result run_update(const guard_config& cfg) {
        return detail::run_each_target(cfg, run_kind::update, [&cfg](const std::string& target, target_result& entry) {
            entry.baseline_file = update_baseline(cfg, target);
            entry.status = target_status::updated;
        });
    }

    std::string render_text(const run_result& result) {
        std::ostringstream os{};
        for (const auto& entry : result.targets) {
            switch (entry.status) {
                case target_status::updated:
                    os << "Updated baseline: " << entry.target << '\n';
                    break;
                case target_status::passed:
                case target_status::failed:
                    if (entry.verdict) {
                        os << entry.verdict->report;
                    }
                    break;
                case target_status::errored:
                    os << "Target: " << entry.target << '\n';
                    os << "  ERROR ({}): {}\n"_format(*entry.error, entry.error_message);
                    break;
            }
        }

        if (!result.passed()) {
            os << "APIGuard: FAIL\n";
        }
        else if (result.kind == run_kind::update) {
            os << "APIGuard: baseline updated.\n";
        }
        else {
            os << "APIGuard: OK\n";
        }
        return os.str();
    }

    std::string render_json(const run_result& result) {
        detail::json_run_record record{};
        record.kind = result.kind == run_kind::update ? "update" : "check";
        record.passed = result.passed();
        record.targets.reserve(result.targets.size());

        for (const auto& entry : result.targets) {
            detail::json_target_record target{};
            target.target = entry.target;
            target.status = std::string{to_string(entry.status)};
            if (entry.verdict) {
                target.outcome = std::string{to_string(entry.verdict->outcome)};
                target.added = entry.verdict->added_count;
                target.removed = entry.verdict->removed_count;
                target.changed = entry.verdict->changed_count;
                target.report = entry.verdict->report;
            }
            if (entry.baseline_file) {
                target.baseline_file = entry.baseline_file->string();
            }
            if (entry.error) {
                target.error = std::string{to_string(*entry.error)};
                target.message = entry.error_message;
            }
            record.targets.push_back(std::move(target));
        }

        std::string json{};
        auto ec = glz::write_json(record, json);
        if (ec) {
            throw guard_error(error_kind::serialization_error, "failed to serialize run report");
        }
        return json;
    }

}  // namespace apiguard
