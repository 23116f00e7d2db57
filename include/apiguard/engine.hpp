#pragma once

#include "config.hpp"
#include "error.hpp"
#include "policy.hpp"
#include "snapshot.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apiguard {

    using namespace std::string_view_literals;

    // Single-target pipeline. Each throws guard_error; nothing is retried or swallowed.
    snapshot produce_snapshot(const guard_config& cfg, std::string_view target);
    std::filesystem::path update_baseline(const guard_config& cfg, std::string_view target);
    decision check_target(const guard_config& cfg, std::string_view target);

    enum class run_kind : uint8_t { check, update };

    enum class target_status : uint8_t {
        passed,
        failed,
        updated,
        errored,
    };

    inline constexpr std::string_view to_string(target_status status) {
        switch (status) {
            case target_status::passed:
                return "passed"sv;
            case target_status::failed:
                return "failed"sv;
            case target_status::updated:
                return "updated"sv;
            case target_status::errored:
                return "errored"sv;
        }
        return "errored"sv;
    }

    struct target_result {
        std::string target{};
        target_status status{target_status::errored};
        std::optional<decision> verdict{};
        std::optional<std::filesystem::path> baseline_file{};
        std::optional<error_kind> error{};
        std::string error_message{};
    };

    struct run_result {
        run_kind kind{run_kind::check};
        std::vector<target_result> targets{};

        bool passed() const noexcept;
    };

    // Targets run sequentially and independently: one target's error is recorded and the rest still run.
    run_result run_check(const guard_config& cfg);
    run_result run_update(const guard_config& cfg);

    std::string render_text(const run_result& result);
    std::string render_json(const run_result& result);

}  // namespace apiguard
