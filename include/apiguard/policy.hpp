#pragma once

#include "config.hpp"
#include "diff.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace apiguard {

    using namespace std::string_view_literals;

    enum class decision_outcome : uint8_t {
        pass,
        breaking_change,
        strict_violation,
    };

    inline constexpr std::string_view to_string(decision_outcome outcome) {
        switch (outcome) {
            case decision_outcome::pass:
                return "pass"sv;
            case decision_outcome::breaking_change:
                return "breaking_change"sv;
            case decision_outcome::strict_violation:
                return "strict_violation"sv;
        }
        return "breaking_change"sv;
    }

    struct decision {
        std::string target{};
        decision_outcome outcome{decision_outcome::pass};
        size_t added_count{};
        size_t removed_count{};
        size_t changed_count{};
        // Always populated, passing or not.
        std::string report{};

        bool passed() const noexcept { return outcome == decision_outcome::pass; }
    };

    /*
     * strict: any added, removed or changed symbol fails.
     * semver: removed or changed symbols fail; added symbols fail only with fail_on_additions.
     */
    decision evaluate(const api_diff& d, guard_mode mode, bool fail_on_additions);

}  // namespace apiguard
