#include "apiguard/policy.hpp"

#include "apiguard/format.hpp"

#include <sstream>
#include <vector>

using namespace apiguard::literals;

namespace apiguard {

    namespace detail {

        static void write_ids(std::ostringstream& os, const std::vector<std::string>& ids, char marker) {
            for (const auto& id : ids) {
                os << "    " << marker << ' ' << id << '\n';
            }
        }

        static constexpr std::string_view result_line(decision_outcome outcome) {
            switch (outcome) {
                case decision_outcome::pass:
                    return "Result: OK"sv;
                case decision_outcome::breaking_change:
                    return "Result: FAIL (semver mode: breaking API change)"sv;
                case decision_outcome::strict_violation:
                    return "Result: FAIL (strict mode: any API change is disallowed)"sv;
            }
            return "Result: FAIL"sv;
        }

        static decision_outcome decide(const api_diff& d, guard_mode mode, bool fail_on_additions) {
            switch (mode) {
                case guard_mode::strict:
                    return d.empty() ? decision_outcome::pass : decision_outcome::strict_violation;
                case guard_mode::semver:
                    if (d.has_breaking() || (fail_on_additions && d.has_additions())) {
                        return decision_outcome::breaking_change;
                    }
                    return decision_outcome::pass;
            }
            return decision_outcome::breaking_change;
        }

    }  // namespace detail

    decision evaluate(const api_diff& d, guard_mode mode, bool fail_on_additions) {
        decision result{};
        result.target = d.target;
        result.outcome = detail::decide(d, mode, fail_on_additions);
        result.added_count = d.added.size();
        result.removed_count = d.removed.size();
        result.changed_count = d.changed.size();

        std::ostringstream os{};
        os << "Target: " << d.target << " ({} mode)\n"_format(mode);
        os << "  BREAKING removed: " << d.removed.size() << '\n';
        detail::write_ids(os, d.removed, '-');
        os << "  BREAKING changed: " << d.changed.size() << '\n';
        detail::write_ids(os, d.changed, '~');
        os << "  Added: " << d.added.size() << '\n';
        detail::write_ids(os, d.added, '+');
        os << "  " << detail::result_line(result.outcome) << '\n';
        result.report = os.str();

        return result;
    }

}  // namespace apiguard
