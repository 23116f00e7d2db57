#pragma once

#include "snapshot.hpp"

#include <string>
#include <vector>

namespace apiguard {

    struct api_diff {
        std::string target{};
        std::vector<std::string> added{};
        std::vector<std::string> removed{};
        std::vector<std::string> changed{};

        bool empty() const noexcept { return added.empty() && removed.empty() && changed.empty(); }
        bool has_breaking() const noexcept { return !removed.empty() || !changed.empty(); }
        bool has_additions() const noexcept { return !added.empty(); }
    };

    // Both snapshots must describe the same target; this is not checked.
    // All three lists come back sorted by identifier.
    api_diff diff(const snapshot& old_snap, const snapshot& new_snap);

}  // namespace apiguard
