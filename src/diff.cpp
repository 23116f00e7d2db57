#include "apiguard/diff.hpp"

#include <algorithm>

namespace apiguard {

    api_diff diff(const snapshot& old_snap, const snapshot& new_snap) {
        api_diff result{};
        result.target = new_snap.target;

        for (const auto& [id, signature] : new_snap.symbols) {
            auto it = old_snap.symbols.find(id);
            if (it == old_snap.symbols.end()) {
                result.added.push_back(id);
            }
            else if (it->second != signature) {
                result.changed.push_back(id);
            }
        }
        for (const auto& [id, signature] : old_snap.symbols) {
            if (!new_snap.symbols.contains(id)) {
                result.removed.push_back(id);
            }
        }

        std::ranges::sort(result.added);
        std::ranges::sort(result.removed);
        std::ranges::sort(result.changed);
        return result;
    }

}  // namespace apiguard
