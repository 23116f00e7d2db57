#pragma once

#include "snapshot.hpp"

#include <filesystem>
#include <string_view>

namespace apiguard {

    std::filesystem::path baseline_path(const std::filesystem::path& baseline_dir, std::string_view target);

    // Throws guard_error{baseline_missing} when no file exists for target, {malformed_baseline} when it
    // cannot be decoded. A missing baseline is never treated as an empty snapshot.
    snapshot load_baseline(const std::filesystem::path& baseline_dir, std::string_view target);

    // Writes <baseline_dir>/<target>.json through a temporary sibling and an atomic rename, so readers see
    // either the previous or the new complete document. Throws guard_error{io_error, serialization_error}.
    std::filesystem::path save_baseline(const snapshot& snap, const std::filesystem::path& baseline_dir);

}  // namespace apiguard
