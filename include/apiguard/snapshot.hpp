#pragma once

#include "canonical_json.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace apiguard {

    // identifier -> normalized signature
    using symbol_map = std::unordered_map<std::string, std::string>;

    struct snapshot {
        std::string target{};
        // ISO-8601 UTC; informational, never compared
        std::string created_at{};
        symbol_map symbols{};
    };

    std::string make_timestamp();

    canonical::value to_canonical(const snapshot& snap);

    // Canonical bytes of {target, createdAt, symbols}; throws guard_error{serialization_error}.
    std::string encode_snapshot(const snapshot& snap);

    // Throws guard_error{malformed_baseline}.
    snapshot decode_snapshot(std::string_view text);

}  // namespace apiguard
