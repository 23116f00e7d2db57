#include "apiguard/snapshot.hpp"

#include "apiguard/error.hpp"
#include "apiguard/format.hpp"

#include <glaze/glaze.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>

using namespace apiguard::literals;

namespace apiguard::detail {

    struct persisted_snapshot {
        std::optional<std::string> target{};
        std::optional<std::string> created_at{};
        std::optional<symbol_map> symbols{};
    };

}  // namespace apiguard::detail

namespace glz {

    template <>
    struct meta<apiguard::detail::persisted_snapshot> {
        using T = apiguard::detail::persisted_snapshot;
        static constexpr auto value =
                object("target", &T::target, "createdAt", &T::created_at, "symbols", &T::symbols);
    };

}  // namespace glz

namespace apiguard {

    std::string make_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto seconds = std::chrono::system_clock::to_time_t(now);

        std::tm utc_tm{};
        gmtime_r(&seconds, &utc_tm);

        std::ostringstream os{};
        os << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%SZ");
        return os.str();
    }

    canonical::value to_canonical(const snapshot& snap) {
        canonical::object symbols{};
        symbols.reserve(snap.symbols.size());
        for (const auto& [id, signature] : snap.symbols) {
            symbols.emplace_back(id, signature);
        }

        return canonical::object{
                {"target", snap.target},
                {"createdAt", snap.created_at},
                {"symbols", std::move(symbols)},
        };
    }

    std::string encode_snapshot(const snapshot& snap) {
        return canonical::encode(to_canonical(snap));
    }

    snapshot decode_snapshot(std::string_view text) {
        detail::persisted_snapshot data{};
        std::string buffer{text};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(data, buffer);
        if (ec) {
            throw guard_error(
                    error_kind::malformed_baseline, "failed to parse snapshot: {}"_format(glz::format_error(ec, buffer)));
        }
        if (!data.target || !data.created_at || !data.symbols) {
            throw guard_error(
                    error_kind::malformed_baseline, "snapshot document requires target, createdAt and symbols");
        }

        return snapshot{
                .target = std::move(*data.target),
                .created_at = std::move(*data.created_at),
                .symbols = std::move(*data.symbols),
        };
    }

}  // namespace apiguard
