#include "apiguard/baseline_store.hpp"

#include "apiguard/error.hpp"
#include "apiguard/format.hpp"
#include "apiguard/utils.hpp"

#include "internal/io.hpp"

extern "C" {
#include <unistd.h>
}

#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace apiguard::literals;

namespace apiguard {

    namespace detail {

        static constexpr auto baseline_extension = ".json"sv;

        // Removes the temporary file unless released after a successful rename.
        struct scoped_temp_file {
            fs::path path{};
            bool released{false};

            explicit scoped_temp_file(fs::path p) : path(std::move(p)) {}

            scoped_temp_file(const scoped_temp_file&) = delete;
            scoped_temp_file& operator=(const scoped_temp_file&) = delete;

            ~scoped_temp_file() {
                if (!released) {
                    std::error_code ec{};
                    fs::remove(path, ec);
                }
            }
        };

        static fs::path make_temp_path(const fs::path& destination) {
            auto name = destination.filename().string();
            return destination.parent_path() / ".{}.tmp.{}"_format(name, static_cast<long>(::getpid()));
        }

    }  // namespace detail

    fs::path baseline_path(const fs::path& baseline_dir, std::string_view target) {
        return baseline_dir / "{}{}"_format(target, detail::baseline_extension);
    }

    snapshot load_baseline(const fs::path& baseline_dir, std::string_view target) {
        auto path = baseline_path(baseline_dir, target);
        std::error_code ec{};
        if (!fs::is_regular_file(path, ec)) {
            throw guard_error(error_kind::baseline_missing, "API baseline missing for target: {}"_format(target));
        }

        auto text = internal::io::try_read_text_file(path);
        if (!text) {
            throw guard_error(error_kind::io_error, "failed to read baseline: {}"_format(path.string()));
        }

        try {
            return decode_snapshot(*text);
        } catch (const guard_error& e) {
            throw guard_error(e.kind(), "{}: {}"_format(path.string(), e.what()));
        }
    }

    fs::path save_baseline(const snapshot& snap, const fs::path& baseline_dir) {
        // encode first: a serialization failure must leave the directory untouched
        auto bytes = encode_snapshot(snap);
        bytes.push_back('\n');

        internal::io::ensure_dir(baseline_dir);
        auto destination = baseline_path(baseline_dir, snap.target);

        detail::scoped_temp_file temp{detail::make_temp_path(destination)};
        internal::io::write_text_file(temp.path, bytes);

        std::error_code ec{};
        fs::rename(temp.path, destination, ec);
        if (ec) {
            throw guard_error(
                    error_kind::io_error,
                    "failed to replace baseline {}: {}"_format(destination.string(), ec.message()));
        }
        temp.released = true;

        debug_log("wrote baseline ", destination.string(), " (", snap.symbols.size(), " symbols)");
        return destination;
    }

}  // namespace apiguard
