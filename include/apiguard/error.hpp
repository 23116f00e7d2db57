#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace apiguard {

    using namespace std::string_view_literals;

    enum class error_kind : uint8_t {
        export_unavailable,
        malformed_export,
        baseline_missing,
        malformed_baseline,
        serialization_error,
        config_not_found,
        config_invalid,
        io_error,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::export_unavailable:
                return "export_unavailable"sv;
            case error_kind::malformed_export:
                return "malformed_export"sv;
            case error_kind::baseline_missing:
                return "baseline_missing"sv;
            case error_kind::malformed_baseline:
                return "malformed_baseline"sv;
            case error_kind::serialization_error:
                return "serialization_error"sv;
            case error_kind::config_not_found:
                return "config_not_found"sv;
            case error_kind::config_invalid:
                return "config_invalid"sv;
            case error_kind::io_error:
                return "io_error"sv;
        }
        return "io_error"sv;
    }

    class guard_error : public std::runtime_error {
      public:
        guard_error(error_kind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

        error_kind kind() const noexcept { return kind_; }

      private:
        error_kind kind_;
    };

}  // namespace apiguard
