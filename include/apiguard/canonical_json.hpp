#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace apiguard::canonical {

    /*
     * Canonical JSON
     *
     * A closed JSON value universe and a deterministic encoder for it. Two values holding the same
     * key/value pairs encode to identical bytes no matter in which order members were inserted:
     * object members are emitted sorted by raw key bytes, arrays keep their order, output is compact.
     *
     * Encoding fails with guard_error{serialization_error} for values that have no canonical form:
     * non-finite doubles and objects with repeated keys.
     */

    struct value;

    using array = std::vector<value>;
    using member = std::pair<std::string, value>;
    // Members in insertion order; the encoder sorts.
    using object = std::vector<member>;

    struct value {
        using variant_type = std::variant<std::nullptr_t, bool, int64_t, double, std::string, array, object>;

        variant_type data{nullptr};

        value() = default;

        template <typename T>
            requires(!std::same_as<std::remove_cvref_t<T>, value> && std::constructible_from<variant_type, T>)
        value(T&& v) : data(std::forward<T>(v)) {}

        template <typename T>
        bool is() const noexcept {
            return std::holds_alternative<T>(data);
        }

        template <typename T>
        const T& get() const {
            return std::get<T>(data);
        }
    };

    std::string encode(const value& v);

    // Appends s as a quoted, escaped JSON string.
    void encode_string(std::string_view s, std::string& out);

}  // namespace apiguard::canonical
