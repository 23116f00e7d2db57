#pragma once

#include "snapshot.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apiguard {

    using namespace std::string_view_literals;

    struct declaration_fragment {
        std::string kind{};
        std::string spelling{};
    };

    // One symbol record from the toolchain's raw export.
    struct raw_symbol {
        std::string precise_id{};
        std::string title{};
        std::string kind{};
        std::optional<std::string> kind_display{};
        std::optional<std::string> access_level{};
        std::optional<std::vector<declaration_fragment>> declaration_fragments{};
    };

    struct symbol_graph {
        std::vector<raw_symbol> symbols{};
    };

    inline constexpr bool is_externally_visible(std::string_view access_level) {
        return access_level == "public"sv || access_level == "open"sv;
    }

    inline constexpr bool is_externally_visible(const std::optional<std::string>& access_level) {
        return access_level && is_externally_visible(std::string_view{*access_level});
    }

    // Throws guard_error{malformed_export}.
    symbol_graph parse_symbol_graph(std::string_view json_text);

    // Throws guard_error{export_unavailable} when unreadable, {malformed_export} when unparseable.
    symbol_graph read_symbol_graph(const std::filesystem::path& path);

    std::string normalize_signature(const raw_symbol& symbol);

    snapshot normalize(std::string target, const symbol_graph& graph);

    snapshot build_snapshot(std::string target, const std::filesystem::path& export_path);

}  // namespace apiguard
