#include "apiguard/symbol_graph.hpp"

#include "apiguard/error.hpp"
#include "apiguard/format.hpp"
#include "apiguard/utils.hpp"

#include "internal/io.hpp"

#include <glaze/glaze.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace apiguard::literals;

namespace apiguard::detail {

    // Wire shape of a symbol graph document. Required keys are optional here and checked
    // after the read so a missing key names the offending record.
    struct wire_identifier {
        std::optional<std::string> precise{};
    };

    struct wire_names {
        std::optional<std::string> title{};
    };

    struct wire_kind {
        std::optional<std::string> identifier{};
        std::optional<std::string> display_name{};
    };

    struct wire_fragment {
        std::optional<std::string> kind{};
        std::optional<std::string> spelling{};
    };

    struct wire_symbol {
        std::optional<wire_identifier> identifier{};
        std::optional<wire_names> names{};
        std::optional<wire_kind> kind{};
        std::optional<std::string> access_level{};
        std::optional<std::vector<wire_fragment>> declaration_fragments{};
    };

    struct wire_graph {
        std::optional<std::vector<wire_symbol>> symbols{};
    };

}  // namespace apiguard::detail

namespace glz {

    template <>
    struct meta<apiguard::detail::wire_identifier> {
        using T = apiguard::detail::wire_identifier;
        static constexpr auto value = object("precise", &T::precise);
    };

    template <>
    struct meta<apiguard::detail::wire_names> {
        using T = apiguard::detail::wire_names;
        static constexpr auto value = object("title", &T::title);
    };

    template <>
    struct meta<apiguard::detail::wire_kind> {
        using T = apiguard::detail::wire_kind;
        static constexpr auto value = object("identifier", &T::identifier, "displayName", &T::display_name);
    };

    template <>
    struct meta<apiguard::detail::wire_fragment> {
        using T = apiguard::detail::wire_fragment;
        static constexpr auto value = object("kind", &T::kind, "spelling", &T::spelling);
    };

    template <>
    struct meta<apiguard::detail::wire_symbol> {
        using T = apiguard::detail::wire_symbol;
        static constexpr auto value =
                object("identifier",
                       &T::identifier,
                       "names",
                       &T::names,
                       "kind",
                       &T::kind,
                       "accessLevel",
                       &T::access_level,
                       "declarationFragments",
                       &T::declaration_fragments);
    };

    template <>
    struct meta<apiguard::detail::wire_graph> {
        using T = apiguard::detail::wire_graph;
        static constexpr auto value = object("symbols", &T::symbols);
    };

}  // namespace glz

namespace apiguard {

    namespace detail {

        [[noreturn]] static void fail_malformed(std::string_view reason) {
            throw guard_error(error_kind::malformed_export, "malformed symbol graph: {}"_format(reason));
        }

        template <typename T>
        static const T& require_field(const std::optional<T>& field, size_t index, std::string_view name) {
            if (!field) {
                fail_malformed("symbol #{} is missing '{}'"_format(index, name));
            }
            return *field;
        }

        static raw_symbol to_raw_symbol(wire_symbol&& wire, size_t index) {
            raw_symbol symbol{};
            symbol.precise_id = require_field(require_field(wire.identifier, index, "identifier").precise,
                                              index,
                                              "identifier.precise");
            symbol.title = require_field(require_field(wire.names, index, "names").title, index, "names.title");

            const auto& kind = require_field(wire.kind, index, "kind");
            symbol.kind = require_field(kind.identifier, index, "kind.identifier");
            symbol.kind_display = kind.display_name;
            symbol.access_level = std::move(wire.access_level);

            if (wire.declaration_fragments) {
                std::vector<declaration_fragment> fragments{};
                fragments.reserve(wire.declaration_fragments->size());
                for (auto& frag : *wire.declaration_fragments) {
                    fragments.push_back(declaration_fragment{
                            .kind = require_field(frag.kind, index, "declarationFragments[].kind"),
                            .spelling = require_field(frag.spelling, index, "declarationFragments[].spelling")});
                }
                symbol.declaration_fragments = std::move(fragments);
            }
            return symbol;
        }

    }  // namespace detail

    symbol_graph parse_symbol_graph(std::string_view json_text) {
        detail::wire_graph wire{};
        std::string buffer{json_text};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(wire, buffer);
        if (ec) {
            detail::fail_malformed(glz::format_error(ec, buffer));
        }
        if (!wire.symbols) {
            detail::fail_malformed("missing 'symbols' list");
        }

        symbol_graph graph{};
        graph.symbols.reserve(wire.symbols->size());
        for (size_t i = 0U; i < wire.symbols->size(); ++i) {
            graph.symbols.push_back(detail::to_raw_symbol(std::move((*wire.symbols)[i]), i));
        }
        return graph;
    }

    symbol_graph read_symbol_graph(const std::filesystem::path& path) {
        auto text = internal::io::try_read_text_file(path);
        if (!text) {
            throw guard_error(error_kind::export_unavailable, "failed to read symbol graph: {}"_format(path.string()));
        }
        return parse_symbol_graph(*text);
    }

    std::string normalize_signature(const raw_symbol& symbol) {
        if (symbol.declaration_fragments && !symbol.declaration_fragments->empty()) {
            std::string joined{};
            for (const auto& frag : *symbol.declaration_fragments) {
                joined += frag.spelling;
            }
            return utils::collapse_whitespace(joined);
        }
        // less precise, still stable
        return "{} {}"_format(symbol.kind, symbol.title);
    }

    snapshot normalize(std::string target, const symbol_graph& graph) {
        snapshot snap{};
        snap.target = std::move(target);
        snap.created_at = make_timestamp();
        snap.symbols.reserve(graph.symbols.size());

        for (const auto& symbol : graph.symbols) {
            if (!is_externally_visible(symbol.access_level)) {
                continue;
            }
            auto [it, inserted] = snap.symbols.insert_or_assign(symbol.precise_id, normalize_signature(symbol));
            if (!inserted) {
                debug_log("duplicate symbol identifier in export for ", snap.target, ": ", it->first);
            }
        }

        debug_log("normalized ", snap.symbols.size(), " of ", graph.symbols.size(), " symbols for ", snap.target);
        return snap;
    }

    snapshot build_snapshot(std::string target, const std::filesystem::path& export_path) {
        return normalize(std::move(target), read_symbol_graph(export_path));
    }

}  // namespace apiguard
