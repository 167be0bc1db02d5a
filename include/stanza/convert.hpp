#pragma once


/*
    ------------------------------------
    Stanza expression to value converter
    ------------------------------------
    `to_value` maps one expression tree to a `Stanza::value`. It is total: a
    well-formed tree always converts, and variants without a dedicated
    schema come out as

        { "kind": "Unknown", "tokens": "<opaque text>" }

    -------
    Schema
    -------
    Every object has a `kind` tag naming the variant. All variants except
    `Verbatim` and `Unknown` carry `attrs`, an array of attribute texts.
    The key set of a variant never depends on the input: optional children
    are present as `null` when absent.

    Sub-trees that are not modeled (blocks, patterns, types, macro bodies,
    paths) are strings produced by the opaque renderer.

    - Labels are reported without the leading quote (`'outer` -> "outer")
    - `else if` converts to the nested `If`. An `else` block that is a single
      tail expression converts to that expression; any other `else` block
      converts to a `Block`
    - Integer literal values are base-10 digit strings, never machine
      integers; hex, octal and binary spellings are converted textually

    -----
    Usage
    -----
        auto expr = Stanza::parse_expr("a + b");
        Stanza::value v = Stanza::to_value(**expr);
        v["op"].as_string(); // "+"
*/

#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>

#include "stanza/ast.hpp"
#include "stanza/config.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaConvert Node Converter
/// @ingroup Stanza
/// @brief Expression tree to canonical value

namespace Stanza {

    /// @ingroup StanzaConvert
    /// @brief Converts one expression node (and its whole subtree)
    [[nodiscard]] STANZA_API value to_value(const Expr& e, std::pmr::memory_resource* mr = std::pmr::get_default_resource());

    /// @ingroup StanzaConvert
    /// @brief Converts a literal to its `{kind, value, suffix}` object
    [[nodiscard]] STANZA_API value lit_to_value(const Lit& lit, std::pmr::memory_resource* mr = std::pmr::get_default_resource());

    /// @ingroup StanzaConvert
    /// @brief Canonical symbol of a binary operator, `std::nullopt` outside the enumerated set
    [[nodiscard]] STANZA_API std::optional<std::string_view> binop_symbol(BinOp op) noexcept;

    /// @ingroup StanzaConvert
    /// @brief Canonical symbol of a unary operator, `std::nullopt` outside the enumerated set
    [[nodiscard]] STANZA_API std::optional<std::string_view> unop_symbol(UnOp op) noexcept;

    /// @ingroup StanzaConvert
    [[nodiscard]] STANZA_API std::string type_to_string(const Type& ty);

    /// @ingroup StanzaConvert
    [[nodiscard]] STANZA_API std::string pat_to_string(const Pat& pat);

    /// @ingroup StanzaConvert
    [[nodiscard]] STANZA_API std::string path_to_string(const Path& path);

} // namespace Stanza
