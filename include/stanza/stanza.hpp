#pragma once


/*
    --------------------------------------------------------------------
    Stanza - Rust expression trees as canonical, language-agnostic JSON
    --------------------------------------------------------------------

    This is the main public header for Stanza

    It brings together:
        - Source parsing:               `Stanza::parse_expr(...)`
        - The expression tree:          `Stanza::Expr`
        - The node converter:           `Stanza::to_value(...)`
        - The opaque renderer:          `Stanza::render(...)`
        - The canonical value:          `Stanza::value`
        - Serialization functions:      `Stanza::dump(...)`
        - Error reporting types:        `Stanza::ParseError`,
                                        `Stanza::WriteError`
        - Configuration options:        `Stanza::ParseOptions`,
                                        `Stanza::WriteOptions`

    -------------------
    High-Level Overview
    -------------------
    - Parsing:
        * `std::expected<ExprPtr, ParseError> parse_expr(std::string_view, const ParseOptions& = {})`
        * Failures carry an error code, the byte offset, line and column
    - Conversion:
        * `value to_value(const Expr&)` never fails. Every modeled variant
          maps to a fixed key set; unmodeled syntax degrades to opaque text
    - Serialization:
        * `std::expected<std::string, WriteError> dump(const value&, const WriteOptions& = {})`
        * `std::expected<void, WriteError> dump(const value&, std::ostream&, const WriteOptions& = {})`
        * Output is compact by default, or indented with `pretty`

    -----
    Usage
    -----
        #include <stanza/stanza.hpp>

        int main() {
            auto expr = Stanza::parse_expr("1 + 2 * 3");
            if (!expr) {
                std::println("Parse error: {}", expr.error().msg);
                return 1;
            }

            auto json = Stanza::dump(Stanza::to_value(**expr), { .pretty = true });
            if (json) std::println("{}", *json);
        }

    Include this header for the full API, or the individual headers
    (`parse.hpp`, `convert.hpp`, `render.hpp`, `value.hpp`) directly
*/

/// @defgroup StanzaAPI Top-level Serialization API
/// @ingroup Stanza
/// @brief Writing canonical values as JSON text

#include <expected>
#include <iosfwd>
#include <string>

#include "stanza/ast.hpp"
#include "stanza/config.hpp"
#include "stanza/convert.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/parse.hpp"
#include "stanza/render.hpp"
#include "stanza/token.hpp"
#include "stanza/value.hpp"

namespace Stanza {

    /// @ingroup StanzaAPI
    /// @brief Result of serializing to a string
    using WriteResult = std::expected<std::string, WriteError>;

    /// @ingroup StanzaAPI
    /// @brief Serializes a canonical value to JSON text
    ///
    /// @details
    /// Object members are written in key order, which `value` keeps sorted.
    /// Numbers use the shortest text that reads back to the same double.
    /// Nothing is returned on failure: a NaN or infinite number yields
    /// `non_finite_number` and a string or key that is not valid UTF-8
    /// yields `invalid_utf8`.
    ///
    /// Example:
    /// @code
    /// auto json = Stanza::dump(v, { .pretty = true });
    /// if (!json) std::println(stderr, "{}", json.error().msg);
    /// @endcode
    ///
    /// @param v The value to serialize
    /// @param opts Formatting options
    /// @return The JSON text or the reason it could not be produced
    [[nodiscard]] STANZA_API WriteResult dump(const value& v, const WriteOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Serializes a canonical value and writes it to @p os
    ///
    /// @details
    /// The value is validated before anything is written, so a failed call
    /// leaves @p os untouched. A stream left in a failed state after writing
    /// yields `io_error`.
    STANZA_API std::expected<void, WriteError> dump(const value& v, std::ostream& os, const WriteOptions& opts = {});

} // namespace Stanza
