#pragma once


/*
    ----------------------------------
    Stanza parsing and writing options
    ----------------------------------
    Plain aggregates, suitable for brace-initialization

    ------------------------------------
    Parsing Options - Stanza::ParseOptions
    ------------------------------------
    - `size_t max_depth`:
        * Limit on nesting depth of expressions, blocks, patterns and types
        * If exceeded, parsing fails with `depth_limit_exceeded`
        * A value of 0 means no explicit limit. The converter and the
          renderer recurse as deep as the tree, so callers feeding untrusted
          input should set a limit

    ------------------------------------
    Writing Options - Stanza::WriteOptions
    ------------------------------------
    - `bool pretty`:
        * When false (default), compact output without extra whitespace
        * When true, one member per line, indented, `"key": value`
    - `size_t indent`:
        * Spaces per nesting level in pretty mode (default 2)

    -----
    Usage
    -----
        auto expr = Stanza::parse_expr(text, { .max_depth = 256 });
        auto json = Stanza::dump(Stanza::to_value(**expr), { .pretty = true });
*/


#include <cstddef>

/// @defgroup StanzaOptions Parsing and Writing Options
/// @ingroup Stanza
/// @brief Configuration objects controlling parsing and serialization

namespace Stanza {

    /// @ingroup StanzaOptions
    /// @brief Configuration controlling source parsing
    struct ParseOptions {
        std::size_t max_depth = 0; ///< Maximum allowed nesting depth (0 = unlimited)
    };

    /// @ingroup StanzaOptions
    /// @brief Configuration controlling canonical value serialization
    struct WriteOptions {
        bool pretty = false;        ///< Enable pretty-printing (formatted output).
        std::size_t indent = 2;     ///< Number of spaces per indentation level.
    };

} // namespace Stanza
