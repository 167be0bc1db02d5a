#pragma once


/*
    ----------------------------------
    Stanza source parsing entry points
    ----------------------------------
    Turns source text into an expression tree (or one of its supporting
    pieces). Parsing is the only fallible stage before conversion; on failure
    no tree is produced.

        auto expr = Stanza::parse_expr("if x > 0 { x } else { -x }");
        if (!expr) {
            const auto& err = expr.error();
            // err.errc, err.line, err.column, err.msg
        }

    Grammar notes
        - Operator precedence, lowest first: assignment (right associative),
          range, `||`, `&&`, comparison (not chainable), `|`, `^`, `&`,
          shifts, additive, multiplicative, `as`, prefix unary, postfix
        - Struct literals are not allowed in `if`, `while`, `match` and
          `for` heads
        - Items inside blocks (`fn`, `struct`, `use`, ...) are kept as
          opaque tokens
        - `box e`, `become e` and `builtin # name(...)` parse to `Verbatim`
        - Doc comments are treated as ordinary comments
*/

#include <expected>
#include <string_view>

#include "stanza/ast.hpp"
#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/token.hpp"

/// @defgroup StanzaParse Parsing
/// @ingroup Stanza
/// @brief Source text to expression tree

namespace Stanza {

    /// @ingroup StanzaParse
    template<typename T>
    using ParseResult = std::expected<T, ParseError>;

    /// @ingroup StanzaParse
    /// @brief Parses one complete expression; trailing tokens are an error
    STANZA_API ParseResult<ExprPtr> parse_expr(std::string_view text, const ParseOptions& opts = {});

    /// @ingroup StanzaParse
    /// @brief Parses one type
    STANZA_API ParseResult<Type> parse_type(std::string_view text, const ParseOptions& opts = {});

    /// @ingroup StanzaParse
    /// @brief Parses one pattern, `|` alternatives included
    STANZA_API ParseResult<Pat> parse_pat(std::string_view text, const ParseOptions& opts = {});

    /// @ingroup StanzaParse
    /// @brief Parses a path in type position (`std::vec::Vec<T>`)
    STANZA_API ParseResult<Path> parse_path(std::string_view text, const ParseOptions& opts = {});

    /// @ingroup StanzaParse
    /// @brief Parses a single literal token, `true` and `false` included
    STANZA_API ParseResult<Lit> parse_lit(std::string_view text);

    /// @ingroup StanzaParse
    /// @brief Splits text into tokens with the spacing the lexer observed
    STANZA_API ParseResult<token_stream> tokenize(std::string_view text);

} // namespace Stanza
