#pragma once


/*
    ------------------------------------------------
    Stanza error reporting - ParseError / WriteError
    ------------------------------------------------
    Stanza has two disjoint failure domains and one error type for each:

    - `Stanza::ParseError`: the source text is not a well-formed expression.
      The node converter is never invoked in this case
    - `Stanza::WriteError`: a canonical value cannot be represented in the
      output encoding (non-finite number, invalid UTF-8 in a string)

    The node converter itself has no failure mode. Anything it does not model
    structurally degrades to opaque text instead of an error

    ------------------
    ParseError Fields
    ------------------
    - `code errc`: failure category (see enum below)
    - `size_t offset`: byte offset into the source text, in `[0, size]`
    - `size_t line`: 1-based line number
    - `size_t column`: 1-based column (byte offset within the line)
    - `std::string msg`: human-readable description, not stable for
      programmatic use

    -----
    Usage
    -----
    Fallible functions return `std::expected<T, ParseError>` or
    `std::expected<T, WriteError>`; errors are values, not exceptions
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "stanza/config.hpp"


/// @defgroup StanzaError Errors
/// @ingroup Stanza
/// @brief Error codes and structures produced by the parser and the writer
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief Structured error produced while parsing source text
    struct ParseError {
        /// @ingroup StanzaError
        /// @brief Failure categories detected by the lexer and the parser
        ///
        /// @details
        /// - `invalid_character`
        ///     A character that cannot start any token, e.g. `\` or `` ` ``.
        /// - `invalid_utf8`
        ///     The source text is not valid UTF-8.
        /// - `invalid_literal`
        ///     Literal with a bad escape, no digits, an out-of-range
        ///     `\x`/`\u{}` escape or a malformed character literal.
        /// - `unterminated_literal`
        ///     String, byte string or character literal missing its closing quote.
        /// - `unterminated_comment`
        ///     Block comment missing its `*/`.
        /// - `unbalanced_delimiter`
        ///     Closing delimiter without an opener, or of the wrong kind.
        /// - `unexpected_token`
        ///     A token that does not fit the grammar at its position.
        /// - `unexpected_end_of_input`
        ///     Input ended before the expression was complete.
        /// - `trailing_tokens`
        ///     A complete expression was parsed but tokens remain.
        /// - `depth_limit_exceeded`
        ///     Nesting is deeper than `ParseOptions::max_depth`.
        enum class code : uint8_t {
            invalid_character,
            invalid_utf8,
            invalid_literal,
            unterminated_literal,
            unterminated_comment,
            unbalanced_delimiter,
            unexpected_token,
            unexpected_end_of_input,
            trailing_tokens,
            depth_limit_exceeded,
        };

        code errc{};          ///< Classification of the failure.
        std::size_t offset{}; ///< Byte offset from the beginning of the input.
        std::size_t line{};   ///< Line number where the error occurred (1-based).
        std::size_t column{}; ///< Column number where the error occurred (1-based).
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @ingroup StanzaError
        /// @brief Constructs a fully-populated `ParseError`
        ///
        /// @param c    The error code describing the category of failure.
        /// @param o    Byte offset from the start of the input.
        /// @param l    Line number (1-based).
        /// @param col  Column number (1-based).
        /// @param m    Human-readable error message.
        STANZA_API static ParseError make(code c, size_t o, size_t l, size_t col, std::string_view m);
    };

    /// @ingroup StanzaError
    /// @brief Returns a stable lowercase name for a parse error code
    STANZA_API std::string_view to_string(ParseError::code c) noexcept;

    /// @ingroup StanzaError
    /// @brief Structured error produced while encoding a canonical value
    struct WriteError {
        /// @ingroup StanzaError
        /// @brief Reasons a value cannot be encoded
        enum class code : uint8_t {
            non_finite_number, ///< NaN or infinity has no JSON spelling.
            invalid_utf8,      ///< A string or object key is not valid UTF-8.
            io_error,          ///< The output stream reported a failure.
        };

        code errc{};       ///< Classification of the failure.
        std::string msg{}; ///< Human-readable diagnostic message.

        /// @ingroup StanzaError
        /// @brief Constructs a `WriteError`
        STANZA_API static WriteError make(code c, std::string_view m);
    };

    /// @ingroup StanzaError
    /// @brief Returns a stable lowercase name for a write error code
    STANZA_API std::string_view to_string(WriteError::code c) noexcept;

} // namespace Stanza
