#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "stanza/ast.hpp"

namespace Stanza::detail {

    /// @brief Decodes the spelling of a literal token into its typed form
    ///
    /// @details
    /// @p repr must be a complete literal token as the lexer delimits it
    /// (quotes, raw-string hashes and suffix included). `true` and `false`
    /// are identifiers and are not handled here.
    ///
    /// @return The literal, or a diagnostic message when an escape, a digit
    ///         or the character count is invalid
    std::expected<Lit, std::string> decode_literal(std::string_view repr);

    /// @brief Converts digits in @p radix (2, 8, 10 or 16, no prefix, no
    ///        underscores) to base-10 text without leading zeros
    std::string to_base10(std::string_view digits, unsigned radix);

    /// @brief XID_Start approximation: ASCII letters, `_` and non-ASCII code points
    ///        outside the space, punctuation, symbol and private-use blocks
    bool is_ident_start(char32_t c) noexcept;

    /// @brief XID_Continue approximation: is_ident_start plus ASCII digits and connectors
    bool is_ident_continue(char32_t c) noexcept;

} // namespace Stanza::detail
