#pragma once

#include <expected>
#include <string_view>
#include <vector>

#include "stanza/error.hpp"
#include "stanza/token.hpp"

namespace Stanza::detail {

    struct lexed_source {
        std::vector<token> tokens;
        source_pos end{}; ///< Position just past the last byte of input
    };

    /// @brief Splits @p text into tokens
    ///
    /// @details
    /// Whitespace and comments are dropped. Every literal is validated with
    /// `decode_literal`, and delimiters are checked for balance, so the
    /// parser only ever sees well-formed token trees.
    std::expected<lexed_source, ParseError> lex(std::string_view text);

} // namespace Stanza::detail
