#include "stanza/error.hpp"

namespace Stanza {

    ParseError ParseError::make(code c, size_t o, size_t l, size_t col, std::string_view m) {
        ParseError e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    std::string_view to_string(ParseError::code c) noexcept {
        switch (c) {
        case ParseError::code::invalid_character: return "invalid_character";
        case ParseError::code::invalid_utf8: return "invalid_utf8";
        case ParseError::code::invalid_literal: return "invalid_literal";
        case ParseError::code::unterminated_literal: return "unterminated_literal";
        case ParseError::code::unterminated_comment: return "unterminated_comment";
        case ParseError::code::unbalanced_delimiter: return "unbalanced_delimiter";
        case ParseError::code::unexpected_token: return "unexpected_token";
        case ParseError::code::unexpected_end_of_input: return "unexpected_end_of_input";
        case ParseError::code::trailing_tokens: return "trailing_tokens";
        case ParseError::code::depth_limit_exceeded: return "depth_limit_exceeded";
        }
        return "unknown";
    }

    WriteError WriteError::make(code c, std::string_view m) {
        WriteError e;
        e.errc = c;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    std::string_view to_string(WriteError::code c) noexcept {
        switch (c) {
        case WriteError::code::non_finite_number: return "non_finite_number";
        case WriteError::code::invalid_utf8: return "invalid_utf8";
        case WriteError::code::io_error: return "io_error";
        }
        return "unknown";
    }

} // namespace Stanza
