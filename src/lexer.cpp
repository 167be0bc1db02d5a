#include "detail/lexer.hpp"
#include "detail/literal.hpp"
#include "detail/utf8.hpp"

#include <string>
#include <utility>

namespace Stanza::detail {

    namespace {
        template<typename T>
        using expected_t = std::expected<T, ParseError>;
        using expected_void = std::expected<void, ParseError>;

        [[nodiscard]] bool is_punct_char(char c) noexcept {
            switch (c) {
            case '~': case '!': case '@': case '#': case '$': case '%': case '^':
            case '&': case '*': case '-': case '=': case '+': case '|': case ';':
            case ':': case ',': case '<': case '.': case '>': case '/': case '?':
            case '\'':
                return true;
            default:
                return false;
            }
        }

        [[nodiscard]] bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

        struct Lexer {
            std::string_view text;
            size_t idx = 0;
            size_t line = 1;
            size_t column = 1;
            std::vector<token> out;
            std::vector<token> open_stack;

            explicit Lexer(std::string_view t) : text{ t } {}

            [[nodiscard]] bool eof() const noexcept { return idx >= text.size(); }
            [[nodiscard]] char peek(size_t k = 0) const noexcept { return idx + k < text.size() ? text[idx + k] : '\0'; }
            [[nodiscard]] source_pos pos() const noexcept { return { idx, line, column }; }

            void advance(size_t n = 1) {
                for (size_t i = 0; i < n && idx < text.size(); i++) {
                    if (text[idx++] == '\n') {
                        line++;
                        column = 1;
                    } else column++;
                }
            }

            // Code point at idx + k bytes; len receives its size
            [[nodiscard]] char32_t peek_cp(size_t k, size_t& len) const {
                if (idx + k >= text.size()) {
                    len = 0;
                    return 0;
                }
                return decode_utf8(text, idx + k, len);
            }

            [[nodiscard]] bool ident_start_at(size_t k) const {
                size_t len = 0;
                char32_t c = peek_cp(k, len);
                return len != 0 && is_ident_start(c) && !is_unicode_space(c);
            }

            [[nodiscard]] static bool is_unicode_space(char32_t c) noexcept {
                return c == 0x85 || c == 0x200E || c == 0x200F || c == 0x2028 || c == 0x2029;
            }

            ParseError make_error(ParseError::code code, std::string_view msg, source_pos at) const {
                return ParseError::make(code, at.offset, at.line, at.column, msg);
            }

            ParseError make_error(ParseError::code code, std::string_view msg) const {
                return make_error(code, msg, pos());
            }

            void scan_ident_chars() {
                while (!eof()) {
                    size_t len = 0;
                    char32_t c = peek_cp(0, len);
                    if (!is_ident_continue(c) || is_unicode_space(c)) break;
                    advance(len);
                }
            }

            void emit(token_kind kind, size_t start, source_pos at) {
                token t;
                t.kind = kind;
                t.text.assign(text.substr(start, idx - start));
                t.pos = at;
                out.push_back(std::move(t));
            }

            expected_void skip_ws_and_comments();
            expected_void lex_literal_tail(size_t start, source_pos at);
            expected_void lex_quoted(char quote, size_t start, source_pos at);
            expected_void lex_raw(size_t start, source_pos at);
            expected_void lex_number(size_t start, source_pos at);
            expected_void lex_quote();
            expected_void lex_delimiter(char c);
            expected_void run();
        };

        expected_void Lexer::skip_ws_and_comments() {
            while (!eof()) {
                char c = peek();
                if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f') {
                    advance();
                    continue;
                }
                if (static_cast<unsigned char>(c) > 0x7F) {
                    size_t len = 0;
                    if (is_unicode_space(peek_cp(0, len))) {
                        advance(len);
                        continue;
                    }
                    return {};
                }
                if (c == '/' && peek(1) == '/') {
                    while (!eof() && peek() != '\n') advance();
                    continue;
                }
                if (c == '/' && peek(1) == '*') {
                    source_pos start = pos();
                    advance(2);
                    size_t nesting = 1;
                    while (nesting > 0) {
                        if (eof()) return std::unexpected(make_error(ParseError::code::unterminated_comment, "unterminated block comment", start));
                        if (peek() == '/' && peek(1) == '*') {
                            advance(2);
                            nesting++;
                        } else if (peek() == '*' && peek(1) == '/') {
                            advance(2);
                            nesting--;
                        } else advance();
                    }
                    continue;
                }
                return {};
            }
            return {};
        }

        // Suffix plus validation of the literal spanning [start, idx)
        expected_void Lexer::lex_literal_tail(size_t start, source_pos at) {
            if (ident_start_at(0)) scan_ident_chars();
            auto lit = decode_literal(text.substr(start, idx - start));
            if (!lit) return std::unexpected(make_error(ParseError::code::invalid_literal, lit.error(), at));
            emit(token_kind::literal, start, at);
            return {};
        }

        // Cooked string, byte string, C string or character body; idx is on the opening quote
        expected_void Lexer::lex_quoted(char quote, size_t start, source_pos at) {
            advance();
            while (true) {
                if (eof()) return std::unexpected(make_error(ParseError::code::unterminated_literal, quote == '"' ? "unterminated double quote string" : "unterminated character literal", at));
                char c = peek();
                if (c == quote) {
                    advance();
                    break;
                }
                if (quote == '\'' && c == '\n')
                    return std::unexpected(make_error(ParseError::code::unterminated_literal, "unterminated character literal", at));
                advance(c == '\\' && idx + 1 < text.size() ? 2 : 1);
            }
            return lex_literal_tail(start, at);
        }

        // Raw string body; idx is on the `r`
        expected_void Lexer::lex_raw(size_t start, source_pos at) {
            advance();
            size_t hashes = 0;
            while (peek() == '#') {
                advance();
                hashes++;
            }
            if (hashes > 255) return std::unexpected(make_error(ParseError::code::invalid_literal, "too many `#` symbols in raw string", at));
            if (peek() != '"') return std::unexpected(make_error(ParseError::code::invalid_literal, "expected `\"` in raw string literal", at));
            advance();

            std::string closing = "\"" + std::string(hashes, '#');
            size_t end = text.find(closing, idx);
            if (end == std::string_view::npos)
                return std::unexpected(make_error(ParseError::code::unterminated_literal, "unterminated raw string", at));
            advance(end + closing.size() - idx);
            return lex_literal_tail(start, at);
        }

        expected_void Lexer::lex_number(size_t start, source_pos at) {
            if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'o' || peek(1) == 'b')) {
                advance(2);
                while (!eof() && (is_digit(peek()) || peek() == '_' || (peek() >= 'a' && peek() <= 'f') || (peek() >= 'A' && peek() <= 'F'))) advance();
                return lex_literal_tail(start, at);
            }

            while (!eof() && (is_digit(peek()) || peek() == '_')) advance();

            // `1.` is a float unless followed by another `.` or an identifier
            if (peek() == '.' && peek(1) != '.' && !ident_start_at(1)) {
                advance();
                while (!eof() && (is_digit(peek()) || peek() == '_')) advance();
            }

            if (peek() == 'e' || peek() == 'E') {
                size_t k = 1;
                if (peek(k) == '+' || peek(k) == '-') k++;
                while (peek(k) == '_') k++;
                if (is_digit(peek(k))) {
                    advance(k);
                    while (!eof() && (is_digit(peek()) || peek() == '_')) advance();
                }
            }
            return lex_literal_tail(start, at);
        }

        // Character literal or lifetime; idx is on the quote
        expected_void Lexer::lex_quote() {
            size_t start = idx;
            source_pos at = pos();

            if (peek(1) == '\\') return lex_quoted('\'', start, at);

            size_t len = 0;
            char32_t c = peek_cp(1, len);
            if (len != 0 && peek(1 + len) == '\'' && c != '\n')
                return lex_quoted('\'', start, at);

            if (ident_start_at(1)) {
                token q;
                q.kind = token_kind::punct;
                q.text = "'";
                q.space = spacing::joint;
                q.pos = at;
                out.push_back(std::move(q));
                advance();

                size_t name_start = idx;
                source_pos name_at = pos();
                if (peek() == 'r' && peek(1) == '#' && ident_start_at(2)) advance(2);
                scan_ident_chars();
                emit(token_kind::ident, name_start, name_at);
                return {};
            }
            return std::unexpected(make_error(ParseError::code::unterminated_literal, "unterminated character literal", at));
        }

        expected_void Lexer::lex_delimiter(char c) {
            token t;
            t.pos = pos();
            switch (c) {
            case '(': case ')': t.delim = delimiter::parenthesis; break;
            case '[': case ']': t.delim = delimiter::bracket; break;
            default: t.delim = delimiter::brace; break;
            }

            if (c == '(' || c == '[' || c == '{') {
                t.kind = token_kind::open;
                open_stack.push_back(t);
                out.push_back(std::move(t));
                advance();
                return {};
            }

            if (open_stack.empty())
                return std::unexpected(make_error(ParseError::code::unbalanced_delimiter, std::string("unexpected closing delimiter: `") + c + "`"));
            if (open_stack.back().delim != t.delim)
                return std::unexpected(make_error(ParseError::code::unbalanced_delimiter, std::string("mismatched closing delimiter: `") + c + "`"));
            open_stack.pop_back();
            t.kind = token_kind::close;
            out.push_back(std::move(t));
            advance();
            return {};
        }

        expected_void Lexer::run() {
            while (true) {
                if (auto ws = skip_ws_and_comments(); !ws) return std::unexpected(ws.error());
                if (eof()) break;

                char c = peek();
                size_t start = idx;
                source_pos at = pos();

                if (c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}') {
                    if (auto r = lex_delimiter(c); !r) return std::unexpected(r.error());
                    continue;
                }

                if (c == '"') {
                    if (auto r = lex_quoted('"', start, at); !r) return std::unexpected(r.error());
                    continue;
                }

                if (c == '\'') {
                    if (auto r = lex_quote(); !r) return std::unexpected(r.error());
                    continue;
                }

                if (is_digit(c)) {
                    if (auto r = lex_number(start, at); !r) return std::unexpected(r.error());
                    continue;
                }

                if (ident_start_at(0)) {
                    expected_void r;
                    if ((c == 'b' || c == 'c') && peek(1) == '"') {
                        advance();
                        r = lex_quoted('"', start, at);
                    } else if (c == 'b' && peek(1) == '\'') {
                        advance();
                        r = lex_quoted('\'', start, at);
                    } else if ((c == 'b' || c == 'c') && peek(1) == 'r' && (peek(2) == '"' || peek(2) == '#')) {
                        advance();
                        r = lex_raw(start, at);
                    } else if (c == 'r' && (peek(1) == '"' || (peek(1) == '#' && (peek(2) == '"' || peek(2) == '#')))) {
                        r = lex_raw(start, at);
                    } else {
                        if (c == 'r' && peek(1) == '#' && ident_start_at(2)) advance(2);
                        scan_ident_chars();
                        emit(token_kind::ident, start, at);
                    }
                    if (!r) return std::unexpected(r.error());
                    continue;
                }

                if (is_punct_char(c)) {
                    advance();
                    token t;
                    t.kind = token_kind::punct;
                    t.text.assign(1, c);
                    t.pos = at;
                    bool comment_next = peek() == '/' && (peek(1) == '/' || peek(1) == '*');
                    t.space = !eof() && is_punct_char(peek()) && !comment_next ? spacing::joint : spacing::alone;
                    out.push_back(std::move(t));
                    continue;
                }

                std::string msg = "unexpected character `";
                size_t len = 0;
                char32_t cp = peek_cp(0, len);
                append_utf8(cp, msg);
                msg += "`";
                return std::unexpected(make_error(ParseError::code::invalid_character, msg));
            }

            if (!open_stack.empty()) {
                const token& open = open_stack.back();
                return std::unexpected(make_error(ParseError::code::unbalanced_delimiter,
                    std::string("unclosed delimiter `") + open_char(open.delim) + "`", open.pos));
            }
            return {};
        }
    } // namespace

    std::expected<lexed_source, ParseError> lex(std::string_view text) {
        size_t bad_idx = 0;
        if (!is_valid_utf8(text, bad_idx)) {
            size_t line = 1;
            size_t column = 1;
            for (size_t i = 0; i < bad_idx; i++) {
                if (text[i] == '\n') {
                    line++;
                    column = 1;
                } else column++;
            }
            return std::unexpected(ParseError::make(ParseError::code::invalid_utf8, bad_idx, line, column, "invalid UTF-8 in source text"));
        }

        Lexer lx{ text };
        if (auto r = lx.run(); !r) return std::unexpected(r.error());

        lexed_source result;
        result.tokens = std::move(lx.out);
        result.end = lx.pos();
        return result;
    }

} // namespace Stanza::detail
