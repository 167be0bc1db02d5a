#include "stanza/parse.hpp"

#include "detail/lexer.hpp"
#include "detail/literal.hpp"
#include "detail/parser.hpp"

#include <array>
#include <algorithm>
#include <string>
#include <utility>

namespace Stanza {

#pragma region Cursor

    namespace detail {

        bool Parser::peek_punct(std::string_view op, size_t k) const noexcept {
            for (size_t i = 0; i < op.size(); i++) {
                const token* t = peek(k + i);
                if (!t || !t->is_punct(op[i])) return false;
                if (i + 1 < op.size() && !t->is_joint()) return false;
            }
            return !op.empty();
        }

        bool Parser::peek_keyword(std::string_view kw, size_t k) const noexcept {
            const token* t = peek(k);
            return t && t->is_ident(kw);
        }

        bool Parser::peek_open(delimiter d, size_t k) const noexcept {
            const token* t = peek(k);
            return t && t->is_open(d);
        }

        bool Parser::peek_lifetime(size_t k) const noexcept {
            const token* q = peek(k);
            const token* n = peek(k + 1);
            return q && n && q->is_punct('\'') && n->is_ident();
        }

        bool Parser::peek_colon(size_t k) const noexcept {
            const token* t = peek(k);
            if (!t || !t->is_punct(':')) return false;
            return !peek_punct("::", k);
        }

        bool Parser::peek_eq(size_t k) const noexcept {
            const token* t = peek(k);
            if (!t || !t->is_punct('=')) return false;
            return !peek_punct("==", k) && !peek_punct("=>", k);
        }

        bool Parser::eat_punct(std::string_view op) {
            if (!peek_punct(op)) return false;
            idx += op.size();
            return true;
        }

        bool Parser::eat_keyword(std::string_view kw) {
            if (!peek_keyword(kw)) return false;
            idx++;
            return true;
        }

        expected_void Parser::expect_punct(std::string_view op) {
            if (eat_punct(op)) return {};
            return std::unexpected(error_here("`" + std::string(op) + "`"));
        }

        expected_void Parser::expect_keyword(std::string_view kw) {
            if (eat_keyword(kw)) return {};
            return std::unexpected(error_here("`" + std::string(kw) + "`"));
        }

        expected_void Parser::expect_open(delimiter d) {
            if (peek_open(d)) {
                idx++;
                return {};
            }
            return std::unexpected(error_here(std::string("`") + open_char(d) + "`"));
        }

        expected_void Parser::expect_close(delimiter d) {
            const token* t = peek();
            if (t && t->is_close(d)) {
                idx++;
                return {};
            }
            return std::unexpected(error_here(std::string("`") + close_char(d) + "`"));
        }

        expected_t<std::string> Parser::expect_ident() {
            const token* t = peek();
            if (t && t->is_ident() && !is_reserved_keyword(t->text)) {
                idx++;
                return t->text;
            }
            return std::unexpected(error_here("identifier"));
        }

        namespace {
            std::string describe(const token& t) {
                switch (t.kind) {
                case token_kind::ident: return (is_reserved_keyword(t.text) ? "keyword `" : "identifier `") + t.text + "`";
                case token_kind::literal: return "literal `" + t.text + "`";
                case token_kind::punct: return "`" + t.text + "`";
                case token_kind::open: return std::string("`") + open_char(t.delim) + "`";
                case token_kind::close: return std::string("`") + close_char(t.delim) + "`";
                }
                return "token";
            }
        } // namespace

        ParseError Parser::error_here(std::string_view expected) const {
            const token* t = peek();
            if (!t) {
                return ParseError::make(ParseError::code::unexpected_end_of_input, end_pos.offset, end_pos.line, end_pos.column,
                    "unexpected end of input, expected " + std::string(expected));
            }
            return ParseError::make(ParseError::code::unexpected_token, t->pos.offset, t->pos.line, t->pos.column,
                "expected " + std::string(expected) + ", found " + describe(*t));
        }

        ParseError Parser::error_at_token(ParseError::code code, std::string_view msg) const {
            source_pos at = eof() ? end_pos : toks[idx].pos;
            return ParseError::make(code, at.offset, at.line, at.column, msg);
        }

        void Parser::skip_tree() {
            if (eof()) return;
            if (toks[idx].kind != token_kind::open) {
                idx++;
                return;
            }
            size_t nesting = 0;
            do {
                if (toks[idx].kind == token_kind::open) nesting++;
                else if (toks[idx].kind == token_kind::close) nesting--;
                idx++;
            } while (nesting > 0 && idx < toks.size());
        }

        token_stream Parser::slice(size_t from, size_t to) const {
            token_stream ts;
            for (size_t i = from; i < to && i < toks.size(); i++) ts.push_back(toks[i]);
            return ts;
        }

        ParseError depth_error(const Parser& p) {
            return p.error_at_token(ParseError::code::depth_limit_exceeded, "nesting depth limit exceeded");
        }

        bool is_reserved_keyword(std::string_view word) noexcept {
            static constexpr std::array<std::string_view, 44> words = {
                "abstract", "as", "async", "await", "become", "box", "break", "const",
                "continue", "crate", "do", "dyn", "else", "enum", "extern", "false",
                "final", "fn", "for", "if", "impl", "in", "let", "loop",
                "macro", "match", "mod", "move", "mut", "override", "priv", "pub",
                "ref", "return", "static", "struct", "super", "trait", "true", "try",
                "type", "typeof", "unsafe", "unsized",
            };
            static constexpr std::array<std::string_view, 6> more = {
                "use", "virtual", "where", "while", "yield", "self",
            };
            if (word == "Self") return true;
            return std::find(words.begin(), words.end(), word) != words.end()
                || std::find(more.begin(), more.end(), word) != more.end();
        }

    } // namespace detail

#pragma endregion
#pragma region Entry points

    namespace {
        using detail::Parser;

        ParseError trailing_error(const Parser& p) {
            const token& t = p.toks[p.idx];
            return ParseError::make(ParseError::code::trailing_tokens, t.pos.offset, t.pos.line, t.pos.column,
                "unexpected token `" + (t.kind == token_kind::open ? std::string(1, open_char(t.delim)) : t.text) + "` after expression");
        }

        // Lexes, runs @p fn, then requires all input to be consumed
        template<class Fn>
        auto run_parser(std::string_view text, const ParseOptions& opts, Fn&& fn) -> decltype(fn(std::declval<Parser&>())) {
            auto lexed = detail::lex(text);
            if (!lexed) return std::unexpected(lexed.error());

            Parser p{ lexed->tokens, lexed->end, opts };
            auto result = fn(p);
            if (!result) return std::unexpected(result.error());
            if (!p.eof()) return std::unexpected(trailing_error(p));
            return result;
        }
    } // namespace

    ParseResult<ExprPtr> parse_expr(std::string_view text, const ParseOptions& opts) {
        return run_parser(text, opts, [](Parser& p) { return detail::parse_expr(p, true); });
    }

    ParseResult<Type> parse_type(std::string_view text, const ParseOptions& opts) {
        return run_parser(text, opts, [](Parser& p) -> ParseResult<Type> {
            Type ty;
            if (auto r = detail::parse_type(p, ty.tokens, true); !r) return std::unexpected(r.error());
            return ty;
        });
    }

    ParseResult<Pat> parse_pat(std::string_view text, const ParseOptions& opts) {
        return run_parser(text, opts, [](Parser& p) -> ParseResult<Pat> {
            Pat pat;
            if (auto r = detail::parse_pat_top(p, pat.tokens); !r) return std::unexpected(r.error());
            return pat;
        });
    }

    ParseResult<Path> parse_path(std::string_view text, const ParseOptions& opts) {
        return run_parser(text, opts, [](Parser& p) { return detail::parse_type_path(p); });
    }

    ParseResult<Lit> parse_lit(std::string_view text) {
        return run_parser(text, {}, [](Parser& p) -> ParseResult<Lit> {
            const token* t = p.peek();
            if (t && (t->is_ident("true") || t->is_ident("false"))) {
                p.idx++;
                return LitBool{ t->text == "true" };
            }
            if (!t || !t->is_literal()) return std::unexpected(p.error_here("literal"));
            p.idx++;
            auto lit = detail::decode_literal(t->text);
            if (!lit) return std::unexpected(ParseError::make(ParseError::code::invalid_literal, t->pos.offset, t->pos.line, t->pos.column, lit.error()));
            return *std::move(lit);
        });
    }

    ParseResult<token_stream> tokenize(std::string_view text) {
        auto lexed = detail::lex(text);
        if (!lexed) return std::unexpected(lexed.error());
        token_stream ts;
        for (auto& t : lexed->tokens) ts.push_back(std::move(t));
        return ts;
    }

#pragma endregion

} // namespace Stanza
