#include "stanza/render.hpp"

#include "detail/parser.hpp"

#include <optional>
#include <utility>

namespace Stanza::detail {

    namespace {
        bool is_path_keyword(std::string_view w) {
            return w == "self" || w == "Self" || w == "super" || w == "crate";
        }

        bool peek_path_start(const Parser& p) {
            const token* t = p.peek();
            if (!t) return false;
            if (t->is_ident()) return !is_reserved_keyword(t->text) || is_path_keyword(t->text);
            return p.peek_punct("::") || p.peek_punct("<");
        }

        // Start of a range bound: `-`? literal, or a path
        bool peek_range_bound(const Parser& p) {
            const token* t = p.peek();
            if (!t) return false;
            if (t->is_literal()) return true;
            if (t->is_punct('-')) return p.peek(1) && p.peek(1)->is_literal();
            return peek_path_start(p) && !t->is_ident("_");
        }

        expected_void parse_path_into(Parser& p, token_stream& out) {
            std::optional<QSelf> qself;
            auto path = parse_expr_path(p, qself);
            if (!path) return std::unexpected(path.error());
            if (qself) to_tokens(*qself, *path, out);
            else to_tokens(*path, out);
            return {};
        }

        expected_void parse_range_bound(Parser& p, token_stream& out) {
            if (p.peek_punct("-")) {
                p.idx++;
                out.punct('-', spacing::alone);
            }
            const token* t = p.peek();
            if (t && t->is_literal()) {
                out.literal(p.next().text);
                return {};
            }
            if (peek_path_start(p)) return parse_path_into(p, out);
            return std::unexpected(p.error_here("range pattern bound"));
        }

        // `..=` / `...` require an end bound; `..` takes one when present
        expected_void parse_range_tail(Parser& p, token_stream& out) {
            if (p.peek_punct("..=") || p.peek_punct("...")) {
                p.idx += 3;
                out.punct("..=");
                return parse_range_bound(p, out);
            }
            if (p.peek_punct("..")) {
                p.idx += 2;
                out.punct("..");
                if (peek_range_bound(p)) return parse_range_bound(p, out);
            }
            return {};
        }

        // Comma-separated pattern list inside the group at idx. The trailing
        // comma survives only for a one-element tuple.
        expected_void parse_pat_list(Parser& p, token_stream& out, delimiter d, bool keep_single_comma) {
            if (auto r = p.expect_open(d); !r) return r;
            out.open(d);

            size_t count = 0;
            bool trailing = false;
            while (!p.at_end()) {
                if (count) out.punct(',', spacing::alone);
                if (auto r = parse_pat_top(p, out); !r) return r;
                count++;
                trailing = false;
                if (p.at_end()) break;
                if (auto r = p.expect_punct(","); !r) return r;
                trailing = true;
            }
            if (keep_single_comma && count == 1 && trailing) out.punct(',', spacing::alone);

            if (auto r = p.expect_close(d); !r) return r;
            out.close(d);
            return {};
        }

        expected_void parse_binding(Parser& p, token_stream& out) {
            if (p.eat_keyword("ref")) out.ident("ref");
            if (p.eat_keyword("mut")) out.ident("mut");

            const token* t = p.peek();
            if (!t || !t->is_ident() || (is_reserved_keyword(t->text) && t->text != "self"))
                return std::unexpected(p.error_here("identifier"));
            out.ident(p.next().text);

            if (p.peek_punct("@")) {
                p.idx++;
                out.punct('@', spacing::alone);
                return parse_pat_single(p, out);
            }
            return {};
        }

        expected_void parse_struct_pat_fields(Parser& p, token_stream& out) {
            p.idx++;
            out.open(delimiter::brace);

            bool first = true;
            while (!p.at_end()) {
                if (!first) out.punct(',', spacing::alone);
                first = false;

                auto attrs = parse_outer_attrs(p);
                if (!attrs) return std::unexpected(attrs.error());
                for (const auto& a : *attrs) to_tokens(a, out);

                if (p.peek_punct("..")) {
                    p.idx += 2;
                    out.punct("..");
                    p.eat_punct(",");
                    break;
                }

                const token* t = p.peek();
                bool named = t && (t->is_literal() || (t->is_ident() && !is_reserved_keyword(t->text)));
                if (named && p.peek_colon(1)) {
                    if (t->is_literal()) out.literal(t->text);
                    else out.ident(t->text);
                    p.idx += 2;
                    out.punct(':', spacing::alone);
                    if (auto r = parse_pat_top(p, out); !r) return r;
                } else {
                    if (p.eat_keyword("box")) out.ident("box");
                    if (auto r = parse_binding(p, out); !r) return r;
                }

                if (p.at_end()) break;
                if (auto r = p.expect_punct(","); !r) return r;
            }

            if (auto r = p.expect_close(delimiter::brace); !r) return r;
            out.close(delimiter::brace);
            return {};
        }

        expected_void parse_path_pat(Parser& p, token_stream& out) {
            std::optional<QSelf> qself;
            auto path = parse_expr_path(p, qself);
            if (!path) return std::unexpected(path.error());

            const token* after = p.peek(1);
            if (!qself && p.peek_punct("!") && after && after->kind == token_kind::open) {
                p.idx++;
                auto mac = parse_macro_body(p, std::move(*path));
                if (!mac) return std::unexpected(mac.error());
                to_tokens(*mac, out);
                return {};
            }

            if (qself) to_tokens(*qself, *path, out);
            else to_tokens(*path, out);

            if (p.peek_open(delimiter::brace)) return parse_struct_pat_fields(p, out);
            if (p.peek_open(delimiter::parenthesis)) return parse_pat_list(p, out, delimiter::parenthesis, false);
            return parse_range_tail(p, out);
        }
    } // namespace

    expected_void parse_pat_top(Parser& p, token_stream& out) {
        if (p.peek_punct("|") && !p.peek_punct("||")) p.idx++;

        if (auto r = parse_pat_single(p, out); !r) return r;
        while (p.peek_punct("|") && !p.peek_punct("||") && !p.peek_punct("|=")) {
            p.idx++;
            out.punct('|', spacing::alone);
            if (auto r = parse_pat_single(p, out); !r) return r;
        }
        return {};
    }

    expected_void parse_pat_single(Parser& p, token_stream& out) {
        DepthGuard guard{ p };
        if (!guard.ok()) return std::unexpected(depth_error(p));

        const token* t = p.peek();
        if (!t || t->kind == token_kind::close) return std::unexpected(p.error_here("pattern"));

        if (t->is_ident("_")) {
            p.idx++;
            out.ident("_");
            return {};
        }
        if (t->is_ident("true") || t->is_ident("false")) {
            out.ident(p.next().text);
            return {};
        }
        if (p.peek_punct("&")) {
            p.idx++;
            out.punct('&', spacing::alone);
            if (p.eat_keyword("mut")) out.ident("mut");
            return parse_pat_single(p, out);
        }
        if (t->is_open(delimiter::parenthesis)) return parse_pat_list(p, out, delimiter::parenthesis, true);
        if (t->is_open(delimiter::bracket)) return parse_pat_list(p, out, delimiter::bracket, false);

        if (p.peek_punct("..=") || p.peek_punct("...")) {
            p.idx += 3;
            out.punct("..=");
            return parse_range_bound(p, out);
        }
        if (p.peek_punct("..")) {
            p.idx += 2;
            out.punct("..");
            if (peek_range_bound(p)) return parse_range_bound(p, out);
            return {};
        }

        if (t->is_literal() || p.peek_punct("-")) {
            if (auto r = parse_range_bound(p, out); !r) return r;
            return parse_range_tail(p, out);
        }

        if (t->is_ident("box")) {
            p.idx++;
            out.ident("box");
            return parse_pat_single(p, out);
        }
        if (t->is_ident("ref") || t->is_ident("mut")) return parse_binding(p, out);

        if (t->is_ident("const") && p.peek_open(delimiter::brace, 1)) {
            p.idx++;
            out.ident("const");
            auto block = parse_block(p);
            if (!block) return std::unexpected(block.error());
            to_tokens(*block, out);
            return {};
        }

        if (peek_path_start(p)) {
            // A lone identifier binds unless something makes it a path
            bool binding = t->is_ident() && !is_path_keyword(t->text)
                && !p.peek_punct("::", 1) && !p.peek_punct("!", 1)
                && !p.peek_open(delimiter::parenthesis, 1) && !p.peek_open(delimiter::brace, 1)
                && !p.peek_punct("..", 1);
            if (binding) return parse_binding(p, out);
            return parse_path_pat(p, out);
        }

        return std::unexpected(p.error_here("pattern"));
    }

} // namespace Stanza::detail
