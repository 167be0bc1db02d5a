#include "stanza/render.hpp"

#include "detail/parser.hpp"

#include <optional>
#include <utility>

namespace Stanza::detail {

    namespace {
        bool is_path_keyword(std::string_view w) {
            return w == "self" || w == "Self" || w == "super" || w == "crate";
        }

        bool peek_segment_ident(const Parser& p, size_t k = 0) {
            const token* t = p.peek(k);
            return t && t->is_ident() && (!is_reserved_keyword(t->text) || is_path_keyword(t->text));
        }

        // `+` continuing a bound list, not `+=`
        bool peek_plus(const Parser& p) {
            return p.peek_punct("+") && !p.peek_punct("+=");
        }

        expected_void parse_lifetime(Parser& p, token_stream& out) {
            if (!p.peek_lifetime()) return std::unexpected(p.error_here("lifetime"));
            p.idx++;
            out.lifetime(p.next().text);
            return {};
        }

        expected_void parse_bound(Parser& p, token_stream& out) {
            if (p.peek_lifetime()) return parse_lifetime(p, out);

            if (p.peek_open(delimiter::parenthesis)) {
                p.idx++;
                out.open(delimiter::parenthesis);
                if (auto r = parse_bound(p, out); !r) return r;
                if (auto r = p.expect_close(delimiter::parenthesis); !r) return r;
                out.close(delimiter::parenthesis);
                return {};
            }

            if (p.eat_punct("?")) out.punct('?', spacing::alone);
            if (p.peek_keyword("for")) {
                if (auto r = parse_bound_lifetimes(p, out); !r) return r;
            }

            auto path = parse_type_path(p);
            if (!path) return std::unexpected(path.error());
            to_tokens(*path, out);
            return {};
        }

        expected_void parse_bounds(Parser& p, token_stream& out, bool allow_plus) {
            if (auto r = parse_bound(p, out); !r) return r;
            while (allow_plus && peek_plus(p)) {
                p.idx++;
                out.punct('+', spacing::alone);
                if (auto r = parse_bound(p, out); !r) return r;
            }
            return {};
        }

        expected_void parse_return_type(Parser& p, token_stream& out) {
            if (!p.eat_punct("->")) return {};
            out.punct("->");
            return parse_type(p, out, false);
        }

        expected_void parse_bare_fn(Parser& p, token_stream& out) {
            if (p.eat_keyword("unsafe")) out.ident("unsafe");
            if (p.eat_keyword("extern")) {
                out.ident("extern");
                if (const token* abi = p.peek(); abi && abi->is_literal()) out.literal(p.next().text);
            }
            if (auto r = p.expect_keyword("fn"); !r) return r;
            out.ident("fn");

            if (auto r = p.expect_open(delimiter::parenthesis); !r) return r;
            out.open(delimiter::parenthesis);
            bool first = true;
            while (!p.at_end()) {
                if (!first) out.punct(',', spacing::alone);
                first = false;

                if (p.peek_punct("...")) {
                    p.idx += 3;
                    out.punct("...");
                } else {
                    const token* t = p.peek();
                    if (t && t->is_ident() && p.peek_colon(1) && (!is_reserved_keyword(t->text))) {
                        out.ident(t->text);
                        out.punct(':', spacing::alone);
                        p.idx += 2;
                    }
                    if (auto r = parse_type(p, out, true); !r) return r;
                }

                if (p.at_end()) break;
                if (auto r = p.expect_punct(","); !r) return r;
            }
            if (auto r = p.expect_close(delimiter::parenthesis); !r) return r;
            out.close(delimiter::parenthesis);

            return parse_return_type(p, out);
        }

        // `(A, B) -> C` after `Fn`, `FnMut` and friends
        expected_void parse_fn_sugar(Parser& p, token_stream& out) {
            p.idx++;
            out.open(delimiter::parenthesis);
            bool first = true;
            while (!p.at_end()) {
                if (!first) out.punct(',', spacing::alone);
                first = false;
                if (auto r = parse_type(p, out, true); !r) return r;
                if (p.at_end()) break;
                if (auto r = p.expect_punct(","); !r) return r;
            }
            if (auto r = p.expect_close(delimiter::parenthesis); !r) return r;
            out.close(delimiter::parenthesis);
            return parse_return_type(p, out);
        }

        expected_void parse_generic_arg(Parser& p, token_stream& out) {
            if (p.peek_lifetime()) return parse_lifetime(p, out);

            const token* t = p.peek();
            if (!t) return std::unexpected(p.error_here("generic argument"));

            if (t->is_literal()) {
                out.literal(p.next().text);
                return {};
            }
            if (p.peek_punct("-") && p.peek(1) && p.peek(1)->is_literal()) {
                p.idx++;
                out.punct('-', spacing::alone);
                out.literal(p.next().text);
                return {};
            }
            if (t->is_open(delimiter::brace)) {
                auto block = parse_block(p);
                if (!block) return std::unexpected(block.error());
                to_tokens(*block, out);
                return {};
            }

            if (t->is_ident() && !is_reserved_keyword(t->text)) {
                // `Item = T` binds an associated type, `Item: Bound` constrains it
                if (p.peek_eq(1)) {
                    out.ident(t->text);
                    out.punct('=', spacing::alone);
                    p.idx += 2;
                    return parse_type(p, out, true);
                }
                if (p.peek_colon(1)) {
                    out.ident(t->text);
                    out.punct(':', spacing::alone);
                    p.idx += 2;
                    return parse_bounds(p, out, true);
                }
            }
            return parse_type(p, out, true);
        }

        // Segments after a qualified self or a leading `::`. Type paths take
        // generic arguments without `::`, expression paths only with it.
        expected_void parse_segments(Parser& p, Path& path, bool type_style) {
            while (true) {
                if (!peek_segment_ident(p)) return std::unexpected(p.error_here("path segment"));
                PathSegment seg{ p.next().text, {} };

                if (type_style && p.peek_punct("<") && !p.peek_punct("<=") && !p.peek_punct("<-")) {
                    if (auto r = parse_generic_args(p, seg.arguments); !r) return r;
                } else if (p.peek_punct("::") && p.peek_punct("<", 2)) {
                    p.idx += 2;
                    seg.arguments.punct("::");
                    if (auto r = parse_generic_args(p, seg.arguments); !r) return r;
                } else if (type_style && p.peek_open(delimiter::parenthesis)) {
                    if (auto r = parse_fn_sugar(p, seg.arguments); !r) return r;
                }
                path.segments.push_back(std::move(seg));

                if (p.peek_punct("::") && peek_segment_ident(p, 2)) {
                    p.idx += 2;
                    continue;
                }
                return {};
            }
        }

        // `<T>::rest` or `<T as Trait>::rest`, cursor on `<`
        expected_t<Path> parse_qpath(Parser& p, std::optional<QSelf>& qself, bool type_style) {
            p.idx++;
            QSelf q;
            if (auto r = parse_type(p, q.ty.tokens, true); !r) return std::unexpected(r.error());

            Path path;
            if (p.eat_keyword("as")) {
                auto trait = parse_type_path(p);
                if (!trait) return trait;
                path = std::move(*trait);
                q.position = path.segments.size();
            } else {
                path.leading_colon = true;
            }

            if (auto r = p.expect_punct(">"); !r) return std::unexpected(r.error());
            if (auto r = p.expect_punct("::"); !r) return std::unexpected(r.error());
            if (auto r = parse_segments(p, path, type_style); !r) return std::unexpected(r.error());

            qself = std::move(q);
            return path;
        }

        expected_void parse_tuple_type(Parser& p, token_stream& out) {
            p.idx++;
            out.open(delimiter::parenthesis);

            size_t count = 0;
            bool trailing = false;
            while (!p.at_end()) {
                if (count) out.punct(',', spacing::alone);
                if (auto r = parse_type(p, out, true); !r) return r;
                count++;
                trailing = false;
                if (p.at_end()) break;
                if (auto r = p.expect_punct(","); !r) return r;
                trailing = true;
            }
            if (count == 1 && trailing) out.punct(',', spacing::alone);

            if (auto r = p.expect_close(delimiter::parenthesis); !r) return r;
            out.close(delimiter::parenthesis);
            return {};
        }

        expected_void parse_array_type(Parser& p, token_stream& out) {
            p.idx++;
            out.open(delimiter::bracket);
            if (auto r = parse_type(p, out, true); !r) return r;
            if (p.eat_punct(";")) {
                out.punct(';', spacing::alone);
                auto len = parse_expr(p, true);
                if (!len) return std::unexpected(len.error());
                to_tokens(**len, out);
            }
            if (auto r = p.expect_close(delimiter::bracket); !r) return r;
            out.close(delimiter::bracket);
            return {};
        }

        expected_void parse_path_type(Parser& p, token_stream& out, bool allow_plus) {
            if (p.peek_punct("<")) {
                std::optional<QSelf> qself;
                auto path = parse_qpath(p, qself, true);
                if (!path) return std::unexpected(path.error());
                to_tokens(*qself, *path, out);
                return {};
            }

            auto path = parse_type_path(p);
            if (!path) return std::unexpected(path.error());

            const token* after = p.peek(1);
            if (p.peek_punct("!") && !p.peek_punct("!=") && after && after->kind == token_kind::open) {
                p.idx++;
                auto mac = parse_macro_body(p, std::move(*path));
                if (!mac) return std::unexpected(mac.error());
                to_tokens(*mac, out);
                return {};
            }

            to_tokens(*path, out);

            // Bare trait object `Trait + Send`
            while (allow_plus && peek_plus(p)) {
                p.idx++;
                out.punct('+', spacing::alone);
                if (auto r = parse_bound(p, out); !r) return r;
            }
            return {};
        }
    } // namespace

    expected_void parse_type(Parser& p, token_stream& out, bool allow_plus) {
        DepthGuard guard{ p };
        if (!guard.ok()) return std::unexpected(depth_error(p));

        const token* t = p.peek();
        if (!t || t->kind == token_kind::close) return std::unexpected(p.error_here("type"));

        if (t->is_open(delimiter::parenthesis)) return parse_tuple_type(p, out);
        if (t->is_open(delimiter::bracket)) return parse_array_type(p, out);

        if (p.peek_punct("!")) {
            p.idx++;
            out.punct('!', spacing::alone);
            return {};
        }
        if (t->is_ident("_")) {
            p.idx++;
            out.ident("_");
            return {};
        }
        if (p.peek_punct("&")) {
            p.idx++;
            out.punct('&', spacing::alone);
            if (p.peek_lifetime()) {
                if (auto r = parse_lifetime(p, out); !r) return r;
            }
            if (p.eat_keyword("mut")) out.ident("mut");
            return parse_type(p, out, false);
        }
        if (p.peek_punct("*")) {
            p.idx++;
            out.punct('*', spacing::alone);
            if (p.eat_keyword("const")) out.ident("const");
            else if (p.eat_keyword("mut")) out.ident("mut");
            else return std::unexpected(p.error_here("`const` or `mut`"));
            return parse_type(p, out, false);
        }

        if (t->is_ident("impl") || t->is_ident("dyn")) {
            out.ident(p.next().text);
            return parse_bounds(p, out, allow_plus);
        }
        if (t->is_ident("for")) {
            if (auto r = parse_bound_lifetimes(p, out); !r) return r;
            if (p.peek_keyword("fn") || p.peek_keyword("unsafe") || p.peek_keyword("extern")) return parse_bare_fn(p, out);
            return parse_bounds(p, out, allow_plus);
        }
        if (t->is_ident("fn") || t->is_ident("unsafe") || t->is_ident("extern")) return parse_bare_fn(p, out);

        if (p.peek_punct("?")) return parse_bounds(p, out, allow_plus);
        if (p.peek_punct("::") || p.peek_punct("<") || peek_segment_ident(p)) return parse_path_type(p, out, allow_plus);

        return std::unexpected(p.error_here("type"));
    }

    expected_t<Path> parse_type_path(Parser& p) {
        Path path;
        if (p.eat_punct("::")) path.leading_colon = true;
        if (auto r = parse_segments(p, path, true); !r) return std::unexpected(r.error());
        return path;
    }

    expected_t<Path> parse_expr_path(Parser& p, std::optional<QSelf>& qself) {
        if (p.peek_punct("<")) return parse_qpath(p, qself, false);

        Path path;
        if (p.eat_punct("::")) path.leading_colon = true;
        if (auto r = parse_segments(p, path, false); !r) return std::unexpected(r.error());
        return path;
    }

    expected_void parse_generic_args(Parser& p, token_stream& out) {
        if (auto r = p.expect_punct("<"); !r) return r;
        out.punct('<', spacing::alone);

        bool first = true;
        while (!p.peek_punct(">")) {
            if (p.at_end()) return std::unexpected(p.error_here("`>`"));
            if (!first) out.punct(',', spacing::alone);
            first = false;
            if (auto r = parse_generic_arg(p, out); !r) return r;
            if (p.peek_punct(">")) break;
            if (auto r = p.expect_punct(","); !r) return r;
        }
        p.idx++;
        out.punct('>', spacing::alone);
        return {};
    }

    expected_void parse_bound_lifetimes(Parser& p, token_stream& out) {
        if (auto r = p.expect_keyword("for"); !r) return r;
        out.ident("for");
        if (auto r = p.expect_punct("<"); !r) return r;
        out.punct('<', spacing::alone);

        bool first = true;
        while (!p.peek_punct(">")) {
            if (!first) out.punct(',', spacing::alone);
            first = false;
            if (auto r = parse_lifetime(p, out); !r) return r;
            if (p.peek_colon()) {
                p.idx++;
                out.punct(':', spacing::alone);
                if (auto r = parse_lifetime(p, out); !r) return r;
                while (peek_plus(p)) {
                    p.idx++;
                    out.punct('+', spacing::alone);
                    if (auto r = parse_lifetime(p, out); !r) return r;
                }
            }
            if (p.peek_punct(">")) break;
            if (auto r = p.expect_punct(","); !r) return r;
        }
        p.idx++;
        out.punct('>', spacing::alone);
        return {};
    }

} // namespace Stanza::detail
