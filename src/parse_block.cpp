#include "detail/parser.hpp"

#include <memory>
#include <optional>
#include <utility>

namespace Stanza::detail {

    namespace {
        enum class item_end : uint8_t {
            semi,  ///< Runs to the next `;`
            brace, ///< Runs to the next `;` or through the first `{ ... }`
        };

        // Decides whether the statement at idx declares an item. Attributes
        // have already been stepped over.
        std::optional<item_end> peek_item(const Parser& p) {
            size_t k = 0;
            if (p.peek_keyword("pub")) k = p.peek_open(delimiter::parenthesis, 1) ? 2 : 1;

            auto kw = [&](std::string_view w, size_t off = 0) { return p.peek_keyword(w, k + off); };
            auto ident_at = [&](size_t off) {
                const token* t = p.peek(k + off);
                return t && t->is_ident() && !is_reserved_keyword(t->text);
            };

            if (kw("use")) return item_end::semi;
            if (kw("type") && ident_at(1)) return item_end::semi;
            if (kw("extern")) return kw("crate", 1) ? item_end::semi : item_end::brace;
            if (kw("static") && (ident_at(1) || kw("mut", 1))) return item_end::semi;
            if (kw("const")) {
                if (ident_at(1)) return item_end::semi;
                if (kw("fn", 1) || kw("unsafe", 1) || kw("extern", 1) || (kw("async", 1) && kw("fn", 2)))
                    return item_end::brace;
            }
            if (kw("fn") || kw("struct") || kw("enum") || kw("trait") || kw("impl") || kw("mod"))
                return item_end::brace;
            if (kw("macro_rules") && p.peek_punct("!", k + 1)) return item_end::brace;
            if (kw("union") && ident_at(1)) return item_end::brace;
            if (kw("unsafe") && (kw("fn", 1) || kw("impl", 1) || kw("trait", 1) || kw("extern", 1) || kw("mod", 1)))
                return item_end::brace;
            if (kw("async") && (kw("fn", 1) || (kw("unsafe", 1) && kw("fn", 2)))) return item_end::brace;

            if (k > 0) return item_end::brace;
            return std::nullopt;
        }

        expected_void skip_item(Parser& p, item_end end) {
            while (!p.at_end()) {
                if (p.peek_punct(";")) {
                    p.idx++;
                    return {};
                }
                if (end == item_end::brace && p.peek_open(delimiter::brace)) {
                    p.skip_tree();
                    return {};
                }
                p.skip_tree();
            }
            return std::unexpected(p.error_here(end == item_end::semi ? "`;`" : "`;` or `{`"));
        }

        expected_t<Stmt> parse_local(Parser& p, Attributes attrs) {
            p.idx++;
            StmtLocal local;
            local.attrs = std::move(attrs);

            if (auto r = parse_pat_top(p, local.pat.tokens); !r) return std::unexpected(r.error());
            if (p.peek_colon()) {
                p.idx++;
                local.pat.tokens.punct(":");
                if (auto r = parse_type(p, local.pat.tokens, true); !r) return std::unexpected(r.error());
            }

            if (p.peek_eq()) {
                p.idx++;
                auto init = parse_expr(p, true);
                if (!init) return std::unexpected(init.error());
                local.init = std::move(*init);

                if (p.eat_keyword("else")) {
                    auto diverge = parse_block(p);
                    if (!diverge) return std::unexpected(diverge.error());
                    local.diverge = std::make_unique<Block>(std::move(*diverge));
                }
            }

            if (auto r = p.expect_punct(";"); !r) return std::unexpected(r.error());
            return Stmt{ std::move(local) };
        }

        expected_t<Stmt> parse_stmt(Parser& p) {
            size_t start = p.idx;
            auto attrs = parse_outer_attrs(p);
            if (!attrs) return std::unexpected(attrs.error());

            if (p.peek_keyword("let")) return parse_local(p, std::move(*attrs));

            if (auto end = peek_item(p)) {
                if (auto r = skip_item(p, *end); !r) return std::unexpected(r.error());
                return Stmt{ StmtItem{ p.slice(start, p.idx) } };
            }

            p.idx = start;
            auto expr = parse_expr_early(p);
            if (!expr) return std::unexpected(expr.error());

            StmtExpr stmt{ std::move(*expr), false };
            if (p.eat_punct(";")) stmt.semi = true;
            else if (!p.at_end() && requires_terminator(*stmt.expr))
                return std::unexpected(p.error_here("`;`"));
            return Stmt{ std::move(stmt) };
        }
    } // namespace

    expected_t<Block> parse_block(Parser& p) {
        if (auto r = p.expect_open(delimiter::brace); !r) return std::unexpected(r.error());

        Block block;
        auto inner = parse_inner_attrs(p);
        if (!inner) return std::unexpected(inner.error());
        block.inner_attrs = std::move(*inner);

        while (!p.at_end()) {
            if (p.eat_punct(";")) {
                block.stmts.emplace_back(StmtEmpty{});
                continue;
            }
            auto stmt = parse_stmt(p);
            if (!stmt) return std::unexpected(stmt.error());
            block.stmts.push_back(std::move(*stmt));
        }

        if (auto r = p.expect_close(delimiter::brace); !r) return std::unexpected(r.error());
        return block;
    }

} // namespace Stanza::detail
