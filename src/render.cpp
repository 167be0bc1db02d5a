#include "stanza/render.hpp"
#include "stanza/convert.hpp"

#include "detail/parser.hpp"

#include <string>
#include <variant>

namespace Stanza {

    namespace {

        template<class... Ts>
        struct overloaded : Ts... { using Ts::operator()...; };

        void outer_attrs(const Attributes& attrs, token_stream& out) {
            for (const auto& a : attrs) {
                if (!a.inner) to_tokens(a, out);
            }
        }

        void inner_attrs(const Attributes& attrs, token_stream& out) {
            for (const auto& a : attrs) {
                if (a.inner) to_tokens(a, out);
            }
        }

        void label(const std::optional<Label>& l, token_stream& out) {
            if (!l) return;
            out.lifetime(l->name);
            out.punct(':', spacing::alone);
        }

        void opt_label(const std::optional<Label>& l, token_stream& out) {
            if (l) out.lifetime(l->name);
        }

        void opt_expr(const ExprPtr& e, token_stream& out) {
            if (e) to_tokens(*e, out);
        }

        void comma_separated(const std::vector<ExprPtr>& items, token_stream& out) {
            for (size_t i = 0; i < items.size(); i++) {
                if (i) out.punct(',', spacing::alone);
                to_tokens(*items[i], out);
            }
        }

        void member(const Member& m, token_stream& out) {
            if (const auto* name = std::get_if<std::string>(&m)) out.ident(*name);
            else out.literal(std::to_string(std::get<std::uint32_t>(m)));
        }

        void segment(const PathSegment& s, token_stream& out) {
            out.ident(s.ident);
            out.append(s.arguments);
        }

        struct ExprPrinter {
            token_stream& out;
            const Attributes& attrs; ///< Of the expression being printed

            void operator()(const ExprArray& e) {
                out.open(delimiter::bracket);
                comma_separated(e.elems, out);
                out.close(delimiter::bracket);
            }

            void operator()(const ExprAssign& e) {
                to_tokens(*e.left, out);
                out.punct('=', spacing::alone);
                to_tokens(*e.right, out);
            }

            void operator()(const ExprAsync& e) {
                out.ident("async");
                if (e.capture) out.ident("move");
                to_tokens(e.block, out);
            }

            void operator()(const ExprAwait& e) {
                to_tokens(*e.base, out);
                out.punct('.', spacing::alone);
                out.ident("await");
            }

            void operator()(const ExprBinary& e) {
                to_tokens(*e.left, out);
                out.punct(binop_symbol(e.op).value_or(e.spelling));
                to_tokens(*e.right, out);
            }

            void operator()(const ExprBlock& e) {
                label(e.label, out);
                to_tokens(e.block, out);
            }

            void operator()(const ExprBreak& e) {
                out.ident("break");
                opt_label(e.label, out);
                opt_expr(e.expr, out);
            }

            void operator()(const ExprCall& e) {
                to_tokens(*e.func, out);
                out.open(delimiter::parenthesis);
                comma_separated(e.args, out);
                out.close(delimiter::parenthesis);
            }

            void operator()(const ExprCast& e) {
                to_tokens(*e.expr, out);
                out.ident("as");
                to_tokens(e.ty, out);
            }

            void operator()(const ExprClosure& e) {
                if (e.lifetimes) out.append(*e.lifetimes);
                if (e.constness) out.ident("const");
                if (e.movability) out.ident("static");
                if (e.asyncness) out.ident("async");
                if (e.capture) out.ident("move");
                if (e.inputs.empty()) {
                    out.punct("||");
                } else {
                    out.punct('|', spacing::alone);
                    for (size_t i = 0; i < e.inputs.size(); i++) {
                        if (i) out.punct(',', spacing::alone);
                        to_tokens(e.inputs[i], out);
                    }
                    out.punct('|', spacing::alone);
                }
                if (e.output) {
                    out.punct("->");
                    to_tokens(*e.output, out);
                }
                to_tokens(*e.body, out);
            }

            void operator()(const ExprConst& e) {
                out.ident("const");
                to_tokens(e.block, out);
            }

            void operator()(const ExprContinue& e) {
                out.ident("continue");
                opt_label(e.label, out);
            }

            void operator()(const ExprField& e) {
                to_tokens(*e.base, out);
                out.punct('.', spacing::alone);
                member(e.member, out);
            }

            void operator()(const ExprForLoop& e) {
                label(e.label, out);
                out.ident("for");
                to_tokens(e.pat, out);
                out.ident("in");
                to_tokens(*e.expr, out);
                to_tokens(e.body, out);
            }

            void operator()(const ExprGroup& e) {
                out.open(delimiter::none);
                to_tokens(*e.expr, out);
                out.close(delimiter::none);
            }

            void operator()(const ExprIf& e) {
                out.ident("if");
                to_tokens(*e.cond, out);
                to_tokens(e.then_branch, out);
                if (e.else_branch) {
                    out.ident("else");
                    to_tokens(*e.else_branch, out);
                }
            }

            void operator()(const ExprIndex& e) {
                to_tokens(*e.expr, out);
                out.open(delimiter::bracket);
                to_tokens(*e.index, out);
                out.close(delimiter::bracket);
            }

            void operator()(const ExprInfer&) { out.ident("_"); }

            void operator()(const ExprLet& e) {
                out.ident("let");
                to_tokens(e.pat, out);
                out.punct('=', spacing::alone);
                to_tokens(*e.expr, out);
            }

            void operator()(const ExprLit& e) { to_tokens(e.lit, out); }

            void operator()(const ExprLoop& e) {
                label(e.label, out);
                out.ident("loop");
                to_tokens(e.body, out);
            }

            void operator()(const ExprMacro& e) { to_tokens(e.mac, out); }

            void operator()(const ExprMatch& e) {
                out.ident("match");
                to_tokens(*e.expr, out);
                out.open(delimiter::brace);
                inner_attrs(attrs, out);
                for (size_t i = 0; i < e.arms.size(); i++) {
                    const Arm& arm = e.arms[i];
                    outer_attrs(arm.attrs, out);
                    to_tokens(arm.pat, out);
                    if (arm.guard) {
                        out.ident("if");
                        to_tokens(*arm.guard, out);
                    }
                    out.punct("=>");
                    to_tokens(*arm.body, out);
                    bool last = i + 1 == e.arms.size();
                    if (arm.comma || (!last && detail::requires_terminator(*arm.body))) out.punct(',', spacing::alone);
                }
                out.close(delimiter::brace);
            }

            void operator()(const ExprMethodCall& e) {
                to_tokens(*e.receiver, out);
                out.punct('.', spacing::alone);
                out.ident(e.method);
                if (e.turbofish) out.append(*e.turbofish);
                out.open(delimiter::parenthesis);
                comma_separated(e.args, out);
                out.close(delimiter::parenthesis);
            }

            void operator()(const ExprParen& e) {
                out.open(delimiter::parenthesis);
                to_tokens(*e.expr, out);
                out.close(delimiter::parenthesis);
            }

            void operator()(const ExprPath& e) {
                if (e.qself) to_tokens(*e.qself, e.path, out);
                else to_tokens(e.path, out);
            }

            void operator()(const ExprRange& e) {
                opt_expr(e.start, out);
                out.punct(e.limits == RangeLimits::closed ? "..=" : "..");
                opt_expr(e.end, out);
            }

            void operator()(const ExprRawAddr& e) {
                out.punct('&', spacing::alone);
                out.ident("raw");
                out.ident(e.mutability ? "mut" : "const");
                to_tokens(*e.expr, out);
            }

            void operator()(const ExprReference& e) {
                out.punct('&', spacing::alone);
                if (e.mutability) out.ident("mut");
                to_tokens(*e.expr, out);
            }

            void operator()(const ExprRepeat& e) {
                out.open(delimiter::bracket);
                to_tokens(*e.expr, out);
                out.punct(';', spacing::alone);
                to_tokens(*e.len, out);
                out.close(delimiter::bracket);
            }

            void operator()(const ExprReturn& e) {
                out.ident("return");
                opt_expr(e.expr, out);
            }

            void operator()(const ExprStruct& e) {
                if (e.qself) to_tokens(*e.qself, e.path, out);
                else to_tokens(e.path, out);
                out.open(delimiter::brace);
                for (size_t i = 0; i < e.fields.size(); i++) {
                    const FieldValue& f = e.fields[i];
                    if (i) out.punct(',', spacing::alone);
                    outer_attrs(f.attrs, out);
                    member(f.member, out);
                    if (f.colon_token) {
                        out.punct(':', spacing::alone);
                        to_tokens(*f.expr, out);
                    }
                }
                if (e.dot2_token) {
                    if (!e.fields.empty()) out.punct(',', spacing::alone);
                    out.punct("..");
                    opt_expr(e.rest, out);
                }
                out.close(delimiter::brace);
            }

            void operator()(const ExprTry& e) {
                to_tokens(*e.expr, out);
                out.punct('?', spacing::alone);
            }

            void operator()(const ExprTryBlock& e) {
                out.ident("try");
                to_tokens(e.block, out);
            }

            void operator()(const ExprTuple& e) {
                out.open(delimiter::parenthesis);
                comma_separated(e.elems, out);
                if (e.elems.size() == 1) out.punct(',', spacing::alone);
                out.close(delimiter::parenthesis);
            }

            void operator()(const ExprUnary& e) {
                out.punct(unop_symbol(e.op).value_or(e.spelling));
                to_tokens(*e.expr, out);
            }

            void operator()(const ExprUnsafe& e) {
                out.ident("unsafe");
                to_tokens(e.block, out);
            }

            void operator()(const ExprVerbatim& e) { out.append(e.tokens); }

            void operator()(const ExprWhile& e) {
                label(e.label, out);
                out.ident("while");
                to_tokens(*e.cond, out);
                to_tokens(e.body, out);
            }

            void operator()(const ExprYield& e) {
                out.ident("yield");
                opt_expr(e.expr, out);
            }

            void operator()(const ExprExtension& e) { out.append(e.tokens); }
        };

    } // namespace

    void to_tokens(const Expr& e, token_stream& out) {
        outer_attrs(e.attrs, out);
        std::visit(ExprPrinter{ out, e.attrs }, e.node);
    }

    void to_tokens(const Block& block, token_stream& out) {
        out.open(delimiter::brace);
        inner_attrs(block.inner_attrs, out);
        for (const auto& stmt : block.stmts) to_tokens(stmt, out);
        out.close(delimiter::brace);
    }

    void to_tokens(const Stmt& stmt, token_stream& out) {
        std::visit(overloaded{
            [&](const StmtLocal& s) {
                outer_attrs(s.attrs, out);
                out.ident("let");
                to_tokens(s.pat, out);
                if (s.init) {
                    out.punct('=', spacing::alone);
                    to_tokens(*s.init, out);
                    if (s.diverge) {
                        out.ident("else");
                        to_tokens(*s.diverge, out);
                    }
                }
                out.punct(';', spacing::alone);
            },
            [&](const StmtItem& s) { out.append(s.tokens); },
            [&](const StmtExpr& s) {
                to_tokens(*s.expr, out);
                if (s.semi) out.punct(';', spacing::alone);
            },
            [&](const StmtEmpty&) { out.punct(';', spacing::alone); },
        }, stmt);
    }

    void to_tokens(const Lit& lit, token_stream& out) {
        std::visit(overloaded{
            [&](const LitBool& l) { out.ident(l.value ? "true" : "false"); },
            [&](const LitExtension& l) { out.append(l.tokens); },
            [&](const auto& l) { out.literal(l.repr); },
        }, lit);
    }

    void to_tokens(const Attribute& attr, token_stream& out) {
        out.punct(attr.inner ? "#!" : "#");
        out.open(delimiter::bracket);
        out.append(attr.meta);
        out.close(delimiter::bracket);
    }

    void to_tokens(const Macro& mac, token_stream& out) {
        to_tokens(mac.path, out);
        out.punct('!', spacing::alone);
        out.open(mac.delim);
        out.append(mac.tokens);
        out.close(mac.delim);
    }

    void to_tokens(const Path& path, token_stream& out) {
        if (path.leading_colon) out.punct("::");
        for (size_t i = 0; i < path.segments.size(); i++) {
            if (i) out.punct("::");
            segment(path.segments[i], out);
        }
    }

    void to_tokens(const QSelf& qself, const Path& path, token_stream& out) {
        out.punct('<', spacing::alone);
        to_tokens(qself.ty, out);

        size_t pos = qself.position;
        if (pos > 0) {
            out.ident("as");
            if (path.leading_colon) out.punct("::");
            for (size_t i = 0; i < pos && i < path.segments.size(); i++) {
                if (i) out.punct("::");
                segment(path.segments[i], out);
            }
        }
        out.punct('>', spacing::alone);

        for (size_t i = pos; i < path.segments.size(); i++) {
            out.punct("::");
            segment(path.segments[i], out);
        }
    }

    void to_tokens(const Pat& pat, token_stream& out) { out.append(pat.tokens); }

    void to_tokens(const Type& ty, token_stream& out) { out.append(ty.tokens); }

} // namespace Stanza
