#include "detail/literal.hpp"
#include "detail/parser.hpp"

#include <charconv>
#include <iterator>
#include <optional>
#include <utility>

namespace Stanza::detail {

    namespace {
        // Binding power, lowest first. Mirrors the order the grammar
        // resolves operators in.
        enum class Precedence : uint8_t {
            Any,
            Assign,
            Range,
            Or,
            And,
            Compare,
            BitOr,
            BitXor,
            BitAnd,
            Shift,
            Sum,
            Product,
            Cast,
        };

        struct binop_entry {
            std::string_view text;
            BinOp op;
        };

        // Longest spellings first so `<<=` wins over `<<` and `<`
        constexpr binop_entry binop_table[] = {
            { "<<=", BinOp::shl_assign }, { ">>=", BinOp::shr_assign },
            { "&&", BinOp::logical_and }, { "||", BinOp::logical_or },
            { "<<", BinOp::shl }, { ">>", BinOp::shr },
            { "==", BinOp::eq }, { "<=", BinOp::le }, { "!=", BinOp::ne }, { ">=", BinOp::ge },
            { "+=", BinOp::add_assign }, { "-=", BinOp::sub_assign }, { "*=", BinOp::mul_assign },
            { "/=", BinOp::div_assign }, { "%=", BinOp::rem_assign }, { "^=", BinOp::bit_xor_assign },
            { "&=", BinOp::bit_and_assign }, { "|=", BinOp::bit_or_assign },
            { "+", BinOp::add }, { "-", BinOp::sub }, { "*", BinOp::mul }, { "/", BinOp::div },
            { "%", BinOp::rem }, { "^", BinOp::bit_xor }, { "&", BinOp::bit_and }, { "|", BinOp::bit_or },
            { "<", BinOp::lt }, { ">", BinOp::gt },
        };

        std::optional<binop_entry> peek_binop(const Parser& p) {
            for (const auto& e : binop_table) {
                if (p.peek_punct(e.text)) return e;
            }
            return std::nullopt;
        }

        Precedence precedence_of(BinOp op) {
            switch (op) {
            case BinOp::add: case BinOp::sub: return Precedence::Sum;
            case BinOp::mul: case BinOp::div: case BinOp::rem: return Precedence::Product;
            case BinOp::logical_and: return Precedence::And;
            case BinOp::logical_or: return Precedence::Or;
            case BinOp::bit_xor: return Precedence::BitXor;
            case BinOp::bit_and: return Precedence::BitAnd;
            case BinOp::bit_or: return Precedence::BitOr;
            case BinOp::shl: case BinOp::shr: return Precedence::Shift;
            case BinOp::eq: case BinOp::lt: case BinOp::le:
            case BinOp::ne: case BinOp::ge: case BinOp::gt:
                return Precedence::Compare;
            default:
                return Precedence::Assign;
            }
        }

        struct range_match {
            RangeLimits limits;
            size_t len;
        };

        std::optional<range_match> peek_range_limits(const Parser& p) {
            if (p.peek_punct("..=") || p.peek_punct("...")) return range_match{ RangeLimits::closed, 3 };
            if (p.peek_punct("..")) return range_match{ RangeLimits::half_open, 2 };
            return std::nullopt;
        }

        Precedence peek_precedence(const Parser& p) {
            if (auto b = peek_binop(p)) return precedence_of(b->op);
            if (p.peek_eq()) return Precedence::Assign;
            if (peek_range_limits(p)) return Precedence::Range;
            if (p.peek_keyword("as")) return Precedence::Cast;
            return Precedence::Any;
        }

        // Whether a range has no end expression at this point
        bool range_end_absent(const Parser& p, bool allow_struct) {
            return p.at_end()
                || p.peek_punct(",")
                || p.peek_punct(";")
                || p.peek_punct("=>")
                || p.peek_punct("?")
                || (p.peek_punct(".") && !p.peek_punct(".."))
                || (!allow_struct && p.peek_open(delimiter::brace));
        }

        bool is_path_start_keyword(std::string_view w) {
            return w == "self" || w == "Self" || w == "super" || w == "crate";
        }

        expected_t<ExprPtr> parse_unary(Parser& p, bool allow_struct);
        expected_t<ExprPtr> parse_atom(Parser& p, bool allow_struct);
        expected_t<ExprPtr> parse_postfix(Parser& p, ExprPtr e);
        expected_t<ExprPtr> parse_expr_prec(Parser& p, ExprPtr lhs, bool allow_struct, Precedence base);

        expected_t<ExprPtr> parse_binop_rhs(Parser& p, bool allow_struct, Precedence prec) {
            auto rhs = parse_unary(p, allow_struct);
            if (!rhs) return rhs;

            while (true) {
                Precedence next = peek_precedence(p);
                if (next > prec || (next == prec && prec == Precedence::Assign)) {
                    rhs = parse_expr_prec(p, std::move(*rhs), allow_struct, next);
                    if (!rhs) return rhs;
                } else break;
            }
            return rhs;
        }

        // End operand of a range whose `..`/`..=` was just consumed; null when
        // a half-open range has none. A closed range always needs one.
        expected_t<ExprPtr> parse_range_end(Parser& p, RangeLimits limits, bool allow_struct) {
            if (range_end_absent(p, allow_struct)) {
                if (limits == RangeLimits::closed) return std::unexpected(p.error_here("expression after `..=`"));
                return ExprPtr{};
            }
            return parse_binop_rhs(p, allow_struct, Precedence::Range);
        }

        expected_t<ExprPtr> parse_expr_prec(Parser& p, ExprPtr lhs, bool allow_struct, Precedence base) {
            ChainGuard chain{ p };
            while (true) {
                if (auto b = peek_binop(p)) {
                    Precedence prec = precedence_of(b->op);
                    if (prec < base) break;
                    if (prec == Precedence::Assign && lhs->is<ExprRange>()) break;
                    if (prec == Precedence::Compare) {
                        if (auto prev = lhs->get_if<ExprBinary>(); prev && precedence_of(prev->op) == Precedence::Compare)
                            return std::unexpected(p.error_at_token(ParseError::code::unexpected_token, "comparison operators cannot be chained"));
                    }
                    if (!chain.push()) return std::unexpected(depth_error(p));
                    p.idx += b->text.size();
                    auto rhs = parse_binop_rhs(p, allow_struct, prec);
                    if (!rhs) return rhs;
                    lhs = make_expr(ExprBinary{ std::move(lhs), b->op, std::move(*rhs), std::string(b->text) });
                } else if (Precedence::Assign >= base && p.peek_eq()) {
                    if (lhs->is<ExprRange>()) break;
                    if (!chain.push()) return std::unexpected(depth_error(p));
                    p.idx++;
                    auto rhs = parse_binop_rhs(p, allow_struct, Precedence::Assign);
                    if (!rhs) return rhs;
                    lhs = make_expr(ExprAssign{ std::move(lhs), std::move(*rhs) });
                } else if (auto r = peek_range_limits(p); r && Precedence::Range >= base) {
                    if (!chain.push()) return std::unexpected(depth_error(p));
                    p.idx += r->len;
                    auto end = parse_range_end(p, r->limits, allow_struct);
                    if (!end) return end;
                    lhs = make_expr(ExprRange{ std::move(lhs), r->limits, std::move(*end) });
                } else if (Precedence::Cast >= base && p.peek_keyword("as")) {
                    if (!chain.push()) return std::unexpected(depth_error(p));
                    p.idx++;
                    Type ty;
                    if (auto t = parse_type(p, ty.tokens, false); !t) return std::unexpected(t.error());
                    lhs = make_expr(ExprCast{ std::move(lhs), std::move(ty) });
                } else break;
            }
            return lhs;
        }

        expected_t<std::vector<ExprPtr>> parse_delimited_exprs(Parser& p, delimiter d) {
            if (auto r = p.expect_open(d); !r) return std::unexpected(r.error());
            std::vector<ExprPtr> items;
            while (!p.at_end()) {
                auto e = parse_expr(p, true);
                if (!e) return std::unexpected(e.error());
                items.push_back(std::move(*e));
                if (p.at_end()) break;
                if (auto r = p.expect_punct(","); !r) return std::unexpected(r.error());
            }
            if (auto r = p.expect_close(d); !r) return std::unexpected(r.error());
            return items;
        }

        void prepend_attrs(Expr& e, Attributes attrs) {
            if (attrs.empty()) return;
            attrs.insert(attrs.end(), std::make_move_iterator(e.attrs.begin()), std::make_move_iterator(e.attrs.end()));
            e.attrs = std::move(attrs);
        }

        expected_t<ExprPtr> parse_trailer(Parser& p, Attributes attrs, bool allow_struct) {
            auto atom = parse_atom(p, allow_struct);
            if (!atom) return atom;
            auto e = parse_postfix(p, std::move(*atom));
            if (!e) return e;
            prepend_attrs(**e, std::move(attrs));
            return e;
        }

        expected_t<ExprPtr> parse_unary(Parser& p, bool allow_struct) {
            DepthGuard guard{ p };
            if (!guard.ok()) return std::unexpected(depth_error(p));

            auto attrs = parse_outer_attrs(p);
            if (!attrs) return std::unexpected(attrs.error());

            if (p.peek_punct("&")) {
                p.idx++;
                if (p.peek_keyword("raw") && (p.peek_keyword("const", 1) || p.peek_keyword("mut", 1))) {
                    p.idx++;
                    bool mutability = p.next().text == "mut";
                    auto operand = parse_unary(p, allow_struct);
                    if (!operand) return operand;
                    return make_expr(ExprRawAddr{ mutability, std::move(*operand) }, std::move(*attrs));
                }
                bool mutability = p.eat_keyword("mut");
                auto operand = parse_unary(p, allow_struct);
                if (!operand) return operand;
                return make_expr(ExprReference{ mutability, std::move(*operand) }, std::move(*attrs));
            }

            std::optional<UnOp> op;
            if (p.peek_punct("*")) op = UnOp::deref;
            else if (p.peek_punct("!")) op = UnOp::logical_not;
            else if (p.peek_punct("-")) op = UnOp::neg;
            if (op) {
                std::string spelling = p.next().text;
                auto operand = parse_unary(p, allow_struct);
                if (!operand) return operand;
                return make_expr(ExprUnary{ *op, std::move(*operand), std::move(spelling) }, std::move(*attrs));
            }

            if (p.peek_keyword("box")) {
                size_t begin = p.idx++;
                auto operand = parse_unary(p, allow_struct);
                if (!operand) return operand;
                return make_expr(ExprVerbatim{ p.slice(begin, p.idx) });
            }

            return parse_trailer(p, std::move(*attrs), allow_struct);
        }

        expected_t<Member> parse_tuple_index(Parser& p, std::string_view text) {
            std::uint32_t index = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), index);
            if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty())
                return std::unexpected(p.error_at_token(ParseError::code::unexpected_token, "invalid tuple index `" + std::string(text) + "`"));
            return Member{ index };
        }

        expected_t<ExprPtr> parse_postfix(Parser& p, ExprPtr e) {
            ChainGuard chain{ p };
            while (true) {
                bool call = p.peek_open(delimiter::parenthesis);
                bool dot = p.peek_punct(".") && !p.peek_punct("..");
                bool index = p.peek_open(delimiter::bracket);
                bool question = p.peek_punct("?");
                if (!call && !dot && !index && !question) break;
                if (!chain.push()) return std::unexpected(depth_error(p));

                if (call) {
                    auto args = parse_delimited_exprs(p, delimiter::parenthesis);
                    if (!args) return std::unexpected(args.error());
                    e = make_expr(ExprCall{ std::move(e), std::move(*args) });
                } else if (dot) {
                    p.idx++;
                    const token* t = p.peek();

                    if (t && t->is_ident("await")) {
                        p.idx++;
                        e = make_expr(ExprAwait{ std::move(e) });
                    } else if (t && t->is_ident() && !is_reserved_keyword(t->text)) {
                        std::string name = p.next().text;
                        std::optional<token_stream> turbofish;
                        if (p.peek_punct("::")) {
                            p.idx += 2;
                            token_stream tf;
                            tf.punct("::");
                            if (auto r = parse_generic_args(p, tf); !r) return std::unexpected(r.error());
                            turbofish = std::move(tf);
                        }
                        if (turbofish || p.peek_open(delimiter::parenthesis)) {
                            auto args = parse_delimited_exprs(p, delimiter::parenthesis);
                            if (!args) return std::unexpected(args.error());
                            e = make_expr(ExprMethodCall{ std::move(e), std::move(name), std::move(turbofish), std::move(*args) });
                        } else {
                            e = make_expr(ExprField{ std::move(e), Member{ std::move(name) } });
                        }
                    } else if (t && t->is_literal()) {
                        // `t.0.1` arrives as the float literal `0.1`
                        std::string_view text = t->text;
                        size_t dot_pos = text.find('.');
                        auto first = parse_tuple_index(p, text.substr(0, dot_pos));
                        if (!first) return std::unexpected(first.error());
                        e = make_expr(ExprField{ std::move(e), std::move(*first) });
                        if (dot_pos != std::string_view::npos) {
                            if (!chain.push()) return std::unexpected(depth_error(p));
                            auto second = parse_tuple_index(p, text.substr(dot_pos + 1));
                            if (!second) return std::unexpected(second.error());
                            e = make_expr(ExprField{ std::move(e), std::move(*second) });
                        }
                        p.idx++;
                    } else {
                        return std::unexpected(p.error_here("identifier or integer after `.`"));
                    }
                } else if (index) {
                    p.idx++;
                    auto subscript = parse_expr(p, true);
                    if (!subscript) return subscript;
                    if (auto r = p.expect_close(delimiter::bracket); !r) return std::unexpected(r.error());
                    e = make_expr(ExprIndex{ std::move(e), std::move(*subscript) });
                } else {
                    p.idx++;
                    e = make_expr(ExprTry{ std::move(e) });
                }
            }
            return e;
        }

        expected_t<ExprPtr> parse_paren_or_tuple(Parser& p) {
            p.idx++;
            if (p.at_end()) {
                if (auto r = p.expect_close(delimiter::parenthesis); !r) return std::unexpected(r.error());
                return make_expr(ExprTuple{});
            }

            auto first = parse_expr(p, true);
            if (!first) return first;
            if (p.at_end()) {
                if (auto r = p.expect_close(delimiter::parenthesis); !r) return std::unexpected(r.error());
                return make_expr(ExprParen{ std::move(*first) });
            }
            if (!p.eat_punct(",")) return std::unexpected(p.error_here("`,` or `)`"));

            ExprTuple tuple;
            tuple.elems.push_back(std::move(*first));
            while (!p.at_end()) {
                auto e = parse_expr(p, true);
                if (!e) return e;
                tuple.elems.push_back(std::move(*e));
                if (p.at_end()) break;
                if (auto r = p.expect_punct(","); !r) return std::unexpected(r.error());
            }
            if (auto r = p.expect_close(delimiter::parenthesis); !r) return std::unexpected(r.error());
            return make_expr(std::move(tuple));
        }

        expected_t<ExprPtr> parse_array_or_repeat(Parser& p) {
            p.idx++;
            if (p.at_end()) {
                if (auto r = p.expect_close(delimiter::bracket); !r) return std::unexpected(r.error());
                return make_expr(ExprArray{});
            }

            auto first = parse_expr(p, true);
            if (!first) return first;

            if (p.eat_punct(";")) {
                auto len = parse_expr(p, true);
                if (!len) return len;
                if (auto r = p.expect_close(delimiter::bracket); !r) return std::unexpected(r.error());
                return make_expr(ExprRepeat{ std::move(*first), std::move(*len) });
            }

            ExprArray array;
            array.elems.push_back(std::move(*first));
            while (!p.at_end()) {
                if (auto r = p.expect_punct(","); !r) return std::unexpected(r.error());
                if (p.at_end()) break;
                auto e = parse_expr(p, true);
                if (!e) return e;
                array.elems.push_back(std::move(*e));
            }
            if (auto r = p.expect_close(delimiter::bracket); !r) return std::unexpected(r.error());
            return make_expr(std::move(array));
        }

        expected_t<ExprPtr> parse_if(Parser& p) {
            DepthGuard guard{ p };
            if (!guard.ok()) return std::unexpected(depth_error(p));

            p.idx++;
            auto cond = parse_expr(p, false);
            if (!cond) return cond;
            auto then_branch = parse_block(p);
            if (!then_branch) return std::unexpected(then_branch.error());

            ExprIf node{ std::move(*cond), std::move(*then_branch), nullptr };
            if (p.eat_keyword("else")) {
                if (p.peek_keyword("if")) {
                    auto nested = parse_if(p);
                    if (!nested) return nested;
                    node.else_branch = std::move(*nested);
                } else if (p.peek_open(delimiter::brace)) {
                    auto block = parse_block(p);
                    if (!block) return std::unexpected(block.error());
                    node.else_branch = make_expr(ExprBlock{ std::nullopt, std::move(*block) });
                } else {
                    return std::unexpected(p.error_here("`if` or block after `else`"));
                }
            }
            return make_expr(std::move(node));
        }

        expected_t<ExprPtr> parse_let(Parser& p, bool allow_struct) {
            p.idx++;
            Pat pat;
            if (auto r = parse_pat_top(p, pat.tokens); !r) return std::unexpected(r.error());
            if (!p.peek_eq()) return std::unexpected(p.error_here("`=`"));
            p.idx++;

            // The scrutinee binds tighter than `&&` and `||`
            auto rhs = parse_unary(p, allow_struct);
            if (!rhs) return rhs;
            rhs = parse_expr_prec(p, std::move(*rhs), allow_struct, Precedence::Compare);
            if (!rhs) return rhs;
            return make_expr(ExprLet{ std::move(pat), std::move(*rhs) });
        }

        expected_t<ExprPtr> parse_while(Parser& p, std::optional<Label> label) {
            p.idx++;
            auto cond = parse_expr(p, false);
            if (!cond) return cond;
            auto body = parse_block(p);
            if (!body) return std::unexpected(body.error());
            return make_expr(ExprWhile{ std::move(label), std::move(*cond), std::move(*body) });
        }

        expected_t<ExprPtr> parse_for(Parser& p, std::optional<Label> label) {
            p.idx++;
            Pat pat;
            if (auto r = parse_pat_top(p, pat.tokens); !r) return std::unexpected(r.error());
            if (auto r = p.expect_keyword("in"); !r) return std::unexpected(r.error());
            auto expr = parse_expr(p, false);
            if (!expr) return expr;
            auto body = parse_block(p);
            if (!body) return std::unexpected(body.error());
            return make_expr(ExprForLoop{ std::move(label), std::move(pat), std::move(*expr), std::move(*body) });
        }

        expected_t<ExprPtr> parse_loop(Parser& p, std::optional<Label> label) {
            p.idx++;
            auto body = parse_block(p);
            if (!body) return std::unexpected(body.error());
            return make_expr(ExprLoop{ std::move(label), std::move(*body) });
        }

        expected_t<ExprPtr> parse_match(Parser& p) {
            p.idx++;
            auto scrutinee = parse_expr(p, false);
            if (!scrutinee) return scrutinee;
            if (auto r = p.expect_open(delimiter::brace); !r) return std::unexpected(r.error());

            // Inner attributes of the arm list travel with the match expression
            auto inner = parse_inner_attrs(p);
            if (!inner) return std::unexpected(inner.error());

            ExprMatch node{ std::move(*scrutinee), {} };
            while (!p.at_end()) {
                Arm arm;
                auto attrs = parse_outer_attrs(p);
                if (!attrs) return std::unexpected(attrs.error());
                arm.attrs = std::move(*attrs);

                if (auto r = parse_pat_top(p, arm.pat.tokens); !r) return std::unexpected(r.error());
                if (p.eat_keyword("if")) {
                    auto guard = parse_expr(p, true);
                    if (!guard) return guard;
                    arm.guard = std::move(*guard);
                }
                if (auto r = p.expect_punct("=>"); !r) return std::unexpected(r.error());

                auto body = parse_expr_early(p);
                if (!body) return body;
                arm.body = std::move(*body);

                arm.comma = p.eat_punct(",");
                if (!arm.comma && requires_terminator(*arm.body) && !p.at_end())
                    return std::unexpected(p.error_here("`,` after match arm"));
                node.arms.push_back(std::move(arm));
            }
            if (auto r = p.expect_close(delimiter::brace); !r) return std::unexpected(r.error());
            return make_expr(std::move(node), std::move(*inner));
        }

        expected_t<ExprPtr> parse_closure(Parser& p, bool allow_struct) {
            ExprClosure c;
            if (p.peek_keyword("for")) {
                token_stream lifetimes;
                if (auto r = parse_bound_lifetimes(p, lifetimes); !r) return std::unexpected(r.error());
                c.lifetimes = std::move(lifetimes);
            }
            c.constness = p.eat_keyword("const");
            c.movability = p.eat_keyword("static");
            c.asyncness = p.eat_keyword("async");
            c.capture = p.eat_keyword("move");

            if (!p.eat_punct("||")) {
                if (auto r = p.expect_punct("|"); !r) return std::unexpected(r.error());
                while (!p.peek_punct("|")) {
                    Pat input;
                    auto attrs = parse_outer_attrs(p);
                    if (!attrs) return std::unexpected(attrs.error());
                    for (const auto& a : *attrs) {
                        input.tokens.punct('#', spacing::alone);
                        input.tokens.open(delimiter::bracket);
                        input.tokens.append(a.meta);
                        input.tokens.close(delimiter::bracket);
                    }
                    if (auto r = parse_pat_single(p, input.tokens); !r) return std::unexpected(r.error());
                    if (p.peek_colon()) {
                        p.idx++;
                        input.tokens.punct(":");
                        if (auto r = parse_type(p, input.tokens, true); !r) return std::unexpected(r.error());
                    }
                    c.inputs.push_back(std::move(input));
                    if (p.peek_punct("|")) break;
                    if (auto r = p.expect_punct(","); !r) return std::unexpected(r.error());
                }
                p.idx++;
            }

            if (p.eat_punct("->")) {
                Type output;
                if (auto r = parse_type(p, output.tokens, false); !r) return std::unexpected(r.error());
                c.output = std::move(output);
                auto block = parse_block(p);
                if (!block) return std::unexpected(block.error());
                c.body = make_expr(ExprBlock{ std::nullopt, std::move(*block) });
            } else {
                auto body = parse_expr(p, allow_struct);
                if (!body) return body;
                c.body = std::move(*body);
            }
            return make_expr(std::move(c));
        }

        std::optional<Label> parse_opt_label(Parser& p) {
            if (!p.peek_lifetime()) return std::nullopt;
            p.idx++;
            return Label{ p.next().text };
        }

        // Optional operand of `break`, `return` and `yield`
        expected_t<ExprPtr> parse_jump_operand(Parser& p, bool allow_struct) {
            if (p.at_end() || p.peek_punct(",") || p.peek_punct(";") || (!allow_struct && p.peek_open(delimiter::brace)))
                return ExprPtr{};
            return parse_expr(p, allow_struct);
        }

        expected_t<ExprPtr> parse_struct_literal(Parser& p, std::optional<QSelf> qself, Path path) {
            p.idx++;
            ExprStruct node;
            node.qself = std::move(qself);
            node.path = std::move(path);

            while (!p.at_end()) {
                if (p.peek_punct("..") && !p.peek_punct("..=")) {
                    p.idx += 2;
                    node.dot2_token = true;
                    if (!p.at_end()) {
                        auto rest = parse_expr(p, true);
                        if (!rest) return rest;
                        node.rest = std::move(*rest);
                    }
                    break;
                }

                FieldValue fv;
                auto attrs = parse_outer_attrs(p);
                if (!attrs) return std::unexpected(attrs.error());
                fv.attrs = std::move(*attrs);

                const token* t = p.peek();
                if (t && t->is_ident() && !is_reserved_keyword(t->text)) {
                    fv.member = t->text;
                } else if (t && t->is_literal()) {
                    auto index = parse_tuple_index(p, t->text);
                    if (!index) return std::unexpected(index.error());
                    fv.member = *index;
                } else {
                    return std::unexpected(p.error_here("field name"));
                }
                p.idx++;

                if (p.peek_colon()) {
                    p.idx++;
                    auto value = parse_expr(p, true);
                    if (!value) return value;
                    fv.expr = std::move(*value);
                } else if (const auto* name = std::get_if<std::string>(&fv.member)) {
                    fv.colon_token = false;
                    Path shorthand;
                    shorthand.segments.push_back(PathSegment{ *name, {} });
                    fv.expr = make_expr(ExprPath{ std::nullopt, std::move(shorthand) });
                } else {
                    return std::unexpected(p.error_here("`:`"));
                }
                node.fields.push_back(std::move(fv));

                if (p.at_end()) break;
                if (auto r = p.expect_punct(","); !r) return std::unexpected(r.error());
            }
            if (auto r = p.expect_close(delimiter::brace); !r) return std::unexpected(r.error());
            return make_expr(std::move(node));
        }

        expected_t<ExprPtr> parse_path_atom(Parser& p, bool allow_struct) {
            std::optional<QSelf> qself;
            auto path = parse_expr_path(p, qself);
            if (!path) return std::unexpected(path.error());

            const token* after = p.peek(1);
            if (!qself && p.peek_punct("!") && !p.peek_punct("!=") && after && after->kind == token_kind::open) {
                p.idx++;
                auto mac = parse_macro_body(p, std::move(*path));
                if (!mac) return std::unexpected(mac.error());
                return make_expr(ExprMacro{ std::move(*mac) });
            }
            if (allow_struct && p.peek_open(delimiter::brace))
                return parse_struct_literal(p, std::move(qself), std::move(*path));
            return make_expr(ExprPath{ std::move(qself), std::move(*path) });
        }

        expected_t<ExprPtr> parse_block_expr(Parser& p, std::optional<Label> label) {
            auto block = parse_block(p);
            if (!block) return std::unexpected(block.error());
            return make_expr(ExprBlock{ std::move(label), std::move(*block) });
        }

        expected_t<ExprPtr> parse_labeled(Parser& p) {
            auto label = parse_opt_label(p);
            if (!p.peek_colon()) return std::unexpected(p.error_here("`:` after label"));
            p.idx++;

            if (p.peek_keyword("loop")) return parse_loop(p, std::move(label));
            if (p.peek_keyword("while")) return parse_while(p, std::move(label));
            if (p.peek_keyword("for")) return parse_for(p, std::move(label));
            if (p.peek_open(delimiter::brace)) return parse_block_expr(p, std::move(label));
            return std::unexpected(p.error_here("`loop`, `while`, `for` or block after label"));
        }

        expected_t<ExprPtr> parse_keyword_atom(Parser& p, bool allow_struct) {
            const std::string& w = p.peek()->text;
            size_t begin = p.idx;

            if (w == "true" || w == "false") {
                p.idx++;
                return make_expr(ExprLit{ LitBool{ w == "true" } });
            }
            if (w == "let") return parse_let(p, allow_struct);
            if (w == "if") return parse_if(p);
            if (w == "while") return parse_while(p, std::nullopt);
            if (w == "for") {
                if (p.peek_punct("<", 1)) return parse_closure(p, allow_struct);
                return parse_for(p, std::nullopt);
            }
            if (w == "loop") return parse_loop(p, std::nullopt);
            if (w == "match") return parse_match(p);

            if (w == "unsafe" && p.peek_open(delimiter::brace, 1)) {
                p.idx++;
                auto block = parse_block(p);
                if (!block) return std::unexpected(block.error());
                return make_expr(ExprUnsafe{ std::move(*block) });
            }
            if (w == "const" && p.peek_open(delimiter::brace, 1)) {
                p.idx++;
                auto block = parse_block(p);
                if (!block) return std::unexpected(block.error());
                return make_expr(ExprConst{ std::move(*block) });
            }
            if (w == "try" && p.peek_open(delimiter::brace, 1)) {
                p.idx++;
                auto block = parse_block(p);
                if (!block) return std::unexpected(block.error());
                return make_expr(ExprTryBlock{ std::move(*block) });
            }
            if (w == "async") {
                bool capture = p.peek_keyword("move", 1);
                if (p.peek_open(delimiter::brace, capture ? 2 : 1)) {
                    p.idx += capture ? 2 : 1;
                    auto block = parse_block(p);
                    if (!block) return std::unexpected(block.error());
                    return make_expr(ExprAsync{ capture, std::move(*block) });
                }
                return parse_closure(p, allow_struct);
            }
            if (w == "const" || w == "static" || w == "move") return parse_closure(p, allow_struct);

            if (w == "break") {
                p.idx++;
                auto label = parse_opt_label(p);
                auto operand = parse_jump_operand(p, allow_struct);
                if (!operand) return operand;
                return make_expr(ExprBreak{ std::move(label), std::move(*operand) });
            }
            if (w == "continue") {
                p.idx++;
                return make_expr(ExprContinue{ parse_opt_label(p) });
            }
            if (w == "return" || w == "yield") {
                bool is_return = w == "return";
                p.idx++;
                auto operand = parse_jump_operand(p, allow_struct);
                if (!operand) return operand;
                if (is_return) return make_expr(ExprReturn{ std::move(*operand) });
                return make_expr(ExprYield{ std::move(*operand) });
            }
            if (w == "become") {
                p.idx++;
                auto operand = parse_expr(p, allow_struct);
                if (!operand) return operand;
                return make_expr(ExprVerbatim{ p.slice(begin, p.idx) });
            }
            if (w == "builtin" && p.peek_punct("#", 1)) {
                p.idx += 2;
                if (auto name = p.expect_ident(); !name) return std::unexpected(name.error());
                if (!p.peek_open(delimiter::parenthesis)) return std::unexpected(p.error_here("`(`"));
                p.skip_tree();
                return make_expr(ExprVerbatim{ p.slice(begin, p.idx) });
            }
            if (w == "_") {
                p.idx++;
                return make_expr(ExprInfer{});
            }

            if (!is_reserved_keyword(w) || is_path_start_keyword(w)) return parse_path_atom(p, allow_struct);
            return std::unexpected(p.error_here("expression"));
        }

        expected_t<ExprPtr> parse_atom(Parser& p, bool allow_struct) {
            const token* t = p.peek();
            if (!t || t->kind == token_kind::close) return std::unexpected(p.error_here("expression"));

            switch (t->kind) {
            case token_kind::open:
                if (t->delim == delimiter::parenthesis) return parse_paren_or_tuple(p);
                if (t->delim == delimiter::bracket) return parse_array_or_repeat(p);
                return parse_block_expr(p, std::nullopt);

            case token_kind::literal: {
                p.idx++;
                auto lit = decode_literal(t->text);
                if (!lit) return std::unexpected(ParseError::make(ParseError::code::invalid_literal, t->pos.offset, t->pos.line, t->pos.column, lit.error()));
                return make_expr(ExprLit{ *std::move(lit) });
            }

            case token_kind::ident:
                return parse_keyword_atom(p, allow_struct);

            case token_kind::punct:
                if (p.peek_lifetime()) return parse_labeled(p);
                if (p.peek_punct("|")) return parse_closure(p, allow_struct);
                if (p.peek_punct("::") || p.peek_punct("<")) return parse_path_atom(p, allow_struct);
                if (auto r = peek_range_limits(p)) {
                    p.idx += r->len;
                    auto end = parse_range_end(p, r->limits, allow_struct);
                    if (!end) return end;
                    return make_expr(ExprRange{ nullptr, r->limits, std::move(*end) });
                }
                break;

            case token_kind::close:
                break;
            }
            return std::unexpected(p.error_here("expression"));
        }

        bool starts_block_like(const Parser& p) {
            const token* t = p.peek();
            if (!t) return false;
            if (t->is_open(delimiter::brace)) return true;
            if (p.peek_lifetime()) return p.peek_colon(2);
            if (!t->is_ident()) return false;
            if (t->text == "if" || t->text == "while" || t->text == "loop" || t->text == "match") return true;
            if (t->text == "for") return !p.peek_punct("<", 1);
            if (t->text == "unsafe" || t->text == "const" || t->text == "try") return p.peek_open(delimiter::brace, 1);
            return false;
        }
    } // namespace

    expected_t<ExprPtr> parse_expr(Parser& p, bool allow_struct) {
        auto lhs = parse_unary(p, allow_struct);
        if (!lhs) return lhs;
        return parse_expr_prec(p, std::move(*lhs), allow_struct, Precedence::Any);
    }

    expected_t<ExprPtr> parse_expr_early(Parser& p) {
        size_t start = p.idx;
        auto attrs = parse_outer_attrs(p);
        if (!attrs) return std::unexpected(attrs.error());

        if (!starts_block_like(p)) {
            p.idx = start;
            return parse_expr(p, true);
        }

        DepthGuard guard{ p };
        if (!guard.ok()) return std::unexpected(depth_error(p));

        auto e = parse_atom(p, true);
        if (!e) return e;
        prepend_attrs(**e, std::move(*attrs));

        // A block-like expression ends the statement unless a method call
        // or `?` continues it
        if ((p.peek_punct(".") && !p.peek_punct("..")) || p.peek_punct("?")) {
            e = parse_postfix(p, std::move(*e));
            if (!e) return e;
            e = parse_expr_prec(p, std::move(*e), true, Precedence::Any);
        }
        return e;
    }

    bool requires_terminator(const Expr& e) noexcept {
        if (const auto* m = e.get_if<ExprMacro>()) return m->mac.delim != delimiter::brace;
        return !(e.is<ExprIf>() || e.is<ExprMatch>() || e.is<ExprBlock>() || e.is<ExprUnsafe>()
            || e.is<ExprWhile>() || e.is<ExprLoop>() || e.is<ExprForLoop>() || e.is<ExprTryBlock>()
            || e.is<ExprConst>());
    }

    expected_t<Attributes> parse_outer_attrs(Parser& p) {
        Attributes attrs;
        while (p.peek_punct("#") && p.peek_open(delimiter::bracket, 1)) {
            p.idx++;
            size_t body = p.idx + 1;
            p.skip_tree();
            attrs.push_back(Attribute{ false, p.slice(body, p.idx - 1) });
        }
        return attrs;
    }

    expected_t<Attributes> parse_inner_attrs(Parser& p) {
        Attributes attrs;
        while (p.peek_punct("#!") && p.peek_open(delimiter::bracket, 2)) {
            p.idx += 2;
            size_t body = p.idx + 1;
            p.skip_tree();
            attrs.push_back(Attribute{ true, p.slice(body, p.idx - 1) });
        }
        return attrs;
    }

    expected_t<Macro> parse_macro_body(Parser& p, Path path) {
        const token* open = p.peek();
        if (!open || open->kind != token_kind::open) return std::unexpected(p.error_here("macro delimiter"));
        delimiter d = open->delim;
        size_t body = p.idx + 1;
        p.skip_tree();
        return Macro{ std::move(path), d, p.slice(body, p.idx - 1) };
    }

} // namespace Stanza::detail
