#include "stanza/convert.hpp"
#include "stanza/render.hpp"

#include "detail/utf8.hpp"

#include <string>
#include <variant>

namespace Stanza {

#pragma region Operators

    std::optional<std::string_view> binop_symbol(BinOp op) noexcept {
        switch (op) {
        case BinOp::add: return "+";
        case BinOp::sub: return "-";
        case BinOp::mul: return "*";
        case BinOp::div: return "/";
        case BinOp::rem: return "%";
        case BinOp::logical_and: return "&&";
        case BinOp::logical_or: return "||";
        case BinOp::bit_xor: return "^";
        case BinOp::bit_and: return "&";
        case BinOp::bit_or: return "|";
        case BinOp::shl: return "<<";
        case BinOp::shr: return ">>";
        case BinOp::eq: return "==";
        case BinOp::lt: return "<";
        case BinOp::le: return "<=";
        case BinOp::ne: return "!=";
        case BinOp::ge: return ">=";
        case BinOp::gt: return ">";
        case BinOp::add_assign: return "+=";
        case BinOp::sub_assign: return "-=";
        case BinOp::mul_assign: return "*=";
        case BinOp::div_assign: return "/=";
        case BinOp::rem_assign: return "%=";
        case BinOp::bit_xor_assign: return "^=";
        case BinOp::bit_and_assign: return "&=";
        case BinOp::bit_or_assign: return "|=";
        case BinOp::shl_assign: return "<<=";
        case BinOp::shr_assign: return ">>=";
        }
        return std::nullopt;
    }

    std::optional<std::string_view> unop_symbol(UnOp op) noexcept {
        switch (op) {
        case UnOp::deref: return "*";
        case UnOp::logical_not: return "!";
        case UnOp::neg: return "-";
        }
        return std::nullopt;
    }

#pragma endregion
#pragma region Opaque strings

    std::string type_to_string(const Type& ty) { return render(ty); }

    std::string pat_to_string(const Pat& pat) { return render(pat); }

    std::string path_to_string(const Path& path) { return render(path); }

#pragma endregion
#pragma region Literals

    namespace {
        template<class... Ts>
        struct overloaded : Ts... { using Ts::operator()...; };

        value literal_object(std::string_view kind, value v, std::string_view suffix, std::pmr::memory_resource* mr) {
            value obj{ mr };
            obj["kind"] = value{ kind, mr };
            obj["value"] = std::move(v);
            obj["suffix"] = value{ suffix, mr };
            return obj;
        }

        value tokens_object(std::string_view kind, std::string_view tokens, std::pmr::memory_resource* mr) {
            value obj{ mr };
            obj["kind"] = value{ kind, mr };
            obj["tokens"] = value{ tokens, mr };
            return obj;
        }
    } // namespace

    value lit_to_value(const Lit& lit, std::pmr::memory_resource* mr) {
        return std::visit(overloaded{
            [&](const LitStr& l) { return literal_object("Str", value{ l.value, mr }, l.suffix, mr); },
            [&](const LitByteStr& l) {
                value bytes{ mr };
                auto& arr = bytes.as_array();
                arr.reserve(l.value.size());
                for (std::uint8_t b : l.value) arr.emplace_back(b, mr);
                return literal_object("ByteStr", std::move(bytes), l.suffix, mr);
            },
            [&](const LitCStr& l) {
                std::string_view raw{ reinterpret_cast<const char*>(l.value.data()), l.value.size() };
                return literal_object("CStr", value{ detail::lossy_utf8(raw), mr }, l.suffix, mr);
            },
            [&](const LitByte& l) { return literal_object("Byte", value{ l.value, mr }, l.suffix, mr); },
            [&](const LitChar& l) {
                std::string text;
                detail::append_utf8(l.value, text);
                return literal_object("Char", value{ std::string_view{ text }, mr }, l.suffix, mr);
            },
            [&](const LitInt& l) { return literal_object("Int", value{ l.digits, mr }, l.suffix, mr); },
            [&](const LitFloat& l) { return literal_object("Float", value{ l.digits, mr }, l.suffix, mr); },
            [&](const LitBool& l) {
                value obj{ mr };
                obj["kind"] = value{ "Bool", mr };
                obj["value"] = value{ l.value, mr };
                return obj;
            },
            [&](const LitVerbatim& l) { return tokens_object("Verbatim", l.repr, mr); },
            // Literal kinds without a schema
            [&](const auto&) { return tokens_object("Unknown", render(lit), mr); },
        }, lit);
    }

#pragma endregion
#pragma region Expressions

    namespace {

        /// @brief One visitor arm per modeled variant
        ///
        /// @details
        /// Arms start from `node(kind)`, which already holds `kind` and
        /// `attrs`, and add the variant's fields. Anything without an arm
        /// falls into the catch-all template and comes out as `Unknown`.
        struct Converter {
            const Expr& self;
            std::pmr::memory_resource* mr;

            value str(std::string_view s) const { return value{ s, mr }; }
            value boolean(bool b) const { return value{ b, mr }; }
            value null() const { return value{ mr }; }

            value expr(const Expr& e) const { return to_value(e, mr); }
            value opt(const ExprPtr& e) const { return e ? expr(*e) : null(); }

            value list(const std::vector<ExprPtr>& items) const {
                value v{ mr };
                auto& arr = v.as_array();
                arr.reserve(items.size());
                for (const auto& item : items) arr.push_back(expr(*item));
                return v;
            }

            value attrs(const Attributes& list) const {
                value v{ mr };
                auto& arr = v.as_array();
                for (const auto& a : list) arr.emplace_back(std::string_view{ render(a) }, mr);
                return v;
            }

            value label(const std::optional<Label>& l) const { return l ? str(l->name) : null(); }

            value member(const Member& m) const {
                value v{ mr };
                if (const auto* name = std::get_if<std::string>(&m)) {
                    v["kind"] = str("Named");
                    v["name"] = str(*name);
                } else {
                    v["kind"] = str("Unnamed");
                    v["index"] = value{ std::get<std::uint32_t>(m), mr };
                }
                return v;
            }

            value opaque(const auto& node) const { return value{ std::string_view{ render(node) }, mr }; }

            value qself(const std::optional<QSelf>& q) const { return q ? opaque(q->ty) : null(); }

            value node(std::string_view kind) const {
                value v{ mr };
                v["kind"] = str(kind);
                v["attrs"] = attrs(self.attrs);
                return v;
            }

            // An `else` block that is only a tail expression converts to
            // that expression
            value else_branch(const ExprPtr& e) const {
                if (!e) return null();
                const auto* blk = e->get_if<ExprBlock>();
                if (blk && !blk->label && e->attrs.empty() && blk->block.inner_attrs.empty() && blk->block.stmts.size() == 1) {
                    const auto* tail = std::get_if<StmtExpr>(&blk->block.stmts.front());
                    if (tail && !tail->semi) return expr(*tail->expr);
                }
                return expr(*e);
            }

            value operator()(const ExprArray& e) const {
                value v = node("Array");
                v["elems"] = list(e.elems);
                return v;
            }

            value operator()(const ExprAssign& e) const {
                value v = node("Assign");
                v["left"] = expr(*e.left);
                v["right"] = expr(*e.right);
                return v;
            }

            value operator()(const ExprAsync& e) const {
                value v = node("Async");
                v["capture"] = boolean(e.capture);
                v["block"] = opaque(e.block);
                return v;
            }

            value operator()(const ExprAwait& e) const {
                value v = node("Await");
                v["base"] = expr(*e.base);
                return v;
            }

            value operator()(const ExprBinary& e) const {
                value v = node("Binary");
                v["left"] = expr(*e.left);
                v["op"] = str(binop_symbol(e.op).value_or(e.spelling));
                v["right"] = expr(*e.right);
                return v;
            }

            value operator()(const ExprBlock& e) const {
                value v = node("Block");
                v["label"] = label(e.label);
                v["block"] = opaque(e.block);
                return v;
            }

            value operator()(const ExprBreak& e) const {
                value v = node("Break");
                v["label"] = label(e.label);
                v["expr"] = opt(e.expr);
                return v;
            }

            value operator()(const ExprCall& e) const {
                value v = node("Call");
                v["func"] = expr(*e.func);
                v["args"] = list(e.args);
                return v;
            }

            value operator()(const ExprCast& e) const {
                value v = node("Cast");
                v["expr"] = expr(*e.expr);
                v["ty"] = str(type_to_string(e.ty));
                return v;
            }

            value operator()(const ExprClosure& e) const {
                value v = node("Closure");
                v["lifetimes"] = e.lifetimes ? str(e.lifetimes->to_string()) : null();
                v["constness"] = boolean(e.constness);
                v["movability"] = boolean(e.movability);
                v["asyncness"] = boolean(e.asyncness);
                v["capture"] = boolean(e.capture);

                value inputs{ mr };
                auto& arr = inputs.as_array();
                for (const auto& p : e.inputs) arr.emplace_back(std::string_view{ pat_to_string(p) }, mr);
                v["inputs"] = std::move(inputs);

                // The return type prints with its arrow, or as "" when absent
                token_stream output;
                if (e.output) {
                    output.punct("->");
                    to_tokens(*e.output, output);
                }
                v["output"] = str(output.to_string());
                v["body"] = expr(*e.body);
                return v;
            }

            value operator()(const ExprConst& e) const {
                value v = node("Const");
                v["block"] = opaque(e.block);
                return v;
            }

            value operator()(const ExprContinue& e) const {
                value v = node("Continue");
                v["label"] = label(e.label);
                return v;
            }

            value operator()(const ExprField& e) const {
                value v = node("Field");
                v["base"] = expr(*e.base);
                v["member"] = member(e.member);
                return v;
            }

            value operator()(const ExprForLoop& e) const {
                value v = node("ForLoop");
                v["label"] = label(e.label);
                v["pat"] = str(pat_to_string(e.pat));
                v["expr"] = expr(*e.expr);
                v["body"] = opaque(e.body);
                return v;
            }

            value operator()(const ExprGroup& e) const {
                value v = node("Group");
                v["expr"] = expr(*e.expr);
                return v;
            }

            value operator()(const ExprIf& e) const {
                value v = node("If");
                v["cond"] = expr(*e.cond);
                v["then_branch"] = opaque(e.then_branch);
                v["else_branch"] = else_branch(e.else_branch);
                return v;
            }

            value operator()(const ExprIndex& e) const {
                value v = node("Index");
                v["expr"] = expr(*e.expr);
                v["index"] = expr(*e.index);
                return v;
            }

            value operator()(const ExprInfer&) const { return node("Infer"); }

            value operator()(const ExprLet& e) const {
                value v = node("Let");
                v["pat"] = str(pat_to_string(e.pat));
                v["expr"] = expr(*e.expr);
                return v;
            }

            value operator()(const ExprLit& e) const {
                value v = node("Lit");
                v["lit"] = lit_to_value(e.lit, mr);
                return v;
            }

            value operator()(const ExprLoop& e) const {
                value v = node("Loop");
                v["label"] = label(e.label);
                v["body"] = opaque(e.body);
                return v;
            }

            value operator()(const ExprMacro& e) const {
                value v = node("Macro");
                v["mac"] = opaque(e.mac);
                return v;
            }

            value operator()(const ExprMatch& e) const {
                value v = node("Match");
                v["expr"] = expr(*e.expr);

                value arms{ mr };
                auto& arr = arms.as_array();
                for (const auto& arm : e.arms) {
                    value a{ mr };
                    a["attrs"] = attrs(arm.attrs);
                    a["pat"] = str(pat_to_string(arm.pat));
                    a["guard"] = opt(arm.guard);
                    a["body"] = expr(*arm.body);
                    arr.push_back(std::move(a));
                }
                v["arms"] = std::move(arms);
                return v;
            }

            value operator()(const ExprMethodCall& e) const {
                value v = node("MethodCall");
                v["receiver"] = expr(*e.receiver);
                v["method"] = str(e.method);
                v["turbofish"] = e.turbofish ? str(e.turbofish->to_string()) : null();
                v["args"] = list(e.args);
                return v;
            }

            value operator()(const ExprParen& e) const {
                value v = node("Paren");
                v["expr"] = expr(*e.expr);
                return v;
            }

            value operator()(const ExprPath& e) const {
                value v = node("Path");
                v["qself"] = qself(e.qself);
                v["path"] = str(path_to_string(e.path));
                return v;
            }

            value operator()(const ExprRange& e) const {
                value v = node("Range");
                v["start"] = opt(e.start);
                v["limits"] = str(e.limits == RangeLimits::closed ? "Closed" : "HalfOpen");
                v["end"] = opt(e.end);
                return v;
            }

            value operator()(const ExprRawAddr& e) const {
                value v = node("RawAddr");
                v["mutability"] = boolean(e.mutability);
                v["expr"] = expr(*e.expr);
                return v;
            }

            value operator()(const ExprReference& e) const {
                value v = node("Reference");
                v["mutability"] = boolean(e.mutability);
                v["expr"] = expr(*e.expr);
                return v;
            }

            value operator()(const ExprRepeat& e) const {
                value v = node("Repeat");
                v["expr"] = expr(*e.expr);
                v["len"] = expr(*e.len);
                return v;
            }

            value operator()(const ExprReturn& e) const {
                value v = node("Return");
                v["expr"] = opt(e.expr);
                return v;
            }

            value operator()(const ExprStruct& e) const {
                value v = node("Struct");
                v["qself"] = qself(e.qself);
                v["path"] = str(path_to_string(e.path));

                value fields{ mr };
                auto& arr = fields.as_array();
                for (const auto& f : e.fields) {
                    value fv{ mr };
                    fv["attrs"] = attrs(f.attrs);
                    fv["member"] = member(f.member);
                    fv["expr"] = expr(*f.expr);
                    arr.push_back(std::move(fv));
                }
                v["fields"] = std::move(fields);
                v["dot2_token"] = boolean(e.dot2_token);
                v["rest"] = opt(e.rest);
                return v;
            }

            value operator()(const ExprTry& e) const {
                value v = node("Try");
                v["expr"] = expr(*e.expr);
                return v;
            }

            value operator()(const ExprTryBlock& e) const {
                value v = node("TryBlock");
                v["block"] = opaque(e.block);
                return v;
            }

            value operator()(const ExprTuple& e) const {
                value v = node("Tuple");
                v["elems"] = list(e.elems);
                return v;
            }

            value operator()(const ExprUnary& e) const {
                value v = node("Unary");
                v["op"] = str(unop_symbol(e.op).value_or(e.spelling));
                v["expr"] = expr(*e.expr);
                return v;
            }

            value operator()(const ExprUnsafe& e) const {
                value v = node("Unsafe");
                v["block"] = opaque(e.block);
                return v;
            }

            value operator()(const ExprVerbatim& e) const { return tokens_object("Verbatim", e.tokens.to_string(), mr); }

            value operator()(const ExprWhile& e) const {
                value v = node("While");
                v["label"] = label(e.label);
                v["cond"] = expr(*e.cond);
                v["body"] = opaque(e.body);
                return v;
            }

            value operator()(const ExprYield& e) const {
                value v = node("Yield");
                v["expr"] = opt(e.expr);
                return v;
            }

            // Variants without a schema (grammar extensions)
            template<class Node>
            value operator()(const Node&) const { return tokens_object("Unknown", render(self), mr); }
        };

    } // namespace

    value to_value(const Expr& e, std::pmr::memory_resource* mr) {
        return std::visit(Converter{ e, mr }, e.node);
    }

#pragma endregion

} // namespace Stanza
