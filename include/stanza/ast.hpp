#pragma once


/*
    -----------------------------------------
    Stanza::Expr - Expression Node tree model
    -----------------------------------------
    The in-memory tree the parser produces and the converter consumes.

    - `Expr` is a tagged union (`ExprNode`, a `std::variant`) plus the list
      of attributes written in front of the expression
    - Every node exclusively owns its children through `ExprPtr`
      (`std::unique_ptr<Expr>`). The tree has no cycles and no parent links
    - Optional children are null `ExprPtr`s
    - Patterns and types are not modeled structurally: `Pat` and `Type` hold
      the canonical token stream the parser re-emitted while reading them
    - Blocks are modeled down to statements so they can be re-rendered, but
      the converter treats them as opaque text

    -------------
    Extensibility
    -------------
    The grammar grows over time. `ExprExtension` carries nodes contributed by
    grammar extensions that the converter has no schema for; such nodes only
    know how to render themselves (their token stream). Code that visits
    `ExprNode` must keep a catch-all arm.
*/

/// @defgroup StanzaAst Expression Tree
/// @ingroup Stanza
/// @brief Expression node types produced by the parser

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "stanza/token.hpp"

namespace Stanza {

    struct Expr;

    /// @ingroup StanzaAst
    /// @brief Owning pointer to a child expression; null when the child is absent
    using ExprPtr = std::unique_ptr<Expr>;

    /// @ingroup StanzaAst
    /// @brief `#[meta]` (outer) or `#![meta]` (inner) attribute
    struct Attribute {
        bool inner = false;
        token_stream meta; ///< Tokens between the brackets
    };

    using Attributes = std::vector<Attribute>;

    /// @ingroup StanzaAst
    /// @brief Type, kept as its canonical token stream
    struct Type {
        token_stream tokens;
    };

    /// @ingroup StanzaAst
    /// @brief Pattern, kept as its canonical token stream
    struct Pat {
        token_stream tokens;
    };

    /// @ingroup StanzaAst
    /// @brief One `::`-separated path segment
    struct PathSegment {
        std::string ident;
        token_stream arguments; ///< `::<T>`, `<T>` or `(A) -> B`; empty when absent
    };

    /// @ingroup StanzaAst
    struct Path {
        bool leading_colon = false;
        std::vector<PathSegment> segments;
    };

    /// @ingroup StanzaAst
    /// @brief Qualified self of `<T as Trait>::item`
    ///
    /// @details
    /// The first `position` segments of the accompanying `Path` name the
    /// trait. With `position == 0` there is no `as` clause and the path has a
    /// leading `::`.
    struct QSelf {
        Type ty;
        std::size_t position = 0;
    };

    /// @ingroup StanzaAst
    /// @brief Loop or block label, name stored without the leading quote
    struct Label {
        std::string name;
    };

    /// @ingroup StanzaAst
    /// @brief Macro invocation `path!(tokens)`
    struct Macro {
        Path path;
        delimiter delim = delimiter::parenthesis;
        token_stream tokens; ///< Body tokens, spacing kept as lexed
    };

    /// @ingroup StanzaAst
    /// @brief Named (`.field`) or unnamed (`.0`) member
    using Member = std::variant<std::string, std::uint32_t>;

    // ------------------------------------------------------------
    // Operators
    // ------------------------------------------------------------

    /// @ingroup StanzaAst
    enum class BinOp : uint8_t {
        add, sub, mul, div, rem,
        logical_and, logical_or,
        bit_xor, bit_and, bit_or, shl, shr,
        eq, lt, le, ne, ge, gt,
        add_assign, sub_assign, mul_assign, div_assign, rem_assign,
        bit_xor_assign, bit_and_assign, bit_or_assign, shl_assign, shr_assign,
    };

    /// @ingroup StanzaAst
    enum class UnOp : uint8_t {
        deref,
        logical_not,
        neg,
    };

    /// @ingroup StanzaAst
    enum class RangeLimits : uint8_t {
        half_open, ///< `..`
        closed,    ///< `..=`
    };

    // ------------------------------------------------------------
    // Literals
    // ------------------------------------------------------------
    // Every literal keeps `repr`, its exact source spelling including any
    // suffix, which is what the renderer prints.

    struct LitStr {
        std::string repr;
        std::string value; ///< Decoded UTF-8 text
        std::string suffix;
    };

    struct LitByteStr {
        std::string repr;
        std::vector<std::uint8_t> value;
        std::string suffix;
    };

    struct LitCStr {
        std::string repr;
        std::vector<std::uint8_t> value; ///< Without the terminating NUL
        std::string suffix;
    };

    struct LitByte {
        std::string repr;
        std::uint8_t value = 0;
        std::string suffix;
    };

    struct LitChar {
        std::string repr;
        char32_t value = 0;
        std::string suffix;
    };

    struct LitInt {
        std::string repr;
        std::string digits; ///< Base-10 digits, `_` removed
        std::string suffix;
    };

    struct LitFloat {
        std::string repr;
        std::string digits; ///< Source digits with `_` removed
        std::string suffix;
    };

    struct LitBool {
        bool value = false;
    };

    /// @brief Literal token the lexer accepted but could not classify
    struct LitVerbatim {
        std::string repr;
    };

    /// @brief Literal kind contributed by a grammar extension; like
    ///        `ExprExtension` it only knows its tokens
    struct LitExtension {
        std::string name;
        token_stream tokens;
    };

    /// @ingroup StanzaAst
    using Lit = std::variant<
        LitStr, LitByteStr, LitCStr, LitByte, LitChar,
        LitInt, LitFloat, LitBool, LitVerbatim, LitExtension
    >;

    // ------------------------------------------------------------
    // Statements and blocks
    // ------------------------------------------------------------

    struct Block;

    /// @brief `let pat (: ty)? (= init (else { ... })?)?;`
    struct StmtLocal {
        Attributes attrs;
        Pat pat;                         ///< Includes the `: Type` annotation
        ExprPtr init;
        std::unique_ptr<Block> diverge;  ///< `else` block of let-else
    };

    /// @brief Item declared inside a block (`fn`, `struct`, `use`, ...)
    struct StmtItem {
        token_stream tokens; ///< Attributes included
    };

    struct StmtExpr {
        ExprPtr expr;
        bool semi = false;
    };

    /// @brief Stray `;`
    struct StmtEmpty {};

    using Stmt = std::variant<StmtLocal, StmtItem, StmtExpr, StmtEmpty>;

    /// @ingroup StanzaAst
    struct Block {
        Attributes inner_attrs; ///< `#![...]` at the start of the block
        std::vector<Stmt> stmts;
    };

    // ------------------------------------------------------------
    // Expression variants
    // ------------------------------------------------------------

    struct ExprArray { std::vector<ExprPtr> elems; };
    struct ExprAssign { ExprPtr left; ExprPtr right; };
    struct ExprAsync { bool capture = false; Block block; };
    struct ExprAwait { ExprPtr base; };

    /// @brief Binary operation
    ///
    /// @details
    /// `spelling` is the operator as written. It is only consulted when `op`
    /// holds a value outside the enumerated set.
    struct ExprBinary {
        ExprPtr left;
        BinOp op = BinOp::add;
        ExprPtr right;
        std::string spelling;
    };

    struct ExprBlock { std::optional<Label> label; Block block; };
    struct ExprBreak { std::optional<Label> label; ExprPtr expr; };
    struct ExprCall { ExprPtr func; std::vector<ExprPtr> args; };
    struct ExprCast { ExprPtr expr; Type ty; };

    /// @brief `for<'a> const static async move |inputs| -> T body`
    struct ExprClosure {
        std::optional<token_stream> lifetimes; ///< `for < 'a >`
        bool constness = false;
        bool movability = false; ///< `static`
        bool asyncness = false;
        bool capture = false;    ///< `move`
        std::vector<Pat> inputs;
        std::optional<Type> output;
        ExprPtr body;
    };

    struct ExprConst { Block block; };
    struct ExprContinue { std::optional<Label> label; };
    struct ExprField { ExprPtr base; Member member; };
    struct ExprForLoop { std::optional<Label> label; Pat pat; ExprPtr expr; Block body; };

    /// @brief Invisible-delimited group, produced by tree builders only
    struct ExprGroup { ExprPtr expr; };

    /// @brief `if cond { } else ...`; `else_branch` is an `ExprBlock` or an `ExprIf`
    struct ExprIf { ExprPtr cond; Block then_branch; ExprPtr else_branch; };

    struct ExprIndex { ExprPtr expr; ExprPtr index; };
    struct ExprInfer {};
    struct ExprLet { Pat pat; ExprPtr expr; };
    struct ExprLit { Lit lit; };
    struct ExprLoop { std::optional<Label> label; Block body; };
    struct ExprMacro { Macro mac; };

    struct Arm {
        Attributes attrs;
        Pat pat;
        ExprPtr guard;
        ExprPtr body;
        bool comma = false;
    };

    struct ExprMatch { ExprPtr expr; std::vector<Arm> arms; };

    struct ExprMethodCall {
        ExprPtr receiver;
        std::string method;
        std::optional<token_stream> turbofish; ///< `:: < T >`
        std::vector<ExprPtr> args;
    };

    struct ExprParen { ExprPtr expr; };
    struct ExprPath { std::optional<QSelf> qself; Path path; };
    struct ExprRange { ExprPtr start; RangeLimits limits = RangeLimits::half_open; ExprPtr end; };
    struct ExprRawAddr { bool mutability = false; ExprPtr expr; };
    struct ExprReference { bool mutability = false; ExprPtr expr; };
    struct ExprRepeat { ExprPtr expr; ExprPtr len; };
    struct ExprReturn { ExprPtr expr; };

    struct FieldValue {
        Attributes attrs;
        Member member;
        bool colon_token = true; ///< false for shorthand `Point { x }`
        ExprPtr expr;
    };

    struct ExprStruct {
        std::optional<QSelf> qself;
        Path path;
        std::vector<FieldValue> fields;
        bool dot2_token = false;
        ExprPtr rest;
    };

    struct ExprTry { ExprPtr expr; };
    struct ExprTryBlock { Block block; };
    struct ExprTuple { std::vector<ExprPtr> elems; };

    /// @brief Unary operation; `spelling` as in ExprBinary
    struct ExprUnary {
        UnOp op = UnOp::neg;
        ExprPtr expr;
        std::string spelling;
    };

    struct ExprUnsafe { Block block; };

    /// @brief Tokens the parser accepted without modeling them
    struct ExprVerbatim { token_stream tokens; };

    struct ExprWhile { std::optional<Label> label; ExprPtr cond; Block body; };
    struct ExprYield { ExprPtr expr; };

    /// @brief Node contributed by a grammar extension
    struct ExprExtension {
        std::string name;
        token_stream tokens;
    };

    /// @ingroup StanzaAst
    using ExprNode = std::variant<
        ExprArray, ExprAssign, ExprAsync, ExprAwait, ExprBinary, ExprBlock,
        ExprBreak, ExprCall, ExprCast, ExprClosure, ExprConst, ExprContinue,
        ExprField, ExprForLoop, ExprGroup, ExprIf, ExprIndex, ExprInfer,
        ExprLet, ExprLit, ExprLoop, ExprMacro, ExprMatch, ExprMethodCall,
        ExprParen, ExprPath, ExprRange, ExprRawAddr, ExprReference, ExprRepeat,
        ExprReturn, ExprStruct, ExprTry, ExprTryBlock, ExprTuple, ExprUnary,
        ExprUnsafe, ExprVerbatim, ExprWhile, ExprYield, ExprExtension
    >;

    /// @ingroup StanzaAst
    /// @brief One expression node: attributes plus the variant payload
    struct Expr {
        Attributes attrs;
        ExprNode node;

        template<class T>
        [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&node); }

        template<class T>
        [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(node); }
    };

    /// @ingroup StanzaAst
    /// @brief Allocates an expression node
    template<class T>
    [[nodiscard]] ExprPtr make_expr(T&& node, Attributes attrs = {}) {
        auto e = std::make_unique<Expr>();
        e->attrs = std::move(attrs);
        e->node = std::forward<T>(node);
        return e;
    }

} // namespace Stanza
