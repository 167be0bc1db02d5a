#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/ast.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/token.hpp"

namespace Stanza::detail {

    using expected_void = std::expected<void, ParseError>;
    template<typename T>
    using expected_t = std::expected<T, ParseError>;

    /// @brief Cursor over the lexed token vector
    ///
    /// @details
    /// "End of input" for the grammar functions means either the real end of
    /// the text or the closing delimiter of the group currently being parsed;
    /// `at_end()` answers both.
    struct Parser {
        const std::vector<token>& toks;
        source_pos end_pos;
        size_t idx = 0;
        size_t depth = 0;
        size_t max_depth = 0;

        Parser(const std::vector<token>& t, source_pos end, const ParseOptions& opts)
            : toks{ t }, end_pos{ end }, max_depth{ opts.max_depth } {}

        [[nodiscard]] const token* peek(size_t k = 0) const noexcept {
            return idx + k < toks.size() ? &toks[idx + k] : nullptr;
        }

        [[nodiscard]] bool eof() const noexcept { return idx >= toks.size(); }
        [[nodiscard]] bool at_end() const noexcept { return eof() || toks[idx].kind == token_kind::close; }

        /// @brief True when the tokens at idx+k spell @p op with joint spacing between characters
        [[nodiscard]] bool peek_punct(std::string_view op, size_t k = 0) const noexcept;

        [[nodiscard]] bool peek_keyword(std::string_view kw, size_t k = 0) const noexcept;
        [[nodiscard]] bool peek_open(delimiter d, size_t k = 0) const noexcept;
        [[nodiscard]] bool peek_lifetime(size_t k = 0) const noexcept;

        /// @brief Single `:` that is not the start of `::`
        [[nodiscard]] bool peek_colon(size_t k = 0) const noexcept;

        /// @brief Single `=` that is not the start of `==` or `=>`
        [[nodiscard]] bool peek_eq(size_t k = 0) const noexcept;

        const token& next() { return toks[idx++]; }

        bool eat_punct(std::string_view op);
        bool eat_keyword(std::string_view kw);

        expected_void expect_punct(std::string_view op);
        expected_void expect_keyword(std::string_view kw);
        expected_void expect_open(delimiter d);
        expected_void expect_close(delimiter d);
        expected_t<std::string> expect_ident();

        /// @brief Error describing the token at idx (or the end of input)
        [[nodiscard]] ParseError error_here(std::string_view expected) const;

        /// @brief Error at the token at idx with an explicit message
        [[nodiscard]] ParseError error_at_token(ParseError::code code, std::string_view msg) const;

        /// @brief Advances over one token tree (a single token or a whole group)
        void skip_tree();

        /// @brief Copies the raw tokens in [from, to)
        [[nodiscard]] token_stream slice(size_t from, size_t to) const;
    };

    /// @brief Counts nesting while alive; `ok()` is false once the limit is hit
    struct DepthGuard {
        Parser& p;
        bool active = false;

        explicit DepthGuard(Parser& parser) : p(parser) {
            if (p.max_depth != 0 && p.depth + 1 > p.max_depth) return;
            p.depth++;
            active = true;
        }

        ~DepthGuard() {
            if (active) p.depth--;
        }

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

        bool ok() const { return active; }
    };

    /// @brief Counts the levels a loop adds by folding nodes into its left operand
    ///
    /// @details
    /// Binary, cast, range and postfix chains are built iteratively, yet each
    /// fold nests the tree one level deeper. Every `push()` charges one level
    /// against `max_depth`; all of them are released when the guard dies.
    struct ChainGuard {
        Parser& p;
        size_t levels = 0;

        explicit ChainGuard(Parser& parser) : p(parser) {}

        ~ChainGuard() { p.depth -= levels; }

        ChainGuard(const ChainGuard&) = delete;
        ChainGuard& operator=(const ChainGuard&) = delete;

        [[nodiscard]] bool push() {
            if (p.max_depth != 0 && p.depth + 1 > p.max_depth) return false;
            p.depth++;
            levels++;
            return true;
        }
    };

    [[nodiscard]] ParseError depth_error(const Parser& p);

    /// @brief Reserved words that cannot name a path segment or binding
    [[nodiscard]] bool is_reserved_keyword(std::string_view word) noexcept;

    // ------------------------------------------------------------
    // Grammar entry points shared between the parser sources
    // ------------------------------------------------------------

    // Expressions
    expected_t<ExprPtr> parse_expr(Parser& p, bool allow_struct);
    expected_t<ExprPtr> parse_expr_early(Parser& p);
    [[nodiscard]] bool requires_terminator(const Expr& e) noexcept;
    expected_t<Attributes> parse_outer_attrs(Parser& p);
    expected_t<Attributes> parse_inner_attrs(Parser& p);
    expected_t<Macro> parse_macro_body(Parser& p, Path path);

    // Blocks and statements
    expected_t<Block> parse_block(Parser& p);

    // Patterns
    expected_void parse_pat_top(Parser& p, token_stream& out);
    expected_void parse_pat_single(Parser& p, token_stream& out);

    // Types and paths
    expected_void parse_type(Parser& p, token_stream& out, bool allow_plus);
    expected_t<Path> parse_type_path(Parser& p);
    expected_t<Path> parse_expr_path(Parser& p, std::optional<QSelf>& qself);
    expected_void parse_generic_args(Parser& p, token_stream& out);
    expected_void parse_bound_lifetimes(Parser& p, token_stream& out);

} // namespace Stanza::detail
