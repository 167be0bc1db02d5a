#pragma once


/*
    ------------------------------------------
    Stanza::token / Stanza::token_stream
    ------------------------------------------
    The flat token model shared by the lexer, the parser and the opaque
    renderer

    - Identifiers and keywords are `ident` tokens (`r#` prefixes preserved)
    - Punctuation is split into single characters. A character that is
      immediately followed by another character of the same operator is
      marked `joint`, so `::` is `:`(joint) `:`(alone)
    - A lifetime `'a` is a `'`(joint) punct followed by the ident `a`
    - Literals keep their exact source spelling in `text`
    - Delimited groups are `open` ... `close` pairs

    -------
    Display
    -------
    `token_stream::to_string()` renders the canonical opaque text:
        - token trees are separated by a single space, except after a
          `joint` punct
        - `(` and `[` groups print tight: `f (a , b)`, `[1 , 2]`
        - brace groups pad their contents: `{ x }`, and print `{ }` when
          empty
    Identical streams always render to byte-identical text
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"

/// @defgroup StanzaTokens Tokens
/// @ingroup Stanza
/// @brief Token model used for parsing and opaque rendering

namespace Stanza {

    /// @ingroup StanzaTokens
    enum class delimiter : uint8_t {
        parenthesis, ///< `( ... )`
        brace,       ///< `{ ... }`
        bracket,     ///< `[ ... ]`
        none,        ///< Invisible group, produced only by tree builders
    };

    /// @ingroup StanzaTokens
    enum class spacing : uint8_t {
        alone, ///< Followed by whitespace, a non-punct token or the end
        joint, ///< Immediately followed by another punct of the same operator
    };

    /// @ingroup StanzaTokens
    enum class token_kind : uint8_t {
        ident,
        punct,
        literal,
        open,
        close,
    };

    /// @ingroup StanzaTokens
    /// @brief Position of a token in the source text
    struct source_pos {
        std::size_t offset = 0;
        std::size_t line = 1;
        std::size_t column = 1;
    };

    /// @ingroup StanzaTokens
    /// @brief A single lexical token
    struct token {
        token_kind kind{};
        std::string text{};                   ///< Ident name, punct character or literal spelling
        delimiter delim = delimiter::none;    ///< Set for `open` and `close`
        spacing space = spacing::alone;       ///< Meaningful for `punct` only
        source_pos pos{};

        [[nodiscard]] bool is_ident() const noexcept { return kind == token_kind::ident; }
        [[nodiscard]] bool is_ident(std::string_view name) const noexcept { return kind == token_kind::ident && text == name; }
        [[nodiscard]] bool is_punct(char c) const noexcept { return kind == token_kind::punct && text.size() == 1 && text[0] == c; }
        [[nodiscard]] bool is_literal() const noexcept { return kind == token_kind::literal; }
        [[nodiscard]] bool is_open(delimiter d) const noexcept { return kind == token_kind::open && delim == d; }
        [[nodiscard]] bool is_close(delimiter d) const noexcept { return kind == token_kind::close && delim == d; }
        [[nodiscard]] bool is_joint() const noexcept { return kind == token_kind::punct && space == spacing::joint; }
    };

    /// @ingroup StanzaTokens
    /// @brief Append-only sequence of tokens with canonical display
    class token_stream {
    public:
        using const_iterator = std::vector<token>::const_iterator;

        /// @brief Appends an identifier or keyword
        STANZA_API void ident(std::string_view name);

        /// @brief Appends an operator; every character but the last is joint
        STANZA_API void punct(std::string_view op);

        /// @brief Appends a single punct character with explicit spacing
        STANZA_API void punct(char c, spacing s);

        /// @brief Appends a literal by its source spelling
        STANZA_API void literal(std::string_view repr);

        /// @brief Appends a lifetime or label, @p name given without the quote
        STANZA_API void lifetime(std::string_view name);

        STANZA_API void open(delimiter d);
        STANZA_API void close(delimiter d);

        /// @brief Appends a raw token as-is (spacing preserved)
        STANZA_API void push_back(token t);

        /// @brief Appends every token of @p other
        STANZA_API void append(const token_stream& other);

        [[nodiscard]] bool empty() const noexcept { return m_Tokens.empty(); }
        [[nodiscard]] std::size_t size() const noexcept { return m_Tokens.size(); }
        [[nodiscard]] const_iterator begin() const noexcept { return m_Tokens.begin(); }
        [[nodiscard]] const_iterator end() const noexcept { return m_Tokens.end(); }
        [[nodiscard]] const token& operator[](std::size_t i) const { return m_Tokens[i]; }
        [[nodiscard]] const std::vector<token>& tokens() const noexcept { return m_Tokens; }

        /// @brief Renders the canonical opaque text of the stream
        [[nodiscard]] STANZA_API std::string to_string() const;

    private:
        std::vector<token> m_Tokens;
    };

    /// @ingroup StanzaTokens
    [[nodiscard]] STANZA_API char open_char(delimiter d) noexcept;

    /// @ingroup StanzaTokens
    [[nodiscard]] STANZA_API char close_char(delimiter d) noexcept;

} // namespace Stanza
