#pragma once


/*
    ---------------------------------
    Stanza opaque renderer (fallback)
    ---------------------------------
    Re-emits any tree node as a token stream and renders it as text. The
    converter uses this for every sub-tree it does not model structurally
    (blocks, patterns, types, macros) and for variants it has no schema for.

    - `to_tokens(node, out)` appends the node's tokens to `out`
    - `to_tokens(node)` returns a fresh stream
    - `render(node)` is `to_tokens(node).to_string()`

    Output is derived from the tree only, never from source bytes, so the
    same sub-tree always renders to byte-identical text. Attributes print
    as `# [meta]` and `#! [meta]`.
*/

#include <string>

#include "stanza/ast.hpp"
#include "stanza/config.hpp"
#include "stanza/token.hpp"

/// @defgroup StanzaRender Opaque Renderer
/// @ingroup Stanza
/// @brief Deterministic text for unmodeled sub-trees

namespace Stanza {

    /// @ingroup StanzaRender
    STANZA_API void to_tokens(const Expr& e, token_stream& out);
    STANZA_API void to_tokens(const Block& block, token_stream& out);
    STANZA_API void to_tokens(const Stmt& stmt, token_stream& out);
    STANZA_API void to_tokens(const Lit& lit, token_stream& out);
    STANZA_API void to_tokens(const Attribute& attr, token_stream& out);
    STANZA_API void to_tokens(const Macro& mac, token_stream& out);
    STANZA_API void to_tokens(const Path& path, token_stream& out);
    STANZA_API void to_tokens(const Pat& pat, token_stream& out);
    STANZA_API void to_tokens(const Type& ty, token_stream& out);

    /// @ingroup StanzaRender
    /// @brief Renders `<T as Trait>::rest`; @p path holds the trait segments followed by the rest
    STANZA_API void to_tokens(const QSelf& qself, const Path& path, token_stream& out);

    /// @ingroup StanzaRender
    template<class T>
    [[nodiscard]] token_stream to_tokens(const T& node) {
        token_stream ts;
        to_tokens(node, ts);
        return ts;
    }

    /// @ingroup StanzaRender
    /// @brief Opaque text of @p node
    template<class T>
    [[nodiscard]] std::string render(const T& node) {
        return to_tokens(node).to_string();
    }

} // namespace Stanza
