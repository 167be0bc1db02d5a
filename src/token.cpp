#include "stanza/token.hpp"

#include <utility>

namespace Stanza {

    void token_stream::ident(std::string_view name) {
        token t;
        t.kind = token_kind::ident;
        t.text.assign(name.begin(), name.end());
        m_Tokens.push_back(std::move(t));
    }

    void token_stream::punct(std::string_view op) {
        for (size_t i = 0; i < op.size(); i++) {
            punct(op[i], i + 1 < op.size() ? spacing::joint : spacing::alone);
        }
    }

    void token_stream::punct(char c, spacing s) {
        token t;
        t.kind = token_kind::punct;
        t.text.assign(1, c);
        t.space = s;
        m_Tokens.push_back(std::move(t));
    }

    void token_stream::literal(std::string_view repr) {
        token t;
        t.kind = token_kind::literal;
        t.text.assign(repr.begin(), repr.end());
        m_Tokens.push_back(std::move(t));
    }

    void token_stream::lifetime(std::string_view name) {
        punct('\'', spacing::joint);
        ident(name);
    }

    void token_stream::open(delimiter d) {
        token t;
        t.kind = token_kind::open;
        t.delim = d;
        m_Tokens.push_back(std::move(t));
    }

    void token_stream::close(delimiter d) {
        token t;
        t.kind = token_kind::close;
        t.delim = d;
        m_Tokens.push_back(std::move(t));
    }

    void token_stream::push_back(token t) {
        m_Tokens.push_back(std::move(t));
    }

    void token_stream::append(const token_stream& other) {
        m_Tokens.insert(m_Tokens.end(), other.m_Tokens.begin(), other.m_Tokens.end());
    }

    char open_char(delimiter d) noexcept {
        switch (d) {
        case delimiter::parenthesis: return '(';
        case delimiter::brace: return '{';
        case delimiter::bracket: return '[';
        case delimiter::none: break;
        }
        return '\0';
    }

    char close_char(delimiter d) noexcept {
        switch (d) {
        case delimiter::parenthesis: return ')';
        case delimiter::brace: return '}';
        case delimiter::bracket: return ']';
        case delimiter::none: break;
        }
        return '\0';
    }

    std::string token_stream::to_string() const {
        // One entry per open group: whether anything was written inside it
        // yet, and whether the last token written was a joint punct.
        struct level {
            bool first = true;
            bool joint = false;
        };

        std::string out;
        std::vector<level> levels(1);

        for (const auto& t : m_Tokens) {
            if (t.kind == token_kind::close) {
                bool empty_group = levels.back().first;
                if (levels.size() > 1) levels.pop_back();
                if (t.delim == delimiter::brace && !empty_group) out.push_back(' ');
                if (t.delim != delimiter::none) out.push_back(close_char(t.delim));
                levels.back().joint = false;
                continue;
            }

            level& cur = levels.back();
            if (!cur.first && !cur.joint) out.push_back(' ');
            cur.first = false;
            cur.joint = false;

            switch (t.kind) {
            case token_kind::open:
                if (t.delim != delimiter::none) out.push_back(open_char(t.delim));
                if (t.delim == delimiter::brace) out.push_back(' ');
                levels.emplace_back();
                break;
            case token_kind::punct:
                out += t.text;
                cur.joint = t.space == spacing::joint;
                break;
            default:
                out += t.text;
                break;
            }
        }
        return out;
    }

} // namespace Stanza
