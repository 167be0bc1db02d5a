#include "detail/literal.hpp"
#include "detail/utf8.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace Stanza::detail {

    namespace {
        struct cp_range {
            char32_t lo;
            char32_t hi;
        };

        // Non-ASCII blocks with no XID_Start code point: spaces, controls,
        // punctuation, symbols, private use and emoji
        constexpr std::array<cp_range, 19> non_ident_ranges = { {
            { 0x0080, 0x00A9 }, { 0x00AB, 0x00B4 }, { 0x00B6, 0x00B9 }, { 0x00BB, 0x00BF },
            { 0x00D7, 0x00D7 }, { 0x00F7, 0x00F7 }, { 0x1680, 0x1680 }, { 0x2000, 0x206F },
            { 0x2190, 0x2BFF }, { 0x3000, 0x3004 }, { 0xD800, 0xDFFF }, { 0xE000, 0xF8FF },
            { 0xFE10, 0xFE1F }, { 0xFEFF, 0xFEFF }, { 0xFF01, 0xFF0F }, { 0xFFF0, 0xFFFF },
            { 0x1F000, 0x1FAFF }, { 0xE0000, 0xE007F }, { 0xF0000, 0xFFFFFFFF },
        } };

        bool in_non_ident_range(char32_t c) noexcept {
            for (const auto& r : non_ident_ranges) {
                if (c >= r.lo && c <= r.hi) return true;
            }
            return false;
        }
    } // namespace

    bool is_ident_start(char32_t c) noexcept {
        if (c <= 0x7F) return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        return !in_non_ident_range(c);
    }

    bool is_ident_continue(char32_t c) noexcept {
        // Middle dot and the undertie connectors continue but never start
        return is_ident_start(c) || (c >= '0' && c <= '9') || c == 0xB7 || c == 0x203F || c == 0x2040;
    }

    std::string to_base10(std::string_view digits, unsigned radix) {
        // Little-endian decimal digits
        std::vector<uint8_t> acc;

        for (char ch : digits) {
            unsigned d = 0;
            if (ch >= '0' && ch <= '9') d = unsigned(ch - '0');
            else if (ch >= 'a' && ch <= 'f') d = unsigned(ch - 'a' + 10);
            else if (ch >= 'A' && ch <= 'F') d = unsigned(ch - 'A' + 10);

            unsigned carry = d;
            for (auto& x : acc) {
                unsigned cur = unsigned(x) * radix + carry;
                x = static_cast<uint8_t>(cur % 10);
                carry = cur / 10;
            }
            while (carry != 0) {
                acc.push_back(static_cast<uint8_t>(carry % 10));
                carry /= 10;
            }
        }

        if (acc.empty()) return "0";
        std::string out;
        out.reserve(acc.size());
        for (auto it = acc.rbegin(); it != acc.rend(); ++it) out.push_back(static_cast<char>('0' + *it));
        return out;
    }

    namespace {
        using decoded = std::expected<std::string, std::string>;

        enum class lit_mode : uint8_t {
            str,
            byte_str,
            c_str,
            chr,
            byte,
        };

        [[nodiscard]] bool is_byte_mode(lit_mode m) noexcept {
            return m == lit_mode::byte_str || m == lit_mode::byte;
        }

        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        // Decodes the text between the quotes of a non-raw literal. The
        // result holds raw bytes for byte modes and UTF-8 otherwise.
        decoded unescape(std::string_view body, lit_mode mode) {
            std::string out;
            size_t i = 0;
            bool quoted_char = mode == lit_mode::chr || mode == lit_mode::byte;

            while (i < body.size()) {
                char c = body[i];

                if (c != '\\') {
                    unsigned char uc = static_cast<unsigned char>(c);
                    if (c == '\r' && (i + 1 >= body.size() || body[i + 1] != '\n'))
                        return std::unexpected("bare CR not allowed in literal");
                    if (quoted_char && (c == '\'' || c == '\n' || c == '\r' || c == '\t'))
                        return std::unexpected("character literal must be escaped");
                    if (is_byte_mode(mode) && uc > 0x7F)
                        return std::unexpected("non-ASCII character in byte literal");
                    if (mode == lit_mode::c_str && c == '\0')
                        return std::unexpected("null characters in C string literals are not supported");
                    out.push_back(c);
                    i++;
                    continue;
                }

                if (i + 1 >= body.size()) return std::unexpected("unterminated escape");
                char e = body[i + 1];
                i += 2;

                switch (e) {
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case '\\': out.push_back('\\'); break;
                case '\'': out.push_back('\''); break;
                case '"': out.push_back('"'); break;
                case '0':
                    if (mode == lit_mode::c_str)
                        return std::unexpected("null characters in C string literals are not supported");
                    out.push_back('\0');
                    break;
                case 'x': {
                    if (i + 2 > body.size()) return std::unexpected("numeric character escape is too short");
                    int hi = hex_value(body[i]);
                    int lo = hex_value(body[i + 1]);
                    if (hi < 0 || lo < 0) return std::unexpected("invalid character in numeric character escape");
                    int v = hi * 16 + lo;
                    i += 2;
                    if ((mode == lit_mode::str || mode == lit_mode::chr) && v > 0x7F)
                        return std::unexpected("out of range hex escape");
                    if (mode == lit_mode::c_str && v == 0)
                        return std::unexpected("null characters in C string literals are not supported");
                    out.push_back(static_cast<char>(v));
                    break;
                }
                case 'u': {
                    if (is_byte_mode(mode)) return std::unexpected("unicode escape in byte literal");
                    if (i >= body.size() || body[i] != '{') return std::unexpected("incorrect unicode escape sequence");
                    i++;
                    char32_t cp = 0;
                    int ndigits = 0;
                    while (i < body.size() && body[i] != '}') {
                        if (body[i] == '_') {
                            if (ndigits == 0) return std::unexpected("invalid start of unicode escape");
                            i++;
                            continue;
                        }
                        int h = hex_value(body[i]);
                        if (h < 0) return std::unexpected("invalid character in unicode escape");
                        if (++ndigits > 6) return std::unexpected("overlong unicode escape");
                        cp = cp * 16 + char32_t(h);
                        i++;
                    }
                    if (i >= body.size()) return std::unexpected("unterminated unicode escape");
                    i++;
                    if (ndigits == 0) return std::unexpected("empty unicode escape");
                    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                        return std::unexpected("invalid unicode character escape");
                    if (mode == lit_mode::c_str && cp == 0)
                        return std::unexpected("null characters in C string literals are not supported");
                    append_utf8(cp, out);
                    break;
                }
                case '\n':
                case '\r':
                    if (quoted_char) return std::unexpected("unknown character escape");
                    // String continuation: drop the line break and leading whitespace
                    while (i < body.size() && (body[i] == ' ' || body[i] == '\t' || body[i] == '\n' || body[i] == '\r')) i++;
                    break;
                default:
                    return std::unexpected("unknown character escape");
                }
            }
            return out;
        }

        decoded check_raw(std::string_view body, lit_mode mode) {
            for (size_t i = 0; i < body.size(); i++) {
                char c = body[i];
                if (c == '\r' && (i + 1 >= body.size() || body[i + 1] != '\n'))
                    return std::unexpected("bare CR not allowed in raw string");
                if (is_byte_mode(mode) && static_cast<unsigned char>(c) > 0x7F)
                    return std::unexpected("non-ASCII character in raw byte string literal");
                if (mode == lit_mode::c_str && c == '\0')
                    return std::unexpected("null characters in C string literals are not supported");
            }
            return std::string(body);
        }

        struct quoted_parts {
            std::string_view body;
            std::string_view suffix;
            bool raw = false;
        };

        // Splits `r##"body"##suffix` or `"body"suffix` (prefix already removed)
        quoted_parts split_quoted(std::string_view s, char quote) {
            quoted_parts p;
            size_t hashes = 0;
            if (!s.empty() && s[0] == 'r') {
                p.raw = true;
                s.remove_prefix(1);
                while (hashes < s.size() && s[hashes] == '#') hashes++;
            }
            size_t open = hashes;
            size_t close = s.rfind(quote);
            p.body = s.substr(open + 1, close - open - 1);
            p.suffix = s.substr(close + 1 + hashes);
            return p;
        }

        std::vector<uint8_t> to_bytes(const std::string& s) {
            return std::vector<uint8_t>(s.begin(), s.end());
        }

        std::expected<Lit, std::string> decode_number(std::string_view repr) {
            unsigned radix = 10;
            size_t i = 0;

            if (repr.size() >= 2 && repr[0] == '0' && (repr[1] == 'x' || repr[1] == 'o' || repr[1] == 'b')) {
                radix = repr[1] == 'x' ? 16 : repr[1] == 'o' ? 8 : 2;
                i = 2;

                std::string digits;
                while (i < repr.size()) {
                    char c = repr[i];
                    if (c == '_') { i++; continue; }
                    bool hex = hex_value(c) >= 0;
                    if (radix == 16 ? !hex : !(c >= '0' && c <= '9')) break;
                    if (hex_value(c) >= int(radix))
                        return std::unexpected("invalid digit for a base " + std::to_string(radix) + " literal");
                    digits.push_back(c);
                    i++;
                }
                if (digits.empty()) return std::unexpected("no valid digits found for number");

                LitInt lit;
                lit.repr = std::string(repr);
                lit.digits = to_base10(digits, radix);
                lit.suffix = std::string(repr.substr(i));
                return lit;
            }

            std::string int_digits;
            while (i < repr.size() && ((repr[i] >= '0' && repr[i] <= '9') || repr[i] == '_')) {
                if (repr[i] != '_') int_digits.push_back(repr[i]);
                i++;
            }

            bool is_float = false;
            if (i < repr.size() && repr[i] == '.') {
                is_float = true;
                i++;
                while (i < repr.size() && ((repr[i] >= '0' && repr[i] <= '9') || repr[i] == '_')) i++;
            }

            if (i < repr.size() && (repr[i] == 'e' || repr[i] == 'E')) {
                size_t j = i + 1;
                if (j < repr.size() && (repr[j] == '+' || repr[j] == '-')) j++;
                while (j < repr.size() && repr[j] == '_') j++;
                if (j < repr.size() && repr[j] >= '0' && repr[j] <= '9') {
                    is_float = true;
                    i = j;
                    while (i < repr.size() && ((repr[i] >= '0' && repr[i] <= '9') || repr[i] == '_')) i++;
                } else if (j != i + 1) {
                    return std::unexpected("expected at least one digit in exponent");
                }
            }

            std::string_view suffix = repr.substr(i);
            if (!is_float && (suffix == "f16" || suffix == "f32" || suffix == "f64" || suffix == "f128"))
                is_float = true;

            if (is_float) {
                LitFloat lit;
                lit.repr = std::string(repr);
                for (char c : repr.substr(0, i)) {
                    if (c != '_') lit.digits.push_back(c);
                }
                lit.suffix = std::string(suffix);
                return lit;
            }

            LitInt lit;
            lit.repr = std::string(repr);
            lit.digits = to_base10(int_digits, 10);
            lit.suffix = std::string(suffix);
            return lit;
        }
    } // namespace

    std::expected<Lit, std::string> decode_literal(std::string_view repr) {
        if (repr.empty()) return std::unexpected("empty literal");

        char c0 = repr[0];
        if (c0 >= '0' && c0 <= '9') return decode_number(repr);

        if (c0 == '"' || (c0 == 'r' && repr.size() > 1 && (repr[1] == '"' || repr[1] == '#'))) {
            auto parts = split_quoted(repr, '"');
            auto text = parts.raw ? check_raw(parts.body, lit_mode::str) : unescape(parts.body, lit_mode::str);
            if (!text) return std::unexpected(text.error());
            return LitStr{ std::string(repr), *std::move(text), std::string(parts.suffix) };
        }

        if (c0 == 'b' && repr.size() > 1 && (repr[1] == '"' || repr[1] == 'r')) {
            auto parts = split_quoted(repr.substr(1), '"');
            auto bytes = parts.raw ? check_raw(parts.body, lit_mode::byte_str) : unescape(parts.body, lit_mode::byte_str);
            if (!bytes) return std::unexpected(bytes.error());
            return LitByteStr{ std::string(repr), to_bytes(*bytes), std::string(parts.suffix) };
        }

        if (c0 == 'c' && repr.size() > 1 && (repr[1] == '"' || repr[1] == 'r')) {
            auto parts = split_quoted(repr.substr(1), '"');
            auto bytes = parts.raw ? check_raw(parts.body, lit_mode::c_str) : unescape(parts.body, lit_mode::c_str);
            if (!bytes) return std::unexpected(bytes.error());
            return LitCStr{ std::string(repr), to_bytes(*bytes), std::string(parts.suffix) };
        }

        if (c0 == 'b' && repr.size() > 1 && repr[1] == '\'') {
            auto parts = split_quoted(repr.substr(1), '\'');
            auto bytes = unescape(parts.body, lit_mode::byte);
            if (!bytes) return std::unexpected(bytes.error());
            if (bytes->size() != 1) return std::unexpected("byte literal must contain exactly one byte");
            return LitByte{ std::string(repr), static_cast<uint8_t>((*bytes)[0]), std::string(parts.suffix) };
        }

        if (c0 == '\'') {
            auto parts = split_quoted(repr, '\'');
            auto text = unescape(parts.body, lit_mode::chr);
            if (!text) return std::unexpected(text.error());
            if (text->empty()) return std::unexpected("empty character literal");
            size_t len = 0;
            char32_t cp = decode_utf8(*text, 0, len);
            if (len != text->size()) return std::unexpected("character literal may only contain one codepoint");
            return LitChar{ std::string(repr), cp, std::string(parts.suffix) };
        }

        return LitVerbatim{ std::string(repr) };
    }

} // namespace Stanza::detail
