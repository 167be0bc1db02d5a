#include "detail/utf8.hpp"

namespace Stanza::detail {

    namespace {
        struct sequence {
            std::size_t len = 0;    ///< Bytes that form a valid prefix
            bool complete = false;  ///< The prefix is a whole code point
        };

        // Range the second byte must fall in, given the lead byte. The
        // narrowed ranges reject overlong forms, surrogates and values above
        // U+10FFFF.
        bool second_byte_ok(unsigned char lead, unsigned char c1) {
            switch (lead) {
            case 0xE0: return c1 >= 0xA0 && c1 <= 0xBF;
            case 0xED: return c1 >= 0x80 && c1 <= 0x9F;
            case 0xF0: return c1 >= 0x90 && c1 <= 0xBF;
            case 0xF4: return c1 >= 0x80 && c1 <= 0x8F;
            default: return (c1 & 0xC0) == 0x80;
            }
        }

        sequence scan_sequence(const unsigned char* data, std::size_t i, std::size_t n) {
            unsigned char c = data[i];
            if (c <= 0x7F) return { 1, true };

            std::size_t want = 0;
            if (c >= 0xC2 && c <= 0xDF) want = 2;
            else if (c >= 0xE0 && c <= 0xEF) want = 3;
            else if (c >= 0xF0 && c <= 0xF4) want = 4;
            else return { 1, false };

            std::size_t len = 1;
            while (len < want) {
                if (i + len >= n) return { len, false };
                unsigned char cx = data[i + len];
                bool ok = len == 1 ? second_byte_ok(c, cx) : (cx & 0xC0) == 0x80;
                if (!ok) return { len, false };
                len++;
            }
            return { len, true };
        }
    } // namespace

    bool is_valid_utf8(std::string_view s, std::size_t& error_idx) {
        const unsigned char* data = reinterpret_cast<const unsigned char*>(s.data());
        std::size_t i = 0;
        std::size_t n = s.size();

        while (i < n) {
            sequence seq = scan_sequence(data, i, n);
            if (!seq.complete) {
                error_idx = i;
                return false;
            }
            i += seq.len;
        }
        return true;
    }

    void append_utf8(char32_t cp, std::string& out) {
        if (cp >= 0xD800 && cp <= 0xDFFF) cp = 0xFFFD;

        if (cp <= 0x7F) {
            out.push_back(static_cast<char>(cp));
        } else if (cp <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp <= 0x10FFFF) {
            out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            append_utf8(0xFFFD, out);
        }
    }

    char32_t decode_utf8(std::string_view s, std::size_t i, std::size_t& len) {
        auto byte = [&](std::size_t k) { return static_cast<unsigned char>(s[i + k]); };
        unsigned char c = byte(0);

        if (c <= 0x7F) {
            len = 1;
            return c;
        }
        if (c < 0xE0) {
            len = 2;
            return (char32_t(c & 0x1F) << 6) | (byte(1) & 0x3F);
        }
        if (c < 0xF0) {
            len = 3;
            return (char32_t(c & 0x0F) << 12) | (char32_t(byte(1) & 0x3F) << 6) | (byte(2) & 0x3F);
        }
        len = 4;
        return (char32_t(c & 0x07) << 18) | (char32_t(byte(1) & 0x3F) << 12)
             | (char32_t(byte(2) & 0x3F) << 6) | (byte(3) & 0x3F);
    }

    std::string lossy_utf8(std::string_view bytes) {
        const unsigned char* data = reinterpret_cast<const unsigned char*>(bytes.data());
        std::size_t n = bytes.size();
        std::string out;
        out.reserve(n);

        std::size_t i = 0;
        while (i < n) {
            sequence seq = scan_sequence(data, i, n);
            if (seq.complete) {
                out.append(bytes.substr(i, seq.len));
            } else {
                // One replacement per maximal invalid prefix
                append_utf8(0xFFFD, out);
            }
            i += seq.len;
        }
        return out;
    }

} // namespace Stanza::detail
