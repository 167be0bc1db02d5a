#include "stanza/stanza.hpp"

#include "detail/utf8.hpp"

#include <charconv>
#include <cmath>
#include <ostream>
#include <sstream>

namespace Stanza {

    namespace detail {
        std::expected<void, WriteError> validate(const value& v);
        void dump_impl(const value& v, std::ostream& os, const WriteOptions& opts, size_t depth);
    } // namespace detail

    WriteResult dump(const value& v, const WriteOptions& opts) {
        if (auto r = detail::validate(v); !r) return std::unexpected(r.error());
        std::ostringstream oss;
        detail::dump_impl(v, oss, opts, 0);
        return oss.str();
    }

    std::expected<void, WriteError> dump(const value& v, std::ostream& os, const WriteOptions& opts) {
        if (auto r = detail::validate(v); !r) return r;
        detail::dump_impl(v, os, opts, 0);
        if (!os) return std::unexpected(WriteError::make(WriteError::code::io_error, "output stream failed while writing"));
        return {};
    }

#pragma region Serializer

    namespace detail {

        // ================================
        // Internal serializer implementation
        // ================================

        std::expected<void, WriteError> validate_text(std::string_view s) {
            size_t at = 0;
            if (is_valid_utf8(s, at)) return {};
            return std::unexpected(WriteError::make(WriteError::code::invalid_utf8,
                "string contains invalid UTF-8 at byte " + std::to_string(at)));
        }

        std::expected<void, WriteError> validate(const value& v) {
            switch (v.type()) {
            case kind::number:
                if (!std::isfinite(v.as_number()))
                    return std::unexpected(WriteError::make(WriteError::code::non_finite_number, "number is not finite"));
                return {};
            case kind::string:
                return validate_text(v.as_string());
            case kind::array:
                for (const auto& item : v.as_array()) {
                    if (auto r = validate(item); !r) return r;
                }
                return {};
            case kind::object:
                for (const auto& [k, val] : v.as_object()) {
                    if (auto r = validate_text(k); !r) return r;
                    if (auto r = validate(val); !r) return r;
                }
                return {};
            default:
                return {};
            }
        }

        void dump_string(std::string_view s, std::ostream& os) {
            os.put('"');
            for (unsigned char c : s) {
                switch (c) {
                case '"': os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\b': os << "\\b"; break;
                case '\f': os << "\\f"; break;
                case '\n': os << "\\n"; break;
                case '\r': os << "\\r"; break;
                case '\t': os << "\\t"; break;
                default:
                    if (c < 0x20) {
                        // control characters -> \u00XX
                        static constexpr char hex[] = "0123456789abcdef";
                        os << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                    } else {
                        os.put(static_cast<char>(c));
                    }
                    break;
                }
            }
            os.put('"');
        }

        void dump_indent(std::ostream& os, size_t depth, const WriteOptions& opts) {
            if (!opts.pretty || opts.indent == 0) return;
            size_t spaces = depth * opts.indent;
            for (size_t i = 0; i < spaces; i++) os.put(' ');
        }

        void dump_number(double d, std::ostream& os) {
            char buf[64];
            // Shortest round-trip form; integral values print without a fraction
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            os.write(buf, ptr - buf);
        }

        void dump_impl(const value& v, std::ostream& os, const WriteOptions& opts, size_t depth) {
            switch (v.type()) {
            case kind::null: os << "null"; return;
            case kind::boolean: os << (v.as_bool() ? "true" : "false"); return;
            case kind::number: dump_number(v.as_number(), os); return;
            case kind::string: dump_string(v.as_string(), os); return;
            case kind::array: {
                const auto& arr = v.as_array();
                size_t n = arr.size();

                os.put('[');
                if (n == 0) {
                    os.put(']');
                    return;
                }

                if (opts.pretty) os.put('\n');
                for (size_t i = 0; i < n; i++) {
                    if (opts.pretty) dump_indent(os, depth + 1, opts);
                    dump_impl(arr[i], os, opts, depth + 1);
                    if (i + 1 < n) os.put(',');
                    if (opts.pretty) os.put('\n');
                }
                if (opts.pretty) dump_indent(os, depth, opts);
                os.put(']');
                return;
            }
            case kind::object: {
                const auto& obj = v.as_object();
                size_t n = obj.size();

                os.put('{');
                if (n == 0) {
                    os.put('}');
                    return;
                }

                // Keys come out sorted: object is a std::pmr::map
                if (opts.pretty) os.put('\n');

                size_t i = 0;
                for (const auto& [k, val] : obj) {
                    if (opts.pretty) dump_indent(os, depth + 1, opts);
                    dump_string(k, os);
                    os << (opts.pretty ? ": " : ":");
                    dump_impl(val, os, opts, depth + 1);
                    if (i + 1 < n) os.put(',');
                    if (opts.pretty) os.put('\n');
                    i++;
                }
                if (opts.pretty) dump_indent(os, depth, opts);
                os.put('}');
                return;
            }
            }
            os << "null";
        }

    } // namespace detail

#pragma endregion

} // namespace Stanza
