#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace Stanza::detail {

    /// @brief Validates UTF-8 (no overlongs, no surrogates, max U+10FFFF)
    /// @param error_idx Receives the offset of the first bad byte on failure
    bool is_valid_utf8(std::string_view s, std::size_t& error_idx);

    /// @brief Appends the UTF-8 encoding of @p cp; invalid code points become U+FFFD
    void append_utf8(char32_t cp, std::string& out);

    /// @brief Decodes one code point starting at @p i (input assumed valid)
    /// @return The code point; @p len receives its byte length
    char32_t decode_utf8(std::string_view s, std::size_t i, std::size_t& len);

    /// @brief Converts arbitrary bytes to UTF-8, replacing each invalid
    ///        sequence with U+FFFD
    std::string lossy_utf8(std::string_view bytes);

} // namespace Stanza::detail
