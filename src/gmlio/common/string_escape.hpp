/**
 * @file string_escape.hpp
 * @brief String-literal escaping for quoted GML values.
 */
#pragma once
#include "gmlio/common/common.hpp"

namespace gmlio
{

/**
 * @brief Exception thrown by `unescape_text()` on a malformed escape sequence.
 */
class EscapeError : public std::invalid_argument
{
public:
    EscapeError(const std::string& message, size_t offset)
        : std::invalid_argument(message)
        , m_offset(offset)
    {
    }

    /**
     * @brief Byte offset of the offending backslash in the input.
     */
    size_t offset() const noexcept
    {
        return m_offset;
    }

private:
    size_t m_offset;
};

/**
 * @brief Escape text so that it can be embedded in a double-quoted literal.
 *
 * @details
 * The input is read as UTF-8. The mapping is:
 * - `"` and `\` are prefixed with a backslash.
 * - Backspace, tab, newline, form feed and carriage return become
 *   `\b`, `\t`, `\n`, `\f` and `\r`.
 * - Any other code point below U+0020 becomes `\u00XX`.
 * - U+0020 through U+007F are copied unchanged.
 * - Code points above U+007F become `\uXXXX`. Code points above U+FFFF are
 *   written as a UTF-16 surrogate pair of two `\uXXXX` escapes.
 * - Bytes that do not form valid UTF-8 are escaped one at a time as `\u00XX`.
 *
 * Hex digits are uppercase. The output is pure ASCII.
 */
std::string escape_as_text(std::string_view text);

/**
 * @brief Reverse `escape_as_text()`.
 *
 * @details
 * Accepts `\"`, `\\`, `\'`, `\/`, `\b`, `\t`, `\n`, `\f`, `\r` and `\uXXXX`
 * (either hex case). A `\uXXXX` high surrogate followed by a `\uXXXX` low
 * surrogate is combined into one code point. The result is UTF-8; a lone
 * surrogate is encoded as its own three-byte sequence.
 *
 * `unescape_text(escape_as_text(s)) == s` holds for every valid UTF-8 `s`.
 * Invalid bytes come back as the Latin-1 character of the same value.
 *
 * @throw EscapeError on a dangling backslash, an unknown escape letter, or a
 *        truncated or non-hex `\u` sequence.
 */
std::string unescape_text(std::string_view text);

} // namespace gmlio
