/**
 * @file string_escape.cpp
 */
#include "gmlio/common/string_escape.hpp"

namespace gmlio
{

namespace
{

constexpr char k_hex_digits[] = "0123456789ABCDEF";

void append_unicode_escape(std::string& out, uint32_t unit)
{
    out += "\\u";
    out.push_back(k_hex_digits[(unit >> 12) & 0xF]);
    out.push_back(k_hex_digits[(unit >> 8) & 0xF]);
    out.push_back(k_hex_digits[(unit >> 4) & 0xF]);
    out.push_back(k_hex_digits[unit & 0xF]);
}

/// Decode the UTF-8 sequence starting at pos. Returns its length, or 0 if
/// the bytes at pos are not a valid, shortest-form sequence.
size_t decode_utf8(std::string_view text, size_t pos, uint32_t& code_point)
{
    const auto lead = static_cast<unsigned char>(text[pos]);
    size_t length = 0;
    uint32_t min_value = 0;
    if (lead < 0x80)
    {
        code_point = lead;
        return 1;
    }
    else if ((lead & 0xE0) == 0xC0)
    {
        length = 2;
        code_point = lead & 0x1F;
        min_value = 0x80;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        length = 3;
        code_point = lead & 0x0F;
        min_value = 0x800;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        length = 4;
        code_point = lead & 0x07;
        min_value = 0x10000;
    }
    else
    {
        return 0;
    }

    if (pos + length > text.size())
    {
        return 0;
    }
    for (size_t i = 1; i < length; ++i)
    {
        const auto cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80)
        {
            return 0;
        }
        code_point = (code_point << 6) | (cont & 0x3F);
    }
    if (code_point < min_value || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF))
    {
        return 0;
    }
    return length;
}

void append_utf8(std::string& out, uint32_t code_point)
{
    if (code_point < 0x80)
    {
        out.push_back(static_cast<char>(code_point));
    }
    else if (code_point < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
    else if (code_point < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    return -1;
}

/// Parse the four hex digits of the `\uXXXX` escape whose backslash is at pos.
uint32_t parse_unicode_escape(std::string_view text, size_t pos)
{
    if (pos + 6 > text.size())
    {
        throw EscapeError(
            "Truncated \\u escape at offset " + std::to_string(pos), pos);
    }
    uint32_t unit = 0;
    for (size_t i = pos + 2; i < pos + 6; ++i)
    {
        int digit = hex_value(text[i]);
        if (digit < 0)
        {
            throw EscapeError(
                "Invalid hex digit in \\u escape at offset " + std::to_string(pos), pos);
        }
        unit = (unit << 4) | static_cast<uint32_t>(digit);
    }
    return unit;
}

} // namespace

std::string escape_as_text(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + text.size() / 8 + 2);

    size_t pos = 0;
    while (pos < text.size())
    {
        uint32_t code_point = 0;
        size_t length = decode_utf8(text, pos, code_point);
        if (length == 0)
        {
            append_unicode_escape(out, static_cast<unsigned char>(text[pos]));
            ++pos;
            continue;
        }
        pos += length;

        switch (code_point)
        {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\r':
            out += "\\r";
            break;
        default:
            if (code_point < 0x20)
            {
                append_unicode_escape(out, code_point);
            }
            else if (code_point <= 0x7F)
            {
                out.push_back(static_cast<char>(code_point));
            }
            else if (code_point <= 0xFFFF)
            {
                append_unicode_escape(out, code_point);
            }
            else
            {
                uint32_t offset = code_point - 0x10000;
                append_unicode_escape(out, 0xD800 + (offset >> 10));
                append_unicode_escape(out, 0xDC00 + (offset & 0x3FF));
            }
            break;
        }
    }
    return out;
}

std::string unescape_text(std::string_view text)
{
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size())
    {
        char c = text[pos];
        if (c != '\\')
        {
            out.push_back(c);
            ++pos;
            continue;
        }
        if (pos + 1 >= text.size())
        {
            throw EscapeError(
                "Dangling backslash at offset " + std::to_string(pos), pos);
        }

        char letter = text[pos + 1];
        switch (letter)
        {
        case '"':
        case '\\':
        case '\'':
        case '/':
            out.push_back(letter);
            break;
        case 'b':
            out.push_back('\b');
            break;
        case 't':
            out.push_back('\t');
            break;
        case 'n':
            out.push_back('\n');
            break;
        case 'f':
            out.push_back('\f');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 'u':
        {
            uint32_t unit = parse_unicode_escape(text, pos);
            size_t consumed = 6;
            if (unit >= 0xD800 && unit <= 0xDBFF && pos + 7 < text.size() &&
                text[pos + 6] == '\\' && text[pos + 7] == 'u')
            {
                uint32_t low = parse_unicode_escape(text, pos + 6);
                if (low >= 0xDC00 && low <= 0xDFFF)
                {
                    unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
                    consumed = 12;
                }
            }
            append_utf8(out, unit);
            pos += consumed;
            continue;
        }
        default:
            throw EscapeError(
                "Unknown escape sequence \\" + std::string(1, letter) + " at offset " +
                    std::to_string(pos),
                pos);
        }
        pos += 2;
    }
    return out;
}

} // namespace gmlio
