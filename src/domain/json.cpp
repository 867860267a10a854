#include "zs/json.hpp"

#include <cstddef>
#include <cstdint>

namespace zs {

namespace {

constexpr std::string_view kReplacement = "\xEF\xBF\xBD"; // U+FFFD

void append_control(std::string& out, unsigned char c)
{
    static constexpr char kHex[] = "0123456789abcdef";
    out += "\\u00";
    out += kHex[c >> 4];
    out += kHex[c & 0x0f];
}

// Length of the well-formed UTF-8 sequence starting at s[pos], 0 if it is not one.
// Rejects overlong forms, surrogates and code points above U+10FFFF.
size_t utf8_sequence_length(std::string_view s, size_t pos)
{
    const auto lead = static_cast<unsigned char>(s[pos]);
    size_t len = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;
    if (lead >= 0xc2 && lead <= 0xdf) { len = 2; cp = lead & 0x1f; min_cp = 0x80; }
    else if (lead >= 0xe0 && lead <= 0xef) { len = 3; cp = lead & 0x0f; min_cp = 0x800; }
    else if (lead >= 0xf0 && lead <= 0xf4) { len = 4; cp = lead & 0x07; min_cp = 0x10000; }
    else return 0;

    if (s.size() - pos < len) return 0;
    for (size_t k = 1; k < len; ++k)
    {
        const auto c = static_cast<unsigned char>(s[pos + k]);
        if ((c & 0xc0) != 0x80) return 0;
        cp = (cp << 6) | (c & 0x3f);
    }
    if (cp < min_cp || cp > 0x10ffff) return 0;
    if (cp >= 0xd800 && cp <= 0xdfff) return 0;
    return len;
}

} // namespace

void append_json_string(std::string& out, std::string_view s)
{
    out.reserve(out.size() + s.size() + 2);
    out += '"';
    size_t i = 0;
    while (i < s.size())
    {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c >= 0x80)
        {
            // wire data (TXT, CAA values) may carry arbitrary bytes
            if (const size_t len = utf8_sequence_length(s, i))
            {
                out.append(s.substr(i, len));
                i += len;
            }
            else
            {
                out += kReplacement;
                ++i;
            }
            continue;
        }

        if (c == '"' || c == '\\')
        {
            out += '\\';
            out += static_cast<char>(c);
        }
        else if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else if (c == '\t') out += "\\t";
        else if (c == '\b') out += "\\b";
        else if (c == '\f') out += "\\f";
        else if (c < 0x20) append_control(out, c);
        else out += static_cast<char>(c);
        ++i;
    }
    out += '"';
}

} // namespace zs
