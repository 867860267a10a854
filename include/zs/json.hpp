#pragma once

#include <string>
#include <string_view>

namespace zs {

// Append s to out as a quoted JSON string literal.
// Control characters use the short escapes where JSON has one, \u00XX otherwise;
// well-formed UTF-8 is copied through, every byte of an ill-formed sequence
// becomes U+FFFD so the output is always valid UTF-8.
void append_json_string(std::string& out, std::string_view s);

inline std::string json_quote(std::string_view s)
{
    std::string out;
    append_json_string(out, s);
    return out;
}

} // namespace zs
