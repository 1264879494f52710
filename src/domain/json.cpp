#include "qf/json.hpp"

#include <format>

namespace qf {

// Escapes a string for use inside a JSON string literal.
std::string json_escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 2);
    for (const char c : s)
    {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\')
        {
            out += '\\';
            out += c;
        }
        else if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else if (c == '\t') out += "\\t";
        else if (uc < 0x20) out += std::format("\\u{:04x}", static_cast<unsigned>(uc));
        else out += c;
    }
    return out;
}

} // namespace qf
