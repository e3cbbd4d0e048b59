#include "utils/StringUtils.hpp"

#include <iomanip>
#include <sstream>

namespace HiveVerify::Utils {

std::string escapeJson(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char uc : s)
    {
        const char c = static_cast<char>(uc);
        switch (c)
        {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (uc < 0x20)
                {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::uppercase << std::setfill('0')
                        << std::setw(4) << static_cast<unsigned int>(uc);
                    out += oss.str();
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

} // namespace HiveVerify::Utils
