#include "url.hpp"

#include <cctype>

namespace
{

bool isSchemeChar(char ch)
{
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '+' || ch == '-' || ch == '.';
}

bool isSafeChar(char ch)
{
    return std::isalnum(static_cast<unsigned char>(ch)) ||
           ch == '_' || ch == '.' || ch == '-' || ch == '~' ||
           ch == ':' || ch == '/';
}

} // namespace

ParsedUrl parseUrl(const std::string &url)
{
    ParsedUrl parsed;
    std::string rest = url;

    // Scheme: a letter followed by letters, digits, '+', '-' or '.', then ':'
    size_t colon = url.find(':');
    if (colon != std::string::npos && colon > 0 &&
        std::isalpha(static_cast<unsigned char>(url[0])))
    {
        bool valid = true;
        for (size_t i = 1; i < colon; ++i)
        {
            if (!isSchemeChar(url[i]))
            {
                valid = false;
                break;
            }
        }
        if (valid)
        {
            parsed.scheme = url.substr(0, colon);
            rest = url.substr(colon + 1);
        }
    }

    // Network location only exists after "//"
    if (rest.compare(0, 2, "//") == 0)
    {
        size_t end = rest.find_first_of("/?#", 2);
        parsed.netloc = rest.substr(2, end == std::string::npos ? std::string::npos : end - 2);
        rest = (end == std::string::npos) ? std::string() : rest.substr(end);
    }

    size_t pathEnd = rest.find_first_of("?#");
    parsed.path = rest.substr(0, pathEnd);
    return parsed;
}

std::string encodeUrl(const std::string &url)
{
    static const char HEX[] = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(url.size());
    for (char ch : url)
    {
        if (isSafeChar(ch))
        {
            encoded += ch;
        }
        else
        {
            auto byte = static_cast<unsigned char>(ch);
            encoded += '%';
            encoded += HEX[byte >> 4];
            encoded += HEX[byte & 0x0F];
        }
    }
    return encoded;
}
