#pragma once

#include <string>

/**
 * Components of an absolute URL "scheme://netloc/path?query#fragment".
 * Only the parts the downloader needs are kept.
 */
struct ParsedUrl
{
    std::string scheme;
    std::string netloc;
    std::string path;

    /**
     * A URL is usable only when both a scheme and a network location are
     * present ("http://host/x" yes, "host/x" or "not a url" no).
     */
    bool isAbsolute() const { return !scheme.empty() && !netloc.empty(); }
};

/**
 * Split a URL into scheme, network location and path.
 * Never throws; missing parts are left empty.
 *
 * @param url Raw URL text
 * @return Parsed components
 */
ParsedUrl parseUrl(const std::string &url);

/**
 * Percent-encode a URL for transport.
 * Letters, digits, "_.-~" and the separators ':' and '/' are kept; every
 * other byte (including '%', '?', '&', spaces) becomes "%XX".
 *
 * Example: "https://host/DM a.jpg" -> "https://host/DM%20a.jpg"
 */
std::string encodeUrl(const std::string &url);
