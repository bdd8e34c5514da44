#include "../../include/archive_engine/common/UrlUtils.h"

#include <algorithm>
#include <cctype>

namespace archive_engine::common {

static inline bool isAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string sanitizeUrl(const std::string& input) {
    if (input.empty()) return input;

    size_t start = 0;
    size_t end = input.size();
    while (start < end && isAsciiSpace(static_cast<unsigned char>(input[start]))) start++;
    while (end > start && isAsciiSpace(static_cast<unsigned char>(input[end - 1]))) end--;

    std::string out;
    out.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c < 0x20 || c == 0x7F) continue;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

bool parseUrl(const std::string& url, UrlParts& parts) {
    std::string clean = sanitizeUrl(url);

    size_t schemeEnd = clean.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return false;
    }

    parts.scheme = toLower(clean.substr(0, schemeEnd));
    if (parts.scheme != "http" && parts.scheme != "https") {
        return false;
    }

    size_t hostStart = schemeEnd + 3;
    size_t hostEnd = clean.find_first_of("/?#", hostStart);
    std::string authority = clean.substr(hostStart, hostEnd == std::string::npos ? std::string::npos : hostEnd - hostStart);

    // Drop userinfo
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) {
        return false;
    }

    parts.netloc = toLower(authority);
    size_t colon = parts.netloc.find(':');
    parts.host = colon == std::string::npos ? parts.netloc : parts.netloc.substr(0, colon);

    if (hostEnd == std::string::npos) {
        parts.path = "/";
    } else {
        std::string rest = clean.substr(hostEnd);
        size_t fragment = rest.find('#');
        if (fragment != std::string::npos) {
            rest = rest.substr(0, fragment);
        }
        parts.path = rest.empty() || rest[0] != '/' ? "/" + rest : rest;
    }
    return true;
}

std::string rootUrl(const std::string& url) {
    UrlParts parts;
    if (!parseUrl(url, parts)) {
        return url;
    }
    return parts.scheme + "://" + parts.netloc + "/";
}

bool isDeepUrl(const std::string& url) {
    UrlParts parts;
    if (!parseUrl(url, parts)) {
        return false;
    }
    return parts.path != "/" && !parts.path.empty();
}

bool hostMatchesDomain(const std::string& host, const std::vector<std::string>& domains) {
    std::string lowered = toLower(host);
    for (const auto& domain : domains) {
        std::string d = toLower(domain);
        if (d.empty()) continue;
        if (lowered == d) return true;
        if (lowered.size() > d.size() &&
            lowered.compare(lowered.size() - d.size(), d.size(), d) == 0 &&
            lowered[lowered.size() - d.size() - 1] == '.') {
            return true;
        }
    }
    return false;
}

} // namespace archive_engine::common
