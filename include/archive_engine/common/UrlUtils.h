#pragma once

#include <string>
#include <vector>

namespace archive_engine::common {

struct UrlParts {
    std::string scheme;   // "http" or "https", lowercased
    std::string netloc;   // host[:port], lowercased
    std::string host;     // host without port
    std::string path;     // path + query, "/" when absent
};

// Strip ASCII control characters and surrounding whitespace from a URL
// that was typed or pasted by a user.
std::string sanitizeUrl(const std::string& input);

// Split an absolute http(s) URL. Returns false when no scheme://host is found.
bool parseUrl(const std::string& url, UrlParts& parts);

// "https://example.com/deep/page" -> "https://example.com/"
std::string rootUrl(const std::string& url);

// True when url points at anything other than the site root.
bool isDeepUrl(const std::string& url);

// host equals one of the domains or is a subdomain of one
bool hostMatchesDomain(const std::string& host, const std::vector<std::string>& domains);

} // namespace archive_engine::common
