// Copyright 2018 Your Name <your_email>

#ifndef LINKCHECK_URL_HPP
#define LINKCHECK_URL_HPP
#include <string>

namespace linkcheck {

struct UrlParts{
    std::string scheme;
    std::string userinfo;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    bool has_authority;
    bool has_query;
    bool has_fragment;
};

// Splits a URL reference into its RFC 3986 components. Never fails,
// unparseable input ends up in `path`.
UrlParts split_url(const std::string& url);

// Resolves `ref` against `base` (RFC 3986 section 5.2).
std::string resolve_url(const std::string& base, const std::string& ref);

// Canonical form used for dedup: resolved, no fragment, no surrounding
// whitespace, no trailing slashes.
std::string normalize_url(const std::string& base, const std::string& link);

bool is_internal(const std::string& base_url, const std::string& url);
bool is_crawlable(const std::string& url);

std::string default_port(const std::string& scheme);

}  // namespace linkcheck
#endif //LINKCHECK_URL_HPP
