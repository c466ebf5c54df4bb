// Copyright 2018 Your Name <your_email>

#include <url.hpp>

#include <algorithm>
#include <cctype>
#include <vector>

namespace linkcheck {

namespace {

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return str;
}

std::string trim(const std::string& str) {
    std::size_t start = 0;
    std::size_t end = str.size();
    while (start < end && std::isspace(static_cast<unsigned char>(str[start])))
        ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1])))
        --end;
    return str.substr(start, end - start);
}

bool valid_scheme(const std::string& scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0])))
        return false;
    for (char c : scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' &&
            c != '-' && c != '.')
            return false;
    }
    return true;
}

void split_authority(const std::string& authority, UrlParts* parts) {
    std::string hostport = authority;
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        parts->userinfo = authority.substr(0, at);
        hostport = authority.substr(at + 1);
    }
    std::size_t host_end = hostport.size();
    if (!hostport.empty() && hostport[0] == '[') {
        auto close = hostport.find(']');
        host_end = close == std::string::npos ? hostport.size() : close + 1;
    } else {
        auto colon = hostport.find(':');
        if (colon != std::string::npos) host_end = colon;
    }
    parts->host = hostport.substr(0, host_end);
    if (host_end < hostport.size() && hostport[host_end] == ':')
        parts->port = hostport.substr(host_end + 1);
}

std::string remove_dot_segments(const std::string& path) {
    std::string input = path;
    std::vector<std::string> output;
    bool absolute = !input.empty() && input[0] == '/';
    bool trailing = false;
    std::size_t pos = absolute ? 1 : 0;
    while (pos <= input.size()) {
        auto next = input.find('/', pos);
        if (next == std::string::npos) next = input.size();
        std::string segment = input.substr(pos, next - pos);
        bool last = next == input.size();
        if (segment == "..") {
            if (!output.empty()) output.pop_back();
            trailing = true;
        } else if (segment == ".") {
            trailing = true;
        } else {
            output.push_back(segment);
            trailing = false;
        }
        if (last) break;
        pos = next + 1;
    }
    std::string result = absolute ? "/" : "";
    for (std::size_t i = 0; i < output.size(); ++i) {
        if (i > 0) result += '/';
        result += output[i];
    }
    if (trailing && !output.empty()) result += '/';
    return result;
}

std::string merge_paths(const UrlParts& base, const std::string& ref_path) {
    if (base.has_authority && base.path.empty()) return "/" + ref_path;
    auto slash = base.path.rfind('/');
    if (slash == std::string::npos) return ref_path;
    return base.path.substr(0, slash + 1) + ref_path;
}

std::string join_url(const UrlParts& parts) {
    std::string url;
    if (!parts.scheme.empty()) url += parts.scheme + ":";
    if (parts.has_authority) {
        url += "//";
        if (!parts.userinfo.empty()) url += parts.userinfo + "@";
        url += parts.host;
        if (!parts.port.empty()) url += ":" + parts.port;
    }
    url += parts.path;
    if (parts.has_query) url += "?" + parts.query;
    if (parts.has_fragment) url += "#" + parts.fragment;
    return url;
}

}  // namespace

UrlParts split_url(const std::string& url) {
    UrlParts parts{};
    std::string rest = url;

    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        parts.has_fragment = true;
        parts.fragment = rest.substr(hash + 1);
        rest.erase(hash);
    }
    auto question = rest.find('?');
    if (question != std::string::npos) {
        parts.has_query = true;
        parts.query = rest.substr(question + 1);
        rest.erase(question);
    }
    auto colon = rest.find(':');
    if (colon != std::string::npos &&
        rest.find('/') > colon &&
        valid_scheme(rest.substr(0, colon))) {
        parts.scheme = rest.substr(0, colon);
        rest.erase(0, colon + 1);
    }
    if (rest.compare(0, 2, "//") == 0) {
        parts.has_authority = true;
        auto path_start = rest.find('/', 2);
        if (path_start == std::string::npos) path_start = rest.size();
        split_authority(rest.substr(2, path_start - 2), &parts);
        rest.erase(0, path_start);
    }
    parts.path = rest;
    return parts;
}

std::string resolve_url(const std::string& base, const std::string& ref) {
    UrlParts b = split_url(base);
    UrlParts r = split_url(ref);
    UrlParts t{};

    if (!r.scheme.empty()) {
        t = r;
        t.path = remove_dot_segments(r.path);
    } else {
        if (r.has_authority) {
            t = r;
            t.path = remove_dot_segments(r.path);
        } else {
            t.has_authority = b.has_authority;
            t.userinfo = b.userinfo;
            t.host = b.host;
            t.port = b.port;
            if (r.path.empty()) {
                t.path = b.path;
                t.has_query = r.has_query || b.has_query;
                t.query = r.has_query ? r.query : b.query;
            } else {
                if (r.path[0] == '/')
                    t.path = remove_dot_segments(r.path);
                else
                    t.path = remove_dot_segments(merge_paths(b, r.path));
                t.has_query = r.has_query;
                t.query = r.query;
            }
        }
        t.scheme = b.scheme;
    }
    t.has_fragment = r.has_fragment;
    t.fragment = r.fragment;
    return join_url(t);
}

std::string normalize_url(const std::string& base, const std::string& link) {
    UrlParts parts = split_url(resolve_url(base, trim(link)));
    parts.has_fragment = false;
    parts.fragment.clear();
    parts.scheme = to_lower(parts.scheme);
    parts.host = to_lower(parts.host);

    std::string url = join_url(parts);
    while (!url.empty() && (url.back() == '/' ||
                            std::isspace(static_cast<unsigned char>(url.back()))))
        url.pop_back();
    return url;
}

bool is_internal(const std::string& base_url, const std::string& url) {
    std::string base_host = to_lower(split_url(base_url).host);
    std::string host = to_lower(split_url(url).host);
    return !host.empty() && host == base_host;
}

bool is_crawlable(const std::string& url) {
    std::string scheme = to_lower(split_url(trim(url)).scheme);
    return scheme == "http" || scheme == "https";
}

std::string default_port(const std::string& scheme) {
    std::string lower = to_lower(scheme);
    if (lower == "https") return "443";
    if (lower == "http") return "80";
    return "";
}

}  // namespace linkcheck
