#include "tickhttp.hpp"

UrlParts::UrlParts() : scheme_("http"), port_(http_limits::DEFAULT_PORT) {
    path_ = "/";
}

std::string UrlParts::request_target() const {
    if (query_.empty()) {
        return path_;
    }
    return path_ + "?" + query_;
}

std::string UrlParts::host_header() const {
    // IPv6 literals keep their brackets on the wire
    std::string host = host_;
    if (host.find(':') != std::string::npos) {
        host = "[" + host + "]";
    }
    if (port_ == http_limits::DEFAULT_PORT) {
        return host;
    }
    std::ostringstream oss;
    oss << host << ":" << port_;
    return oss.str();
}

static bool parse_port(const std::string& value, int& port) {
    if (value.empty() || value.size() > 5) {
        return false;
    }
    for (size_t i = 0; i < value.size(); ++i) {
        if (!isdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    port = std::atoi(value.c_str());
    return port > 0 && port <= 65535;
}

bool parse_url(const std::string& url, UrlParts& parts) {
    std::string rest = trim(url);
    parts = UrlParts();

    // Scheme
    size_t scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        parts.scheme_ = to_lower(rest.substr(0, scheme_end));
        rest = rest.substr(scheme_end + 3);
    }
    if (parts.scheme_ != "http") {
        log(LOG_ERROR, "Unsupported URL scheme '%s' in '%s'",
            parts.scheme_.c_str(), url.c_str());
        return false;
    }

    // Fragment and query hang off the end, strip them first
    size_t fragment_pos = rest.find('#');
    if (fragment_pos != std::string::npos) {
        parts.fragment_ = rest.substr(fragment_pos + 1);
        rest = rest.substr(0, fragment_pos);
    }
    size_t query_pos = rest.find('?');
    if (query_pos != std::string::npos) {
        parts.query_ = rest.substr(query_pos + 1);
        rest = rest.substr(0, query_pos);
    }

    // Authority ends at the first slash
    std::string authority = rest;
    size_t path_pos = rest.find('/');
    if (path_pos != std::string::npos) {
        authority = rest.substr(0, path_pos);
        parts.path_ = rest.substr(path_pos);
    }

    // Userinfo is not supported, drop it
    size_t at_pos = authority.rfind('@');
    if (at_pos != std::string::npos) {
        authority = authority.substr(at_pos + 1);
    }

    // Bracketed IPv6 literal, optionally followed by ":port"
    std::string port_part;
    bool has_port = false;
    if (!authority.empty() && authority[0] == '[') {
        size_t close_pos = authority.find(']');
        if (close_pos == std::string::npos) {
            log(LOG_ERROR, "Unterminated IPv6 address in URL '%s'",
                url.c_str());
            return false;
        }
        std::string after = authority.substr(close_pos + 1);
        if (!after.empty()) {
            if (after[0] != ':') {
                log(LOG_ERROR, "Unexpected text after IPv6 address in URL '%s'",
                    url.c_str());
                return false;
            }
            port_part = after.substr(1);
            has_port = true;
        }
        authority = authority.substr(1, close_pos - 1);
    } else {
        size_t colon_pos = authority.rfind(':');
        if (colon_pos != std::string::npos) {
            port_part = authority.substr(colon_pos + 1);
            has_port = true;
            authority = authority.substr(0, colon_pos);
        }
    }

    if (has_port) {
        if (!parse_port(port_part, parts.port_)) {
            log(LOG_ERROR, "Invalid port in URL '%s'", url.c_str());
            return false;
        }
    }

    parts.host_ = authority;
    if (parts.host_.empty()) {
        log(LOG_ERROR, "Missing host in URL '%s'", url.c_str());
        return false;
    }

    log(LOG_TRACE, "Parsed URL '%s': host '%s', port %d, target '%s'",
        url.c_str(), parts.host_.c_str(), parts.port_,
        parts.request_target().c_str());
    return true;
}

std::string url_encode(const std::string& str) {
    static const char hex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if (isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex[c >> 4];
            encoded += hex[c & 0x0F];
        }
    }
    return encoded;
}

std::string build_query_string(const RequestData& data, bool traditional) {
    std::string query;

    for (RequestData::const_iterator it = data.begin(); it != data.end();
         ++it) {
        const std::vector<std::string>& values = it->second;

        // Non-traditional arrays get the PHP/Rails "[]" suffix
        std::string key = it->first;
        if (values.size() > 1 && !traditional) {
            key += "[]";
        }
        key = url_encode(key);

        for (size_t i = 0; i < values.size(); ++i) {
            if (!query.empty()) {
                query += "&";
            }
            query += key + "=" + url_encode(values[i]);
        }
    }

    return query;
}
