#ifndef URL_HPP
#define URL_HPP

#include "tickhttp.hpp"

// Key -> values payload. A key with several values is serialised as an
// array, in the style selected by the traditional flag.
typedef std::map<std::string, std::vector<std::string> > RequestData;

// Components of an absolute http:// URL.
struct UrlParts {
    std::string scheme_;  // Always "http" once parsed
    std::string host_;
    int port_;            // 80 unless given explicitly
    std::string path_;    // "/" when the URL has no path
    std::string query_;   // Without the leading '?'
    std::string fragment_;

    UrlParts();

    // Path plus query, as written on the request line
    std::string request_target() const;

    // Value of the Host header ("host" or "host:port")
    std::string host_header() const;
};

// Splits a URL into its parts. Returns false (and logs) for URLs without a
// host, with an invalid port, or with a scheme other than http.
bool parse_url(const std::string& url, UrlParts& parts);

// Percent-encodes everything except RFC 3986 unreserved characters.
std::string url_encode(const std::string& str);

// Serialises the payload as k=v pairs joined by '&'.
std::string build_query_string(const RequestData& data, bool traditional);

#endif  // URL_HPP
