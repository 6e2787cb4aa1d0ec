#include "tickhttp.hpp"

HttpRequest::HttpRequest() : method_("GET"), target_("/") {
    version_ = "HTTP/1.1";
}

HttpRequest::~HttpRequest() {}

void HttpRequest::set_header(const std::string& name,
                             const std::string& value) {
    std::string lower_name = to_lower(name);

    for (size_t i = 0; i < headers_.size(); ++i) {
        if (to_lower(headers_[i].first) == lower_name) {
            headers_[i].second = value;
            log(LOG_TRACE, "Request header overridden: '%s: %s'",
                headers_[i].first.c_str(), value.c_str());
            return;
        }
    }

    headers_.push_back(std::make_pair(name, value));
    log(LOG_TRACE, "Request header set: '%s: %s'", name.c_str(),
        value.c_str());
}

std::string HttpRequest::get_header(const std::string& name) const {
    // Case-insensitive lookup for headers
    std::string lower_name = to_lower(name);

    for (size_t i = 0; i < headers_.size(); ++i) {
        if (to_lower(headers_[i].first) == lower_name) {
            return headers_[i].second;
        }
    }
    return "";
}

bool HttpRequest::has_header(const std::string& name) const {
    std::string lower_name = to_lower(name);

    for (size_t i = 0; i < headers_.size(); ++i) {
        if (to_lower(headers_[i].first) == lower_name) {
            return true;
        }
    }
    return false;
}

std::string HttpRequest::get_request_line() const {
    std::ostringstream oss;
    oss << method_ << " " << target_ << " " << version_;
    return oss.str();
}

std::string HttpRequest::get_headers_string() const {
    std::ostringstream oss;

    oss << get_request_line() << CRLF;

    for (size_t i = 0; i < headers_.size(); ++i) {
        oss << headers_[i].first << ": " << headers_[i].second << CRLF;
    }

    // End of headers
    oss << CRLF;

    return oss.str();
}
