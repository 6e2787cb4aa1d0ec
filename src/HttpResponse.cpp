#include "tickhttp.hpp"

HttpResponse::HttpResponse()
    : status_code_(0),
      content_length_(0),
      has_content_length_(false),
      chunked_(false) {}

HttpResponse::~HttpResponse() {}

void HttpResponse::set_header(const std::string& name,
                              const std::string& value) {
    std::string lower_name = to_lower(name);

    // Repeated headers are folded into one comma-separated value
    std::map<std::string, std::string>::iterator it =
        headers_.find(lower_name);
    if (it != headers_.end() && !it->second.empty()) {
        it->second += ", " + value;
    } else {
        headers_[lower_name] = value;
    }

    log(LOG_TRACE, "Response header set: '%s: %s'", lower_name.c_str(),
        value.c_str());
}

std::string HttpResponse::get_header(const std::string& name) const {
    // Case-insensitive lookup for headers
    std::map<std::string, std::string>::const_iterator it =
        headers_.find(to_lower(name));
    if (it != headers_.end()) {
        return it->second;
    }
    return "";
}

bool HttpResponse::has_header(const std::string& name) const {
    return headers_.find(to_lower(name)) != headers_.end();
}

bool HttpResponse::status_forbids_body() const {
    return (status_code_ >= codes::CONTINUE && status_code_ < codes::OK) ||
           status_code_ == codes::NO_CONTENT ||
           status_code_ == codes::NOT_MODIFIED;
}

std::string HttpResponse::get_status_line() const {
    std::ostringstream oss;
    oss << version_ << " " << status_code_ << " " << status_message_;
    return oss.str();
}

void HttpResponse::clear() {
    status_code_ = 0;
    status_message_.clear();
    version_.clear();
    status_line_.clear();
    headers_.clear();
    content_length_ = 0;
    has_content_length_ = false;
    chunked_ = false;

    log(LOG_TRACE, "HttpResponse cleared");
}
