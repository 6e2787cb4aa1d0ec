#include "tickhttp.hpp"

// Helper function to trim whitespace
std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    for (size_t i = 0; i < lower.size(); ++i) {
        lower[i] = std::tolower(static_cast<unsigned char>(lower[i]));
    }
    return lower;
}

std::string to_upper(const std::string& str) {
    std::string upper = str;
    for (size_t i = 0; i < upper.size(); ++i) {
        upper[i] = std::toupper(static_cast<unsigned char>(upper[i]));
    }
    return upper;
}

// Wall-clock jumps must not shorten or extend deadlines
void monotonic_now(struct timespec& now) {
    if (clock_gettime(CLOCK_MONOTONIC, &now) != 0) {
        log(LOG_ERROR, "clock_gettime failed: %s", strerror(errno));
        now.tv_sec = 0;
        now.tv_nsec = 0;
    }
}

long elapsed_ms(const struct timespec& since) {
    struct timespec now;
    monotonic_now(now);
    return (now.tv_sec - since.tv_sec) * 1000L +
           (now.tv_nsec - since.tv_nsec) / 1000000L;
}

const char* method_name(codes::Method method) {
    switch (method) {
        case codes::METHOD_GET:
            return "GET";
        case codes::METHOD_POST:
            return "POST";
        case codes::METHOD_HEAD:
            return "HEAD";
        case codes::METHOD_OPTIONS:
            return "OPTIONS";
    }
    return "GET";
}

bool parse_method(const std::string& name, codes::Method& out) {
    std::string upper = to_upper(trim(name));

    if (upper == "GET") {
        out = codes::METHOD_GET;
    } else if (upper == "POST") {
        out = codes::METHOD_POST;
    } else if (upper == "HEAD") {
        out = codes::METHOD_HEAD;
    } else if (upper == "OPTIONS") {
        out = codes::METHOD_OPTIONS;
    } else {
        log(LOG_WARNING, "Unsupported HTTP method: '%s'", name.c_str());
        return false;
    }
    return true;
}

const char* data_type_name(codes::DataType data_type) {
    switch (data_type) {
        case codes::DATA_TEXT:
            return "TEXT";
        case codes::DATA_JSON:
            return "JSON";
        case codes::DATA_LUA_TABLE:
            return "LUA_TABLE";
        case codes::DATA_XML:
            return "XML";
        case codes::DATA_OSC:
            return "OSC";
        case codes::DATA_LUA_SCRIPT:
            return "LUA_SCRIPT";
        case codes::DATA_HTML:
            return "HTML";
    }
    return "TEXT";
}

bool parse_data_type(const std::string& name, codes::DataType& out) {
    std::string upper = to_upper(trim(name));

    if (upper == "TEXT") {
        out = codes::DATA_TEXT;
    } else if (upper == "JSON") {
        out = codes::DATA_JSON;
    } else if (upper == "LUA_TABLE") {
        out = codes::DATA_LUA_TABLE;
    } else if (upper == "XML") {
        out = codes::DATA_XML;
    } else if (upper == "OSC") {
        out = codes::DATA_OSC;
    } else if (upper == "LUA_SCRIPT") {
        out = codes::DATA_LUA_SCRIPT;
    } else if (upper == "HTML") {
        out = codes::DATA_HTML;
    } else {
        log(LOG_WARNING, "Unknown data type: '%s'", name.c_str());
        return false;
    }
    return true;
}

const char* text_status_name(codes::TextStatus status) {
    switch (status) {
        case codes::STATUS_NONE:
            return "";
        case codes::STATUS_TIMEOUT:
            return "TIMEOUT";
        case codes::STATUS_ERROR:
            return "ERROR";
        case codes::STATUS_NOTMODIFIED:
            return "NOTMODIFIED";
        case codes::STATUS_PARSERERROR:
            return "PARSERERROR";
        case codes::STATUS_ABORTED:
            return "ABORTED";
    }
    return "";
}

std::string get_status_message(int code) {
    switch (code) {
        // 1xx - Informational
        case 100:
            return "Continue";
        case 101:
            return "Switching Protocols";

        // 2xx - Success
        case 200:
            return "OK";
        case 201:
            return "Created";
        case 202:
            return "Accepted";
        case 204:
            return "No Content";
        case 206:
            return "Partial Content";

        // 3xx - Redirection
        case 301:
            return "Moved Permanently";
        case 302:
            return "Found";
        case 303:
            return "See Other";
        case 304:
            return "Not Modified";
        case 307:
            return "Temporary Redirect";
        case 308:
            return "Permanent Redirect";

        // 4xx - Client Error
        case 400:
            return "Bad Request";
        case 401:
            return "Unauthorized";
        case 403:
            return "Forbidden";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 408:
            return "Request Timeout";
        case 413:
            return "Payload Too Large";
        case 429:
            return "Too Many Requests";

        // 5xx - Server Error
        case 500:
            return "Internal Server Error";
        case 501:
            return "Not Implemented";
        case 502:
            return "Bad Gateway";
        case 503:
            return "Service Unavailable";
        case 504:
            return "Gateway Timeout";

        default:
            return "Unknown Status";
    }
}
