#include "tickhttp.hpp"

static log_level g_active_log_level = LOG_INFO;

void print_request(const HttpRequest* request) {
    if (request == NULL) {
        std::cerr << "Error: request is NULL" << std::endl;
        return;
    }

    std::cerr << "\n==== OUTGOING REQUEST ====\n\n";
    std::cerr << request->get_headers_string();
    if (!request->body_.empty()) {
        std::cerr << "body (" << request->body_.size()
                  << " bytes): " << request->body_ << std::endl;
    }
    std::cerr << "\n==========================\n" << std::endl;
}

void print_response(const HttpResponse* response) {
    if (response == NULL) {
        std::cerr << "Error: response is NULL" << std::endl;
        return;
    }

    std::cerr << "\n==== RESPONSE HEADER ====\n";
    std::cerr << "Status: " << response->status_code_ << " "
              << response->status_message_ << " (" << response->version_
              << ")" << std::endl;
    std::cerr << "Headers: ";
    for (std::map<std::string, std::string>::const_iterator it =
             response->headers_.begin();
         it != response->headers_.end(); ++it) {
        std::cerr << it->first << "=" << it->second << "; ";
    }
    std::cerr << std::endl;
    if (response->has_content_length_) {
        std::cerr << "Content-Length: " << response->content_length_
                  << std::endl;
    }
    std::cerr << "=========================\n" << std::endl;
}

void print_contents(const Request* request) {
    if (request == NULL) {
        std::cerr << "Error: request is NULL" << std::endl;
        return;
    }

    std::cerr << "=== CONTENT (" << request->length() << " bytes from "
              << request->url() << ") ===" << std::endl;

    if (request->length() > http_limits::MAX_CONTENT_DUMP) {
        std::cerr << " *** too much content to display (> 32 kbytes) *** "
                  << std::endl;
        return;
    }

    const std::vector<std::string>& contents = request->contents();
    for (size_t i = 0; i < contents.size(); ++i) {
        std::cerr << "[" << i << "] ";
        std::cerr.write(contents[i].data(), contents[i].size());
        std::cerr << std::endl;
    }
}

void set_log_level(log_level level) { g_active_log_level = level; }

log_level get_log_level() { return g_active_log_level; }

bool parse_log_level(const std::string& name, log_level& out) {
    std::string lower = to_lower(name);

    if (lower == "off") {
        out = LOG_OFF;
    } else if (lower == "trace") {
        out = LOG_TRACE;
    } else if (lower == "debug") {
        out = LOG_DEBUG;
    } else if (lower == "info") {
        out = LOG_INFO;
    } else if (lower == "warning") {
        out = LOG_WARNING;
    } else if (lower == "error") {
        out = LOG_ERROR;
    } else if (lower == "fatal") {
        out = LOG_FATAL;
    } else {
        return false;
    }
    return true;
}

std::string get_current_gmt_time() {
    char buffer[100];
    time_t now = time(NULL);
    struct tm* tm_info = gmtime(&now);

    strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S: ", tm_info);
    return std::string(buffer);
}

int log(log_level level, const char* msg, ...) {
    if (g_active_log_level == LOG_OFF || level < g_active_log_level) {
        return 0;
    }

    char output[8192];
    va_list args;
    int n;

    va_start(args, msg);
    n = vsnprintf(output, sizeof(output), msg, args);
    va_end(args);

    if (level == LOG_TRACE)
        std::cerr << LIGHT_BLUE << "[TRACE]\t";
    else if (level == LOG_DEBUG)
        std::cerr << WHITE << "[DEBUG]\t";
    else if (level == LOG_INFO)
        std::cerr << CYAN << "[INFO]\t";
    else if (level == LOG_WARNING)
        std::cerr << MAGENTA << "[WARNING]\t";
    else if (level == LOG_ERROR)
        std::cerr << RED << "[ERROR]\t";
    else if (level == LOG_FATAL)
        std::cerr << LIGHT_RED << "[FATAL]\t";

    std::cerr << get_current_gmt_time() << output << RESET << std::endl;

    return n;
}
