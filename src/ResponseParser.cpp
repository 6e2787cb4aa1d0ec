#include "tickhttp.hpp"

ResponseParser::ResponseParser() {}

ResponseParser::~ResponseParser() {}

codes::ParseStatus ResponseParser::read_header(ATransport& transport,
                                               int timeout_ms,
                                               HttpResponse& response,
                                               std::string& error) {
    std::vector<std::string> header_lines;
    bool terminated = false;

    while (true) {
        std::string line;
        std::string receive_error;
        codes::ReceiveStatus status =
            transport.receive_line(timeout_ms, line, receive_error);

        if (status == codes::RECEIVE_ERROR) {
            log(LOG_ERROR, "Receiving response header failed: %s",
                receive_error.c_str());
            error = receive_error;
            return codes::PARSE_INVALID_HEADER;
        }
        if (status != codes::RECEIVE_OK) {
            // Unexpected EOF or no more lines within the timeout
            log(LOG_DEBUG, "Response header ended early: %s",
                receive_error.c_str());
            error = receive_error;
            break;
        }

        if (line.empty()) {
            // Header ends with an empty line
            terminated = true;
            break;
        }

        if (line.size() > http_limits::MAX_HEADER_LINE_LENGTH) {
            log(LOG_ERROR, "Response header line exceeds %zu bytes",
                http_limits::MAX_HEADER_LINE_LENGTH);
            return codes::PARSE_HEADER_TOO_LONG;
        }
        if (header_lines.size() >= http_limits::MAX_HEADERS) {
            log(LOG_ERROR, "Response header has more than %zu lines",
                http_limits::MAX_HEADERS);
            return codes::PARSE_TOO_MANY_HEADERS;
        }

        header_lines.push_back(line);
    }

    if (header_lines.empty()) {
        log(LOG_ERROR, "No response header received");
        return codes::PARSE_INVALID_HEADER;
    }

    if (!terminated) {
        log(LOG_WARNING, "Response header not terminated by an empty line");
    }

    return parse_header_lines(header_lines, response);
}

codes::ParseStatus ResponseParser::parse_header_lines(
    const std::vector<std::string>& lines, HttpResponse& response) {
    response.clear();

    if (lines.empty()) {
        return codes::PARSE_INVALID_HEADER;
    }

    size_t first = 0;
    if (lines[0].compare(0, 5, "HTTP/") == 0) {
        codes::ParseStatus parse_status = parse_status_line(lines[0], response);
        if (parse_status != codes::PARSE_SUCCESS) {
            return parse_status;
        }
        first = 1;
    } else {
        log(LOG_WARNING, "Response has no status line: '%s'",
            lines[0].c_str());
    }

    for (size_t i = first; i < lines.size(); ++i) {
        codes::ParseStatus parse_status =
            process_single_header(lines[i], i + 1, response);
        if (parse_status != codes::PARSE_SUCCESS) {
            log(LOG_ERROR, "Failed to parse header '%s'", lines[i].c_str());
            return parse_status;
        }
    }

    codes::ParseStatus parse_status = determine_body_framing(response);
    if (parse_status != codes::PARSE_SUCCESS) {
        return parse_status;
    }

    if (log(LOG_DEBUG, "Response header parsed: %s",
            response.get_status_line().c_str()) > 0) {
        print_response(&response);
    }
    return codes::PARSE_SUCCESS;
}

// "HTTP/1.1 200 OK"; the reason phrase may be empty or contain spaces
codes::ParseStatus ResponseParser::parse_status_line(const std::string& line,
                                                     HttpResponse& response) {
    response.status_line_ = line;

    // Keep the raw line reachable by number, like any colonless line
    response.headers_["1"] = line;

    size_t first_space = line.find(' ');
    if (first_space == std::string::npos) {
        log(LOG_ERROR, "Invalid status line: '%s'", line.c_str());
        return codes::PARSE_INVALID_STATUS_LINE;
    }

    std::string version = line.substr(0, first_space);
    std::string rest = trim(line.substr(first_space + 1));

    size_t second_space = rest.find(' ');
    std::string code = rest.substr(0, second_space);
    std::string message;
    if (second_space != std::string::npos) {
        message = trim(rest.substr(second_space + 1));
    }

    if (code.size() != 3 || !isdigit(static_cast<unsigned char>(code[0])) ||
        !isdigit(static_cast<unsigned char>(code[1])) ||
        !isdigit(static_cast<unsigned char>(code[2]))) {
        log(LOG_ERROR, "Invalid status code in status line: '%s'",
            line.c_str());
        return codes::PARSE_INVALID_STATUS_LINE;
    }

    response.version_ = version;
    response.status_code_ = std::atoi(code.c_str());
    response.status_message_ =
        message.empty() ? get_status_message(response.status_code_) : message;

    log(LOG_DEBUG, "Status line: %s %d %s", response.version_.c_str(),
        response.status_code_, response.status_message_.c_str());
    return codes::PARSE_SUCCESS;
}

codes::ParseStatus ResponseParser::process_single_header(
    const std::string& header_line, size_t line_number,
    HttpResponse& response) {
    // Find the colon
    size_t colon_pos = header_line.find(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        // Not a "Name: Value" line, keep it under its line number
        std::ostringstream key;
        key << line_number;
        response.headers_[key.str()] = header_line;
        log(LOG_DEBUG, "Header line %zu has no name: '%s'", line_number,
            header_line.c_str());
        return codes::PARSE_SUCCESS;
    }

    std::string key = trim(header_line.substr(0, colon_pos));
    std::string value = trim(header_line.substr(colon_pos + 1));

    if (key.empty()) {
        return codes::PARSE_INVALID_HEADER;
    }

    response.set_header(key, value);
    return codes::PARSE_SUCCESS;
}

codes::ParseStatus ResponseParser::determine_body_framing(
    HttpResponse& response) {
    std::string transfer_encoding =
        to_lower(response.get_header("transfer-encoding"));
    if (transfer_encoding.find("chunked") != std::string::npos) {
        response.chunked_ = true;
    }

    if (!response.has_header("content-length")) {
        return codes::PARSE_SUCCESS;
    }

    // Repeated Content-Length headers arrive folded as "5, 5" and are
    // accepted only when every value is the same
    std::string content_length = response.get_header("content-length");
    unsigned long body_size = 0;
    size_t start = 0;

    while (true) {
        size_t comma = content_length.find(',', start);
        std::string part = content_length.substr(
            start, comma == std::string::npos ? std::string::npos
                                              : comma - start);
        part = trim(part);
        char* end_ptr;
        unsigned long part_size = std::strtoul(part.c_str(), &end_ptr, 10);

        // Check for invalid Content-Length format
        if (part.empty() || end_ptr == part.c_str() || *end_ptr != '\0' ||
            part[0] == '-' || part[0] == '+') {
            log(LOG_ERROR, "Invalid Content-Length header: '%s'",
                content_length.c_str());
            return codes::PARSE_INVALID_CONTENT_LENGTH;
        }
        if (start > 0 && part_size != body_size) {
            log(LOG_ERROR, "Conflicting Content-Length values: '%s'",
                content_length.c_str());
            return codes::PARSE_INVALID_CONTENT_LENGTH;
        }
        body_size = part_size;

        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }

    if (response.chunked_) {
        // Transfer-Encoding overrides Content-Length
        log(LOG_WARNING,
            "Response has both Content-Length and chunked encoding, "
            "ignoring Content-Length");
        return codes::PARSE_SUCCESS;
    }

    response.content_length_ = body_size;
    response.has_content_length_ = true;
    return codes::PARSE_SUCCESS;
}
