#include "tickhttp.hpp"

Request::Request(const RequestSettings& settings, ATransportFactory* factory)
    : settings_(settings),
      factory_(factory),
      handler_(settings.handler_),
      url_(settings.url_),
      transport_(NULL),
      request_data_(new HttpRequest()),
      response_data_(new HttpResponse()),
      length_(0),
      retries_(0),
      text_status_(codes::STATUS_NONE),
      state_(codes::REQ_SETUP),
      complete_(false) {
    if (handler_ == NULL) {
        handler_ = LoggingRequestHandler::get_instance();
    }
    monotonic_now(started_);
}

Request::~Request() {
    close_connection();

    if (request_data_) {
        delete request_data_;
    }
    if (response_data_) {
        delete response_data_;
    }

    log(LOG_TRACE, "Request resources cleaned up for %s", url_.c_str());
}

bool Request::start() {
    if (state_ != codes::REQ_SETUP) {
        log(LOG_WARNING, "Request for %s already started", url_.c_str());
        return !complete_;
    }
    monotonic_now(started_);

    std::string error;
    if (!prepare(error)) {
        fail(codes::STATUS_ERROR, error);
        return false;
    }

    // Create a connection with the server
    transport_ = factory_->create_client(url_parts_.host_, url_parts_.port_,
                                         settings_.connect_timeout_ms_, error);
    if (transport_ == NULL) {
        fail(codes::STATUS_ERROR, error);
        return false;
    }

    if (!send_request(error)) {
        fail(codes::STATUS_ERROR, error);
        return false;
    }
    state_ = codes::REQ_HEADERS_SENT;

    // Read the response header
    codes::ParseStatus parse_status = parser_.read_header(
        *transport_, settings_.header_timeout_ms_, *response_data_, error);
    if (parse_status != codes::PARSE_SUCCESS) {
        log(LOG_DEBUG, "Response header of %s rejected with status %d",
            url_.c_str(), parse_status);
        fail(codes::STATUS_ERROR, "Invalid page header");
        return false;
    }

    log(LOG_INFO, "%s: %d %s", url_.c_str(), response_data_->status_code_,
        response_data_->status_message_.c_str());

    if (!expects_body()) {
        log(LOG_DEBUG, "No body expected from %s", url_.c_str());
        complete_transfer();
        return false;
    }

    state_ = codes::REQ_READING_BODY;
    return true;
}

// Resolves the URL, serialises the payload and builds the header block
bool Request::prepare(std::string& error) {
    if (factory_ == NULL) {
        error = "No transport factory";
        return false;
    }
    if (!settings_.is_valid(error)) {
        log(LOG_ERROR, "Invalid request settings: %s", error.c_str());
        return false;
    }
    if (!parse_url(settings_.url_, url_parts_)) {
        error = "Invalid URL: " + settings_.url_;
        return false;
    }

    query_string_ = build_query_string(settings_.data_, settings_.traditional_);

    if (!query_string_.empty()) {
        if (settings_.method_ == codes::METHOD_POST) {
            // Form encoding uses '+' for spaces
            std::string body;
            for (size_t i = 0; i < query_string_.size(); ++i) {
                if (query_string_.compare(i, 3, "%20") == 0) {
                    body += '+';
                    i += 2;
                } else {
                    body += query_string_[i];
                }
            }
            query_string_ = body;
        } else {
            url_parts_.query_ = url_parts_.query_.empty()
                                    ? query_string_
                                    : url_parts_.query_ + "&" + query_string_;
            size_t fragment_pos = url_.find('#');
            std::string base = url_.substr(0, fragment_pos);
            url_ = base + (base.find('?') == std::string::npos ? "?" : "&") +
                   query_string_;
        }
    }

    build_headers();
    return true;
}

void Request::build_headers() {
    request_data_->method_ = method_name(settings_.method_);
    request_data_->target_ = url_parts_.request_target();

    // With GET requests the body is empty. With POST requests the body
    // consists of the parameters.
    size_t content_length = 0;
    if (settings_.method_ == codes::METHOD_POST) {
        request_data_->body_ = query_string_;
        content_length = query_string_.size();
    }

    std::ostringstream length;
    length << content_length;

    request_data_->set_header("Host", url_parts_.host_header());
    request_data_->set_header("Content-Type", settings_.content_type_);
    request_data_->set_header("Content-Length", length.str());
    request_data_->set_header("Connection", "keep-alive");
    request_data_->set_header("User-Agent", settings_.user_agent_);

    for (size_t i = 0; i < settings_.headers_.size(); ++i) {
        request_data_->set_header(settings_.headers_[i].first,
                                  settings_.headers_[i].second);
    }
}

bool Request::send_request(std::string& error) {
    if (log(LOG_DEBUG, "Sending %s %s to %s:%d", request_data_->method_.c_str(),
            request_data_->target_.c_str(), url_parts_.host_.c_str(),
            url_parts_.port_) > 0) {
        print_request(request_data_);
    }

    if (!transport_->send(request_data_->get_headers_string(), error)) {
        return false;
    }

    // Send the POST parameters in the request body, if applicable
    if (!request_data_->body_.empty()) {
        if (!transport_->send(request_data_->body_, error)) {
            return false;
        }
    }
    return true;
}

bool Request::expects_body() const {
    if (settings_.method_ == codes::METHOD_HEAD) {
        return false;
    }
    if (response_data_->status_forbids_body()) {
        return false;
    }
    if (!response_data_->is_chunked() && response_data_->has_content_length_ &&
        response_data_->content_length_ == 0) {
        return false;
    }
    return true;
}

bool Request::body_complete() const {
    if (response_data_->is_chunked()) {
        return chunked_decoder_.is_complete();
    }
    if (response_data_->has_content_length_) {
        return length_ >= response_data_->content_length_;
    }
    // Close-delimited, ends with the connection
    return false;
}

bool Request::deadline_expired() const {
    return settings_.timeout_ms_ > 0 &&
           elapsed_ms(started_) >= settings_.timeout_ms_;
}

bool Request::read_content() {
    if (complete_) {
        return false;
    }
    if (state_ != codes::REQ_READING_BODY) {
        log(LOG_ERROR, "Reading content of %s before the header was read",
            url_.c_str());
        return false;
    }

    if (deadline_expired()) {
        log(LOG_WARNING, "Deadline of %ld ms exceeded (%s)",
            settings_.timeout_ms_, url_.c_str());
        fail(codes::STATUS_TIMEOUT, "timeout");
        return false;
    }

    // Read all pending data
    std::string buffer;
    std::string socket_error;
    codes::ReceiveStatus status = transport_->receive_available(
        settings_.body_read_timeout_ms_, buffer, socket_error);

    switch (status) {
        case codes::RECEIVE_OK: {
            if (text_status_ == codes::STATUS_TIMEOUT) {
                text_status_ = codes::STATUS_NONE;
            }

            std::string error;
            if (!process_data(buffer, error)) {
                fail(codes::STATUS_ERROR, error);
                return false;
            }
            log_progress();

            // Detect end of transmission
            if (body_complete()) {
                complete_transfer();
                return false;
            }
            return true;
        }

        case codes::RECEIVE_TIMEOUT:
            ++retries_;
            if (retries_ < settings_.max_retries_) {
                // Retry next time
                text_status_ = codes::STATUS_TIMEOUT;
                log(LOG_WARNING, "read timeout %d/%d (%s)", retries_,
                    settings_.max_retries_, url_.c_str());
                return true;
            }
            log(LOG_WARNING, "Giving up after %d read timeouts (%s)",
                retries_, url_.c_str());
            fail(codes::STATUS_ERROR, socket_error);
            return false;

        case codes::RECEIVE_CLOSED:
            if (!response_data_->is_chunked() &&
                !response_data_->has_content_length_) {
                log(LOG_DEBUG, "Connection closed, end of body (%s)",
                    url_.c_str());
                complete_transfer();
                return false;
            }
            log(LOG_WARNING, "Connection closed before end of body (%s)",
                url_.c_str());
            fail(codes::STATUS_ERROR, socket_error);
            return false;

        case codes::RECEIVE_ERROR:
            log(LOG_WARNING, "%s", socket_error.c_str());
            fail(codes::STATUS_ERROR, socket_error);
            return false;
    }

    return !complete_;
}

bool Request::process_data(const std::string& data, std::string& error) {
    if (response_data_->is_chunked()) {
        log(LOG_TRACE, "Unchunking message stream");

        codes::ChunkStatus chunk_status =
            chunked_decoder_.feed(data, contents_);
        if (chunk_status == codes::CHUNK_INVALID_SIZE ||
            chunk_status == codes::CHUNK_ERROR) {
            error = "Invalid chunked encoding";
            return false;
        }
        length_ = chunked_decoder_.bytes_decoded();
        return true;
    }

    if (response_data_->has_content_length_ &&
        length_ + data.size() > response_data_->content_length_) {
        size_t wanted = response_data_->content_length_ - length_;
        log(LOG_WARNING, "Discarding %zu bytes beyond Content-Length (%s)",
            data.size() - wanted, url_.c_str());
        if (wanted > 0) {
            contents_.push_back(data.substr(0, wanted));
            length_ += wanted;
        }
        return true;
    }

    // Store received new data
    contents_.push_back(data);
    length_ += data.size();
    return true;
}

void Request::log_progress() const {
    // Display amount of data read
    if (length_ > 10 * 1024) {
        log(LOG_DEBUG, "%zu kbytes read (%s)", length_ / 1024, url_.c_str());
    } else {
        log(LOG_DEBUG, "%zu bytes read (%s)", length_, url_.c_str());
    }
}

void Request::abort() {
    if (complete_) {
        return;
    }
    log(LOG_INFO, "Aborting %s", url_.c_str());
    fail(codes::STATUS_ABORTED, "aborted");
}

void Request::complete_transfer() {
    state_ = codes::REQ_DECODING;

    int status_code = response_data_->status_code_;
    if (status_code == codes::NOT_MODIFIED) {
        text_status_ = codes::STATUS_NOTMODIFIED;
    } else if (settings_.fail_on_http_error_ &&
               status_code >= codes::BAD_REQUEST) {
        std::ostringstream oss;
        oss << "HTTP " << status_code << " "
            << response_data_->status_message_;
        text_status_ = codes::STATUS_ERROR;
        do_callback(oss.str(), true);
        return;
    } else {
        text_status_ = codes::STATUS_NONE;
    }

    do_callback("", false);
}

void Request::fail(codes::TextStatus status, const std::string& error) {
    text_status_ = status;
    do_callback(error, true);
}

// Finalizes the transaction and invokes the handler
void Request::do_callback(const std::string& socket_error, bool failed) {
    if (log(LOG_TRACE, "=== CONTENT (%zu bytes from %s) ===", length_,
            url_.c_str()) > 0) {
        print_contents(this);
    }

    if (failed) {
        log(LOG_INFO, "%s failed with error: '%s'.", url_.c_str(),
            socket_error.c_str());
    } else {
        log(LOG_INFO, "%s has completed.", url_.c_str());
    }

    // Close the connection before anyone else gets control
    close_connection();
    complete_ = true;

    std::string error = socket_error;
    decoded_.clear();
    decoded_.data_type_ = settings_.data_type_;

    // Decode data of non-plain datatypes
    if (!failed && length_ > 0) {
        std::string parser_error;
        if (!content_decoder_.decode(contents_, settings_.data_type_, decoded_,
                                     parser_error)) {
            text_status_ = codes::STATUS_PARSERERROR;
            error = parser_error;
            failed = true;
        }
    }

    state_ = failed ? codes::REQ_FAILED : codes::REQ_DONE;

    if (failed) {
        handler_->on_error(this, text_status_, error);
    } else {
        handler_->on_success(decoded_, text_status_, this);
    }
    handler_->on_complete(this, text_status_);
}

void Request::close_connection() {
    if (transport_ == NULL) {
        return;
    }
    transport_->close();
    delete transport_;
    transport_ = NULL;
    log(LOG_TRACE, "Connection to %s released", url_parts_.host_.c_str());
}
