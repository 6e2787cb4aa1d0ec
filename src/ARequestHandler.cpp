#include "tickhttp.hpp"

void LoggingRequestHandler::on_success(const DecodedContent& data,
                                       codes::TextStatus status,
                                       Request* request) {
    (void)data;
    log(LOG_DEBUG, "%s succeeded%s%s", request->url().c_str(),
        status == codes::STATUS_NONE ? "" : " with status ",
        text_status_name(status));
}

void LoggingRequestHandler::on_error(Request* request,
                                     codes::TextStatus status,
                                     const std::string& error) {
    log(LOG_ERROR, "%s failed (%s): %s", request->url().c_str(),
        text_status_name(status),
        error.empty() ? "[unknown error]" : error.c_str());
}

void LoggingRequestHandler::on_complete(Request* request,
                                        codes::TextStatus status) {
    (void)status;
    log(LOG_TRACE, "%s completed", request->url().c_str());
}

LoggingRequestHandler* LoggingRequestHandler::get_instance() {
    static LoggingRequestHandler instance;
    return &instance;
}
