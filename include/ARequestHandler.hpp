#ifndef AREQUESTHANDLER_HPP
#define AREQUESTHANDLER_HPP

#include "tickhttp.hpp"

// Forward declarations
class Request;
struct DecodedContent;

// Completion callbacks of a Request. Exactly one of on_success / on_error
// fires per Request, always followed by on_complete. The connection is
// already released when any of them runs.
class ARequestHandler {
   public:
    // Virtual destructor is essential for classes intended for polymorphic
    // deletion
    virtual ~ARequestHandler() {}

    // status is STATUS_NONE, or STATUS_NOTMODIFIED for a 304 response.
    virtual void on_success(const DecodedContent& data,
                            codes::TextStatus status, Request* request) = 0;

    // error is the transport or decoder message, may be empty.
    virtual void on_error(Request* request, codes::TextStatus status,
                          const std::string& error) = 0;

    virtual void on_complete(Request* request, codes::TextStatus status) = 0;

};  // class ARequestHandler

// Used when a Request is started without a handler: logs failures and
// discards the content.
class LoggingRequestHandler : public ARequestHandler {
   public:
    void on_success(const DecodedContent& data, codes::TextStatus status,
                    Request* request);
    void on_error(Request* request, codes::TextStatus status,
                  const std::string& error);
    void on_complete(Request* request, codes::TextStatus status);

    static LoggingRequestHandler* get_instance();

};  // class LoggingRequestHandler

#endif  // AREQUESTHANDLER_HPP
