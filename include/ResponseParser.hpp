#ifndef RESPONSEPARSER_HPP
#define RESPONSEPARSER_HPP

#include "tickhttp.hpp"

// Forward declarations
class ATransport;
struct HttpResponse;

// Reads and parses the response header block of an HTTP/1.1 exchange.
class ResponseParser {
   public:
    ResponseParser();
    ~ResponseParser();

    // Reads lines from the transport, each bounded by timeout_ms, until the
    // empty line ending the header or until the transport stops delivering
    // (timeout or EOF). The collected lines are parsed into response.
    // - Returns PARSE_SUCCESS if at least one line was collected and parsed.
    // - Returns PARSE_INVALID_HEADER if nothing usable arrived, with error
    //   holding the transport error (if any).
    codes::ParseStatus read_header(ATransport& transport, int timeout_ms,
                                   HttpResponse& response, std::string& error);

    // Parses already collected header lines (without line terminators).
    codes::ParseStatus parse_header_lines(const std::vector<std::string>& lines,
                                          HttpResponse& response);

   private:
    codes::ParseStatus parse_status_line(const std::string& line,
                                         HttpResponse& response);
    codes::ParseStatus process_single_header(const std::string& header_line,
                                             size_t line_number,
                                             HttpResponse& response);
    codes::ParseStatus determine_body_framing(HttpResponse& response);

    // Prevent copying
    ResponseParser(const ResponseParser&);
    ResponseParser& operator=(const ResponseParser&);

};  // class ResponseParser

#endif  // RESPONSEPARSER_HPP
