#ifndef TICKHTTP_HPP
#define TICKHTTP_HPP

#include <cstddef>
#include <ctime>
#include <string>

#define TICKHTTP_VERSION "1.0"

namespace codes {
enum RequestState {
    REQ_SETUP,         // Constructed, nothing sent yet
    REQ_HEADERS_SENT,  // Request written, waiting for the response header
    REQ_READING_BODY,  // In the pool, body read one slice per tick
    REQ_DECODING,      // Body complete, running the content decoder
    REQ_DONE,          // Success callback fired
    REQ_FAILED         // Error callback fired
};

enum Method {
    METHOD_GET,
    METHOD_POST,
    METHOD_HEAD,
    METHOD_OPTIONS
};

// Body decoding strategy. Only TEXT, JSON, XML and LUA_TABLE transform
// anything; the others are accepted and passed through untouched.
enum DataType {
    DATA_TEXT,
    DATA_JSON,
    DATA_LUA_TABLE,  // Raw fragment list, returned unprocessed
    DATA_XML,
    DATA_OSC,
    DATA_LUA_SCRIPT,
    DATA_HTML
};

// Status reported to the callbacks. STATUS_NONE means in progress or
// succeeded.
enum TextStatus {
    STATUS_NONE,
    STATUS_TIMEOUT,
    STATUS_ERROR,
    STATUS_NOTMODIFIED,
    STATUS_PARSERERROR,
    STATUS_ABORTED
};

// Result of a transport receive
enum ReceiveStatus {
    RECEIVE_OK,       // Data (or a line) was returned
    RECEIVE_TIMEOUT,  // Nothing available within the timeout, recoverable
    RECEIVE_CLOSED,   // Peer closed the connection
    RECEIVE_ERROR     // Hard transport failure
};

// Result of a response header parsing attempt
enum ParseStatus {
    PARSE_SUCCESS,                 // Header block parsed
    PARSE_INVALID_HEADER,          // Nothing usable before EOF
    PARSE_INVALID_STATUS_LINE,     // Status line present but malformed
    PARSE_INVALID_CONTENT_LENGTH,  // Content-Length is not a number
    PARSE_HEADER_TOO_LONG,         // Header line exceeds maximum length
    PARSE_TOO_MANY_HEADERS         // Too many header lines
};

// Result of feeding a fragment to the chunked decoder
enum ChunkStatus {
    CHUNK_INCOMPLETE,    // Need more data
    CHUNK_COMPLETE,      // Terminal chunk seen during this call
    CHUNK_AFTER_END,     // Body already finished, nothing consumed
    CHUNK_INVALID_SIZE,  // Chunk-size line is not valid hex
    CHUNK_ERROR          // Missing CRLF after chunk data or oversized line
};

enum ResponseStatus {
    CONTINUE = 100,
    OK = 200,
    NO_CONTENT = 204,
    NOT_MODIFIED = 304,
    BAD_REQUEST = 400
};

}  // namespace codes

namespace http_limits {
const int DEFAULT_PORT = 80;
const int CONNECT_TIMEOUT_MS = 5000;       // Bound for the TCP connect
const int HEADER_TIMEOUT_MS = 1000;        // Per-line bound of the header phase
const int BODY_READ_TIMEOUT_MS = 0;        // Body reads return immediately
const int MAX_RETRIES = 10;                // Consecutive empty body reads
const int TICK_INTERVAL_MS = 100;          // Default host tick period
const size_t READ_SIZE = 16384;            // Bytes per recv() call
const size_t MAX_HEADER_LINE_LENGTH = 8192;
const size_t MAX_HEADERS = 100;
const size_t MAX_CHUNK_LINE_LENGTH = 1024;  // Chunk size plus extensions
const size_t MAX_CONTENT_DUMP = 32 * 1024;  // Larger bodies are never dumped
}  // namespace http_limits

#define CRLF "\r\n"  // Carriage return + line feed

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "Logger.hpp"

#include "Url.hpp"
#include "ATransport.hpp"
#include "ChunkedDecoder.hpp"
#include "ContentDecoder.hpp"
#include "ARequestHandler.hpp"
#include "ATickSource.hpp"
#include "HttpRequest.hpp"
#include "HttpResponse.hpp"
#include "RequestSettings.hpp"
#include "ResponseParser.hpp"
#include "SocketTransport.hpp"
#include "Request.hpp"
#include "RequestPool.hpp"
#include "IdleLoop.hpp"

// utils
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);
void monotonic_now(struct timespec& now);
long elapsed_ms(const struct timespec& since);

const char* method_name(codes::Method method);
bool parse_method(const std::string& name, codes::Method& out);
const char* data_type_name(codes::DataType data_type);
bool parse_data_type(const std::string& name, codes::DataType& out);
const char* text_status_name(codes::TextStatus status);
std::string get_status_message(int code);

#endif  // TICKHTTP_HPP
