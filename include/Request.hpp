#ifndef REQUEST_HPP
#define REQUEST_HPP

#include "tickhttp.hpp"

// Forward declarations
class ARequestHandler;
class ATransport;
class ATransportFactory;
struct HttpRequest;
struct HttpResponse;

// One HTTP transaction. start() connects, sends the request and reads the
// response header with bounded blocking reads; afterwards the body is read
// one non-blocking slice per read_content() call, normally once per tick
// from the RequestPool.
//
// Lifecycle:
//   REQ_SETUP -> REQ_HEADERS_SENT -> REQ_READING_BODY
//             -> REQ_DECODING -> REQ_DONE
//   (any state) -> REQ_FAILED
// On REQ_DONE / REQ_FAILED the connection is released and the handler gets
// on_success or on_error, then on_complete.
class Request {
   public:
    //--------------------------------------
    // Constructor / Destructor
    //--------------------------------------
    // Snapshots settings. factory is not owned and must outlive start().
    Request(const RequestSettings& settings, ATransportFactory* factory);
    ~Request();  // Closes the connection if still open

    //--------------------------------------
    // Transaction steps
    //--------------------------------------
    // Synchronous setup. Returns true if the body still has to be read;
    // false if the request already finished (callbacks have fired).
    bool start();

    // Reads whatever body bytes are available. Returns true while more
    // reads are needed; false once the request is complete.
    bool read_content();

    // Tears down the connection and fails the request with STATUS_ABORTED.
    // Does nothing on a completed request.
    void abort();

    //--------------------------------------
    // Accessors
    //--------------------------------------
    bool is_complete() const { return complete_; }
    codes::RequestState state() const { return state_; }
    codes::TextStatus text_status() const { return text_status_; }
    size_t length() const { return length_; }
    int retries() const { return retries_; }
    const std::string& url() const { return url_; }
    const RequestSettings& settings() const { return settings_; }
    const UrlParts& url_parts() const { return url_parts_; }
    const HttpRequest* request_data() const { return request_data_; }
    const HttpResponse* response() const { return response_data_; }
    const std::vector<std::string>& contents() const { return contents_; }
    const DecodedContent& decoded() const { return decoded_; }
    bool has_connection() const { return transport_ != NULL; }

   private:
    RequestSettings settings_;
    ATransportFactory* factory_;
    ARequestHandler* handler_;

    std::string url_;  // Effective URL, including appended query data
    UrlParts url_parts_;
    std::string query_string_;

    ATransport* transport_;        // Owned, NULL when no connection is open
    HttpRequest* request_data_;    // Owned outgoing request
    HttpResponse* response_data_;  // Owned parsed response header

    ResponseParser parser_;
    ChunkedDecoder chunked_decoder_;
    ContentDecoder content_decoder_;

    std::vector<std::string> contents_;  // Received body fragments
    size_t length_;                      // Body bytes after de-chunking
    int retries_;                        // Empty body reads so far
    codes::TextStatus text_status_;
    codes::RequestState state_;
    bool complete_;
    struct timespec started_;

    DecodedContent decoded_;

    bool prepare(std::string& error);
    void build_headers();
    bool send_request(std::string& error);
    bool expects_body() const;
    bool body_complete() const;
    bool deadline_expired() const;

    bool process_data(const std::string& data, std::string& error);
    void log_progress() const;

    void complete_transfer();
    void fail(codes::TextStatus status, const std::string& error);
    void do_callback(const std::string& socket_error, bool failed);
    void close_connection();

    // Prevent copying
    Request(const Request&);
    Request& operator=(const Request&);

};  // class Request

#endif  // REQUEST_HPP
