#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include "tickhttp.hpp"

// Parsed response header received from the server.
// An instance of this is owned by Request and filled by ResponseParser.
struct HttpResponse {
    //--------------------------------------
    // Response Data Members
    //--------------------------------------
    int status_code_;             // e.g., 200, 404; 0 if no status line
    std::string status_message_;  // e.g., "OK", "Not Found"
    std::string version_;         // e.g., "HTTP/1.1"
    std::string status_line_;     // Raw first line

    // Header names are stored lowercased. Lines without a colon are stored
    // under their 1-based line number ("1" is usually the status line).
    std::map<std::string, std::string> headers_;

    // Body framing extracted from the header
    size_t content_length_;
    bool has_content_length_;
    bool chunked_;

    //--------------------------------------
    // Constructor / Destructor
    //--------------------------------------
    HttpResponse();
    ~HttpResponse();

    //--------------------------------------
    // Helper Methods (declarations)
    //--------------------------------------
    void set_header(const std::string& name, const std::string& value);
    std::string get_header(const std::string& name) const;
    bool has_header(const std::string& name) const;

    bool is_chunked() const { return chunked_; }

    // True for responses that never carry a body: 1xx, 204 and 304
    bool status_forbids_body() const;

    std::string get_status_line() const;

    void clear();

   private:
    // Prevent copying
    HttpResponse(const HttpResponse&);
    HttpResponse& operator=(const HttpResponse&);

};  // struct HttpResponse

#endif  // HTTP_RESPONSE_HPP
