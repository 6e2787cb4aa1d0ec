#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include "tickhttp.hpp"

// Outgoing HTTP request: request line, ordered header block and body.
// Owned by Request and built once before the first send.
struct HttpRequest {
    //--------------------------------------
    // Request Data Members
    //--------------------------------------
    std::string method_;   // e.g., "GET", "POST"
    std::string target_;   // Path plus query, e.g. "/search?q=1"
    std::string version_;  // Always "HTTP/1.1"

    // Header name/value pairs in the order they are sent. Names keep their
    // spelling; lookups are case-insensitive.
    std::vector<std::pair<std::string, std::string> > headers_;

    std::string body_;  // URL-encoded parameters for POST

    //--------------------------------------
    // Constructor / Destructor
    //--------------------------------------
    HttpRequest();
    ~HttpRequest();

    //--------------------------------------
    // Helper Methods
    //--------------------------------------
    // Inserts a header, or overrides the value of an existing one in place
    void set_header(const std::string& name, const std::string& value);
    std::string get_header(const std::string& name) const;
    bool has_header(const std::string& name) const;

    // "<METHOD> <target> HTTP/1.1"
    std::string get_request_line() const;

    // Request line + headers + mandatory empty line
    std::string get_headers_string() const;

   private:
    // Prevent copying
    HttpRequest(const HttpRequest&);
    HttpRequest& operator=(const HttpRequest&);

};  // struct HttpRequest

#endif  // HTTP_REQUEST_HPP
