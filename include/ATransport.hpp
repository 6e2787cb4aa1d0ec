#ifndef ATRANSPORT_HPP
#define ATRANSPORT_HPP

#include "tickhttp.hpp"

// Abstract byte-stream connection used by a Request. A Request owns exactly
// one transport for the lifetime of its transaction.
class ATransport {
   public:
    // Virtual destructor is essential for classes intended for polymorphic
    // deletion
    virtual ~ATransport() {}

    // Writes all of data. Returns false and sets error on failure.
    virtual bool send(const std::string& data, std::string& error) = 0;

    // Reads one line, without its terminating CRLF (or bare LF), waiting at
    // most timeout_ms. error is "timeout" for RECEIVE_TIMEOUT and "closed"
    // for RECEIVE_CLOSED.
    virtual codes::ReceiveStatus receive_line(int timeout_ms,
                                              std::string& line,
                                              std::string& error) = 0;

    // Returns whatever bytes are currently available, waiting at most
    // timeout_ms for the first one. A zero timeout never blocks.
    virtual codes::ReceiveStatus receive_available(int timeout_ms,
                                                   std::string& data,
                                                   std::string& error) = 0;

    // Releases the underlying connection. Safe to call more than once.
    virtual void close() = 0;

};  // class ATransport

// Creates connected transports. The caller owns the returned object.
class ATransportFactory {
   public:
    virtual ~ATransportFactory() {}

    // Returns NULL and sets error when the connection cannot be made.
    virtual ATransport* create_client(const std::string& host, int port,
                                      int connect_timeout_ms,
                                      std::string& error) = 0;

};  // class ATransportFactory

#endif  // ATRANSPORT_HPP
