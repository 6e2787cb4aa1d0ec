#ifndef SOCKETTRANSPORT_HPP
#define SOCKETTRANSPORT_HPP

#include "tickhttp.hpp"

// TCP transport over a non-blocking POSIX socket. Reads go through an
// internal buffer so that bytes received past a header line stay available
// to later bulk reads.
class SocketTransport : public ATransport {
   public:
    explicit SocketTransport(int fd);
    ~SocketTransport();

    bool send(const std::string& data, std::string& error);
    codes::ReceiveStatus receive_line(int timeout_ms, std::string& line,
                                      std::string& error);
    codes::ReceiveStatus receive_available(int timeout_ms, std::string& data,
                                           std::string& error);
    void close();

    int get_fd() const { return fd_; }

    static bool set_non_blocking(int fd);

   private:
    int fd_;
    std::string read_buffer_;  // Received but not yet consumed
    bool peer_closed_;         // recv() returned 0

    // Waits for readability, then drains the socket into read_buffer_.
    codes::ReceiveStatus fill_buffer(int timeout_ms, std::string& error);

    // Prevent copying
    SocketTransport(const SocketTransport&);
    SocketTransport& operator=(const SocketTransport&);

};  // class SocketTransport

class SocketTransportFactory : public ATransportFactory {
   public:
    SocketTransportFactory();
    ~SocketTransportFactory();

    ATransport* create_client(const std::string& host, int port,
                              int connect_timeout_ms, std::string& error);

   private:
    int connect_to(const struct addrinfo* addr, int connect_timeout_ms,
                   std::string& error);

    // Prevent copying
    SocketTransportFactory(const SocketTransportFactory&);
    SocketTransportFactory& operator=(const SocketTransportFactory&);

};  // class SocketTransportFactory

#endif  // SOCKETTRANSPORT_HPP
