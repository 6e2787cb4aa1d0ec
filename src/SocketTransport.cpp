#include "tickhttp.hpp"

SocketTransport::SocketTransport(int fd) : fd_(fd), peer_closed_(false) {}

SocketTransport::~SocketTransport() { close(); }

bool SocketTransport::set_non_blocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        log(LOG_ERROR, "Failed to get flags for socket '%i'", fd);
        return false;
    }

    flags |= O_NONBLOCK;

    if (fcntl(fd, F_SETFL, flags) == -1) {
        log(LOG_ERROR, "Failed to set non-blocking mode for socket '%i'", fd);
        return false;
    }

    return true;
}

void SocketTransport::close() {
    if (fd_ >= 0) {
        log(LOG_TRACE, "Closing socket '%i'", fd_);
        ::close(fd_);
        fd_ = -1;
    }
    read_buffer_.clear();
}

bool SocketTransport::send(const std::string& data, std::string& error) {
    if (fd_ < 0) {
        error = "not connected";
        return false;
    }

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t bytes_written = ::send(fd_, data.data() + offset,
                                       data.size() - offset,
                                       MSG_NOSIGNAL);  // Prevents SIGPIPE
        if (bytes_written > 0) {
            offset += bytes_written;
            continue;
        }

        if (bytes_written < 0 && errno == EINTR) {
            continue;
        }

        if (bytes_written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            // Socket buffer full, wait (bounded) until it drains
            struct pollfd pfd;
            pfd.fd = fd_;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            int ready = poll(&pfd, 1, http_limits::CONNECT_TIMEOUT_MS);
            if (ready > 0) {
                continue;
            }
            error = ready == 0 ? "timeout" : strerror(errno);
            log(LOG_ERROR, "Send on socket '%i' stalled: %s", fd_,
                error.c_str());
            return false;
        }

        error = bytes_written < 0 ? strerror(errno) : "closed";
        log(LOG_ERROR, "Error writing to socket '%i': %s", fd_, error.c_str());
        return false;
    }

    log(LOG_TRACE, "Sent %zu bytes on socket '%i'", data.size(), fd_);
    return true;
}

codes::ReceiveStatus SocketTransport::fill_buffer(int timeout_ms,
                                                  std::string& error) {
    if (fd_ < 0) {
        error = "not connected";
        return codes::RECEIVE_ERROR;
    }

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ready = poll(&pfd, 1, timeout_ms < 0 ? 0 : timeout_ms);
    if (ready < 0) {
        if (errno == EINTR) {
            error = "timeout";
            return codes::RECEIVE_TIMEOUT;
        }
        error = strerror(errno);
        log(LOG_ERROR, "poll() failed on socket '%i': %s", fd_, error.c_str());
        return codes::RECEIVE_ERROR;
    }
    if (ready == 0) {
        error = "timeout";
        return codes::RECEIVE_TIMEOUT;
    }

    // Drain everything the kernel has for us
    size_t received = 0;
    char buffer[http_limits::READ_SIZE];
    while (true) {
        ssize_t bytes_read = recv(fd_, buffer, sizeof(buffer), 0);
        if (bytes_read > 0) {
            read_buffer_.append(buffer, bytes_read);
            received += bytes_read;
            continue;
        }
        if (bytes_read == 0) {
            log(LOG_DEBUG, "Peer closed socket '%i'", fd_);
            peer_closed_ = true;
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        }
        error = strerror(errno);
        log(LOG_ERROR, "Error reading from socket '%i': %s", fd_,
            error.c_str());
        return codes::RECEIVE_ERROR;
    }

    if (received > 0) {
        log(LOG_TRACE, "Read %zu bytes from socket '%i'", received, fd_);
        return codes::RECEIVE_OK;
    }
    if (peer_closed_) {
        error = "closed";
        return codes::RECEIVE_CLOSED;
    }
    error = "timeout";
    return codes::RECEIVE_TIMEOUT;
}

codes::ReceiveStatus SocketTransport::receive_line(int timeout_ms,
                                                   std::string& line,
                                                   std::string& error) {
    struct timespec started;
    monotonic_now(started);

    while (true) {
        size_t newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            if (!line.empty() && line[line.size() - 1] == '\r') {
                line.erase(line.size() - 1);
            }
            return codes::RECEIVE_OK;
        }

        if (read_buffer_.size() > http_limits::MAX_HEADER_LINE_LENGTH) {
            error = "line too long";
            log(LOG_ERROR, "Line exceeds %zu bytes on socket '%i'",
                http_limits::MAX_HEADER_LINE_LENGTH, fd_);
            return codes::RECEIVE_ERROR;
        }

        if (peer_closed_) {
            if (read_buffer_.empty()) {
                error = "closed";
                return codes::RECEIVE_CLOSED;
            }
            // Unterminated last line
            line = read_buffer_;
            read_buffer_.clear();
            return codes::RECEIVE_OK;
        }

        int remaining = timeout_ms - static_cast<int>(elapsed_ms(started));
        if (remaining < 0) {
            remaining = 0;
        }

        codes::ReceiveStatus status = fill_buffer(remaining, error);
        if (status == codes::RECEIVE_ERROR) {
            return status;
        }
        if (status == codes::RECEIVE_TIMEOUT) {
            if (remaining == 0) {
                return status;
            }
            // Interrupted poll, try again within the remaining time
            continue;
        }
    }
}

codes::ReceiveStatus SocketTransport::receive_available(int timeout_ms,
                                                        std::string& data,
                                                        std::string& error) {
    if (!read_buffer_.empty()) {
        // Pick up anything else that has arrived, without waiting
        if (!peer_closed_) {
            std::string drain_error;
            if (fill_buffer(0, drain_error) == codes::RECEIVE_ERROR) {
                // Reported again by the next read once the buffer is empty
                log(LOG_DEBUG, "Deferring read error on socket '%i': %s", fd_,
                    drain_error.c_str());
            }
        }
        data.swap(read_buffer_);
        read_buffer_.clear();
        return codes::RECEIVE_OK;
    }

    if (peer_closed_) {
        error = "closed";
        return codes::RECEIVE_CLOSED;
    }

    codes::ReceiveStatus status = fill_buffer(timeout_ms, error);
    if (status == codes::RECEIVE_OK) {
        data.swap(read_buffer_);
        read_buffer_.clear();
    }
    return status;
}

SocketTransportFactory::SocketTransportFactory() {}

SocketTransportFactory::~SocketTransportFactory() {}

int SocketTransportFactory::connect_to(const struct addrinfo* addr,
                                       int connect_timeout_ms,
                                       std::string& error) {
    int fd = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
    if (fd < 0) {
        error = strerror(errno);
        return -1;
    }

    if (!SocketTransport::set_non_blocking(fd)) {
        error = "failed to set non-blocking mode";
        ::close(fd);
        return -1;
    }

    if (::connect(fd, addr->ai_addr, addr->ai_addrlen) == 0) {
        return fd;
    }

    if (errno != EINPROGRESS) {
        error = strerror(errno);
        ::close(fd);
        return -1;
    }

    // Wait for the handshake, bounded by the connect timeout
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    int ready = poll(&pfd, 1, connect_timeout_ms);
    if (ready <= 0) {
        error = ready == 0 ? "timeout" : strerror(errno);
        ::close(fd);
        return -1;
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
        error = strerror(errno);
        ::close(fd);
        return -1;
    }
    if (so_error != 0) {
        error = strerror(so_error);
        ::close(fd);
        return -1;
    }

    return fd;
}

ATransport* SocketTransportFactory::create_client(const std::string& host,
                                                  int port,
                                                  int connect_timeout_ms,
                                                  std::string& error) {
    log(LOG_DEBUG, "Connecting to %s:%d", host.c_str(), port);

    struct addrinfo hints, *res;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::ostringstream port_str;
    port_str << port;

    int status = getaddrinfo(host.c_str(), port_str.str().c_str(), &hints,
                             &res);
    if (status != 0) {
        error = gai_strerror(status);
        log(LOG_ERROR, "Error resolving hostname '%s': %s", host.c_str(),
            error.c_str());
        return NULL;
    }

    int fd = -1;
    for (struct addrinfo* addr = res; addr != NULL && fd < 0;
         addr = addr->ai_next) {
        fd = connect_to(addr, connect_timeout_ms, error);
    }
    freeaddrinfo(res);

    if (fd < 0) {
        log(LOG_ERROR, "Connection failed to %s:%d: %s", host.c_str(), port,
            error.c_str());
        return NULL;
    }

    try {
        ATransport* transport = new SocketTransport(fd);
        log(LOG_INFO, "Connected to %s:%d (fd: %i)", host.c_str(), port, fd);
        return transport;
    } catch (const std::exception& e) {
        error = e.what();
        log(LOG_ERROR, "Failed to create transport for %s:%d: %s",
            host.c_str(), port, e.what());
        ::close(fd);
        return NULL;
    }
}
