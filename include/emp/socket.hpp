# pragma once

#include <cstdint>


namespace emp {

/*
 * RAII wrapper for a POSIX TCP socket
 *
 * Owns the descriptor and closes it on destruction
 * Move-only
 */
class Socket {
public:
    // Constructs an invalid socket
    Socket() noexcept;

    // Takes ownership of an existing file descriptor
    explicit Socket(int fd) noexcept;

    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    // Non-blocking listening socket on all interfaces.
    // port 0 picks an ephemeral port. Throws std::system_error.
    static Socket listen_tcp(uint16_t port, int backlog);

    // Port the socket is bound to, in host byte order
    uint16_t local_port() const;

    bool valid() const noexcept;
    int fd() const noexcept;

    // Releases ownership without closing
    int release() noexcept;

    // Closes now, leaving the socket invalid
    void reset() noexcept;

private:
    int fd_;
};

} // namespace emp
