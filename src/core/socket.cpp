
#include "emp/socket.hpp"

#include <cerrno>
#include <system_error>
#include <arpa/inet.h>   // htons()
#include <netinet/in.h>  // sockaddr_in
#include <sys/socket.h>
#include <unistd.h>      // close()


namespace emp {

namespace {

[[noreturn]] void throw_errno(const char* what) {
    throw std::system_error(errno, std::generic_category(), what);
}

} // namespace

Socket::Socket() noexcept: fd_(-1) {}

Socket::Socket(int fd) noexcept: fd_(fd) {}

Socket::~Socket() {
    reset();
}

Socket::Socket(Socket&& other) noexcept: fd_(other.release()) {}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        reset();
        fd_ = other.release();
    }
    return *this;
}

Socket Socket::listen_tcp(uint16_t port, int backlog) {
    Socket sock{::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0)};
    if (!sock.valid())
        throw_errno("socket");

    int opt = 1;
    if (::setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == -1)
        throw_errno("setsockopt(SO_REUSEADDR)");

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (::bind(sock.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1)
        throw_errno("bind");

    if (::listen(sock.fd(), backlog) == -1)
        throw_errno("listen");

    return sock;
}

uint16_t Socket::local_port() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == -1)
        throw_errno("getsockname");
    return ntohs(addr.sin_port);
}

bool Socket::valid() const noexcept {
    return fd_ != -1;
}

int Socket::fd() const noexcept {
    return fd_;
}

int Socket::release() noexcept {
    int tmp = fd_;
    fd_ = -1;
    return tmp;
}

void Socket::reset() noexcept {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace emp
