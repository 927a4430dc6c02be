
#include "waker.hpp"

#include <cerrno>
#include <cstdint>
#include <system_error>
#include <sys/eventfd.h>
#include <unistd.h>


namespace emp {

Waker::Waker() : event_fd_(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
    if (event_fd_ == -1)
        throw std::system_error(errno, std::generic_category(), "eventfd");
}

Waker::~Waker() {
    ::close(event_fd_);
}

int Waker::read_fd() const {
    return event_fd_;
}

void Waker::notify() noexcept {
    uint64_t one = 1;
    // EAGAIN means the counter is saturated, the reactor wakes anyway
    [[maybe_unused]] ssize_t n = ::write(event_fd_, &one, sizeof(one));
}

void Waker::clear() noexcept {
    uint64_t value = 0;
    [[maybe_unused]] ssize_t n = ::read(event_fd_, &value, sizeof(value));
}

} // namespace emp
