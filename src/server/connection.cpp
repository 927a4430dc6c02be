#include "connection.hpp"
#include <cerrno>
#include <unistd.h>
#include <sys/socket.h>

namespace emp {


bool Connection::read_to_inbox() {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(socket_.fd(), buffer, sizeof(buffer));

        if (n == 0)
            return false;
        if (n < 0) {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                return true; // No data left to read
            throw IOError{"read failed"};
        }
        if (!deferred_error_ && inbox_.size() + n > MAX_INBOX_SIZE) {
            inbox_.clear();
            if (!busy_)
                throw HttpError{413, "request too large"};
            deferred_error_.emplace(413, "request too large");
        }

        // Nothing after an overflow is framed anymore
        if (!deferred_error_)
            inbox_.append(buffer, n);
        if (static_cast<size_t>(n) < sizeof(buffer))
            return true;
    }
}

std::optional<HttpRequest> Connection::try_get_request() {
    if (deferred_error_) {
        HttpError error = *deferred_error_;
        deferred_error_.reset();
        inbox_.clear();
        throw error;
    }

    try {
        return HttpParser::try_parse(inbox_);
    } catch (const HttpError&) {
        // Framing is lost, nothing after this point can be trusted
        inbox_.clear();
        throw;
    }
}


void Connection::append_response(std::string data) {
    std::lock_guard lock(outbox_mutex_);
    outbox_.append(data);
}

bool Connection::write_from_outbox() {
    std::lock_guard lock(outbox_mutex_);
    if (outbox_.empty())
        return false;

    // MSG_NOSIGNAL: don't SIGPIPE us if the socket is dead
    ssize_t n = ::send(socket_.fd(), outbox_.data(), outbox_.size(), MSG_NOSIGNAL);
    if (n >= 0) {
        outbox_.erase(0, n); // Remove what was actually sent
        return !outbox_.empty();
    }
    // n < 0
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        return true;
    throw IOError("write failed");
}



bool Connection::inbox_has_data() const {
    return !inbox_.empty();
}

bool Connection::outbox_has_data() const {
    std::lock_guard lock(outbox_mutex_);
    return !outbox_.empty();
}

} // namespace emp
