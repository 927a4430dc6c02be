#pragma once

#include "emp/http.hpp"
#include "emp/socket.hpp"
#include <atomic>
#include <string>
#include <stdexcept>
#include <mutex>
#include <optional>

namespace emp {

class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
};

/*
 * Represents a single client connection.
 * The inbox is touched by the reactor thread only; the outbox is shared
 * with the worker that answers the in-flight request.
 */
class Connection {
public:
    explicit Connection(Socket socket) : socket_(std::move(socket)) {}

    int fd() const noexcept { return socket_.fd(); }

    // Pull available bytes from the socket. Returns false if the client disconnected.
    // Throws HttpError 413 on overflow, unless a request is in flight: then the
    // error waits for try_get_request so its response queues behind the pending one.
    bool read_to_inbox();

    // Next complete request in the inbox, if any. Throws HttpError,
    // including an overflow deferred while the connection was busy.
    std::optional<HttpRequest> try_get_request();

    // Queue a serialized response
    void append_response(std::string data);

    // Write to client. Returns true if there is still data left to send
    bool write_from_outbox();

    // At most one request per connection is handed to the workers at a time,
    // so responses leave in request order.
    bool busy() const noexcept { return busy_; }
    void set_busy(bool busy) noexcept { busy_ = busy; }

    // Close once the outbox has been flushed
    void close_after_flush() noexcept { close_after_flush_ = true; }
    bool should_close() const noexcept { return close_after_flush_; }

    // only used in tests to confirm partial reads/writes
    bool inbox_has_data() const;
    bool outbox_has_data() const;

private:
    static constexpr size_t MAX_INBOX_SIZE = MAX_HEADER_SIZE + MAX_BODY_SIZE;
    Socket socket_;
    std::string inbox_;
    std::optional<HttpError> deferred_error_; // reactor thread only
    std::string outbox_;
    mutable std::mutex outbox_mutex_;
    std::atomic<bool> busy_{false};
    std::atomic<bool> close_after_flush_{false};
};

} // namespace emp
