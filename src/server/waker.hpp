#pragma once

namespace emp {

/*
 * Wakes the reactor out of poll() from another thread or a signal handler.
 * Backed by an eventfd; notify() is async-signal-safe.
 */
class Waker {
public:
    Waker();
    ~Waker();

    Waker(const Waker&) = delete;
    Waker& operator=(const Waker&) = delete;

    int read_fd() const;

    void notify() noexcept;

    // Drains pending notifications
    void clear() noexcept;

private:
    int event_fd_;
};

} // namespace emp
