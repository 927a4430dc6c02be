#pragma once

#include "emp/http.hpp"
#include "emp/request_dispatcher.hpp"
#include "emp/socket.hpp"
#include "emp/work_queue.hpp"
#include "waker.hpp"
#include "connection.hpp"
#include <cstdint>
#include <thread>
#include <mutex>
#include <vector>
#include <functional>
#include <memory>
#include <optional>
#include <atomic>
#include <poll.h>
#include <map>
#include <unordered_map>

namespace emp {

struct Task {
    std::weak_ptr<Connection> connection;
    HttpRequest request;
    std::function<void()> on_complete; // Reactor poke callback

    void execute(const RequestDispatcher& dispatcher);
};


/*
 * HTTP/1.1 server: a poll() reactor owns every socket, a pool of workers
 * runs the dispatcher. Workers hand responses back through the connection
 * outbox and wake the reactor to flush them.
 */
class TcpServer {
public:
    TcpServer(const RequestDispatcher& dispatcher, uint16_t port, size_t num_workers = 4)
        : dispatcher_(dispatcher), port_(port), num_workers_(num_workers) {}

    ~TcpServer() = default;

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    TcpServer(TcpServer&&) = delete;
    TcpServer& operator=(TcpServer&&) = delete;

    // Bind and listen. Throws std::system_error on failure.
    void listen();

    // Run the reactor until stop(). Requires listen().
    void run();

    // listen() then run(); installs SIGINT/SIGTERM handlers for the duration
    void start();

    // Safe from any thread and from a signal handler
    void stop() noexcept;

    // Bound port, useful after listening on port 0
    uint16_t port() const noexcept;

private:
    const RequestDispatcher& dispatcher_;
    Socket listen_socket_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint16_t> port_{0};

    // Reactor event loop
    void run_reactor();
    void handle_new_connection();
    // Both return false if the client was dropped
    bool handle_client_read(size_t& poll_fds_idx);
    bool handle_client_write(size_t& poll_fds_idx);
    void handle_client_dc(size_t& poll_fds_idx);
    void schedule_next_request(int fd, const std::shared_ptr<Connection>& client);
    void reject_request(int fd, const std::shared_ptr<Connection>& client, const HttpError& error);
    void shutdown();

    // Thread pool
    size_t num_workers_{4};
    WorkQueue<Task> work_queue_;
    std::vector<std::jthread> workers_;
    std::vector<pollfd> poll_fds_;
    std::map<int, std::shared_ptr<Connection>> clients_; // fd -> connection map
    void setup_workers();
    void worker_loop(std::stop_token stop_token);

    // Waker
    Waker waker_;
    inline static TcpServer* s_this_server = nullptr; // target of the signal handler
    static void signal_handler(int) {
        if (s_this_server)
            s_this_server->stop();
    }

    // dirty list: fds with a finished response to flush
    std::mutex dirty_mutex_;
    std::vector<int> dirty_fds_;
    std::unordered_map<int, size_t> fd_idx_map_;

    void mark_as_dirty(int fd);
    void apply_dirty_updates();

};

} // namespace emp
