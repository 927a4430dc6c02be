#include "tcp_server.hpp"

#include <cerrno>
#include <csignal>
#include <stdexcept>
#include <system_error>
#include <netinet/in.h>  // sockaddr_in
#include <sys/socket.h>  // accept4()

#include <spdlog/spdlog.h>

namespace emp {

void Task::execute(const RequestDispatcher& dispatcher) {
    auto client = connection.lock();
    if (!client) {
        // The reactor already dropped this connection
        spdlog::debug("[Worker] Skipping {} {}: client already disconnected",
            to_string(request.method), request.target);
        return;
    }

    HttpResponse response = dispatcher.dispatch(request);
    spdlog::info("{} {} -> {}", to_string(request.method), request.target, response.status);

    bool keep_alive = request.keep_alive();
    if (!keep_alive)
        response.headers["Connection"] = "close";

    // Order matters: the reactor reads these flags without the outbox lock
    client->append_response(response.serialize());
    if (!keep_alive)
        client->close_after_flush();
    client->set_busy(false);

    if (on_complete)
        on_complete();
}


void TcpServer::listen() {
    if (listen_socket_.valid())
        throw std::logic_error("Server is already listening");

    listen_socket_ = Socket::listen_tcp(port_, SOMAXCONN);
    port_ = listen_socket_.local_port();
    spdlog::info("Listening on port {}", port_.load());
}

void TcpServer::start() {
    listen();

    std::signal(SIGPIPE, SIG_IGN);
    s_this_server = this;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    run();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    s_this_server = nullptr;
}

void TcpServer::run() {
    if (!listen_socket_.valid())
        throw std::logic_error("listen() must be called before run()");

    poll_fds_.clear();
    poll_fds_.push_back({listen_socket_.fd(), POLLIN, 0}); // The server listening socket
    poll_fds_.push_back({waker_.read_fd(), POLLIN, 0});   // Wake-ups from workers and stop()

    setup_workers();
    try {
        run_reactor();
    } catch (...) {
        shutdown();
        throw;
    }
    shutdown();
}

void TcpServer::run_reactor() {
    while (!stop_requested_) {
        apply_dirty_updates();
        int activity = ::poll(poll_fds_.data(), poll_fds_.size(), -1); // Block until a FD is ready
        if (activity < 0) {
            if (errno == EINTR) // interrupted syscall, eg: SIGWINCH or SIGINT
                continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }

        for (size_t i = 0; i < poll_fds_.size(); i++) {
            short revents = poll_fds_[i].revents;
            // Nothing on current fd
            if (revents == 0)
                continue;

            int fd = poll_fds_[i].fd;

            // Waker poke
            if (fd == waker_.read_fd()) {
                waker_.clear();
                continue;
            }

            // New client
            if (fd == listen_socket_.fd()) {
                if (revents & POLLIN)
                    handle_new_connection();
                continue;
            }

            if (revents & (POLLERR | POLLNVAL)) {
                handle_client_dc(i);
                continue;
            }

            // Read from client (POLLHUP shows up as a zero-length read)
            if ((revents & (POLLIN | POLLHUP)) && !handle_client_read(i))
                continue;

            // Write to client
            if (revents & POLLOUT)
                handle_client_write(i);
        }
    }
}

void TcpServer::apply_dirty_updates() {
    std::vector<int> local_dirty;
    {
        // Swap to a local vector to keep the lock time minimal
        std::lock_guard lock(dirty_mutex_);
        local_dirty.swap(dirty_fds_);
    }

    for (auto fd : local_dirty) {
        auto it = fd_idx_map_.find(fd);
        if (it == fd_idx_map_.end())
            continue;
        poll_fds_[it->second].events |= POLLOUT;
        // The previous request is answered, pipelined ones may now run
        schedule_next_request(fd, clients_[fd]);
    }
}

void TcpServer::mark_as_dirty(int fd) {
    {
        std::lock_guard lock(dirty_mutex_);
        dirty_fds_.push_back(fd);
    }
    waker_.notify();
}

void TcpServer::schedule_next_request(int fd, const std::shared_ptr<Connection>& client) {
    if (client->busy() || client->should_close())
        return;

    try {
        auto request = client->try_get_request();
        if (!request)
            return;

        client->set_busy(true);
        work_queue_.push_back(Task{
            .connection = client,
            .request = std::move(*request),
            .on_complete = [this, fd]() { mark_as_dirty(fd); }
        });
    } catch (const HttpError& e) {
        reject_request(fd, client, e);
    }
}

void TcpServer::reject_request(int fd, const std::shared_ptr<Connection>& client, const HttpError& error) {
    spdlog::warn("Client [{}] sent an unparseable request: {}", fd, error.what());
    HttpResponse response = HttpResponse::problem(ProblemDetails::of_status(error.status(), error.what()));
    response.headers["Connection"] = "close";
    client->append_response(response.serialize());
    client->close_after_flush();
    mark_as_dirty(fd);
}

bool TcpServer::handle_client_write(size_t& poll_fds_idx) {
    int fd = poll_fds_[poll_fds_idx].fd;
    auto& client_connection = clients_[fd];

    try {
        if (!client_connection->write_from_outbox()) {  // if "everything has been written"
            poll_fds_[poll_fds_idx].events &= ~POLLOUT; // Outbox empty, turn off POLLOUT
            if (client_connection->should_close() && !client_connection->busy()) {
                handle_client_dc(poll_fds_idx);
                return false;
            }
        }
    } catch (const IOError& e) {
        spdlog::debug("Client [{}] write error: {}", fd, e.what());
        handle_client_dc(poll_fds_idx);
        return false;
    }
    return true;
}

void TcpServer::handle_client_dc(size_t& poll_fds_idx) {
    int moving_fd = poll_fds_.back().fd;
    int dead_fd = poll_fds_[poll_fds_idx].fd;

    // swap & pop to remove dead connection in O(1)
    if (poll_fds_idx < poll_fds_.size() - 1) {
        std::swap(poll_fds_[poll_fds_idx], poll_fds_.back());
        fd_idx_map_[moving_fd] = poll_fds_idx;
    }
    fd_idx_map_.erase(dead_fd);
    clients_.erase(dead_fd);
    poll_fds_.pop_back();
    poll_fds_idx--;

    spdlog::debug("Client [{}] disconnected", dead_fd);
}

void TcpServer::handle_new_connection() {
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);

    // Create non-blocking client socket
    int client_fd = ::accept4(
        listen_socket_.fd(),
        reinterpret_cast<sockaddr*>(&client_addr),
        &client_len,
        SOCK_NONBLOCK | SOCK_CLOEXEC
    );

    if (client_fd < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR || errno == ECONNABORTED)
            return;
        spdlog::error("accept failed: {}", std::system_category().message(errno));
        return;
    }

    spdlog::debug("Client [{}] connected on port {}", client_fd, port_.load());
    poll_fds_.push_back({client_fd, POLLIN, 0});
    fd_idx_map_[client_fd] = poll_fds_.size() - 1;
    clients_[client_fd] = std::make_shared<Connection>(Socket{client_fd});
}

bool TcpServer::handle_client_read(size_t& poll_fds_idx) {
    int fd = poll_fds_[poll_fds_idx].fd;
    auto client_connection = clients_[fd];
    try {
        // Pull data from the OS into our buffer
        if (!client_connection->read_to_inbox()) {
            handle_client_dc(poll_fds_idx);
            return false;
        }
    } catch (const HttpError& e) {
        reject_request(fd, client_connection, e);
        return true;
    } catch (const IOError& e) {
        spdlog::debug("Client [{}] read error: {}", fd, e.what());
        handle_client_dc(poll_fds_idx);
        return false;
    }

    schedule_next_request(fd, client_connection);
    return true;
}

void TcpServer::stop() noexcept {
    stop_requested_ = true;
    waker_.notify();
}

void TcpServer::shutdown() {
    workers_.clear(); // jthread requests stop and joins
    clients_.clear();
    fd_idx_map_.clear();
    poll_fds_.clear();
    listen_socket_.reset();
    spdlog::info("Server stopped");
}

uint16_t TcpServer::port() const noexcept {
    return port_;
}

void TcpServer::worker_loop(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        auto task = work_queue_.wait_and_pop_front(stop_token);
        if (!task)
            continue;
        try {
            task->execute(dispatcher_);
        } catch (const std::exception& e) {
            spdlog::error("[Worker] request failed: {}", e.what());
        }
    }
}

void TcpServer::setup_workers() {
    for (size_t i = 0; i < num_workers_; i++) {
        workers_.emplace_back([this](std::stop_token stop_token) {
            worker_loop(stop_token);
        });
    }
}


} // namespace emp
