#include <gtest/gtest.h>
#include "connection.hpp"
#include "emp/socket.hpp"
#include <sys/socket.h>
#include <unistd.h>
#include <memory>


using namespace emp;

class ConnectionTest : public ::testing::Test {
protected:
    int client_fd_;
    std::unique_ptr<Connection> connection;

    void SetUp() override {
        int fds[2];
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, fds), 0);
        client_fd_ = fds[1];
        connection = std::make_unique<emp::Connection>(Socket{fds[0]});
    }

    void TearDown() override {
        if (client_fd_ != -1)
            close(client_fd_);
    }

    void client_sends(const std::string& data) {
         [[maybe_unused]] ssize_t _ = write(client_fd_, data.data(), data.size());
    }

    void client_closes() {
        close(client_fd_);
        client_fd_ = -1;
    }

    // Streams one request that never fits the inbox. Returns the status the
    // connection threw with, or 0 if it did not throw.
    int client_streams_oversized_request() {
        std::string chunk(64 * 1024, 'A');
        size_t sent = 0;
        while (sent <= MAX_HEADER_SIZE + MAX_BODY_SIZE) {
            ssize_t n = write(client_fd_, chunk.data(), chunk.size());
            if (n > 0)
                sent += n;
            try {
                connection->read_to_inbox();
            } catch (const HttpError& e) {
                return e.status();
            }
        }
        return 0;
    }

    std::string client_reads() {
        std::string data{};
        char buffer[4096];
        ssize_t n = 1;

        while ((n = read(client_fd_, buffer, 4096)) > 0) {
            data.append(buffer, n);
        }
        return data;
    }

};


TEST_F(ConnectionTest, BuffersPartialRequestUntilComplete) {
    client_sends("GET /api/v1/employee HTT");
    EXPECT_TRUE(connection->read_to_inbox());
    EXPECT_TRUE(connection->inbox_has_data());
    EXPECT_EQ(connection->try_get_request(), std::nullopt);

    client_sends("P/1.1\r\nHost: x\r\n\r\n");
    connection->read_to_inbox();
    auto request = connection->try_get_request();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->path, "/api/v1/employee");
    EXPECT_FALSE(connection->inbox_has_data());
}

TEST_F(ConnectionTest, BuffersBodyUntilContentLengthArrives) {
    client_sends("POST /api/v1/employee HTTP/1.1\r\nContent-Length: 4\r\n\r\nnu");
    connection->read_to_inbox();
    EXPECT_EQ(connection->try_get_request(), std::nullopt);

    client_sends("ll");
    connection->read_to_inbox();
    auto request = connection->try_get_request();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->body, "null");
}

TEST_F(ConnectionTest, MultipleRequestsInOneMessage) {
    client_sends("GET /a HTTP/1.1\r\n\r\nGET /b HTTP/1.1\r\n\r\n");
    connection->read_to_inbox();
    EXPECT_EQ(connection->try_get_request()->path, "/a");
    EXPECT_EQ(connection->try_get_request()->path, "/b");
    EXPECT_EQ(connection->try_get_request(), std::nullopt);
}

TEST_F(ConnectionTest, MalformedRequestDropsInbox) {
    client_sends("NONSENSE\r\n\r\nGET /b HTTP/1.1\r\n\r\n");
    connection->read_to_inbox();
    EXPECT_THROW(connection->try_get_request(), HttpError);
    EXPECT_FALSE(connection->inbox_has_data());
}

TEST_F(ConnectionTest, ReadConnectionClosed) {
    client_closes();
    EXPECT_FALSE(connection->read_to_inbox());
}

TEST_F(ConnectionTest, ReadWithNothingPending) {
    EXPECT_TRUE(connection->read_to_inbox());
    EXPECT_FALSE(connection->inbox_has_data());
}

TEST_F(ConnectionTest, ReadRequestLargerThanBuffer) {
    std::string body(16 * 1024, 'A'); // 16KB of 'A's
    std::string full_request = "POST /x HTTP/1.1\r\nContent-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
    client_sends(full_request);

    // Simulates the reactor calling read_to_inbox whenever the socket is ready
    std::optional<HttpRequest> result;
    int max_attempts = 20; // Prevent infinite loop if test fails
    while (!(result = connection->try_get_request()) && (max_attempts-- > 0)) {
        connection->read_to_inbox();
    }

    ASSERT_TRUE(result.has_value()) << "Failed to retrieve request after multiple reads";
    EXPECT_EQ(result->body, body);
}

TEST_F(ConnectionTest, WriteLargeResponse) {
    std::string large_data(16 * 1024, 'A');
    std::string full_response = HttpResponse::json(200, "\"" + large_data + "\"").serialize();

    connection->append_response(full_response);
    EXPECT_TRUE(connection->outbox_has_data());
    EXPECT_FALSE(connection->write_from_outbox());
    EXPECT_EQ(client_reads(), full_response);
    EXPECT_FALSE(connection->outbox_has_data());
}

TEST_F(ConnectionTest, WriteResponseToClient) {
    connection->append_response(HttpResponse::no_content().serialize());
    EXPECT_TRUE(connection->outbox_has_data());
    EXPECT_FALSE(connection->write_from_outbox());
    EXPECT_EQ(client_reads(), "HTTP/1.1 204 No Content\r\n\r\n");
    EXPECT_FALSE(connection->outbox_has_data());
}

TEST_F(ConnectionTest, WriteWithEmptyOutbox) {
    EXPECT_FALSE(connection->write_from_outbox());
}

TEST_F(ConnectionTest, WriteConnectionClosed) {
    connection->append_response("HTTP/1.1 204 No Content\r\n\r\n");
    client_closes();
    EXPECT_THROW(connection->write_from_outbox(), IOError);
}

TEST_F(ConnectionTest, BusyAndCloseFlags) {
    EXPECT_FALSE(connection->busy());
    connection->set_busy(true);
    EXPECT_TRUE(connection->busy());
    connection->set_busy(false);
    EXPECT_FALSE(connection->busy());

    EXPECT_FALSE(connection->should_close());
    connection->close_after_flush();
    EXPECT_TRUE(connection->should_close());
}

TEST_F(ConnectionTest, OverflowThrowsWhenIdle) {
    EXPECT_EQ(client_streams_oversized_request(), 413);
    EXPECT_FALSE(connection->inbox_has_data());
}

TEST_F(ConnectionTest, OverflowWaitsForInFlightRequest) {
    connection->set_busy(true);
    EXPECT_EQ(client_streams_oversized_request(), 0);
    EXPECT_FALSE(connection->inbox_has_data());

    // The answer to the in-flight request goes out first
    std::string first = HttpResponse::no_content().serialize();
    connection->append_response(first);
    connection->set_busy(false);

    try {
        connection->try_get_request();
        FAIL() << "expected the deferred overflow";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.status(), 413);
    }
    EXPECT_EQ(connection->try_get_request(), std::nullopt);

    EXPECT_FALSE(connection->write_from_outbox());
    EXPECT_EQ(client_reads(), first);
}
