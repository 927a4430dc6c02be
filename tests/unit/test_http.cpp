#include <gtest/gtest.h>
#include "emp/http.hpp"

using namespace emp;

namespace {

int error_status(std::string buffer) {
    try {
        HttpParser::try_parse(buffer);
    } catch (const HttpError& e) {
        return e.status();
    }
    return 0;
}

} // namespace

// Request framing

TEST(HttpParserTest, ParsesSimpleGet) {
    std::string buffer = "GET /api/v1/employee HTTP/1.1\r\nHost: localhost\r\n\r\n";
    auto request = HttpParser::try_parse(buffer);
    ASSERT_TRUE(request);
    EXPECT_EQ(request->method, Method::Get);
    EXPECT_EQ(request->target, "/api/v1/employee");
    EXPECT_EQ(request->path, "/api/v1/employee");
    EXPECT_EQ(request->version, "HTTP/1.1");
    EXPECT_EQ(request->header("host"), "localhost");
    EXPECT_TRUE(request->body.empty());
    EXPECT_TRUE(buffer.empty());
}

TEST(HttpParserTest, ParsesBodyByContentLength) {
    std::string buffer =
        "POST /api/v1/employee HTTP/1.1\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 17\r\n"
        "\r\n"
        "{\"firstName\":\"A\"}";
    auto request = HttpParser::try_parse(buffer);
    ASSERT_TRUE(request);
    EXPECT_EQ(request->method, Method::Post);
    EXPECT_EQ(request->body, "{\"firstName\":\"A\"}");
    EXPECT_TRUE(buffer.empty());
}

TEST(HttpParserTest, WaitsForCompleteHeaders) {
    std::string buffer = "GET /api/v1/employee HTTP/1.1\r\nHost: loc";
    EXPECT_FALSE(HttpParser::try_parse(buffer));
    EXPECT_FALSE(buffer.empty());

    buffer += "alhost\r\n\r\n";
    EXPECT_TRUE(HttpParser::try_parse(buffer));
}

TEST(HttpParserTest, WaitsForCompleteBody) {
    std::string buffer = "PATCH /x HTTP/1.1\r\nContent-Length: 10\r\n\r\n{\"age\":";
    EXPECT_FALSE(HttpParser::try_parse(buffer));

    buffer += "42}";
    auto request = HttpParser::try_parse(buffer);
    ASSERT_TRUE(request);
    EXPECT_EQ(request->method, Method::Patch);
    EXPECT_EQ(request->body, "{\"age\":42}");
}

TEST(HttpParserTest, PipelinedRequestsParseInOrder) {
    std::string buffer =
        "GET /a HTTP/1.1\r\n\r\n"
        "DELETE /b HTTP/1.1\r\n\r\n";
    auto first = HttpParser::try_parse(buffer);
    auto second = HttpParser::try_parse(buffer);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->path, "/a");
    EXPECT_EQ(second->method, Method::Delete);
    EXPECT_EQ(second->path, "/b");
    EXPECT_FALSE(HttpParser::try_parse(buffer));
}

TEST(HttpParserTest, HeaderNamesAreCaseInsensitive) {
    std::string buffer = "GET / HTTP/1.1\r\nX-Custom-Header:   some value  \r\n\r\n";
    auto request = HttpParser::try_parse(buffer);
    ASSERT_TRUE(request);
    EXPECT_EQ(request->header("X-CUSTOM-HEADER"), "some value");
    EXPECT_EQ(request->header("x-custom-header"), "some value");
    EXPECT_EQ(request->header("missing"), std::nullopt);
}

TEST(HttpParserTest, QueryIsStrippedFromPath) {
    std::string buffer = "GET /api/v1/employee?page=2 HTTP/1.1\r\n\r\n";
    auto request = HttpParser::try_parse(buffer);
    ASSERT_TRUE(request);
    EXPECT_EQ(request->path, "/api/v1/employee");
    EXPECT_EQ(request->target, "/api/v1/employee?page=2");
}

TEST(HttpParserTest, UnknownMethodStillParses) {
    std::string buffer = "BREW /pot HTTP/1.1\r\n\r\n";
    auto request = HttpParser::try_parse(buffer);
    ASSERT_TRUE(request);
    EXPECT_EQ(request->method, Method::Unknown);
}

TEST(HttpParserTest, MalformedRequests) {
    EXPECT_EQ(error_status("GARBAGE\r\n\r\n"), 400);
    EXPECT_EQ(error_status("GET  HTTP/1.1\r\n\r\n"), 400);
    EXPECT_EQ(error_status("GET http://host/ HTTP/1.1\r\n\r\n"), 400);
    EXPECT_EQ(error_status("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n"), 400);
    EXPECT_EQ(error_status("GET / HTTP/1.1\r\nBad Name: x\r\n\r\n"), 400);
    EXPECT_EQ(error_status("GET / HTTP/2.0\r\n\r\n"), 505);
}

TEST(HttpParserTest, InvalidContentLength) {
    EXPECT_EQ(error_status("POST / HTTP/1.1\r\nContent-Length: abc\r\n\r\n"), 400);
    EXPECT_EQ(error_status("POST / HTTP/1.1\r\nContent-Length: -1\r\n\r\n"), 400);
    EXPECT_EQ(error_status("POST / HTTP/1.1\r\nContent-Length: 1\r\nContent-Length: 2\r\n\r\n"), 400);
}

TEST(HttpParserTest, EnforcesLimits) {
    EXPECT_EQ(error_status("POST / HTTP/1.1\r\nContent-Length: " + std::to_string(MAX_BODY_SIZE + 1) + "\r\n\r\n"), 413);
    EXPECT_EQ(error_status("GET / HTTP/1.1\r\nX: " + std::string(MAX_HEADER_SIZE, 'a')), 431);
}

TEST(HttpParserTest, ChunkedBodiesAreNotSupported) {
    EXPECT_EQ(error_status("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"), 501);
}

TEST(HttpRequestTest, KeepAliveDefaults) {
    HttpRequest request;
    request.version = "HTTP/1.1";
    EXPECT_TRUE(request.keep_alive());

    request.headers["connection"] = "Close";
    EXPECT_FALSE(request.keep_alive());

    HttpRequest old;
    old.version = "HTTP/1.0";
    EXPECT_FALSE(old.keep_alive());
    old.headers["connection"] = "keep-alive";
    EXPECT_TRUE(old.keep_alive());
}


// Responses

TEST(HttpResponseTest, SerializesJson) {
    HttpResponse res = HttpResponse::json(201, "{\"a\":1}");
    EXPECT_EQ(res.serialize(),
        "HTTP/1.1 201 Created\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 7\r\n"
        "\r\n"
        "{\"a\":1}");
}

TEST(HttpResponseTest, NoContentHasNoBodyOrLength) {
    EXPECT_EQ(HttpResponse::no_content().serialize(), "HTTP/1.1 204 No Content\r\n\r\n");
}

TEST(HttpResponseTest, ProblemResponse) {
    auto problem = ProblemDetails::not_found("Employee not found: x");
    problem.instance = "/api/v1/employee/x";
    HttpResponse res = HttpResponse::problem(problem);
    EXPECT_EQ(res.status, 404);
    EXPECT_EQ(res.headers.at("Content-Type"), "application/problem+json");
    EXPECT_NE(res.body.find("\"status\":404"), std::string::npos);
    EXPECT_NE(res.body.find("\"title\":\"Not Found\""), std::string::npos);
    EXPECT_NE(res.body.find("\"detail\":\"Employee not found: x\""), std::string::npos);
    EXPECT_NE(res.body.find("\"instance\":\"/api/v1/employee/x\""), std::string::npos);
}

TEST(HttpResponseTest, MethodNamesAndReasons) {
    EXPECT_EQ(parse_method("PATCH"), Method::Patch);
    EXPECT_EQ(parse_method("patch"), Method::Unknown);
    EXPECT_EQ(to_string(Method::Delete), "DELETE");
    EXPECT_EQ(reason_phrase(405), "Method Not Allowed");
}
