#pragma once

#include "emp/problem.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace emp {

// Request framing limits
constexpr size_t MAX_HEADER_SIZE = 8 * 1024;
constexpr size_t MAX_BODY_SIZE = 1024 * 1024;

enum class Method { Get, Head, Post, Put, Patch, Delete, Options, Unknown };

Method parse_method(std::string_view token);
std::string_view to_string(Method method);
std::string_view reason_phrase(int status);

// A request that cannot be framed. status is the code to answer with.
class HttpError : public std::runtime_error {
public:
    HttpError(int status, const std::string& msg) : std::runtime_error(msg), status_(status) {}

    int status() const noexcept { return status_; }

private:
    int status_;
};

struct HttpRequest {
    Method method = Method::Unknown;
    std::string target; // as sent, including any query
    std::string path;   // target without the query
    std::string version;
    std::map<std::string, std::string> headers; // names lower-cased
    std::string body;

    // Lookup by case-insensitive name
    std::optional<std::string> header(std::string_view name) const;

    // HTTP/1.1 defaults to keep-alive, HTTP/1.0 to close
    bool keep_alive() const;
};

struct HttpResponse {
    int status = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    static HttpResponse json(int status, std::string body);
    static HttpResponse no_content();
    static HttpResponse problem(const ProblemDetails& problem);

    std::string serialize() const;
};

/*
 * Incremental HTTP/1.1 request framing.
 * Bodies are delimited by Content-Length only.
 */
class HttpParser {
public:
    // Extracts one complete request from the front of buffer and erases it.
    // Returns nullopt if more bytes are needed. Throws HttpError.
    static std::optional<HttpRequest> try_parse(std::string& buffer);

private:
    static void parse_request_line(std::string_view line, HttpRequest& request);
    static void parse_header_line(std::string_view line, HttpRequest& request);
    static size_t content_length(const HttpRequest& request);
};

} // namespace emp
