#include "emp/http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace emp {

namespace {

std::string to_lower(std::string_view text) {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    return out;
}

std::string_view trim_ows(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
        text.remove_suffix(1);
    return text;
}

bool is_token_char(unsigned char c) {
    if (std::isalnum(c))
        return true;
    switch (c) {
    case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
    case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
        return true;
    default:
        return false;
    }
}

} // namespace

Method parse_method(std::string_view token) {
    if (token == "GET") return Method::Get;
    if (token == "HEAD") return Method::Head;
    if (token == "POST") return Method::Post;
    if (token == "PUT") return Method::Put;
    if (token == "PATCH") return Method::Patch;
    if (token == "DELETE") return Method::Delete;
    if (token == "OPTIONS") return Method::Options;
    return Method::Unknown;
}

std::string_view to_string(Method method) {
    switch (method) {
    case Method::Get: return "GET";
    case Method::Head: return "HEAD";
    case Method::Post: return "POST";
    case Method::Put: return "PUT";
    case Method::Patch: return "PATCH";
    case Method::Delete: return "DELETE";
    case Method::Options: return "OPTIONS";
    case Method::Unknown: break;
    }
    return "UNKNOWN";
}

std::string_view reason_phrase(int status) {
    switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 411: return "Length Required";
    case 413: return "Payload Too Large";
    case 414: return "URI Too Long";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 505: return "HTTP Version Not Supported";
    default: return "Unknown";
    }
}

std::optional<std::string> HttpRequest::header(std::string_view name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? std::make_optional(it->second) : std::nullopt;
}

bool HttpRequest::keep_alive() const {
    auto connection = header("connection");
    if (connection) {
        std::string value = to_lower(*connection);
        if (value.find("close") != std::string::npos)
            return false;
        if (value.find("keep-alive") != std::string::npos)
            return true;
    }
    return version == "HTTP/1.1";
}

HttpResponse HttpResponse::json(int status, std::string body) {
    HttpResponse res;
    res.status = status;
    res.headers["Content-Type"] = "application/json";
    res.body = std::move(body);
    return res;
}

HttpResponse HttpResponse::no_content() {
    HttpResponse res;
    res.status = 204;
    return res;
}

HttpResponse HttpResponse::problem(const ProblemDetails& problem) {
    HttpResponse res;
    res.status = problem.status;
    res.headers["Content-Type"] = "application/problem+json";
    res.body = problem.to_json();
    return res;
}

std::string HttpResponse::serialize() const {
    std::string out;
    out.reserve(128 + body.size());
    out.append("HTTP/1.1 ").append(std::to_string(status)).append(" ").append(reason_phrase(status)).append("\r\n");
    for (const auto& [name, value] : headers)
        out.append(name).append(": ").append(value).append("\r\n");
    // 204 carries neither a body nor a length
    if (status != 204)
        out.append("Content-Length: ").append(std::to_string(body.size())).append("\r\n");
    out.append("\r\n");
    if (status != 204)
        out.append(body);
    return out;
}

std::optional<HttpRequest> HttpParser::try_parse(std::string& buffer) {
    // Tolerate stray CRLFs between pipelined requests
    size_t skip = 0;
    while (skip + 1 < buffer.size() && buffer[skip] == '\r' && buffer[skip + 1] == '\n')
        skip += 2;
    if (skip > 0)
        buffer.erase(0, skip);

    auto header_end = buffer.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        if (buffer.size() > MAX_HEADER_SIZE)
            throw HttpError{431, "request header block too large"};
        return std::nullopt;
    }
    if (header_end + 4 > MAX_HEADER_SIZE)
        throw HttpError{431, "request header block too large"};

    HttpRequest request;
    std::string_view head{buffer.data(), header_end};

    auto line_end = head.find("\r\n");
    parse_request_line(head.substr(0, line_end), request);

    while (line_end != std::string_view::npos) {
        size_t start = line_end + 2;
        line_end = head.find("\r\n", start);
        parse_header_line(head.substr(start, line_end == std::string_view::npos ? std::string_view::npos : line_end - start), request);
    }

    if (request.headers.count("transfer-encoding"))
        throw HttpError{501, "Transfer-Encoding is not supported"};

    size_t length = content_length(request);
    size_t body_start = header_end + 4;
    if (buffer.size() - body_start < length)
        return std::nullopt;

    request.body = buffer.substr(body_start, length);
    buffer.erase(0, body_start + length);
    return request;
}

void HttpParser::parse_request_line(std::string_view line, HttpRequest& request) {
    auto first_space = line.find(' ');
    auto last_space = line.rfind(' ');
    if (first_space == std::string_view::npos || first_space == last_space)
        throw HttpError{400, "malformed request line"};

    std::string_view method = line.substr(0, first_space);
    std::string_view target = line.substr(first_space + 1, last_space - first_space - 1);
    std::string_view version = line.substr(last_space + 1);

    if (method.empty() || target.empty() || target.find(' ') != std::string_view::npos)
        throw HttpError{400, "malformed request line"};
    if (version != "HTTP/1.1" && version != "HTTP/1.0")
        throw HttpError{505, "unsupported HTTP version"};
    if (target.front() != '/')
        throw HttpError{400, "request target must be an absolute path"};

    request.method = parse_method(method);
    request.target = std::string{target};
    request.path = std::string{target.substr(0, target.find('?'))};
    request.version = std::string{version};
}

void HttpParser::parse_header_line(std::string_view line, HttpRequest& request) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0)
        throw HttpError{400, "malformed header line"};

    std::string_view name = line.substr(0, colon);
    for (unsigned char c : name) {
        if (!is_token_char(c))
            throw HttpError{400, "malformed header name"};
    }

    std::string key = to_lower(name);
    std::string value{trim_ows(line.substr(colon + 1))};

    auto it = request.headers.find(key);
    if (it == request.headers.end()) {
        request.headers.emplace(std::move(key), std::move(value));
    } else if (key == "content-length") {
        if (it->second != value)
            throw HttpError{400, "conflicting Content-Length headers"};
    } else {
        it->second.append(", ").append(value);
    }
}

size_t HttpParser::content_length(const HttpRequest& request) {
    auto it = request.headers.find("content-length");
    if (it == request.headers.end())
        return 0;

    const std::string& text = it->second;
    size_t length = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), length);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty())
        throw HttpError{400, "invalid Content-Length"};
    if (length > MAX_BODY_SIZE)
        throw HttpError{413, "request body too large"};
    return length;
}

} // namespace emp
