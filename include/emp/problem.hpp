#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace emp {

// RFC 7807 error body, served as application/problem+json
struct ProblemDetails {
    std::string type = "about:blank";
    std::string title;
    int status = 500;
    std::optional<std::string> detail;
    std::optional<std::string> instance;

    std::string to_json() const;

    static ProblemDetails of_status(int status, std::string_view detail = "");
    static ProblemDetails bad_request(std::string_view detail = "");
    static ProblemDetails not_found(std::string_view detail = "");
    static ProblemDetails method_not_allowed(std::string_view detail = "");
    static ProblemDetails internal_server_error(std::string_view detail = "");
};

} // namespace emp
