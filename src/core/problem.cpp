#include "emp/problem.hpp"
#include "emp/http.hpp"

#include <nlohmann/json.hpp>

namespace emp {

std::string ProblemDetails::to_json() const {
    nlohmann::json j{
        {"type", type},
        {"title", title},
        {"status", status},
    };
    if (detail)
        j["detail"] = *detail;
    if (instance)
        j["instance"] = *instance;
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

ProblemDetails ProblemDetails::of_status(int status, std::string_view detail) {
    ProblemDetails p;
    p.status = status;
    p.title = std::string{reason_phrase(status)};
    if (!detail.empty())
        p.detail = std::string{detail};
    return p;
}

ProblemDetails ProblemDetails::bad_request(std::string_view detail) {
    return of_status(400, detail);
}

ProblemDetails ProblemDetails::not_found(std::string_view detail) {
    return of_status(404, detail);
}

ProblemDetails ProblemDetails::method_not_allowed(std::string_view detail) {
    return of_status(405, detail);
}

ProblemDetails ProblemDetails::internal_server_error(std::string_view detail) {
    return of_status(500, detail);
}

} // namespace emp
