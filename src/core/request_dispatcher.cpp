
#include "emp/request_dispatcher.hpp"
#include "emp/id_generator.hpp"
#include "emp/json_codec.hpp"

#include <spdlog/spdlog.h>

namespace emp {

namespace {

HttpResponse method_not_allowed(const HttpRequest& request, const char* allow) {
    auto problem = ProblemDetails::method_not_allowed(
        std::string{to_string(request.method)} + " is not supported on this resource");
    problem.instance = request.path;
    HttpResponse res = HttpResponse::problem(problem);
    res.headers["Allow"] = allow;
    return res;
}

} // namespace

RequestDispatcher::RequestDispatcher(EmployeeService& service, std::string base_path)
    : service_(service), base_path_(std::move(base_path)) {
    while (base_path_.size() > 1 && base_path_.back() == '/')
        base_path_.pop_back();
}

HttpResponse RequestDispatcher::dispatch(const HttpRequest& request) const {
    ProblemDetails problem;
    try {
        return route(request);
    } catch (const MissingBodyError& e) {
        problem = ProblemDetails::bad_request(e.what());
    } catch (const ValidationError& e) {
        problem = ProblemDetails::bad_request(e.what());
    } catch (const NotFoundError& e) {
        problem = ProblemDetails::not_found(e.what());
    } catch (const MalformedBodyError& e) {
        problem = ProblemDetails::bad_request(e.what());
    } catch (const std::exception& e) {
        spdlog::error("Unhandled error on {} {}: {}", to_string(request.method), request.path, e.what());
        problem = ProblemDetails::internal_server_error();
    }
    problem.instance = request.path;
    return HttpResponse::problem(problem);
}

HttpResponse RequestDispatcher::route(const HttpRequest& request) const {
    auto rest = match(request.path);
    if (!rest) {
        auto problem = ProblemDetails::not_found("no route for " + request.path);
        problem.instance = request.path;
        return HttpResponse::problem(problem);
    }
    if (rest->empty())
        return handle_collection(request);
    return handle_item(request, *rest);
}

HttpResponse RequestDispatcher::handle_collection(const HttpRequest& request) const {
    switch (request.method) {
    case Method::Get:
        return HttpResponse::json(200, serialize_employees(service_.list()));
    case Method::Post: {
        Employee created = service_.create(parse_create_request(request.body));
        HttpResponse res = HttpResponse::json(201, serialize_employee(created));
        res.headers["Location"] = base_path_ + "/" + created.uuid;
        return res;
    }
    default:
        return method_not_allowed(request, "GET, POST");
    }
}

HttpResponse RequestDispatcher::handle_item(const HttpRequest& request, std::string_view id) const {
    if (request.method != Method::Get && request.method != Method::Patch && request.method != Method::Delete)
        return method_not_allowed(request, "GET, PATCH, DELETE");

    auto uuid = IdGenerator::normalize(id);
    if (!uuid) {
        auto problem = ProblemDetails::bad_request("invalid employee id: " + std::string{id});
        problem.instance = request.path;
        return HttpResponse::problem(problem);
    }

    switch (request.method) {
    case Method::Get:
        return HttpResponse::json(200, serialize_employee(service_.get(*uuid)));
    case Method::Patch:
        return HttpResponse::json(200, serialize_employee(service_.update(*uuid, parse_update_request(request.body))));
    default:
        service_.remove(*uuid);
        return HttpResponse::no_content();
    }
}

std::optional<std::string_view> RequestDispatcher::match(std::string_view path) const {
    std::string_view base{base_path_};
    if (path.substr(0, base.size()) != base)
        return std::nullopt;
    path.remove_prefix(base.size());

    if (path.empty())
        return std::string_view{};
    if (path.front() != '/')
        return std::nullopt;
    path.remove_prefix(1);

    // Only a single id segment is routable
    if (path.empty() || path.find('/') != std::string_view::npos)
        return std::nullopt;
    return path;
}

} // namespace emp
