#pragma once

#include "emp/employee_service.hpp"
#include "emp/http.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace emp {

/*
 * Maps HTTP requests onto EmployeeService operations:
 *   GET    {base}        list
 *   POST   {base}        create
 *   GET    {base}/{id}   get
 *   PATCH  {base}/{id}   update
 *   DELETE {base}/{id}   delete
 * Every failure becomes a problem+json response; dispatch never throws.
 */
class RequestDispatcher {
public:
    RequestDispatcher(EmployeeService& service, std::string base_path);

    HttpResponse dispatch(const HttpRequest& request) const;

    const std::string& base_path() const noexcept { return base_path_; }

private:
    HttpResponse route(const HttpRequest& request) const;
    HttpResponse handle_collection(const HttpRequest& request) const;
    HttpResponse handle_item(const HttpRequest& request, std::string_view id) const;

    // Strips the base path; returns "" for the collection, the id for an item
    std::optional<std::string_view> match(std::string_view path) const;

    EmployeeService& service_;
    std::string base_path_;
};

} // namespace emp
