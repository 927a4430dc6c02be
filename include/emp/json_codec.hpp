#pragma once

#include "emp/employee.hpp"

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace emp {

// The body is not JSON, or a field has the wrong type
class MalformedBodyError : public std::runtime_error {
public:
    explicit MalformedBodyError(const std::string& msg) : std::runtime_error(msg) {}
};

// JSON field names follow the public API: firstName, contractHireDate, ...
void to_json(nlohmann::json& j, const Employee& employee);

/*
 * Request decoding. An empty body or a literal null is an absent
 * request (nullopt). JSON null fields count as not supplied and
 * unknown fields are ignored.
 * Throws MalformedBodyError.
 */
std::optional<CreateEmployeeRequest> parse_create_request(std::string_view body);
std::optional<UpdateEmployeeRequest> parse_update_request(std::string_view body);

std::string serialize_employee(const Employee& employee);
std::string serialize_employees(const std::vector<Employee>& employees);

} // namespace emp
