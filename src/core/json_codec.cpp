#include "emp/json_codec.hpp"
#include "emp/validation.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace emp {

namespace {

template <typename T>
json optional_to_json(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json timestamp_to_json(const std::optional<Timestamp>& value) {
    return value ? json(format_timestamp(*value)) : json(nullptr);
}

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    if (!it->is_string())
        throw MalformedBodyError{std::string{key} + " must be a string"};
    return it->get<std::string>();
}

std::optional<int> optional_int(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    if (!it->is_number_integer())
        throw MalformedBodyError{std::string{key} + " must be an integer"};

    if (it->is_number_unsigned()) {
        auto value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            throw MalformedBodyError{std::string{key} + " is out of range"};
        return static_cast<int>(value);
    }

    auto value = it->get<std::int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
        throw MalformedBodyError{std::string{key} + " is out of range"};
    return static_cast<int>(value);
}

std::optional<Timestamp> optional_timestamp(const json& j, const char* key) {
    auto text = optional_string(j, key);
    if (!text)
        return std::nullopt;
    auto ts = parse_timestamp(trim(*text));
    if (!ts)
        throw MalformedBodyError{std::string{key} + " must be an ISO-8601 instant"};
    return ts;
}

// Returns nullopt when the body stands for "no request"
std::optional<json> parse_object(std::string_view body) {
    if (is_blank(body))
        return std::nullopt;

    json j = json::parse(body.begin(), body.end(), nullptr, false);
    if (j.is_discarded())
        throw MalformedBodyError{"request body is not valid JSON"};
    if (j.is_null())
        return std::nullopt;
    if (!j.is_object())
        throw MalformedBodyError{"request body must be a JSON object"};
    return j;
}

} // namespace

void to_json(json& j, const Employee& employee) {
    j = json{
        {"uuid", employee.uuid},
        {"firstName", employee.first_name},
        {"lastName", employee.last_name},
        {"fullName", employee.full_name},
        {"salary", optional_to_json(employee.salary)},
        {"age", optional_to_json(employee.age)},
        {"jobTitle", optional_to_json(employee.job_title)},
        {"email", optional_to_json(employee.email)},
        {"contractHireDate", timestamp_to_json(employee.contract_hire_date)},
        {"contractTerminationDate", timestamp_to_json(employee.contract_termination_date)},
    };
}

std::optional<CreateEmployeeRequest> parse_create_request(std::string_view body) {
    auto j = parse_object(body);
    if (!j)
        return std::nullopt;

    CreateEmployeeRequest req;
    req.first_name = optional_string(*j, "firstName");
    req.last_name = optional_string(*j, "lastName");
    req.salary = optional_int(*j, "salary");
    req.age = optional_int(*j, "age");
    req.job_title = optional_string(*j, "jobTitle");
    req.email = optional_string(*j, "email");
    req.contract_hire_date = optional_timestamp(*j, "contractHireDate");
    return req;
}

std::optional<UpdateEmployeeRequest> parse_update_request(std::string_view body) {
    auto j = parse_object(body);
    if (!j)
        return std::nullopt;

    UpdateEmployeeRequest req;
    req.first_name = optional_string(*j, "firstName");
    req.last_name = optional_string(*j, "lastName");
    req.salary = optional_int(*j, "salary");
    req.age = optional_int(*j, "age");
    req.job_title = optional_string(*j, "jobTitle");
    req.email = optional_string(*j, "email");
    req.contract_hire_date = optional_timestamp(*j, "contractHireDate");
    return req;
}

std::string serialize_employee(const Employee& employee) {
    return json(employee).dump();
}

std::string serialize_employees(const std::vector<Employee>& employees) {
    json arr = json::array();
    for (const auto& employee : employees)
        arr.push_back(employee);
    return arr.dump();
}

} // namespace emp
