#pragma once

#include "emp/timestamp.hpp"

#include <optional>
#include <string>

namespace emp {

/*
 * An employee record as held by the store.
 * full_name is always derived from first_name and last_name.
 */
struct Employee {
    std::string uuid;
    std::string first_name;
    std::string last_name;
    std::string full_name;
    std::optional<int> salary;
    std::optional<int> age;
    std::optional<std::string> job_title;
    std::optional<std::string> email;
    std::optional<Timestamp> contract_hire_date;
    // Set by the system only, never through a request
    std::optional<Timestamp> contract_termination_date;

    bool operator==(const Employee&) const = default;
};

/*
 * Client-supplied fields for creating an employee.
 * Server-managed fields (uuid, full name, termination date) are not part of it.
 */
struct CreateEmployeeRequest {
    std::optional<std::string> first_name;
    std::optional<std::string> last_name;
    std::optional<int> salary;
    std::optional<int> age;
    std::optional<std::string> job_title;
    std::optional<std::string> email;
    std::optional<Timestamp> contract_hire_date;
};

// Partial update: an absent field leaves the stored value untouched.
struct UpdateEmployeeRequest {
    std::optional<std::string> first_name;
    std::optional<std::string> last_name;
    std::optional<int> salary;
    std::optional<int> age;
    std::optional<std::string> job_title;
    std::optional<std::string> email;
    std::optional<Timestamp> contract_hire_date;
};

} // namespace emp
