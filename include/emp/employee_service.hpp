#pragma once

#include "emp/employee.hpp"
#include "emp/employee_store.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace emp {

class ServiceError : public std::runtime_error {
public:
    explicit ServiceError(const std::string& msg) : std::runtime_error(msg) {}
};

// The request payload was absent
class MissingBodyError : public ServiceError {
public:
    MissingBodyError() : ServiceError("request body is required") {}
};

// A supplied field violates its rule
class ValidationError : public ServiceError {
public:
    ValidationError(std::string field, const std::string& msg)
        : ServiceError(msg), field_(std::move(field)) {}

    const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

class NotFoundError : public ServiceError {
public:
    explicit NotFoundError(const std::string& uuid)
        : ServiceError("Employee not found: " + uuid), uuid_(uuid) {}

    const std::string& uuid() const noexcept { return uuid_; }

private:
    std::string uuid_;
};

/*
 * Validation and mutation policy for employee records.
 * The only writer of the store it is given; the store must outlive it.
 * All operations may be called concurrently.
 */
class EmployeeService {
public:
    explicit EmployeeService(EmployeeStore& store) : store_(store) {}

    std::vector<Employee> list() const;

    // Throws NotFoundError
    Employee get(const std::string& uuid) const;

    // Throws MissingBodyError, ValidationError
    Employee create(const std::optional<CreateEmployeeRequest>& request);

    // Applies only the supplied fields. All supplied fields are checked before
    // anything changes, so a rejected update leaves the record as it was.
    // Throws MissingBodyError, NotFoundError, ValidationError
    Employee update(const std::string& uuid, const std::optional<UpdateEmployeeRequest>& request);

    // Throws NotFoundError
    void remove(const std::string& uuid);

private:
    std::string next_uuid() const;

    EmployeeStore& store_;
};

// Loads the two sample employees the service ships with
void seed_sample_employees(EmployeeService& service);

} // namespace emp
