#include "emp/employee_service.hpp"
#include "emp/id_generator.hpp"
#include "emp/validation.hpp"

#include <spdlog/spdlog.h>

namespace emp {

namespace {

void require_name(const std::optional<std::string>& value, const char* field) {
    if (!value || is_blank(*value))
        throw ValidationError{field, std::string{field} + " is required"};
}

void check_salary(const std::optional<int>& salary) {
    if (salary && *salary < 0)
        throw ValidationError{"salary", "salary must not be negative"};
}

void check_age(const std::optional<int>& age) {
    if (age && (*age < 0 || *age > 100))
        throw ValidationError{"age", "age must be between 0 and 100"};
}

void check_job_title(const std::optional<std::string>& job_title) {
    if (job_title && is_blank(*job_title))
        throw ValidationError{"jobTitle", "jobTitle must not be blank"};
}

void check_email(const std::optional<std::string>& email) {
    if (email && !is_valid_email(*email))
        throw ValidationError{"email", "email must be a valid email address"};
}

std::optional<std::string> trimmed(const std::optional<std::string>& value) {
    return value ? std::make_optional(trim(*value)) : std::nullopt;
}

std::string join_name(const std::string& first, const std::string& last) {
    return trim(trim(first) + " " + trim(last));
}

} // namespace

std::vector<Employee> EmployeeService::list() const {
    return store_.list_all();
}

Employee EmployeeService::get(const std::string& uuid) const {
    auto employee = store_.get(uuid);
    if (!employee)
        throw NotFoundError{uuid};
    return *employee;
}

Employee EmployeeService::create(const std::optional<CreateEmployeeRequest>& request) {
    if (!request)
        throw MissingBodyError{};

    const CreateEmployeeRequest& req = *request;
    require_name(req.first_name, "firstName");
    require_name(req.last_name, "lastName");
    check_salary(req.salary);
    check_age(req.age);
    check_job_title(req.job_title);
    check_email(req.email);

    Employee e;
    e.uuid = next_uuid();
    e.first_name = trim(*req.first_name);
    e.last_name = trim(*req.last_name);
    e.full_name = e.first_name + " " + e.last_name;
    e.salary = req.salary;
    e.age = req.age;
    e.job_title = trimmed(req.job_title);
    e.email = trimmed(req.email);
    e.contract_hire_date = req.contract_hire_date ? *req.contract_hire_date : now_timestamp();

    store_.put(e.uuid, e);
    spdlog::debug("Created employee {} ({})", e.uuid, e.full_name);
    return e;
}

Employee EmployeeService::update(const std::string& uuid, const std::optional<UpdateEmployeeRequest>& request) {
    if (!request)
        throw MissingBodyError{};

    auto existing = store_.get(uuid);
    if (!existing)
        throw NotFoundError{uuid};

    const UpdateEmployeeRequest& req = *request;
    if (req.first_name)
        require_name(req.first_name, "firstName");
    if (req.last_name)
        require_name(req.last_name, "lastName");
    check_salary(req.salary);
    check_age(req.age);
    check_job_title(req.job_title);
    check_email(req.email);

    // Copy-on-write: build the new value, then write it back in one put
    Employee e = std::move(*existing);
    if (req.first_name)
        e.first_name = trim(*req.first_name);
    if (req.last_name)
        e.last_name = trim(*req.last_name);
    if (req.first_name || req.last_name)
        e.full_name = join_name(e.first_name, e.last_name);
    if (req.salary)
        e.salary = req.salary;
    if (req.age)
        e.age = req.age;
    if (req.job_title)
        e.job_title = trim(*req.job_title);
    if (req.email)
        e.email = trim(*req.email);
    if (req.contract_hire_date)
        e.contract_hire_date = req.contract_hire_date;

    // A delete racing between get and put re-inserts the record; accepted.
    store_.put(uuid, e);
    spdlog::debug("Updated employee {}", uuid);
    return e;
}

void EmployeeService::remove(const std::string& uuid) {
    if (!store_.remove(uuid))
        throw NotFoundError{uuid};
    spdlog::debug("Deleted employee {}", uuid);
}

std::string EmployeeService::next_uuid() const {
    std::string uuid = IdGenerator::generate();
    while (store_.contains(uuid))
        uuid = IdGenerator::generate();
    return uuid;
}

void seed_sample_employees(EmployeeService& service) {
    CreateEmployeeRequest daniel;
    daniel.first_name = "Daniel";
    daniel.last_name = "Rendon";
    daniel.age = 23;
    daniel.salary = 90000;
    daniel.job_title = "Backend (Java) Associate Software Engineer";
    daniel.email = "drendon@example.com";

    CreateEmployeeRequest destiny;
    destiny.first_name = "Destiny";
    destiny.last_name = "Esquivel";
    destiny.age = 22;
    destiny.salary = 80000;
    destiny.job_title = "Sales Manager";
    destiny.email = "destiny.esquivel@example.com";

    service.create(daniel);
    service.create(destiny);
    spdlog::info("Seeded {} sample employees", 2);
}

} // namespace emp
