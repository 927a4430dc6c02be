#pragma once

#include "emp/employee.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <shared_mutex>
#include <vector>


namespace emp {

/*
 * Thread-safe in-memory employee store keyed by uuid.
 * Every call is atomic on its own; there is no multi-call transaction.
 * Records are copied in and out, callers never alias the backing map.
 */
class EmployeeStore {
public:
    // Insert or replace
    void put(const std::string& uuid, Employee employee);
    std::optional<Employee> get(const std::string& uuid) const;
    // Returns the removed record, if there was one
    std::optional<Employee> remove(const std::string& uuid);
    // Snapshot copy, unspecified order
    std::vector<Employee> list_all() const;
    bool contains(const std::string& uuid) const;
    size_t size() const;

private:
    std::unordered_map<std::string, Employee> data_;
    mutable std::shared_mutex mutex_;
};

} // namespace emp
