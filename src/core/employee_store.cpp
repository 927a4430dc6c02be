#include "emp/employee_store.hpp"
#include <mutex>

namespace emp {

void EmployeeStore::put(const std::string& uuid, Employee employee) {
    std::unique_lock lock(mutex_);
    data_.insert_or_assign(uuid, std::move(employee));
}

std::optional<Employee> EmployeeStore::get(const std::string& uuid) const {
    std::shared_lock lock(mutex_);
    auto it = data_.find(uuid);
    return it != data_.end() ? std::make_optional(it->second) : std::nullopt;
}

std::optional<Employee> EmployeeStore::remove(const std::string& uuid) {
    std::unique_lock lock(mutex_);
    auto it = data_.find(uuid);
    if (it == data_.end())
        return std::nullopt;

    Employee removed = std::move(it->second);
    data_.erase(it);
    return removed;
}

std::vector<Employee> EmployeeStore::list_all() const {
    std::shared_lock lock(mutex_);
    std::vector<Employee> snapshot;
    snapshot.reserve(data_.size());
    for (const auto& [uuid, employee] : data_)
        snapshot.push_back(employee);
    return snapshot;
}

bool EmployeeStore::contains(const std::string& uuid) const {
    std::shared_lock lock(mutex_);
    return data_.find(uuid) != data_.end();
}

size_t EmployeeStore::size() const {
    std::shared_lock lock(mutex_);
    return data_.size();
}

} // namespace emp
