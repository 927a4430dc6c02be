#include "emp/validation.hpp"

namespace emp {

namespace {

// Space and every ASCII control character
bool is_space(char c) {
    return static_cast<unsigned char>(c) <= ' ';
}

} // namespace

std::string trim(std::string_view value) {
    size_t start = 0;
    while (start < value.size() && is_space(value[start]))
        ++start;

    size_t end = value.size();
    while (end > start && is_space(value[end - 1]))
        --end;

    return std::string{value.substr(start, end - start)};
}

bool is_blank(std::string_view value) {
    for (char c : value) {
        if (!is_space(c))
            return false;
    }
    return true;
}

bool is_valid_email(std::string_view email) {
    std::string e = trim(email);
    auto at = e.find('@');
    auto last_at = e.rfind('@');

    if (at == std::string::npos || at == 0 || at != last_at)
        return false;

    std::string_view domain{e};
    domain.remove_prefix(at + 1);
    return !domain.empty() && domain.find('.') != std::string_view::npos;
}

} // namespace emp
