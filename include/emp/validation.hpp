#pragma once

#include <string>
#include <string_view>

namespace emp {

// Strips leading and trailing whitespace, control characters included
std::string trim(std::string_view value);

bool is_blank(std::string_view value);

/*
 * Minimal email shape check, applied to the trimmed input:
 * exactly one '@', not in the first position, and a non-empty
 * domain after it that contains a '.'.
 */
bool is_valid_email(std::string_view email);

} // namespace emp
