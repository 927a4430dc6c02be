#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace emp {

/*
 * Version 4 (random) UUIDs in canonical lower-case form:
 * xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y in {8, 9, a, b}.
 * Safe to call from any thread.
 */
class IdGenerator {
public:
    static std::string generate();

    // Returns the lower-cased canonical form, or nullopt if text is not 8-4-4-4-12 hex
    static std::optional<std::string> normalize(std::string_view text);
};

} // namespace emp
