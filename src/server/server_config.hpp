#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <spdlog/common.h>

namespace emp {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct ServerConfig {
    uint16_t port = 8080;
    size_t workers = 4;
    std::string base_path = "/api/v1/employee";
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::optional<std::string> log_file;
    bool seed = true;
    bool show_help = false;
};

/*
 * Command line:
 *   --port <n>  --workers <n>  --base-path <path>  --log-level <level>
 *   --log-file <path>  --no-seed  --help
 * Throws ConfigError on unknown options or bad values.
 */
ServerConfig parse_args(int argc, const char* const* argv);

std::string usage();

} // namespace emp
