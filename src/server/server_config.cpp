#include "server_config.hpp"

#include <charconv>
#include <string_view>

namespace emp {

namespace {

template <typename T>
T parse_number(std::string_view option, std::string_view text, T min, T max) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < min || value > max) {
        throw ConfigError{std::string{option} + " expects a number between " +
            std::to_string(min) + " and " + std::to_string(max) + ", got '" + std::string{text} + "'"};
    }
    return value;
}

spdlog::level::level_enum parse_level(std::string_view text) {
    auto level = spdlog::level::from_str(std::string{text});
    // from_str maps anything unknown to off
    if (level == spdlog::level::off && text != "off")
        throw ConfigError{"unknown log level '" + std::string{text} + "'"};
    return level;
}

std::string parse_base_path(std::string_view text) {
    std::string path{text};
    while (path.size() > 1 && path.back() == '/')
        path.pop_back();
    if (path.empty() || path.front() != '/' || path == "/")
        throw ConfigError{"--base-path must be an absolute path below '/', got '" + std::string{text} + "'"};
    if (path.find_first_of("?# ") != std::string::npos)
        throw ConfigError{"--base-path must not contain '?', '#' or spaces"};
    return path;
}

} // namespace

ServerConfig parse_args(int argc, const char* const* argv) {
    ServerConfig config;

    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];

        auto value = [&]() -> std::string_view {
            if (i + 1 >= argc)
                throw ConfigError{std::string{arg} + " requires a value"};
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--port") {
            config.port = parse_number<uint16_t>(arg, value(), 0, 65535);
        } else if (arg == "--workers") {
            config.workers = parse_number<size_t>(arg, value(), 1, 256);
        } else if (arg == "--base-path") {
            config.base_path = parse_base_path(value());
        } else if (arg == "--log-level") {
            config.log_level = parse_level(value());
        } else if (arg == "--log-file") {
            config.log_file = std::string{value()};
        } else if (arg == "--no-seed") {
            config.seed = false;
        } else {
            throw ConfigError{"unknown option '" + std::string{arg} + "'"};
        }
    }

    return config;
}

std::string usage() {
    return
        "usage:\n"
        "  employee_server [options]\n"
        "\n"
        "options:\n"
        "  --port <n>          default: 8080 (0 picks a free port)\n"
        "  --workers <n>       default: 4\n"
        "  --base-path <path>  default: /api/v1/employee\n"
        "  --log-level <lvl>   trace|debug|info|warn|err|critical|off, default: info\n"
        "  --log-file <path>   also write logs to this file\n"
        "  --no-seed           start with an empty store\n"
        "  --help\n";
}

} // namespace emp
