#include "logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace emp {

void init_logging(spdlog::level::level_enum level, const std::optional<std::string>& log_file) {
    spdlog::init_thread_pool(8192, 1);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (log_file)
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*log_file, true));

    auto logger = std::make_shared<spdlog::async_logger>(
        "employee_api", sinks.begin(), sinks.end(), spdlog::thread_pool(),
        spdlog::async_overflow_policy::overrun_oldest);

    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    // thread id helps to tell the reactor from the workers
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%t] [%l] %v");
}

} // namespace emp
