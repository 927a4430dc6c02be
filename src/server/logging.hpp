#pragma once

#include <optional>
#include <string>

#include <spdlog/common.h>

namespace emp {

// Installs the process-wide async logger: colored stdout plus an optional file
void init_logging(spdlog::level::level_enum level, const std::optional<std::string>& log_file);

} // namespace emp
