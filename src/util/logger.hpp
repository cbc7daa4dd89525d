#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace wasmbox::util {

// Install the "wasmbox" console logger as the spdlog default
void init_logger();

void set_log_level(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn", "error", "off" (anything else -> info)
spdlog::level::level_enum log_level_from_string(const std::string& name);

} // namespace wasmbox::util
