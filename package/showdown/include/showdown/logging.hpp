#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace showdown {

// Shared "showdown" logger. Created on first use unless the host application
// registered one under the same name beforehand.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
void set_log_level(const std::string &level);

} // namespace showdown
