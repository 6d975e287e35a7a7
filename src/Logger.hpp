#pragma once

#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace jcmp {
    // The "jcmp" logger (stderr, colour). Created on first use; safe to call from any thread.
    std::shared_ptr<spdlog::logger> logger();

    // Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
    // Throws std::invalid_argument on any other name.
    void set_log_level(std::string_view level);

    // Applies SPDLOG_LEVEL from the environment (e.g. SPDLOG_LEVEL=debug or jcmp=trace).
    void load_log_level_from_env();
} // namespace jcmp
