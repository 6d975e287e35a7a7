#include "Logger.hpp"

#include <array>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <fmt/format.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

using namespace std;

namespace jcmp {
    static constexpr string_view LOGGER_NAME = "jcmp";

    shared_ptr<spdlog::logger> logger() {
        static const shared_ptr<spdlog::logger> inst = [] {
            auto existing = spdlog::get(string(LOGGER_NAME));
            if (existing) return existing;
            auto created = spdlog::stderr_color_mt(string(LOGGER_NAME));
            created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            created->set_level(spdlog::level::info);
            return created;
        }();
        return inst;
    }

    void set_log_level(const string_view level) {
        static constexpr array<string_view, 7> names = {
            "trace", "debug", "info", "warn", "error", "critical", "off"
        };
        if (ranges::find(names, level) == names.end())
            throw invalid_argument(fmt::format("unknown log level '{}'", level));
        logger()->set_level(spdlog::level::from_str(string(level)));
    }

    void load_log_level_from_env() {
        // the logger must be registered before spdlog applies per-logger levels
        logger();
        spdlog::cfg::load_env_levels();
    }
} // namespace jcmp
