#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using ordered_json = nlohmann::ordered_json;

namespace jcmp {
    /*
     CommandLine
     - jcmp [options] <command> <args...>
     - options: --format text|json, --indent N, --log-level LEVEL, --config FILE, -q/--quiet,
       -h/--help, --version; "--opt=value" and "--opt value" are both accepted
     - a lone "-" is a positional argument (standard input); "--" ends option parsing
    */
    struct CommandLine {
        std::string command;
        std::vector<std::string> args;
        // options given as flags, keyed by option name without dashes
        ordered_json options = ordered_json::object();
        std::optional<std::string> config_file;
        bool help = false;
        bool version = false;

        // Throws UsageError on unknown options, missing or invalid values.
        static CommandLine parse(const std::vector<std::string> &argv);

        static CommandLine parse(int argc, const char *const argv[]);

        // Config file object (if any) overridden by command-line flags, then validated.
        // Throws UsageError / ParseError / std::runtime_error.
        [[nodiscard]] ordered_json effective_options() const;

        // Checks option names and value types; throws UsageError.
        static void validate_options(const ordered_json &options);
    };
} // namespace jcmp
