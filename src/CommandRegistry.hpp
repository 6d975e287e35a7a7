#pragma once

#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using std::nullopt;
using std::optional;
using std::runtime_error;
using ordered_json = nlohmann::ordered_json;

namespace jcmp {
    // Bad command line or option values; reported with the usage text.
    struct UsageError final : public runtime_error {
        using runtime_error::runtime_error;
    };

    namespace exit_code {
        constexpr int equal = 0;
        constexpr int different = 1;
        constexpr int error = 2;
    }

    // Command function signature:
    // - args: positional arguments after the command name (arity already checked)
    // - options: merged configuration object (config file, then command-line flags)
    // - out / err: where results and error reports go
    // returns the process exit code
    using CommandFunction = std::function<int(const std::vector<std::string> &args, const ordered_json &options,
                                              std::ostream &out, std::ostream &err)>;

    class CommandRegistry {
    public:
        struct Command {
            std::string usage; // e.g. "diff LEFT RIGHT"
            std::string summary;
            size_t arity;
            CommandFunction fn;
        };

        static CommandRegistry &instance();

        void register_command(const std::string &name, Command command);

        // run a registered command; throws UsageError if unknown or called with the wrong number of arguments
        int run_command(const std::string &name, const std::vector<std::string> &args, const ordered_json &options,
                        std::ostream &out, std::ostream &err);

        bool has_command(const std::string &name);

        // (usage, summary) pairs, sorted by command name
        std::vector<std::pair<std::string, std::string>> usages();

        template<typename T>
        static T get_option(const ordered_json &options, const std::string &name, const T &defaultValue) {
            if (options.is_object() && options.contains(name))
                return options.at(name).get<T>();
            return defaultValue;
        }

        template<typename T>
        static optional<T> get_option(const ordered_json &options, const std::string &name) {
            if (options.is_object() && options.contains(name))
                return options.at(name).get<T>();
            return nullopt;
        }

    private:
        CommandRegistry() = default;

        ~CommandRegistry() = default;

        std::map<std::string, Command> _registry;
        std::shared_mutex _registryMutex;
    };
} // namespace jcmp
