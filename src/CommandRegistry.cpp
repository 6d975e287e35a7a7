#include "CommandRegistry.hpp"
#include "commands/CompareCommands.hpp"

#include <mutex>
#include <fmt/format.h>

using namespace std;
using namespace jcmp;

CommandRegistry &CommandRegistry::instance() {
    static CommandRegistry inst;
    // init() registers into inst and must not call instance()
    static const bool commandsRegistered = [] {
        CompareCommands::init(inst);
        return true;
    }();
    (void) commandsRegistered;
    return inst;
}

void CommandRegistry::register_command(const std::string &name, Command command) {
    unique_lock locker(_registryMutex);
    _registry[name] = std::move(command);
}

int CommandRegistry::run_command(const std::string &name, const std::vector<std::string> &args,
                                 const ordered_json &options, std::ostream &out, std::ostream &err) {
    CommandFunction fn;
    {
        shared_lock locker(_registryMutex);
        const auto it = _registry.find(name);
        if (it == _registry.end())
            throw UsageError(fmt::format("unknown command: {}", name));
        if (args.size() != it->second.arity)
            throw UsageError(fmt::format("usage: jcmp [options] {}", it->second.usage));
        fn = it->second.fn;
    }
    return fn(args, options, out, err);
}

bool CommandRegistry::has_command(const std::string &name) {
    shared_lock locker(_registryMutex);
    return _registry.contains(name);
}

std::vector<std::pair<std::string, std::string>> CommandRegistry::usages() {
    shared_lock locker(_registryMutex);
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto &[name, command]: _registry)
        out.emplace_back(command.usage, command.summary);
    return out;
}
