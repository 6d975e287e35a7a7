#pragma once

#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

using ordered_json = nlohmann::ordered_json;

namespace jcmp {
    class CommandRegistry;

    class CompareCommands {
    public:
        static void init(CommandRegistry &registry);

    private:
        static int diff(const std::vector<std::string> &args, const ordered_json &options, std::ostream &out,
                        std::ostream &err);

        static int path(const std::vector<std::string> &args, const ordered_json &options, std::ostream &out,
                        std::ostream &err);

        static int value(const std::vector<std::string> &args, const ordered_json &options, std::ostream &out,
                         std::ostream &err);
    };
}
