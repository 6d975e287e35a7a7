#include "CommandLine.hpp"
#include "CommandRegistry.hpp"
#include "Document.hpp"

#include <cctype>
#include <charconv>
#include <fmt/format.h>

using namespace std;

namespace jcmp {
    static int parse_indent(const string &value) {
        int indent = 0;
        const auto [ptr, ec] = from_chars(value.data(), value.data() + value.size(), indent);
        if (ec != errc() || ptr != value.data() + value.size())
            throw UsageError(fmt::format("--indent expects an integer, got '{}'", value));
        return indent;
    }

    // "-" and negative numbers such as -1 or -2.5 are positional
    static bool looks_like_option(const string &a) {
        if (a.size() < 2 || a[0] != '-') return false;
        return !isdigit(static_cast<unsigned char>(a[1])) && a[1] != '.';
    }

    CommandLine CommandLine::parse(const vector<string> &argv) {
        CommandLine cl;
        bool options_done = false;

        for (size_t i = 0; i < argv.size(); ++i) {
            const string &a = argv[i];
            if (!options_done && a == "--") {
                options_done = true;
                continue;
            }
            if (options_done || !looks_like_option(a)) {
                if (cl.command.empty()) cl.command = a;
                else cl.args.push_back(a);
                continue;
            }

            string name;
            optional<string> value;
            if (a[1] == '-') {
                const string body = a.substr(2);
                const auto eq = body.find('=');
                name = body.substr(0, eq);
                if (eq != string::npos) value = body.substr(eq + 1);
            } else if (a == "-h") {
                name = "help";
            } else if (a == "-q") {
                name = "quiet";
            } else {
                throw UsageError(fmt::format("unknown option {}", a));
            }

            if (name == "help" || name == "version" || name == "quiet") {
                if (value) throw UsageError(fmt::format("--{} takes no value", name));
                if (name == "help") cl.help = true;
                else if (name == "version") cl.version = true;
                else cl.options["quiet"] = true;
                continue;
            }

            if (name != "format" && name != "indent" && name != "log-level" && name != "config")
                throw UsageError(fmt::format("unknown option {}", a));
            if (!value) {
                if (i + 1 >= argv.size()) throw UsageError(fmt::format("--{} expects a value", name));
                value = argv[++i];
            }

            if (name == "indent") cl.options["indent"] = parse_indent(*value);
            else if (name == "config") cl.config_file = *value;
            else cl.options[name] = *value;
        }

        if (!cl.help && !cl.version && cl.command.empty())
            throw UsageError("missing command");
        validate_options(cl.options);
        return cl;
    }

    CommandLine CommandLine::parse(const int argc, const char *const argv[]) {
        vector<string> args;
        for (int i = 1; i < argc; ++i)
            args.emplace_back(argv[i]);
        return parse(args);
    }

    ordered_json CommandLine::effective_options() const {
        ordered_json merged = ordered_json::object();
        if (config_file) {
            ordered_json config = Document::load(*config_file);
            if (!config.is_object())
                throw UsageError(fmt::format("configuration file {} must contain a JSON object", *config_file));
            merged = std::move(config);
        }
        merged.update(options);
        validate_options(merged);
        return merged;
    }

    void CommandLine::validate_options(const ordered_json &options) {
        for (auto it = options.begin(); it != options.end(); ++it) {
            const string &key = it.key();
            const ordered_json &v = it.value();
            if (key == "format") {
                if (!v.is_string() || (v.get_ref<const string &>() != "text" &&
                                       v.get_ref<const string &>() != "json"))
                    throw UsageError(fmt::format("format must be \"text\" or \"json\", got {}", v.dump()));
            } else if (key == "indent") {
                if (!v.is_number_integer() || v.get<long long>() < -1)
                    throw UsageError(fmt::format("indent must be an integer >= -1, got {}", v.dump()));
            } else if (key == "log-level") {
                if (!v.is_string())
                    throw UsageError(fmt::format("log-level must be a string, got {}", v.dump()));
            } else if (key == "quiet") {
                if (!v.is_boolean())
                    throw UsageError(fmt::format("quiet must be a boolean, got {}", v.dump()));
            } else {
                throw UsageError(fmt::format("unknown option '{}'", key));
            }
        }
    }
} // namespace jcmp
