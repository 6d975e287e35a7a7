#include "CommandLine.hpp"
#include "CommandRegistry.hpp"
#include "Logger.hpp"

#include <iostream>
#include <fmt/format.h>

using namespace std;
using namespace jcmp;

static constexpr const char *APP_VERSION = "1.0.0";

static void print_usage(ostream &out) {
    out << "usage: jcmp [options] <command> <args...>\n\ncommands:\n";
    for (const auto &[usage, summary]: CommandRegistry::instance().usages())
        out << fmt::format("  {:<26} {}\n", usage, summary);
    out << "\noptions:\n"
            "  --format text|json   output format (default text)\n"
            "  --indent N           JSON indentation, -1 for compact (default 2)\n"
            "  --log-level LEVEL    trace, debug, info, warn, error, critical, off\n"
            "  --config FILE        JSON object with any of the options above\n"
            "  -q, --quiet          print nothing, report through the exit code\n"
            "  -h, --help           show this help\n"
            "  --version            show the version\n"
            "\nexit status: 0 equal, 1 different, 2 error\n"
            "a file name of - reads standard input\n";
}

int main(const int argc, char *argv[]) {
    try {
        load_log_level_from_env();

        const CommandLine cl = CommandLine::parse(argc, argv);
        if (cl.help) {
            print_usage(cout);
            return exit_code::equal;
        }
        if (cl.version) {
            cout << "jcmp " << APP_VERSION << '\n';
            return exit_code::equal;
        }

        const ordered_json options = cl.effective_options();
        if (const auto level = CommandRegistry::get_option<string>(options, "log-level"))
            set_log_level(*level);

        return CommandRegistry::instance().run_command(cl.command, cl.args, options, cout, cerr);
    } catch (const UsageError &e) {
        cerr << "jcmp: " << e.what() << "\n\n";
        print_usage(cerr);
    } catch (const exception &e) {
        // ParseError, unreadable files, bad log level
        logger()->error("{}", e.what());
    }
    return exit_code::error;
}
