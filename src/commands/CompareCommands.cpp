#include "CompareCommands.hpp"
#include "../CommandRegistry.hpp"
#include "../Comparator.hpp"
#include "../DiffReport.hpp"
#include "../Document.hpp"
#include "../Logger.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace std;
using namespace jcmp;

void CompareCommands::init(CommandRegistry &registry) {
    registry.register_command("diff", {"diff LEFT RIGHT", "list every difference between two documents", 2, diff});
    registry.register_command("path", {
                                  "path LEFT RIGHT EXPR", "compare the values both documents hold at EXPR", 3, path
                              });
    registry.register_command("value", {
                                  "value FILE EXPR EXPECTED", "compare the value at EXPR with the JSON text EXPECTED",
                                  3, value
                              });
}

/* -------------------------
   Output helpers
   ------------------------- */

static bool json_output(const ordered_json &options) {
    return CommandRegistry::get_option(options, "format", string("text")) == "json";
}

static void check_single_stdin(const vector<string> &files) {
    if (ranges::count(files, string("-")) > 1)
        throw UsageError("only one document can be read from standard input");
}

static int report_result(const bool equal, const ordered_json &options, ostream &out) {
    if (!CommandRegistry::get_option(options, "quiet", false)) {
        if (json_output(options)) {
            ordered_json j = ordered_json::object();
            j["equal"] = equal;
            out << j.dump(CommandRegistry::get_option(options, "indent", 2)) << '\n';
        } else {
            out << (equal ? "true" : "false") << '\n';
        }
    }
    return equal ? exit_code::equal : exit_code::different;
}

static int report_path_error(const PathError &error, const ordered_json &options, ostream &out, ostream &err) {
    logger()->debug("path error: {}", error.what());
    if (json_output(options)) {
        ordered_json j = ordered_json::object();
        j["error"] = error;
        out << j.dump(CommandRegistry::get_option(options, "indent", 2)) << '\n';
    } else {
        err << "jcmp: " << error.what() << '\n';
    }
    return exit_code::error;
}

/* -------------------------
   Commands
   ------------------------- */

/**
 * Full structural comparison of two documents.
 *
 * @param args LEFT and RIGHT file names ("-" for standard input).
 * @param options format: "text" (default) or "json"; indent: JSON indentation (default 2);
 *                quiet: bool (default false) - print nothing, only set the exit code.
 * @return 0 when the documents are equal, 1 otherwise.
 */
int CompareCommands::diff(const vector<string> &args, const ordered_json &options, ostream &out, ostream &) {
    check_single_stdin(args);
    const ordered_json left = Document::load(args[0]);
    const ordered_json right = Document::load(args[1]);

    const DiffResult result = Comparator::compare_full(left, right);
    logger()->info("{} vs {}: {} difference(s)", args[0], args[1], result.differences.size());

    if (!CommandRegistry::get_option(options, "quiet", false)) {
        if (json_output(options))
            out << ordered_json(result).dump(CommandRegistry::get_option(options, "indent", 2)) << '\n';
        else
            out << DiffReport::to_text(result);
    }
    return result.equal() ? exit_code::equal : exit_code::different;
}

/**
 * Compare the values two documents hold at the same path.
 *
 * @param args LEFT, RIGHT and the path expression.
 * @param options see diff.
 * @return 0 when equal, 1 when different, 2 when the path is malformed or missing in either document.
 */
int CompareCommands::path(const vector<string> &args, const ordered_json &options, ostream &out, ostream &err) {
    check_single_stdin({args[0], args[1]});
    const ordered_json left = Document::load(args[0]);
    const ordered_json right = Document::load(args[1]);

    const auto result = Comparator::compare_at_path(left, right, args[2]);
    if (!result) return report_path_error(result.error(), options, out, err);
    logger()->info("{} vs {} at '{}': {}", args[0], args[1], args[2], result.value() ? "equal" : "different");
    return report_result(result.value(), options, out);
}

/**
 * Compare the value a document holds at a path with an expected JSON value.
 *
 * @param args FILE, the path expression and EXPECTED as JSON text (30 is a number, "30" a string).
 * @param options see diff.
 * @return 0 when equal, 1 when different, 2 when the path is malformed or missing.
 */
int CompareCommands::value(const vector<string> &args, const ordered_json &options, ostream &out, ostream &err) {
    const ordered_json tree = Document::load(args[0]);
    const ordered_json expected = Document::parse(string_view(args[2]), "EXPECTED");

    const auto result = Comparator::compare_value_at_path(tree, args[1], expected);
    if (!result) return report_path_error(result.error(), options, out, err);
    logger()->info("{} at '{}': {}", args[0], args[1], result.value() ? "equal" : "different");
    return report_result(result.value(), options, out);
}
