#include "Document.hpp"

#include <fstream>
#include <iostream>
#include <fmt/format.h>

#include "Logger.hpp"

using namespace std;

namespace jcmp {
    static ParseError to_parse_error(const ordered_json::parse_error &e, const string &name) {
        return ParseError(fmt::format("invalid JSON in {}: {}", name, e.what()), name, e.byte);
    }

    ordered_json Document::parse(const string_view text, const string &name) {
        try {
            return ordered_json::parse(text.begin(), text.end());
        } catch (const ordered_json::parse_error &e) {
            throw to_parse_error(e, name);
        }
    }

    ordered_json Document::parse(istream &in, const string &name) {
        try {
            return ordered_json::parse(in);
        } catch (const ordered_json::parse_error &e) {
            throw to_parse_error(e, name);
        }
    }

    ordered_json Document::load(const string &file) {
        if (file == "-") {
            logger()->debug("reading document from stdin");
            return parse(cin, "<stdin>");
        }
        ifstream in(file);
        if (!in.is_open())
            throw runtime_error(fmt::format("cannot open {}", file));
        logger()->debug("reading document {}", file);
        return parse(in, file);
    }
} // namespace jcmp
