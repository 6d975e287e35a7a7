#pragma once

#include <istream>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

#include "JCmpError.hpp"

using std::string;
using std::string_view;
using ordered_json = nlohmann::ordered_json;

namespace jcmp {
    /*
     Document
     - turns JSON text into an ordered_json tree (object keys keep document order)
     - malformed text -> ParseError naming the document and the byte offset
    */
    struct Document {
        static ordered_json parse(string_view text, const string &name);

        static ordered_json parse(std::istream &in, const string &name);

        // "-" reads standard input. Throws std::runtime_error if the file cannot be opened.
        static ordered_json load(const string &file);
    };
} // namespace jcmp
