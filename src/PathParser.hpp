#pragma once

#include <string_view>

#include "JCmpError.hpp"
#include "Path.hpp"

namespace jcmp {
    /*
     PathParser
     - parses the textual path language into a Path, once, before any evaluation
     - syntax: dot-separated field names, [N] array indices, ["key"] / ['key'] quoted field names
       e.g. user.addresses[0].city, $.items[2]["odd.key"]
     - an optional leading root marker '$' (alone, or followed by '.' or '[') is stripped
     - "" and "$" denote the empty path (the document root)
    */
    class PathParser {
    public:
        // Returns PathError::MalformedExpression on invalid syntax; never yields a partial path.
        static PathResult<Path> parse(std::string_view expression);
    };
} // namespace jcmp
