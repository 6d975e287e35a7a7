#pragma once

#include <string_view>
#include <nlohmann/json.hpp>

#include "Differ.hpp"
#include "JCmpError.hpp"
#include "Path.hpp"

using ordered_json = nlohmann::ordered_json;

namespace jcmp {
    /*
     Comparator
     - the three comparison operations external callers use
     - all inputs are already-parsed documents; nothing here reads text or throws on mismatch
     - path operations return PathResult: MalformedExpression (string overloads only) or NotFound
    */
    struct Comparator {
        // Full structural comparison, see Differ.
        static DiffResult compare_full(const ordered_json &left, const ordered_json &right);

        // Resolves `path` in left, then in right (first failure wins) and compares the two values.
        static PathResult<bool> compare_at_path(const ordered_json &left, const ordered_json &right,
                                                const Path &path);

        static PathResult<bool> compare_at_path(const ordered_json &left, const ordered_json &right,
                                                std::string_view expression);

        // Resolves `path` in tree and compares the value with `expected`; scalar types must match exactly.
        static PathResult<bool> compare_value_at_path(const ordered_json &tree, const Path &path,
                                                      const ordered_json &expected);

        static PathResult<bool> compare_value_at_path(const ordered_json &tree, std::string_view expression,
                                                      const ordered_json &expected);
    };
} // namespace jcmp
