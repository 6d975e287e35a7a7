#pragma once

#include <nlohmann/json.hpp>

#include "JCmpError.hpp"
#include "Path.hpp"

using ordered_json = nlohmann::ordered_json;

namespace jcmp {
    class PathEvaluator {
    public:
        /**
         * Resolve a parsed path against a document.
         *
         * @param tree The document root.
         * @param path The path to walk; the empty path resolves to the root itself.
         * @return A pointer into `tree` (no copy, valid as long as `tree` is), or
         *         PathError::NotFound with the failing segment and the prefix resolved before it.
         */
        static PathResult<const ordered_json *> evaluate(const ordered_json &tree, const Path &path);
    };
} // namespace jcmp
