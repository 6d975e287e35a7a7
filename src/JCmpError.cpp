#include "JCmpError.hpp"

#include <fmt/format.h>

using namespace std;

namespace jcmp {
    PathError PathError::malformed_expression(const string_view expression, const string_view reason,
                                              const size_t column) {
        PathError e(fmt::format("malformed path expression '{}': {} (column {})", expression, reason, column),
                    Kind::MalformedExpression);
        e._column = column;
        e._expression = string(expression);
        return e;
    }

    PathError PathError::not_found(PathSegment segment, Path resolved) {
        const string where = resolved.empty() ? string("root") : fmt::format("'{}'", resolved.to_string());
        PathError e(fmt::format("path segment '{}' not found at {}", segment.to_string(), where), Kind::NotFound);
        e._segment = std::move(segment);
        e._path = std::move(resolved);
        return e;
    }

    string_view to_string(const PathError::Kind kind) noexcept {
        switch (kind) {
            case PathError::Kind::MalformedExpression: return "MalformedExpression";
            case PathError::Kind::NotFound: return "NotFound";
        }
        return "Unknown";
    }
} // namespace jcmp
