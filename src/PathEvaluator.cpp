#include "PathEvaluator.hpp"

using namespace std;

namespace jcmp {
    PathResult<const ordered_json *> PathEvaluator::evaluate(const ordered_json &tree, const Path &path) {
        const ordered_json *curj = &tree;
        const auto &segments = path.segments();
        for (size_t depth = 0; depth < segments.size(); ++depth) {
            const auto &seg = segments[depth];
            if (seg.is_index()) {
                if (!curj->is_array() || seg.position() >= curj->size())
                    return outcome::failure(PathError::not_found(seg, path.prefix(depth)));
                curj = &((*curj)[seg.position()]);
            } else {
                if (!curj->is_object())
                    return outcome::failure(PathError::not_found(seg, path.prefix(depth)));
                const auto it = curj->find(seg.name());
                if (it == curj->end())
                    return outcome::failure(PathError::not_found(seg, path.prefix(depth)));
                curj = &(*it);
            }
        }
        return outcome::success(curj);
    }
} // namespace jcmp
