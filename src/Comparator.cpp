#include "Comparator.hpp"

#include "Logger.hpp"
#include "PathEvaluator.hpp"
#include "PathParser.hpp"

using namespace std;

namespace jcmp {
    DiffResult Comparator::compare_full(const ordered_json &left, const ordered_json &right) {
        return Differ::diff(left, right);
    }

    PathResult<bool> Comparator::compare_at_path(const ordered_json &left, const ordered_json &right,
                                                 const Path &path) {
        auto l = PathEvaluator::evaluate(left, path);
        if (!l) {
            logger()->debug("compare_at_path: left: {}", l.error().what());
            return outcome::failure(std::move(l).error());
        }
        auto r = PathEvaluator::evaluate(right, path);
        if (!r) {
            logger()->debug("compare_at_path: right: {}", r.error().what());
            return outcome::failure(std::move(r).error());
        }
        return outcome::success(Differ::equal(*l.value(), *r.value()));
    }

    PathResult<bool> Comparator::compare_at_path(const ordered_json &left, const ordered_json &right,
                                                 const string_view expression) {
        auto path = PathParser::parse(expression);
        if (!path) {
            logger()->debug("compare_at_path: {}", path.error().what());
            return outcome::failure(std::move(path).error());
        }
        return compare_at_path(left, right, path.value());
    }

    PathResult<bool> Comparator::compare_value_at_path(const ordered_json &tree, const Path &path,
                                                       const ordered_json &expected) {
        auto v = PathEvaluator::evaluate(tree, path);
        if (!v) {
            logger()->debug("compare_value_at_path: {}", v.error().what());
            return outcome::failure(std::move(v).error());
        }
        return outcome::success(Differ::equal(*v.value(), expected));
    }

    PathResult<bool> Comparator::compare_value_at_path(const ordered_json &tree, const string_view expression,
                                                       const ordered_json &expected) {
        auto path = PathParser::parse(expression);
        if (!path) {
            logger()->debug("compare_value_at_path: {}", path.error().what());
            return outcome::failure(std::move(path).error());
        }
        return compare_value_at_path(tree, path.value(), expected);
    }
} // namespace jcmp
