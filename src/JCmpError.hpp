#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <boost/outcome/std_result.hpp>
#include <boost/outcome/success_failure.hpp>

#include "Path.hpp"

using std::runtime_error;
using std::string;
using std::string_view;

namespace jcmp {
    namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

    /*
     PathError
     - MalformedExpression: the path text could not be parsed; column() is 1-based
     - NotFound: traversal hit a missing field, a wrong-shape node or an out-of-range index;
       segment() is the failing segment, path() the prefix resolved before it
     - returned inside a PathResult, never thrown by the comparison core
    */
    struct PathError final : public runtime_error {
    public:
        enum class Kind { MalformedExpression, NotFound };

        // empty NotFound at the root; PathResult requires a default-constructible error
        PathError() : PathError("", Kind::NotFound) {
        }

        static PathError malformed_expression(string_view expression, string_view reason, size_t column);

        static PathError not_found(PathSegment segment, Path resolved);

        [[nodiscard]] Kind kind() const noexcept { return _kind; }
        [[nodiscard]] bool is_not_found() const noexcept { return _kind == Kind::NotFound; }
        [[nodiscard]] bool is_malformed() const noexcept { return _kind == Kind::MalformedExpression; }

        // MalformedExpression only
        [[nodiscard]] size_t column() const noexcept { return _column; }
        [[nodiscard]] const string &expression() const noexcept { return _expression; }

        // NotFound only
        [[nodiscard]] const std::optional<PathSegment> &segment() const noexcept { return _segment; }
        [[nodiscard]] const Path &path() const noexcept { return _path; }

    private:
        PathError(const string &msg, Kind kind) : runtime_error(msg), _kind(kind) {
        }

        Kind _kind;
        size_t _column = 0;
        string _expression;
        std::optional<PathSegment> _segment;
        Path _path;
    };

    [[nodiscard]] string_view to_string(PathError::Kind kind) noexcept;

    template<typename T>
    using PathResult = outcome::std_checked<T, PathError>;

    /*
     ParseError
     - malformed JSON text reported by the document loader
     - document() names the input ("-" for stdin), byte() is nlohmann's 1-based byte offset
    */
    struct ParseError final : public runtime_error {
    public:
        ParseError(const string &msg, string document, const size_t byte)
            : runtime_error(msg), _document(std::move(document)), _byte(byte) {
        }

        [[nodiscard]] const string &document() const noexcept { return _document; }
        [[nodiscard]] size_t byte() const noexcept { return _byte; }

    private:
        string _document;
        size_t _byte;
    };
} // namespace jcmp
