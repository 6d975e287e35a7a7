#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

using std::string;
using std::string_view;
using ordered_json = nlohmann::ordered_json;

namespace jcmp {
    /*
     PathSegment
     - either a field name (object access) or a non-negative index (array access)
    */
    class PathSegment {
    public:
        static PathSegment field(string name) { return PathSegment(std::move(name)); }
        static PathSegment index(const size_t idx) { return PathSegment(idx); }

        [[nodiscard]] bool is_field() const noexcept { return std::holds_alternative<string>(_value); }
        [[nodiscard]] bool is_index() const noexcept { return std::holds_alternative<size_t>(_value); }

        [[nodiscard]] const string &name() const { return std::get<string>(_value); }
        [[nodiscard]] size_t position() const { return std::get<size_t>(_value); }

        // "name" or "[3]"; used in error messages
        [[nodiscard]] string to_string() const;

        // field names as JSON strings, indices as JSON numbers
        [[nodiscard]] ordered_json to_json() const;

        bool operator==(const PathSegment &other) const = default;

    private:
        explicit PathSegment(string name) : _value(std::move(name)) {
        }

        explicit PathSegment(const size_t idx) : _value(idx) {
        }

        std::variant<string, size_t> _value;
    };

    /*
     Path
     - ordered sequence of segments, rendered canonically as a.b[2].c
     - the empty path is the document root and renders as ""
    */
    class Path {
    public:
        Path() = default;

        explicit Path(std::vector<PathSegment> segments) : _segments(std::move(segments)) {
        }

        [[nodiscard]] const std::vector<PathSegment> &segments() const noexcept { return _segments; }
        [[nodiscard]] bool empty() const noexcept { return _segments.empty(); }
        [[nodiscard]] size_t size() const noexcept { return _segments.size(); }

        void push_back(PathSegment segment) { _segments.push_back(std::move(segment)); }
        void pop_back() { _segments.pop_back(); }

        // the first n segments
        [[nodiscard]] Path prefix(size_t n) const;

        // Canonical rendering. Field names that cannot be written in dot form are quoted: a["x.y"]
        [[nodiscard]] string to_string() const;

        [[nodiscard]] ordered_json to_json() const;

        bool operator==(const Path &other) const = default;

    private:
        std::vector<PathSegment> _segments;
    };
} // namespace jcmp
