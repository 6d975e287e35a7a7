#pragma once

#include <optional>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

#include "Path.hpp"

using ordered_json = nlohmann::ordered_json;

namespace jcmp {
    // Coarse category of a value; the three nlohmann number types are all Number.
    enum class ShapeClass { Null, Boolean, Number, String, Object, Array };

    [[nodiscard]] ShapeClass shape_of(const ordered_json &value) noexcept;

    [[nodiscard]] std::string_view to_string(ShapeClass shape) noexcept;

    enum class DifferenceKind { MissingInRight, ExtraInRight, ValueMismatch };

    [[nodiscard]] std::string_view to_string(DifferenceKind kind) noexcept;

    /*
     DifferenceRecord
     - MissingInRight: only left_value is set
     - ExtraInRight: only right_value is set
     - ValueMismatch: both are set, holding the full subtrees at `path`
    */
    struct DifferenceRecord {
        Path path;
        DifferenceKind kind;
        std::optional<ordered_json> left_value;
        std::optional<ordered_json> right_value;

        bool operator==(const DifferenceRecord &other) const = default;
    };

    struct DiffResult {
        std::vector<DifferenceRecord> differences;

        [[nodiscard]] bool equal() const noexcept { return differences.empty(); }
    };

    /*
     Differ
     - recursive structural comparison of two documents
     - object fields are visited in left-document order, then right-only fields;
       array indices ascending
     - a shape mismatch is reported once at its root, not per descendant
    */
    class Differ {
    public:
        static DiffResult diff(const ordered_json &left, const ordered_json &right);

        /**
         * Deep equality: same shape class and same content, recursively.
         * Arrays compare in order, object keys regardless of order.
         * Numbers compare by numeric value, so 30 == 30.0 but 30 != "30".
         */
        static bool equal(const ordered_json &left, const ordered_json &right);

    private:
        Differ() = default;

        void compare(const ordered_json &left, const ordered_json &right);

        void compare_objects(const ordered_json &left, const ordered_json &right);

        void compare_arrays(const ordered_json &left, const ordered_json &right);

        void report(DifferenceKind kind, const ordered_json *left, const ordered_json *right);

        Path _path;
        std::vector<DifferenceRecord> _differences;
    };
} // namespace jcmp
