#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "Differ.hpp"
#include "JCmpError.hpp"

using std::string;
using ordered_json = nlohmann::ordered_json;

namespace jcmp {
    NLOHMANN_JSON_SERIALIZE_ENUM(DifferenceKind, {
                                 {DifferenceKind::MissingInRight, "MissingInRight"},
                                 {DifferenceKind::ExtraInRight, "ExtraInRight"},
                                 {DifferenceKind::ValueMismatch, "ValueMismatch"},
                                 })

    // {"path": "a.b[2]", "segments": ["a", "b", 2], "kind": ..., "leftValue": ..., "rightValue": ...}
    void to_json(ordered_json &j, const DifferenceRecord &record);

    // {"equal": bool, "differences": [...]}
    void to_json(ordered_json &j, const DiffResult &result);

    // {"error": "NotFound", "message": ..., "segment": ..., "path": ...}
    // {"error": "MalformedExpression", "message": ..., "expression": ..., "column": N}
    void to_json(ordered_json &j, const PathError &error);

    class DiffReport {
    public:
        // "<path>: <description>", the root path shown as "$"
        static string describe(const DifferenceRecord &record);

        // one describe() line per record, "documents are equal" when there is none
        static string to_text(const DiffResult &result);
    };
} // namespace jcmp
