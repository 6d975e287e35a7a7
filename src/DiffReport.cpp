#include "DiffReport.hpp"

#include <fmt/format.h>

using namespace std;

namespace jcmp {
    /* -------------------------
       JSON encoding
       ------------------------- */

    void to_json(ordered_json &j, const DifferenceRecord &record) {
        j = ordered_json::object();
        j["path"] = record.path.to_string();
        j["segments"] = record.path.to_json();
        j["kind"] = record.kind;
        if (record.left_value) j["leftValue"] = *record.left_value;
        if (record.right_value) j["rightValue"] = *record.right_value;
    }

    void to_json(ordered_json &j, const DiffResult &result) {
        j = ordered_json::object();
        j["equal"] = result.equal();
        ordered_json differences = ordered_json::array();
        for (const auto &record: result.differences)
            differences.push_back(ordered_json(record));
        j["differences"] = std::move(differences);
    }

    void to_json(ordered_json &j, const PathError &error) {
        j = ordered_json::object();
        j["error"] = string(to_string(error.kind()));
        j["message"] = error.what();
        if (error.is_malformed()) {
            j["expression"] = error.expression();
            j["column"] = error.column();
        } else {
            if (error.segment()) j["segment"] = error.segment()->to_json();
            j["path"] = error.path().to_string();
        }
    }

    /* -------------------------
       Text report
       ------------------------- */

    string DiffReport::describe(const DifferenceRecord &record) {
        const string where = record.path.empty() ? string("$") : record.path.to_string();
        switch (record.kind) {
            case DifferenceKind::MissingInRight:
                return fmt::format("{}: missing in right: {}", where, record.left_value->dump());
            case DifferenceKind::ExtraInRight:
                return fmt::format("{}: extra in right: {}", where, record.right_value->dump());
            case DifferenceKind::ValueMismatch: {
                const auto l = shape_of(*record.left_value);
                const auto r = shape_of(*record.right_value);
                if (l != r)
                    return fmt::format("{}: type differs: {} vs {} ({} vs {})", where, to_string(l),
                                       to_string(r), record.left_value->dump(), record.right_value->dump());
                return fmt::format("{}: value differs: {} vs {}", where, record.left_value->dump(),
                                   record.right_value->dump());
            }
        }
        return where;
    }

    string DiffReport::to_text(const DiffResult &result) {
        if (result.equal()) return "documents are equal\n";
        string out;
        for (const auto &record: result.differences) {
            out += describe(record);
            out.push_back('\n');
        }
        out += fmt::format("{} difference(s)\n", result.differences.size());
        return out;
    }
} // namespace jcmp
