#include "Path.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace std;

namespace jcmp {
    /* -------------------------
       Rendering helpers
       ------------------------- */

    // a field name can be written after '.' only if the parser would read it back unchanged
    static bool needs_quoting(const string &name, const bool first) noexcept {
        if (name.empty()) return true;
        if (first && name == "$") return true;
        return ranges::any_of(name, [](const char c) {
            return c == '.' || c == '[' || c == ']' || c == '"' || c == '\'';
        });
    }

    static string quoted_segment(const string &name) {
        string out = "[\"";
        for (const char c: name) {
            if (c == '"' || c == '\\') out.push_back('\\');
            out.push_back(c);
        }
        out += "\"]";
        return out;
    }

    /* -------------------------
       PathSegment
       ------------------------- */

    string PathSegment::to_string() const {
        if (is_index()) return fmt::format("[{}]", position());
        return name();
    }

    ordered_json PathSegment::to_json() const {
        if (is_index()) return position();
        return name();
    }

    /* -------------------------
       Path
       ------------------------- */

    Path Path::prefix(const size_t n) const {
        const auto count = std::min(n, _segments.size());
        return Path(vector<PathSegment>(_segments.begin(), _segments.begin() + static_cast<long>(count)));
    }

    string Path::to_string() const {
        string out;
        bool first = true;
        for (const auto &seg: _segments) {
            if (seg.is_index()) {
                out += fmt::format("[{}]", seg.position());
            } else if (needs_quoting(seg.name(), first)) {
                out += quoted_segment(seg.name());
            } else {
                if (!first) out.push_back('.');
                out += seg.name();
            }
            first = false;
        }
        return out;
    }

    ordered_json Path::to_json() const {
        ordered_json arr = ordered_json::array();
        for (const auto &seg: _segments)
            arr.push_back(seg.to_json());
        return arr;
    }
} // namespace jcmp
