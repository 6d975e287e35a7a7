#include "PathParser.hpp"

#include <cctype>
#include <charconv>
#include <string>

using namespace std;

namespace jcmp {
    /* -------------------------
       Cursor with column tracking (1-based)
       ------------------------- */
    struct Cursor {
        string_view s;
        size_t i = 0;

        explicit Cursor(const string_view src) : s(src) {
        }

        bool eof() const noexcept { return i >= s.size(); }

        // '\0' past the end; the path language never gives '\0' a meaning
        char peek(const size_t lookahead = 0) const noexcept {
            const size_t pos = i + lookahead;
            return (pos < s.size()) ? s[pos] : '\0';
        }

        char next() noexcept {
            if (eof()) return '\0';
            return s[i++];
        }

        size_t column() const noexcept { return i + 1; }
    };

    static bool is_field_char(const char c) noexcept {
        return c != '.' && c != '[' && c != ']';
    }

    // dot-form field name: everything up to the next '.', '[' or ']'
    static string scan_field(Cursor &cur) {
        string name;
        while (!cur.eof() && is_field_char(cur.peek()))
            name.push_back(cur.next());
        return name;
    }

    /* scan_bracket:
       - positioned on '['
       - [123] -> index segment, ["key"] or ['key'] -> field segment
    */
    static PathResult<PathSegment> scan_bracket(Cursor &cur, const string_view expression) {
        const size_t open_column = cur.column();
        cur.next(); // '['

        const char c = cur.peek();
        if (isdigit(static_cast<unsigned char>(c))) {
            const size_t start = cur.i;
            while (isdigit(static_cast<unsigned char>(cur.peek()))) cur.next();
            const string_view digits = expression.substr(start, cur.i - start);

            size_t idx = 0;
            const auto [ptr, ec] = from_chars(digits.data(), digits.data() + digits.size(), idx);
            if (ec != errc() || ptr != digits.data() + digits.size())
                return outcome::failure(PathError::malformed_expression(expression, "array index out of range",
                                                                        start + 1));
            if (cur.peek() != ']')
                return outcome::failure(PathError::malformed_expression(
                    expression, cur.eof() ? "unterminated '['" : "expected ']' after array index", cur.column()));
            cur.next();
            return outcome::success(PathSegment::index(idx));
        }

        if (c == '"' || c == '\'') {
            const char delim = cur.next();
            string name;
            bool closed = false;
            while (!cur.eof()) {
                const char ch = cur.next();
                if (ch == '\\') {
                    const char esc = cur.peek();
                    if (esc != '\\' && esc != '"' && esc != '\'')
                        return outcome::failure(PathError::malformed_expression(
                            expression, "invalid escape in quoted name", cur.column() - 1));
                    name.push_back(cur.next());
                    continue;
                }
                if (ch == delim) {
                    closed = true;
                    break;
                }
                name.push_back(ch);
            }
            if (!closed)
                return outcome::failure(PathError::malformed_expression(expression, "unterminated quoted name",
                                                                        open_column + 1));
            if (cur.peek() != ']')
                return outcome::failure(PathError::malformed_expression(
                    expression, cur.eof() ? "unterminated '['" : "expected ']' after quoted name", cur.column()));
            cur.next();
            return outcome::success(PathSegment::field(std::move(name)));
        }

        if (c == '-')
            return outcome::failure(PathError::malformed_expression(expression, "negative array index",
                                                                    cur.column()));
        if (cur.eof())
            return outcome::failure(PathError::malformed_expression(expression, "unterminated '['", open_column));
        return outcome::failure(PathError::malformed_expression(
            expression, "expected array index or quoted name inside [...]", cur.column()));
    }

    PathResult<Path> PathParser::parse(const string_view expression) {
        Cursor cur{expression};
        Path path;

        bool at_start = true; // nothing consumed but an optional root marker
        bool need_field = false; // just consumed a '.'

        if (cur.peek() == '$' && (expression.size() == 1 || cur.peek(1) == '.' || cur.peek(1) == '[')) {
            cur.next();
            if (cur.peek() == '.') {
                cur.next();
                need_field = true;
                at_start = false;
            }
        }

        while (true) {
            if (need_field) {
                if (cur.eof() || !is_field_char(cur.peek()))
                    return outcome::failure(PathError::malformed_expression(
                        expression, "expected field name after '.'", cur.column()));
                path.push_back(PathSegment::field(scan_field(cur)));
                need_field = false;
                continue;
            }
            if (cur.eof()) break;

            const char c = cur.peek();
            if (c == '.') {
                if (at_start)
                    return outcome::failure(PathError::malformed_expression(
                        expression, "path cannot start with '.'", cur.column()));
                cur.next();
                need_field = true;
            } else if (c == '[') {
                auto seg = scan_bracket(cur, expression);
                if (!seg) return outcome::failure(std::move(seg).error());
                path.push_back(std::move(seg).value());
            } else if (c == ']') {
                return outcome::failure(PathError::malformed_expression(expression, "unexpected ']'",
                                                                        cur.column()));
            } else {
                // a bare name is only allowed first; after ']' a '.' or '[' must follow
                if (!at_start)
                    return outcome::failure(PathError::malformed_expression(
                        expression, "expected '.' or '[' after ']'", cur.column()));
                path.push_back(PathSegment::field(scan_field(cur)));
            }
            at_start = false;
        }

        return outcome::success(std::move(path));
    }
} // namespace jcmp
