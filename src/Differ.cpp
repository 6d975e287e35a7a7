#include "Differ.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

using namespace std;
using value_t = nlohmann::json::value_t;

namespace jcmp {
    ShapeClass shape_of(const ordered_json &value) noexcept {
        switch (value.type()) {
            case value_t::boolean: return ShapeClass::Boolean;
            case value_t::number_integer:
            case value_t::number_unsigned:
            case value_t::number_float: return ShapeClass::Number;
            case value_t::string: return ShapeClass::String;
            case value_t::object: return ShapeClass::Object;
            case value_t::array: return ShapeClass::Array;
            case value_t::null:
            case value_t::binary:
            case value_t::discarded:
            default: return ShapeClass::Null;
        }
    }

    string_view to_string(const ShapeClass shape) noexcept {
        switch (shape) {
            case ShapeClass::Null: return "null";
            case ShapeClass::Boolean: return "boolean";
            case ShapeClass::Number: return "number";
            case ShapeClass::String: return "string";
            case ShapeClass::Object: return "object";
            case ShapeClass::Array: return "array";
        }
        return "unknown";
    }

    string_view to_string(const DifferenceKind kind) noexcept {
        switch (kind) {
            case DifferenceKind::MissingInRight: return "MissingInRight";
            case DifferenceKind::ExtraInRight: return "ExtraInRight";
            case DifferenceKind::ValueMismatch: return "ValueMismatch";
        }
        return "Unknown";
    }

    /* -------------------------
       Exact numeric equality
       ------------------------- */

    // 2^63 and 2^64 are exact in a double
    static constexpr double TWO_POW_63 = 9223372036854775808.0;
    static constexpr double TWO_POW_64 = 18446744073709551616.0;

    static bool is_integral(const double d) noexcept {
        return isfinite(d) && trunc(d) == d;
    }

    static bool signed_equals_float(const int64_t i, const double d) noexcept {
        if (!is_integral(d) || d < -TWO_POW_63 || d >= TWO_POW_63) return false;
        return static_cast<int64_t>(d) == i;
    }

    static bool unsigned_equals_float(const uint64_t u, const double d) noexcept {
        if (!is_integral(d) || d < 0.0 || d >= TWO_POW_64) return false;
        return static_cast<uint64_t>(d) == u;
    }

    static bool signed_equals_unsigned(const int64_t i, const uint64_t u) noexcept {
        return i >= 0 && static_cast<uint64_t>(i) == u;
    }

    // compares by value without converting through a narrower or lossy representation
    static bool numbers_equal(const ordered_json &left, const ordered_json &right) {
        const auto lt = left.type();
        const auto rt = right.type();
        if (lt == value_t::number_integer) {
            const auto i = left.get<int64_t>();
            if (rt == value_t::number_integer) return i == right.get<int64_t>();
            if (rt == value_t::number_unsigned) return signed_equals_unsigned(i, right.get<uint64_t>());
            return signed_equals_float(i, right.get<double>());
        }
        if (lt == value_t::number_unsigned) {
            const auto u = left.get<uint64_t>();
            if (rt == value_t::number_unsigned) return u == right.get<uint64_t>();
            if (rt == value_t::number_integer) return signed_equals_unsigned(right.get<int64_t>(), u);
            return unsigned_equals_float(u, right.get<double>());
        }
        const auto d = left.get<double>();
        if (rt == value_t::number_float) return d == right.get<double>();
        if (rt == value_t::number_integer) return signed_equals_float(right.get<int64_t>(), d);
        return unsigned_equals_float(right.get<uint64_t>(), d);
    }

    /* -------------------------
       Deep equality
       ------------------------- */

    bool Differ::equal(const ordered_json &left, const ordered_json &right) {
        switch (left.type()) {
            case value_t::null:
                return right.is_null();
            case value_t::boolean:
                return right.is_boolean() && left.get<bool>() == right.get<bool>();
            case value_t::number_integer:
            case value_t::number_unsigned:
            case value_t::number_float:
                return right.is_number() && numbers_equal(left, right);
            case value_t::string:
                return right.is_string() &&
                       left.get_ref<const string &>() == right.get_ref<const string &>();
            case value_t::array: {
                if (!right.is_array() || left.size() != right.size()) return false;
                for (size_t i = 0; i < left.size(); ++i) {
                    if (!equal(left[i], right[i])) return false;
                }
                return true;
            }
            case value_t::object: {
                // keys are unique, so equal sizes plus every left key found in right means equal key sets
                if (!right.is_object() || left.size() != right.size()) return false;
                for (auto it = left.begin(); it != left.end(); ++it) {
                    const auto other = right.find(it.key());
                    if (other == right.end() || !equal(it.value(), *other)) return false;
                }
                return true;
            }
            default:
                return left == right;
        }
    }

    /* -------------------------
       Structural diff
       ------------------------- */

    DiffResult Differ::diff(const ordered_json &left, const ordered_json &right) {
        Differ differ;
        differ.compare(left, right);
        logger()->debug("diff: {} difference(s)", differ._differences.size());
        return DiffResult{std::move(differ._differences)};
    }

    void Differ::compare(const ordered_json &left, const ordered_json &right) {
        if (left.is_object() && right.is_object()) {
            compare_objects(left, right);
            return;
        }
        if (left.is_array() && right.is_array()) {
            compare_arrays(left, right);
            return;
        }
        if (!equal(left, right))
            report(DifferenceKind::ValueMismatch, &left, &right);
    }

    void Differ::compare_objects(const ordered_json &left, const ordered_json &right) {
        for (auto it = left.begin(); it != left.end(); ++it) {
            _path.push_back(PathSegment::field(it.key()));
            const auto other = right.find(it.key());
            if (other == right.end())
                report(DifferenceKind::MissingInRight, &it.value(), nullptr);
            else
                compare(it.value(), *other);
            _path.pop_back();
        }
        for (auto it = right.begin(); it != right.end(); ++it) {
            if (left.contains(it.key())) continue;
            _path.push_back(PathSegment::field(it.key()));
            report(DifferenceKind::ExtraInRight, nullptr, &it.value());
            _path.pop_back();
        }
    }

    void Differ::compare_arrays(const ordered_json &left, const ordered_json &right) {
        const size_t n = std::max(left.size(), right.size());
        for (size_t i = 0; i < n; ++i) {
            _path.push_back(PathSegment::index(i));
            if (i < left.size() && i < right.size())
                compare(left[i], right[i]);
            else if (i < left.size())
                report(DifferenceKind::MissingInRight, &left[i], nullptr);
            else
                report(DifferenceKind::ExtraInRight, nullptr, &right[i]);
            _path.pop_back();
        }
    }

    void Differ::report(const DifferenceKind kind, const ordered_json *left, const ordered_json *right) {
        DifferenceRecord record{_path, kind, nullopt, nullopt};
        if (left) record.left_value = *left;
        if (right) record.right_value = *right;
        _differences.push_back(std::move(record));
    }
} // namespace jcmp
