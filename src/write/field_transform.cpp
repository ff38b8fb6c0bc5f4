/**
 * @file field_transform.cpp
 * @brief Field mask and transform implementation
 *
 * @defgroup transforms Field Transforms
 * @{
 */

#include "write/field_transform.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

namespace clouddoc::write {

namespace {

using common::Value;
using common::ValueArray;

int64_t saturating_add(int64_t a, int64_t b) {
    constexpr int64_t MAX = std::numeric_limits<int64_t>::max();
    constexpr int64_t MIN = std::numeric_limits<int64_t>::min();
    if (b > 0 && a > MAX - b) {
        return MAX;
    }
    if (b < 0 && a < MIN - b) {
        return MIN;
    }
    return a + b;
}

/* Shared by maximum/minimum: pick_first decides whether a wins over b */
template <typename Pick>
Value extreme_value(const Value* current, const Value& operand, Pick pick_first) {
    if (current == nullptr || !current->is_numeric()) {
        return operand;
    }
    if (current->is_integer() && operand.is_integer()) {
        const int64_t a = current->as_integer();
        const int64_t b = operand.as_integer();
        return Value::make_integer(pick_first(a, b) ? a : b);
    }
    const double a = current->to_float64();
    const double b = operand.to_float64();
    if (std::isnan(a) || std::isnan(b)) {
        return Value::make_double(std::numeric_limits<double>::quiet_NaN());
    }
    return Value::make_double(pick_first(a, b) ? a : b);
}

}  // anonymous namespace

bool array_contains(const ValueArray& values, const Value& needle) {
    return std::any_of(values.begin(), values.end(),
                       [&needle](const Value& v) { return v == needle; });
}

Value increment_value(const Value* current, const Value& delta) {
    if (current == nullptr || !current->is_numeric()) {
        return delta;
    }
    if (current->is_integer() && delta.is_integer()) {
        return Value::make_integer(saturating_add(current->as_integer(), delta.as_integer()));
    }
    return Value::make_double(current->to_float64() + delta.to_float64());
}

Value maximum_value(const Value* current, const Value& operand) {
    return extreme_value(current, operand, [](auto a, auto b) { return a >= b; });
}

Value minimum_value(const Value* current, const Value& operand) {
    return extreme_value(current, operand, [](auto a, auto b) { return a <= b; });
}

TransformOutcome apply_field_transforms(const common::FieldMap& fields,
                                        const std::vector<FieldTransform>& transforms,
                                        const common::Timestamp& commit_time) {
    TransformOutcome out;
    out.fields = fields;
    out.results.reserve(transforms.size());

    for (const auto& transform : transforms) {
        const auto path = storage::FieldPath::parse(transform.field_path);
        const Value* current = path.lookup(out.fields);

        Value result;
        switch (transform.kind) {
            case TransformKind::SERVER_TIMESTAMP:
                result = Value::make_timestamp(commit_time);
                break;
            case TransformKind::INCREMENT:
                result = increment_value(current, transform.operand);
                break;
            case TransformKind::MAXIMUM:
                result = maximum_value(current, transform.operand);
                break;
            case TransformKind::MINIMUM:
                result = minimum_value(current, transform.operand);
                break;
            case TransformKind::APPEND_MISSING_ELEMENTS: {
                ValueArray existing;
                if (current != nullptr && current->is_array()) {
                    existing = current->as_array();
                }
                /* Only the pre-existing elements are checked, not earlier additions */
                ValueArray merged = existing;
                for (const auto& v : transform.operand.as_array()) {
                    if (!array_contains(existing, v)) {
                        merged.push_back(v);
                    }
                }
                result = Value::make_array(std::move(merged));
                break;
            }
            case TransformKind::REMOVE_ALL_FROM_ARRAY: {
                ValueArray kept;
                if (current != nullptr && current->is_array()) {
                    const auto& remove = transform.operand.as_array();
                    for (const auto& v : current->as_array()) {
                        if (!array_contains(remove, v)) {
                            kept.push_back(v);
                        }
                    }
                }
                result = Value::make_array(std::move(kept));
                break;
            }
        }

        path.set(out.fields, result);
        out.results.push_back(std::move(result));
    }
    return out;
}

common::FieldMap apply_update_mask(const common::FieldMap& existing,
                                   const common::FieldMap& update,
                                   const std::vector<storage::FieldPath>& mask) {
    common::FieldMap merged = existing;
    for (const auto& path : mask) {
        const Value* value = path.lookup(update);
        if (value != nullptr) {
            path.set(merged, *value);
        }
    }
    return merged;
}

}  // namespace clouddoc::write

/** @} */ /* transforms */
