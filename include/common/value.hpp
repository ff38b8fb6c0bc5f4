/**
 * @file value.hpp
 * @brief Tagged document field value
 */

#ifndef CLOUDDOC_COMMON_VALUE_HPP
#define CLOUDDOC_COMMON_VALUE_HPP

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "common/timestamp.hpp"

namespace clouddoc::common {

/**
 * @brief Value variants carried by a document field
 */
enum class ValueType : uint8_t {
    TYPE_NULL = 0,
    TYPE_BOOLEAN = 1,
    TYPE_INTEGER = 2,
    TYPE_DOUBLE = 3,
    TYPE_TIMESTAMP = 4,
    TYPE_STRING = 5,
    TYPE_BYTES = 6,
    TYPE_REFERENCE = 7,
    TYPE_GEO_POINT = 8,
    TYPE_ARRAY = 9,
    TYPE_MAP = 10
};

struct GeoPoint {
    static constexpr double MAX_LATITUDE = 90.0;
    static constexpr double MAX_LONGITUDE = 180.0;

    double latitude = 0.0;
    double longitude = 0.0;

    [[nodiscard]] bool is_valid() const;
};

class Value;
using ValueArray = std::vector<Value>;
using FieldMap = std::map<std::string, Value>;

/**
 * @brief Closed tagged union over the document value variants.
 *
 * Copying a Value copies nested arrays and maps recursively, so a copy never
 * shares state with its source.
 */
class Value {
   private:
    ValueType type_;
    std::variant<std::monostate, bool, int64_t, double, Timestamp, std::string, GeoPoint,
                 ValueArray, FieldMap>
        data_;

   public:
    Value();

    ~Value() = default;
    Value(const Value& other) = default;
    Value(Value&& other) noexcept = default;
    Value& operator=(const Value& other) = default;
    Value& operator=(Value&& other) noexcept = default;

    /**
     * @brief Deep equality.
     *
     * Integers compare by value, doubles by value with NaN equal to NaN,
     * timestamps after truncation to milliseconds. Integer and double never
     * compare equal to each other.
     */
    [[nodiscard]] bool operator==(const Value& other) const;
    [[nodiscard]] bool operator!=(const Value& other) const { return !(*this == other); }

    [[nodiscard]] static Value make_null();
    [[nodiscard]] static Value make_boolean(bool v);
    [[nodiscard]] static Value make_integer(int64_t v);
    [[nodiscard]] static Value make_double(double v);
    [[nodiscard]] static Value make_timestamp(const Timestamp& v);
    [[nodiscard]] static Value make_string(std::string v);
    [[nodiscard]] static Value make_bytes(std::string raw);
    [[nodiscard]] static Value make_reference(std::string path);
    [[nodiscard]] static Value make_geo_point(double latitude, double longitude);
    [[nodiscard]] static Value make_array(ValueArray values);
    [[nodiscard]] static Value make_map(FieldMap fields);

    [[nodiscard]] ValueType type() const { return type_; }
    [[nodiscard]] bool is_null() const { return type_ == ValueType::TYPE_NULL; }
    [[nodiscard]] bool is_integer() const { return type_ == ValueType::TYPE_INTEGER; }
    [[nodiscard]] bool is_double() const { return type_ == ValueType::TYPE_DOUBLE; }
    [[nodiscard]] bool is_numeric() const { return is_integer() || is_double(); }
    [[nodiscard]] bool is_array() const { return type_ == ValueType::TYPE_ARRAY; }
    [[nodiscard]] bool is_map() const { return type_ == ValueType::TYPE_MAP; }

    [[nodiscard]] bool as_boolean() const;
    [[nodiscard]] int64_t as_integer() const;
    [[nodiscard]] double as_double() const;
    [[nodiscard]] const Timestamp& as_timestamp() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const std::string& as_bytes() const;
    [[nodiscard]] const std::string& as_reference() const;
    [[nodiscard]] const GeoPoint& as_geo_point() const;
    [[nodiscard]] const ValueArray& as_array() const;
    [[nodiscard]] ValueArray& as_array();
    [[nodiscard]] const FieldMap& as_map() const;
    [[nodiscard]] FieldMap& as_map();

    /**
     * @brief Numeric value widened to double; throws for non-numeric values
     */
    [[nodiscard]] double to_float64() const;

    [[nodiscard]] std::string to_debug_string() const;

    [[nodiscard]] static const char* type_name(ValueType type);
};

/**
 * @brief Deep equality over two field maps (same key set, equal values)
 */
[[nodiscard]] bool fields_equal(const FieldMap& a, const FieldMap& b);

}  // namespace clouddoc::common

#endif  // CLOUDDOC_COMMON_VALUE_HPP
