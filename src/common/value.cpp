/**
 * @file value.cpp
 * @brief Tagged value construction, access and deep equality
 */

#include "common/value.hpp"

#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace clouddoc::common {

bool GeoPoint::is_valid() const {
    return std::isfinite(latitude) && std::isfinite(longitude) && latitude >= -MAX_LATITUDE &&
           latitude <= MAX_LATITUDE && longitude >= -MAX_LONGITUDE && longitude <= MAX_LONGITUDE;
}

Value::Value() : type_(ValueType::TYPE_NULL), data_(std::monostate{}) {}

Value Value::make_null() {
    return {};
}

Value Value::make_boolean(bool v) {
    Value val;
    val.type_ = ValueType::TYPE_BOOLEAN;
    val.data_ = v;
    return val;
}

Value Value::make_integer(int64_t v) {
    Value val;
    val.type_ = ValueType::TYPE_INTEGER;
    val.data_ = v;
    return val;
}

Value Value::make_double(double v) {
    Value val;
    val.type_ = ValueType::TYPE_DOUBLE;
    val.data_ = v;
    return val;
}

Value Value::make_timestamp(const Timestamp& v) {
    Value val;
    val.type_ = ValueType::TYPE_TIMESTAMP;
    val.data_ = v;
    return val;
}

Value Value::make_string(std::string v) {
    Value val;
    val.type_ = ValueType::TYPE_STRING;
    val.data_ = std::move(v);
    return val;
}

Value Value::make_bytes(std::string raw) {
    Value val;
    val.type_ = ValueType::TYPE_BYTES;
    val.data_ = std::move(raw);
    return val;
}

Value Value::make_reference(std::string path) {
    Value val;
    val.type_ = ValueType::TYPE_REFERENCE;
    val.data_ = std::move(path);
    return val;
}

Value Value::make_geo_point(double latitude, double longitude) {
    Value val;
    val.type_ = ValueType::TYPE_GEO_POINT;
    val.data_ = GeoPoint{latitude, longitude};
    return val;
}

Value Value::make_array(ValueArray values) {
    Value val;
    val.type_ = ValueType::TYPE_ARRAY;
    val.data_ = std::move(values);
    return val;
}

Value Value::make_map(FieldMap fields) {
    Value val;
    val.type_ = ValueType::TYPE_MAP;
    val.data_ = std::move(fields);
    return val;
}

bool Value::as_boolean() const {
    if (type_ != ValueType::TYPE_BOOLEAN) {
        throw std::runtime_error("Value is not boolean");
    }
    return std::get<bool>(data_);
}

int64_t Value::as_integer() const {
    if (type_ != ValueType::TYPE_INTEGER) {
        throw std::runtime_error("Value is not integer");
    }
    return std::get<int64_t>(data_);
}

double Value::as_double() const {
    if (type_ != ValueType::TYPE_DOUBLE) {
        throw std::runtime_error("Value is not double");
    }
    return std::get<double>(data_);
}

const Timestamp& Value::as_timestamp() const {
    if (type_ != ValueType::TYPE_TIMESTAMP) {
        throw std::runtime_error("Value is not timestamp");
    }
    return std::get<Timestamp>(data_);
}

const std::string& Value::as_string() const {
    if (type_ != ValueType::TYPE_STRING) {
        throw std::runtime_error("Value is not string");
    }
    return std::get<std::string>(data_);
}

const std::string& Value::as_bytes() const {
    if (type_ != ValueType::TYPE_BYTES) {
        throw std::runtime_error("Value is not bytes");
    }
    return std::get<std::string>(data_);
}

const std::string& Value::as_reference() const {
    if (type_ != ValueType::TYPE_REFERENCE) {
        throw std::runtime_error("Value is not reference");
    }
    return std::get<std::string>(data_);
}

const GeoPoint& Value::as_geo_point() const {
    if (type_ != ValueType::TYPE_GEO_POINT) {
        throw std::runtime_error("Value is not geoPoint");
    }
    return std::get<GeoPoint>(data_);
}

const ValueArray& Value::as_array() const {
    if (type_ != ValueType::TYPE_ARRAY) {
        throw std::runtime_error("Value is not array");
    }
    return std::get<ValueArray>(data_);
}

ValueArray& Value::as_array() {
    if (type_ != ValueType::TYPE_ARRAY) {
        throw std::runtime_error("Value is not array");
    }
    return std::get<ValueArray>(data_);
}

const FieldMap& Value::as_map() const {
    if (type_ != ValueType::TYPE_MAP) {
        throw std::runtime_error("Value is not map");
    }
    return std::get<FieldMap>(data_);
}

FieldMap& Value::as_map() {
    if (type_ != ValueType::TYPE_MAP) {
        throw std::runtime_error("Value is not map");
    }
    return std::get<FieldMap>(data_);
}

double Value::to_float64() const {
    if (type_ == ValueType::TYPE_INTEGER) {
        return static_cast<double>(std::get<int64_t>(data_));
    }
    if (type_ == ValueType::TYPE_DOUBLE) {
        return std::get<double>(data_);
    }
    throw std::runtime_error(std::string("Value is not numeric: ") + type_name(type_));
}

bool Value::operator==(const Value& other) const {
    if (type_ != other.type_) {
        return false;
    }

    switch (type_) {
        case ValueType::TYPE_NULL:
            return true;
        case ValueType::TYPE_BOOLEAN:
            return std::get<bool>(data_) == std::get<bool>(other.data_);
        case ValueType::TYPE_INTEGER:
            return std::get<int64_t>(data_) == std::get<int64_t>(other.data_);
        case ValueType::TYPE_DOUBLE: {
            const double a = std::get<double>(data_);
            const double b = std::get<double>(other.data_);
            if (std::isnan(a) && std::isnan(b)) {
                return true;
            }
            return a == b;
        }
        case ValueType::TYPE_TIMESTAMP:
            return std::get<Timestamp>(data_).to_millis() ==
                   std::get<Timestamp>(other.data_).to_millis();
        case ValueType::TYPE_STRING:
        case ValueType::TYPE_BYTES:
        case ValueType::TYPE_REFERENCE:
            return std::get<std::string>(data_) == std::get<std::string>(other.data_);
        case ValueType::TYPE_GEO_POINT: {
            const auto& a = std::get<GeoPoint>(data_);
            const auto& b = std::get<GeoPoint>(other.data_);
            return a.latitude == b.latitude && a.longitude == b.longitude;
        }
        case ValueType::TYPE_ARRAY: {
            const auto& a = std::get<ValueArray>(data_);
            const auto& b = std::get<ValueArray>(other.data_);
            if (a.size() != b.size()) {
                return false;
            }
            for (size_t i = 0; i < a.size(); ++i) {
                if (a[i] != b[i]) {
                    return false;
                }
            }
            return true;
        }
        case ValueType::TYPE_MAP:
            return fields_equal(std::get<FieldMap>(data_), std::get<FieldMap>(other.data_));
    }
    return false;
}

bool fields_equal(const FieldMap& a, const FieldMap& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& [key, value] : a) {
        const auto it = b.find(key);
        if (it == b.end() || value != it->second) {
            return false;
        }
    }
    return true;
}

std::string Value::to_debug_string() const {
    std::ostringstream out;
    switch (type_) {
        case ValueType::TYPE_NULL:
            out << "null";
            break;
        case ValueType::TYPE_BOOLEAN:
            out << (std::get<bool>(data_) ? "true" : "false");
            break;
        case ValueType::TYPE_INTEGER:
            out << std::get<int64_t>(data_);
            break;
        case ValueType::TYPE_DOUBLE:
            out << std::get<double>(data_);
            break;
        case ValueType::TYPE_TIMESTAMP:
            out << std::get<Timestamp>(data_).to_string();
            break;
        case ValueType::TYPE_STRING:
            out << '"' << std::get<std::string>(data_) << '"';
            break;
        case ValueType::TYPE_BYTES:
            out << "bytes[" << std::get<std::string>(data_).size() << "]";
            break;
        case ValueType::TYPE_REFERENCE:
            out << "ref(" << std::get<std::string>(data_) << ")";
            break;
        case ValueType::TYPE_GEO_POINT: {
            const auto& geo = std::get<GeoPoint>(data_);
            out << "geo(" << geo.latitude << ", " << geo.longitude << ")";
            break;
        }
        case ValueType::TYPE_ARRAY: {
            out << "[";
            bool first = true;
            for (const auto& v : std::get<ValueArray>(data_)) {
                out << (first ? "" : ", ") << v.to_debug_string();
                first = false;
            }
            out << "]";
            break;
        }
        case ValueType::TYPE_MAP: {
            out << "{";
            bool first = true;
            for (const auto& [key, v] : std::get<FieldMap>(data_)) {
                out << (first ? "" : ", ") << key << ": " << v.to_debug_string();
                first = false;
            }
            out << "}";
            break;
        }
    }
    return out.str();
}

const char* Value::type_name(ValueType type) {
    switch (type) {
        case ValueType::TYPE_NULL:
            return "nullValue";
        case ValueType::TYPE_BOOLEAN:
            return "booleanValue";
        case ValueType::TYPE_INTEGER:
            return "integerValue";
        case ValueType::TYPE_DOUBLE:
            return "doubleValue";
        case ValueType::TYPE_TIMESTAMP:
            return "timestampValue";
        case ValueType::TYPE_STRING:
            return "stringValue";
        case ValueType::TYPE_BYTES:
            return "bytesValue";
        case ValueType::TYPE_REFERENCE:
            return "referenceValue";
        case ValueType::TYPE_GEO_POINT:
            return "geoPointValue";
        case ValueType::TYPE_ARRAY:
            return "arrayValue";
        case ValueType::TYPE_MAP:
            return "mapValue";
    }
    return "unknown";
}

}  // namespace clouddoc::common
