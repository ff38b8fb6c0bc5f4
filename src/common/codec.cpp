/**
 * @file codec.cpp
 * @brief JSON <-> Value codec implementation
 *
 * @defgroup codec Value Codec
 * @{
 */

#include "common/codec.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <system_error>
#include <utility>

#include "common/timestamp.hpp"
#include "common/value.hpp"

namespace clouddoc::common {

namespace {

using json = nlohmann::json;

constexpr const char* NAN_TEXT = "NaN";
constexpr const char* POS_INF_TEXT = "Infinity";
constexpr const char* NEG_INF_TEXT = "-Infinity";

constexpr std::array<char, 64> BASE64_ALPHABET = {
    'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M', 'N', 'O', 'P',
    'Q', 'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z', 'a', 'b', 'c', 'd', 'e', 'f',
    'g', 'h', 'i', 'j', 'k', 'l', 'm', 'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v',
    'w', 'x', 'y', 'z', '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '+', '/'};

int base64_index(char c) {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9') {
        return c - '0' + 52;
    }
    if (c == '+' || c == '-') {
        return 62;
    }
    if (c == '/' || c == '_') {
        return 63;
    }
    return -1;
}

int64_t parse_integer_text(const std::string& text) {
    int64_t out = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, out);
    if (text.empty() || ec != std::errc() || ptr != end) {
        throw CodecError("Invalid integerValue: " + text);
    }
    return out;
}

int64_t decode_integer(const json& payload) {
    if (payload.is_string()) {
        return parse_integer_text(payload.get<std::string>());
    }
    if (payload.is_number_integer()) {
        if (payload.is_number_unsigned() &&
            payload.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw CodecError("Invalid integerValue: " + payload.dump());
        }
        return payload.get<int64_t>();
    }
    throw CodecError("Invalid integerValue: " + payload.dump());
}

double decode_double(const json& payload) {
    if (payload.is_number()) {
        return payload.get<double>();
    }
    if (payload.is_string()) {
        const auto& text = payload.get_ref<const std::string&>();
        if (text == NAN_TEXT) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        if (text == POS_INF_TEXT) {
            return std::numeric_limits<double>::infinity();
        }
        if (text == NEG_INF_TEXT) {
            return -std::numeric_limits<double>::infinity();
        }
    }
    throw CodecError("Invalid doubleValue: " + payload.dump());
}

json encode_double(double v) {
    if (std::isnan(v)) {
        return NAN_TEXT;
    }
    if (std::isinf(v)) {
        return v > 0 ? POS_INF_TEXT : NEG_INF_TEXT;
    }
    return v;
}

void check_timestamp_range(int64_t seconds) {
    if (seconds < Timestamp::MIN_SECONDS || seconds > Timestamp::MAX_SECONDS) {
        throw CodecError("Timestamp out of range: " + std::to_string(seconds) + " seconds");
    }
}

Timestamp decode_timestamp(const json& payload) {
    if (payload.is_string()) {
        const auto parsed = Timestamp::parse(payload.get<std::string>());
        if (!parsed.has_value()) {
            throw CodecError("Invalid timestamp format: " + payload.get<std::string>());
        }
        check_timestamp_range(parsed->seconds);
        return *parsed;
    }
    if (payload.is_object()) {
        int64_t seconds = 0;
        int64_t nanos = 0;
        if (payload.contains("seconds")) {
            seconds = decode_integer(payload.at("seconds"));
        }
        if (payload.contains("nanos")) {
            nanos = decode_integer(payload.at("nanos"));
        }
        if (nanos < 0 || nanos >= Timestamp::NANOS_PER_SECOND) {
            throw CodecError("Invalid timestamp nanos: " + std::to_string(nanos));
        }
        check_timestamp_range(seconds);
        return Timestamp::from_parts(seconds, nanos);
    }
    throw CodecError("Invalid timestampValue: " + payload.dump());
}

const std::string& require_string(const json& payload, const char* tag) {
    if (!payload.is_string()) {
        throw CodecError(std::string("Invalid ") + tag + ": expected string");
    }
    return payload.get_ref<const std::string&>();
}

bool is_resource_path(const std::string& path) {
    static const std::string PREFIX = "projects/";
    if (path.compare(0, PREFIX.size(), PREFIX) != 0) {
        return false;
    }
    const auto db = path.find("/databases/");
    if (db == std::string::npos) {
        return false;
    }
    const auto docs = path.find("/documents/", db);
    return docs != std::string::npos && docs + 11 < path.size();
}

GeoPoint decode_geo_point(const json& payload) {
    if (!payload.is_object()) {
        throw CodecError("geoPointValue must be an object");
    }
    if (!payload.contains("latitude") || !payload.at("latitude").is_number()) {
        throw CodecError("geoPointValue missing latitude");
    }
    if (!payload.contains("longitude") || !payload.at("longitude").is_number()) {
        throw CodecError("geoPointValue missing longitude");
    }
    GeoPoint geo{payload.at("latitude").get<double>(), payload.at("longitude").get<double>()};
    if (!std::isfinite(geo.latitude) || geo.latitude < -GeoPoint::MAX_LATITUDE ||
        geo.latitude > GeoPoint::MAX_LATITUDE) {
        throw CodecError("Invalid latitude: " + payload.at("latitude").dump());
    }
    if (!std::isfinite(geo.longitude) || geo.longitude < -GeoPoint::MAX_LONGITUDE ||
        geo.longitude > GeoPoint::MAX_LONGITUDE) {
        throw CodecError("Invalid longitude: " + payload.at("longitude").dump());
    }
    return geo;
}

}  // anonymous namespace

Value ValueCodec::decode(const json& wire) {
    if (!wire.is_object()) {
        throw CodecError("Value must be an object");
    }
    if (wire.empty()) {
        throw CodecError("Empty Value object");
    }
    if (wire.size() > 1) {
        throw CodecError("Value object must have exactly one type field");
    }

    const auto it = wire.begin();
    const std::string& tag = it.key();
    const json& payload = it.value();

    if (tag == "nullValue") {
        if (!payload.is_null() && !(payload.is_string() && payload.get<std::string>() == "NULL_VALUE")) {
            throw CodecError("Invalid nullValue");
        }
        return Value::make_null();
    }
    if (tag == "booleanValue") {
        if (!payload.is_boolean()) {
            throw CodecError("Invalid booleanValue: expected boolean");
        }
        return Value::make_boolean(payload.get<bool>());
    }
    if (tag == "integerValue") {
        return Value::make_integer(decode_integer(payload));
    }
    if (tag == "doubleValue") {
        return Value::make_double(decode_double(payload));
    }
    if (tag == "timestampValue") {
        return Value::make_timestamp(decode_timestamp(payload));
    }
    if (tag == "stringValue") {
        return Value::make_string(require_string(payload, "stringValue"));
    }
    if (tag == "bytesValue") {
        return Value::make_bytes(decode_base64(require_string(payload, "bytesValue")));
    }
    if (tag == "referenceValue") {
        const auto& path = require_string(payload, "referenceValue");
        if (!is_resource_path(path)) {
            throw CodecError("Invalid referenceValue format: " + path);
        }
        return Value::make_reference(path);
    }
    if (tag == "geoPointValue") {
        const GeoPoint geo = decode_geo_point(payload);
        return Value::make_geo_point(geo.latitude, geo.longitude);
    }
    if (tag == "arrayValue") {
        if (!payload.is_object()) {
            throw CodecError("arrayValue must be an object");
        }
        ValueArray values;
        if (payload.contains("values")) {
            const auto& items = payload.at("values");
            if (!items.is_array()) {
                throw CodecError("arrayValue.values must be an array");
            }
            values.reserve(items.size());
            for (const auto& item : items) {
                values.push_back(decode(item));
            }
        }
        return Value::make_array(std::move(values));
    }
    if (tag == "mapValue") {
        if (!payload.is_object()) {
            throw CodecError("mapValue must be an object");
        }
        if (!payload.contains("fields")) {
            return Value::make_map({});
        }
        return Value::make_map(decode_fields(payload.at("fields")));
    }

    throw CodecError("Unsupported Value type: " + tag);
}

json ValueCodec::encode(const Value& value) {
    switch (value.type()) {
        case ValueType::TYPE_NULL:
            return json{{"nullValue", nullptr}};
        case ValueType::TYPE_BOOLEAN:
            return json{{"booleanValue", value.as_boolean()}};
        case ValueType::TYPE_INTEGER:
            return json{{"integerValue", std::to_string(value.as_integer())}};
        case ValueType::TYPE_DOUBLE:
            return json{{"doubleValue", encode_double(value.as_double())}};
        case ValueType::TYPE_TIMESTAMP:
            return json{{"timestampValue", value.as_timestamp().to_string()}};
        case ValueType::TYPE_STRING:
            return json{{"stringValue", value.as_string()}};
        case ValueType::TYPE_BYTES:
            return json{{"bytesValue", encode_base64(value.as_bytes())}};
        case ValueType::TYPE_REFERENCE:
            return json{{"referenceValue", value.as_reference()}};
        case ValueType::TYPE_GEO_POINT: {
            const auto& geo = value.as_geo_point();
            return json{{"geoPointValue", {{"latitude", geo.latitude}, {"longitude", geo.longitude}}}};
        }
        case ValueType::TYPE_ARRAY: {
            json values = json::array();
            for (const auto& item : value.as_array()) {
                values.push_back(encode(item));
            }
            return json{{"arrayValue", {{"values", std::move(values)}}}};
        }
        case ValueType::TYPE_MAP:
            return json{{"mapValue", {{"fields", encode_fields(value.as_map())}}}};
    }
    return json{{"nullValue", nullptr}};
}

FieldMap ValueCodec::decode_fields(const json& wire) {
    if (!wire.is_object()) {
        throw CodecError("fields must be an object");
    }
    FieldMap fields;
    for (auto it = wire.begin(); it != wire.end(); ++it) {
        try {
            fields.emplace(it.key(), decode(it.value()));
        } catch (const CodecError& e) {
            throw CodecError("Invalid field value for " + it.key() + ": " + e.what());
        }
    }
    return fields;
}

json ValueCodec::encode_fields(const FieldMap& fields) {
    json out = json::object();
    for (const auto& [key, value] : fields) {
        out[key] = encode(value);
    }
    return out;
}

Value ValueCodec::from_native(const json& native) {
    switch (native.type()) {
        case json::value_t::null:
            return Value::make_null();
        case json::value_t::boolean:
            return Value::make_boolean(native.get<bool>());
        case json::value_t::number_integer:
            return Value::make_integer(native.get<int64_t>());
        case json::value_t::number_unsigned: {
            const auto v = native.get<uint64_t>();
            if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Value::make_double(static_cast<double>(v));
            }
            return Value::make_integer(static_cast<int64_t>(v));
        }
        case json::value_t::number_float:
            return Value::make_double(native.get<double>());
        case json::value_t::string:
            return Value::make_string(native.get<std::string>());
        case json::value_t::array: {
            ValueArray values;
            values.reserve(native.size());
            for (const auto& item : native) {
                values.push_back(from_native(item));
            }
            return Value::make_array(std::move(values));
        }
        case json::value_t::object: {
            FieldMap fields;
            for (auto it = native.begin(); it != native.end(); ++it) {
                fields.emplace(it.key(), from_native(it.value()));
            }
            return Value::make_map(std::move(fields));
        }
        default:
            break;
    }
    throw CodecError(std::string("Cannot encode ") + native.type_name() + " value");
}

json ValueCodec::to_native(const Value& value) {
    switch (value.type()) {
        case ValueType::TYPE_NULL:
            return nullptr;
        case ValueType::TYPE_BOOLEAN:
            return value.as_boolean();
        case ValueType::TYPE_INTEGER:
            return value.as_integer();
        case ValueType::TYPE_DOUBLE:
            return encode_double(value.as_double());
        case ValueType::TYPE_TIMESTAMP:
            return value.as_timestamp().to_string();
        case ValueType::TYPE_STRING:
            return value.as_string();
        case ValueType::TYPE_BYTES:
            return encode_base64(value.as_bytes());
        case ValueType::TYPE_REFERENCE:
            return value.as_reference();
        case ValueType::TYPE_GEO_POINT: {
            const auto& geo = value.as_geo_point();
            return json{{"latitude", geo.latitude}, {"longitude", geo.longitude}};
        }
        case ValueType::TYPE_ARRAY: {
            json out = json::array();
            for (const auto& item : value.as_array()) {
                out.push_back(to_native(item));
            }
            return out;
        }
        case ValueType::TYPE_MAP: {
            json out = json::object();
            for (const auto& [key, item] : value.as_map()) {
                out[key] = to_native(item);
            }
            return out;
        }
    }
    return nullptr;
}

std::string ValueCodec::encode_base64(const std::string& raw) {
    std::string out;
    out.reserve(((raw.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= raw.size()) {
        const uint32_t chunk = (static_cast<uint32_t>(static_cast<uint8_t>(raw[i])) << 16U) |
                               (static_cast<uint32_t>(static_cast<uint8_t>(raw[i + 1])) << 8U) |
                               static_cast<uint32_t>(static_cast<uint8_t>(raw[i + 2]));
        out += BASE64_ALPHABET[(chunk >> 18U) & 0x3FU];
        out += BASE64_ALPHABET[(chunk >> 12U) & 0x3FU];
        out += BASE64_ALPHABET[(chunk >> 6U) & 0x3FU];
        out += BASE64_ALPHABET[chunk & 0x3FU];
        i += 3;
    }

    const size_t rest = raw.size() - i;
    if (rest == 1) {
        const uint32_t chunk = static_cast<uint32_t>(static_cast<uint8_t>(raw[i])) << 16U;
        out += BASE64_ALPHABET[(chunk >> 18U) & 0x3FU];
        out += BASE64_ALPHABET[(chunk >> 12U) & 0x3FU];
        out += "==";
    } else if (rest == 2) {
        const uint32_t chunk = (static_cast<uint32_t>(static_cast<uint8_t>(raw[i])) << 16U) |
                               (static_cast<uint32_t>(static_cast<uint8_t>(raw[i + 1])) << 8U);
        out += BASE64_ALPHABET[(chunk >> 18U) & 0x3FU];
        out += BASE64_ALPHABET[(chunk >> 12U) & 0x3FU];
        out += BASE64_ALPHABET[(chunk >> 6U) & 0x3FU];
        out += '=';
    }
    return out;
}

std::string ValueCodec::decode_base64(const std::string& text) {
    /* Trailing padding is optional; anything after it is rejected */
    size_t end = text.size();
    size_t padding = 0;
    while (end > 0 && text[end - 1] == '=' && padding < 2) {
        --end;
        ++padding;
    }
    if (end % 4 == 1) {
        throw CodecError("Invalid base64 string: bad length");
    }

    std::string out;
    out.reserve((end / 4) * 3 + 2);

    uint32_t buffer = 0;
    unsigned int bits = 0;
    for (size_t i = 0; i < end; ++i) {
        const int idx = base64_index(text[i]);
        if (idx < 0) {
            throw CodecError("Invalid base64 string: contains invalid characters");
        }
        buffer = (buffer << 6U) | static_cast<uint32_t>(idx);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((buffer >> bits) & 0xFFU);
        }
    }
    return out;
}

}  // namespace clouddoc::common

/** @} */ /* codec */
