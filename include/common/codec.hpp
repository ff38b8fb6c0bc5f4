/**
 * @file codec.hpp
 * @brief Conversion between JSON and tagged values
 */

#ifndef CLOUDDOC_COMMON_CODEC_HPP
#define CLOUDDOC_COMMON_CODEC_HPP

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "common/value.hpp"

namespace clouddoc::common {

/**
 * @brief Raised when JSON input does not describe a valid value
 */
class CodecError : public std::runtime_error {
   public:
    explicit CodecError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Wire and native JSON codec for Value.
 *
 * The wire form is the tagged object ({"integerValue": "42"}, {"mapValue":
 * {"fields": {...}}}, ...). The native form is plain JSON (42, {"a": 1}).
 */
class ValueCodec {
   public:
    /**
     * @brief Decode a wire value object
     * @throws CodecError on zero/multiple/unknown tags or malformed payloads
     */
    [[nodiscard]] static Value decode(const nlohmann::json& wire);

    /**
     * @brief Encode a value to its wire object
     */
    [[nodiscard]] static nlohmann::json encode(const Value& value);

    /**
     * @brief Decode a {"field": <wire value>, ...} object
     */
    [[nodiscard]] static FieldMap decode_fields(const nlohmann::json& wire);

    [[nodiscard]] static nlohmann::json encode_fields(const FieldMap& fields);

    /**
     * @brief Map plain JSON to a value (integers stay integers)
     */
    [[nodiscard]] static Value from_native(const nlohmann::json& native);

    /**
     * @brief Map a value to plain JSON
     */
    [[nodiscard]] static nlohmann::json to_native(const Value& value);

    [[nodiscard]] static std::string encode_base64(const std::string& raw);

    /**
     * @brief Decode standard or URL-safe base64, padding optional
     * @throws CodecError on characters outside the alphabet or bad length
     */
    [[nodiscard]] static std::string decode_base64(const std::string& text);
};

}  // namespace clouddoc::common

#endif  // CLOUDDOC_COMMON_CODEC_HPP
