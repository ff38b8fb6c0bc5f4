/**
 * @file write.hpp
 * @brief Write operations carried by a commit
 */

#ifndef CLOUDDOC_WRITE_WRITE_HPP
#define CLOUDDOC_WRITE_WRITE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/timestamp.hpp"
#include "common/value.hpp"

namespace clouddoc::write {

enum class WriteKind : uint8_t { UPDATE, DELETE, TRANSFORM };

enum class TransformKind : uint8_t {
    SERVER_TIMESTAMP,
    INCREMENT,
    MAXIMUM,
    MINIMUM,
    APPEND_MISSING_ELEMENTS,
    REMOVE_ALL_FROM_ARRAY
};

/**
 * @brief Server-side mutation of one field.
 *
 * operand is numeric for INCREMENT/MAXIMUM/MINIMUM, an array for the two
 * array operations and null for SERVER_TIMESTAMP.
 */
struct FieldTransform {
    std::string field_path;
    TransformKind kind = TransformKind::SERVER_TIMESTAMP;
    common::Value operand;
};

/**
 * @brief currentDocument condition checked against the live document
 */
struct Precondition {
    std::optional<bool> exists;
    std::optional<std::string> update_time;  // matched verbatim against the stored RFC3339 text

    [[nodiscard]] bool is_empty() const { return !exists.has_value() && !update_time.has_value(); }
};

/**
 * @brief One entry of a commit's writes array
 */
struct Write {
    WriteKind kind = WriteKind::UPDATE;
    std::string document;                                 // full resource name
    common::FieldMap fields;                              // UPDATE only
    std::optional<std::vector<std::string>> update_mask;  // UPDATE only
    std::vector<FieldTransform> transforms;  // updateTransforms, or fieldTransforms for TRANSFORM
    Precondition precondition;
};

struct WriteResult {
    common::Timestamp update_time;
    std::optional<common::ValueArray> transform_results;
};

}  // namespace clouddoc::write

#endif  // CLOUDDOC_WRITE_WRITE_HPP
