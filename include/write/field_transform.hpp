/**
 * @file field_transform.hpp
 * @brief Field masks and the field transform algebra
 */

#ifndef CLOUDDOC_WRITE_FIELD_TRANSFORM_HPP
#define CLOUDDOC_WRITE_FIELD_TRANSFORM_HPP

#include <vector>

#include "common/timestamp.hpp"
#include "common/value.hpp"
#include "storage/field_path.hpp"
#include "write/write.hpp"

namespace clouddoc::write {

struct TransformOutcome {
    common::FieldMap fields;
    common::ValueArray results;  // one entry per transform, in order
};

/**
 * @brief Apply transforms in order to a copy of fields.
 *
 * Field paths must already be valid; they are re-parsed here.
 */
[[nodiscard]] TransformOutcome apply_field_transforms(const common::FieldMap& fields,
                                                      const std::vector<FieldTransform>& transforms,
                                                      const common::Timestamp& commit_time);

/**
 * @brief Merge the masked paths of update into existing.
 *
 * A mask path present in update is copied in. A mask path missing from update
 * leaves existing as it was, and unmasked fields are kept.
 */
[[nodiscard]] common::FieldMap apply_update_mask(const common::FieldMap& existing,
                                                 const common::FieldMap& update,
                                                 const std::vector<storage::FieldPath>& mask);

[[nodiscard]] bool array_contains(const common::ValueArray& values, const common::Value& needle);

[[nodiscard]] common::Value increment_value(const common::Value* current,
                                            const common::Value& delta);
[[nodiscard]] common::Value maximum_value(const common::Value* current,
                                          const common::Value& operand);
[[nodiscard]] common::Value minimum_value(const common::Value* current,
                                          const common::Value& operand);

}  // namespace clouddoc::write

#endif  // CLOUDDOC_WRITE_FIELD_TRANSFORM_HPP
