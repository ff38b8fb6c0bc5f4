/**
 * @file document.hpp
 * @brief Stored document record
 */

#ifndef CLOUDDOC_STORAGE_DOCUMENT_HPP
#define CLOUDDOC_STORAGE_DOCUMENT_HPP

#include <optional>
#include <string>

#include "common/timestamp.hpp"
#include "common/value.hpp"

namespace clouddoc::storage {

/**
 * @brief A document: full resource name, fields and lifecycle timestamps
 */
struct Document {
    std::string name;
    common::FieldMap fields;
    common::Timestamp create_time;
    common::Timestamp update_time;
};

/**
 * @brief Structural equality used by conflict detection.
 *
 * Two absent documents are equal; absent and present never are. Present
 * documents must agree on createTime, updateTime and every field.
 */
[[nodiscard]] bool documents_equal(const std::optional<Document>& a,
                                   const std::optional<Document>& b);

}  // namespace clouddoc::storage

#endif  // CLOUDDOC_STORAGE_DOCUMENT_HPP
