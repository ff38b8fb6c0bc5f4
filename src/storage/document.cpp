/**
 * @file document.cpp
 * @brief Document comparison
 */

#include "storage/document.hpp"

#include <optional>

namespace clouddoc::storage {

bool documents_equal(const std::optional<Document>& a, const std::optional<Document>& b) {
    if (!a.has_value() || !b.has_value()) {
        return a.has_value() == b.has_value();
    }
    return a->update_time == b->update_time && a->create_time == b->create_time &&
           common::fields_equal(a->fields, b->fields);
}

}  // namespace clouddoc::storage
