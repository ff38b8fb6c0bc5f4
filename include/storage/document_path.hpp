/**
 * @file document_path.hpp
 * @brief Document resource name grammar
 */

#ifndef CLOUDDOC_STORAGE_DOCUMENT_PATH_HPP
#define CLOUDDOC_STORAGE_DOCUMENT_PATH_HPP

#include <optional>
#include <string>
#include <vector>

#include "common/status.hpp"

namespace clouddoc::storage {

/**
 * @brief Parsed form of
 * projects/{project}/databases/{database}/documents/{collection}/{doc}[/...]
 */
struct DocumentPath {
    static constexpr const char* DEFAULT_DATABASE = "(default)";

    std::string project_id;
    std::string database;
    std::vector<std::string> segments;  // collection/doc pairs after "documents"

    /**
     * @brief Parse a full document name
     * @return std::nullopt if the name does not follow the grammar
     */
    [[nodiscard]] static std::optional<DocumentPath> parse(const std::string& name);

    [[nodiscard]] const std::string& collection_id() const { return segments[segments.size() - 2]; }
    [[nodiscard]] const std::string& document_id() const { return segments.back(); }

    /**
     * @brief "users/u1/posts/p1"
     */
    [[nodiscard]] std::string relative_path() const;

    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Check a document name and its database.
 *
 * Malformed names are INVALID_ARGUMENT, a database other than "(default)" is
 * NOT_FOUND.
 */
[[nodiscard]] common::Status validate_document_name(const std::string& name);

}  // namespace clouddoc::storage

#endif  // CLOUDDOC_STORAGE_DOCUMENT_PATH_HPP
