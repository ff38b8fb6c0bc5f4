/**
 * @file field_path.hpp
 * @brief Dotted field paths and navigation over nested maps
 */

#ifndef CLOUDDOC_STORAGE_FIELD_PATH_HPP
#define CLOUDDOC_STORAGE_FIELD_PATH_HPP

#include <string>
#include <utility>
#include <vector>

#include "common/value.hpp"

namespace clouddoc::storage {

/**
 * @brief Path to a (possibly nested) field, e.g. "address.city" or "`a.b`.c"
 */
class FieldPath {
   private:
    std::vector<std::string> segments_;

   public:
    explicit FieldPath(std::vector<std::string> segments) : segments_(std::move(segments)) {}

    /**
     * @brief Parse dot notation; backticks quote a segment containing dots
     * @throws std::invalid_argument on an empty path, empty segment or
     *         unclosed backtick
     */
    [[nodiscard]] static FieldPath parse(const std::string& path);

    [[nodiscard]] const std::vector<std::string>& segments() const { return segments_; }

    /**
     * @brief Canonical text, quoting segments that contain dots
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Value at this path, or nullptr if any step is missing or not a map
     */
    [[nodiscard]] const common::Value* lookup(const common::FieldMap& fields) const;

    /**
     * @brief Store a value at this path, creating or replacing intermediate maps
     */
    void set(common::FieldMap& fields, common::Value value) const;
};

/**
 * @brief Projection of a read: keep only the fields named by the mask
 */
[[nodiscard]] common::FieldMap apply_field_mask(const common::FieldMap& fields,
                                                const std::vector<FieldPath>& mask);

}  // namespace clouddoc::storage

#endif  // CLOUDDOC_STORAGE_FIELD_PATH_HPP
