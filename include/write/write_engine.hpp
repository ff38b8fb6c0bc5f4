/**
 * @file write_engine.hpp
 * @brief Validation and atomic application of write batches
 */

#ifndef CLOUDDOC_WRITE_WRITE_ENGINE_HPP
#define CLOUDDOC_WRITE_WRITE_ENGINE_HPP

#include <optional>
#include <vector>

#include "common/status.hpp"
#include "common/timestamp.hpp"
#include "storage/document.hpp"
#include "storage/document_store.hpp"
#include "storage/field_path.hpp"
#include "write/write.hpp"

namespace clouddoc::write {

/**
 * @brief A write that passed validation, with what it was validated against
 */
struct PendingWrite {
    const Write* write = nullptr;
    std::optional<storage::Document> current;
    std::vector<storage::FieldPath> mask;
};

/**
 * @brief Applies a batch of writes all-or-nothing.
 *
 * validate() inspects every write against the live store without mutating
 * it; apply() cannot fail and is only called once the whole batch
 * validated. Callers serialise validate()+apply() so the store does not
 * move in between.
 */
class WriteEngine {
   public:
    explicit WriteEngine(storage::DocumentStore& store) : store_(store) {}

    /**
     * @brief Validate paths, masks, transforms and preconditions
     * @param pending Filled with one entry per write on success
     */
    [[nodiscard]] common::Status validate(const std::vector<Write>& writes,
                                          std::vector<PendingWrite>& pending) const;

    /**
     * @brief Apply validated writes in order, one result per write
     */
    std::vector<WriteResult> apply(const std::vector<PendingWrite>& pending,
                                   const common::Timestamp& commit_time);

    /**
     * @brief validate() then apply(); results untouched on failure
     */
    [[nodiscard]] common::Status execute(const std::vector<Write>& writes,
                                         const common::Timestamp& commit_time,
                                         std::vector<WriteResult>& results);

    [[nodiscard]] static common::Status check_precondition(
        const std::optional<storage::Document>& current, const Precondition& precondition);

   private:
    storage::DocumentStore& store_;
};

}  // namespace clouddoc::write

#endif  // CLOUDDOC_WRITE_WRITE_ENGINE_HPP
