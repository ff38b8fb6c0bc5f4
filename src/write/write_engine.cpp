/**
 * @file write_engine.cpp
 * @brief Write batch validation and application
 *
 * @defgroup write_engine Write Engine
 * @{
 */

#include "write/write_engine.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "storage/document_path.hpp"
#include "write/field_transform.hpp"

namespace clouddoc::write {

namespace {

common::Status validate_transforms(const std::vector<FieldTransform>& transforms) {
    for (const auto& transform : transforms) {
        try {
            static_cast<void>(storage::FieldPath::parse(transform.field_path));
        } catch (const std::invalid_argument& e) {
            return common::Status::invalid_argument(e.what());
        }

        switch (transform.kind) {
            case TransformKind::SERVER_TIMESTAMP:
                break;
            case TransformKind::INCREMENT:
            case TransformKind::MAXIMUM:
            case TransformKind::MINIMUM:
                if (!transform.operand.is_numeric()) {
                    return common::Status::invalid_argument(
                        "Transform operand for " + transform.field_path + " must be numeric");
                }
                break;
            case TransformKind::APPEND_MISSING_ELEMENTS:
            case TransformKind::REMOVE_ALL_FROM_ARRAY:
                if (!transform.operand.is_array()) {
                    return common::Status::invalid_argument(
                        "Transform operand for " + transform.field_path + " must be an array");
                }
                break;
        }
    }
    return common::Status::ok();
}

}  // anonymous namespace

common::Status WriteEngine::check_precondition(const std::optional<storage::Document>& current,
                                               const Precondition& precondition) {
    if (precondition.exists.has_value()) {
        if (*precondition.exists && !current.has_value()) {
            return common::Status::failed_precondition("Document does not exist");
        }
        if (!*precondition.exists && current.has_value()) {
            return common::Status::already_exists("Document already exists");
        }
    }

    if (precondition.update_time.has_value()) {
        if (!current.has_value()) {
            return common::Status::failed_precondition("Document does not exist");
        }
        if (current->update_time.to_string() != *precondition.update_time) {
            return common::Status::failed_precondition("Document updateTime does not match");
        }
    }
    return common::Status::ok();
}

common::Status WriteEngine::validate(const std::vector<Write>& writes,
                                     std::vector<PendingWrite>& pending) const {
    std::vector<PendingWrite> staged;
    staged.reserve(writes.size());

    for (const auto& write : writes) {
        const auto path_status = storage::validate_document_name(write.document);
        if (!path_status.is_ok()) {
            return path_status;
        }

        PendingWrite entry;
        entry.write = &write;

        if (write.kind == WriteKind::UPDATE && write.update_mask.has_value()) {
            try {
                for (const auto& field : *write.update_mask) {
                    entry.mask.push_back(storage::FieldPath::parse(field));
                }
            } catch (const std::invalid_argument& e) {
                return common::Status::invalid_argument(e.what());
            }
        }

        if (write.kind != WriteKind::DELETE) {
            auto status = validate_transforms(write.transforms);
            if (!status.is_ok()) {
                return status;
            }
        }

        /* Preconditions see the live store, not any transaction snapshot */
        entry.current = store_.get(write.document);
        auto status = check_precondition(entry.current, write.precondition);
        if (!status.is_ok()) {
            return status;
        }

        staged.push_back(std::move(entry));
    }

    pending = std::move(staged);
    return common::Status::ok();
}

std::vector<WriteResult> WriteEngine::apply(const std::vector<PendingWrite>& pending,
                                            const common::Timestamp& commit_time) {
    /* Later writes in the batch observe earlier ones through the overlay */
    std::map<std::string, std::optional<storage::Document>> overlay;
    std::vector<std::string> touched;
    std::vector<WriteResult> results;
    results.reserve(pending.size());

    for (const auto& entry : pending) {
        const Write& write = *entry.write;
        const std::string& path = write.document;

        std::optional<storage::Document> current = entry.current;
        const auto seen = overlay.find(path);
        if (seen != overlay.end()) {
            current = seen->second;
        } else {
            touched.push_back(path);
        }

        WriteResult result;
        result.update_time = commit_time;

        if (write.kind == WriteKind::DELETE) {
            overlay[path] = std::nullopt;
            results.push_back(std::move(result));
            continue;
        }

        common::FieldMap fields;
        if (write.kind == WriteKind::UPDATE) {
            if (write.update_mask.has_value()) {
                static const common::FieldMap EMPTY;
                fields = apply_update_mask(current.has_value() ? current->fields : EMPTY,
                                           write.fields, entry.mask);
            } else {
                fields = write.fields;
            }
            if (!write.transforms.empty()) {
                auto outcome = apply_field_transforms(fields, write.transforms, commit_time);
                fields = std::move(outcome.fields);
                result.transform_results = std::move(outcome.results);
            }
        } else {
            auto outcome = apply_field_transforms(
                current.has_value() ? current->fields : common::FieldMap{}, write.transforms,
                commit_time);
            fields = std::move(outcome.fields);
            result.transform_results = std::move(outcome.results);
        }

        storage::Document doc;
        doc.name = path;
        doc.fields = std::move(fields);
        doc.create_time = current.has_value() ? current->create_time : commit_time;
        doc.update_time = commit_time;
        overlay[path] = std::move(doc);

        results.push_back(std::move(result));
    }

    storage::DocumentBatch batch;
    batch.reserve(touched.size());
    for (const auto& path : touched) {
        batch.emplace_back(path, std::move(overlay[path]));
    }
    store_.apply_batch(std::move(batch));
    return results;
}

common::Status WriteEngine::execute(const std::vector<Write>& writes,
                                    const common::Timestamp& commit_time,
                                    std::vector<WriteResult>& results) {
    std::vector<PendingWrite> pending;
    auto status = validate(writes, pending);
    if (!status.is_ok()) {
        return status;
    }
    results = apply(pending, commit_time);
    return common::Status::ok();
}

}  // namespace clouddoc::write

/** @} */ /* write_engine */
