/**
 * @file document_service.hpp
 * @brief batchGet / commit / beginTransaction / rollback handlers
 */

#ifndef CLOUDDOC_API_DOCUMENT_SERVICE_HPP
#define CLOUDDOC_API_DOCUMENT_SERVICE_HPP

#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/timestamp.hpp"
#include "storage/document_store.hpp"
#include "transaction/transaction_manager.hpp"
#include "write/write_engine.hpp"

namespace clouddoc::api {

/**
 * @brief HTTP status plus JSON body of one handler call
 */
struct ApiResponse {
    int status_code = 200;
    nlohmann::json body;

    [[nodiscard]] bool ok() const { return status_code == 200; }
};

/**
 * @brief Protocol handlers over a document store.
 *
 * Handler calls are serialised by one service mutex, so a commit's conflict
 * check, validation and store mutation run as a single critical section.
 */
class DocumentService {
   public:
    DocumentService(storage::DocumentStore& store, const config::Config& config);

    DocumentService(const DocumentService&) = delete;
    DocumentService& operator=(const DocumentService&) = delete;
    DocumentService(DocumentService&&) = delete;
    DocumentService& operator=(DocumentService&&) = delete;
    ~DocumentService() = default;

    [[nodiscard]] ApiResponse batch_get(const nlohmann::json& body);
    [[nodiscard]] ApiResponse commit(const nlohmann::json& body);
    [[nodiscard]] ApiResponse begin_transaction(const nlohmann::json& body);
    [[nodiscard]] ApiResponse rollback(const nlohmann::json& body);

    [[nodiscard]] transaction::TransactionManager& get_transaction_manager() {
        return txn_manager_;
    }

    [[nodiscard]] static ApiResponse error_response(const common::Status& status);

   private:
    ApiResponse do_batch_get(const nlohmann::json& body);
    ApiResponse do_commit(const nlohmann::json& body, std::optional<std::string>& resolved_txn);
    ApiResponse do_begin_transaction(const nlohmann::json& body);
    ApiResponse do_rollback(const nlohmann::json& body);

    /* INVALID_ARGUMENT unless txn names a transaction that can still be used */
    [[nodiscard]] static common::Status check_live(const transaction::Transaction* txn);

    std::mutex service_mutex_;
    storage::DocumentStore& store_;
    config::Config config_;
    transaction::TransactionManager txn_manager_;
    write::WriteEngine write_engine_;
    common::CommitClock clock_;
};

}  // namespace clouddoc::api

#endif  // CLOUDDOC_API_DOCUMENT_SERVICE_HPP
