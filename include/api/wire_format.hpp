/**
 * @file wire_format.hpp
 * @brief JSON request parsing and response encoding for the document RPCs
 */

#ifndef CLOUDDOC_API_WIRE_FORMAT_HPP
#define CLOUDDOC_API_WIRE_FORMAT_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "common/status.hpp"
#include "storage/document.hpp"
#include "write/write.hpp"

namespace clouddoc::api {

/**
 * @brief beginTransaction options / batchGet newTransaction
 */
struct TransactionOptions {
    bool read_only = false;
    std::optional<std::string> read_time;
    std::optional<std::string> retry_transaction;
};

struct BatchGetRequest {
    std::vector<std::string> documents;
    std::optional<std::vector<std::string>> mask;
    std::optional<std::string> transaction;
    std::optional<TransactionOptions> new_transaction;
    std::optional<std::string> read_time;
};

struct CommitRequest {
    std::vector<write::Write> writes;
    std::optional<std::string> transaction;
};

struct BeginTransactionRequest {
    TransactionOptions options;
};

struct RollbackRequest {
    std::string transaction;
};

/*
 * Request parsers. Each throws common::CodecError with a client-facing
 * message when the body does not have the expected shape. Size limits are
 * left to the handlers.
 */
[[nodiscard]] BatchGetRequest parse_batch_get_request(const nlohmann::json& body);
[[nodiscard]] CommitRequest parse_commit_request(const nlohmann::json& body);
[[nodiscard]] BeginTransactionRequest parse_begin_transaction_request(const nlohmann::json& body);
[[nodiscard]] RollbackRequest parse_rollback_request(const nlohmann::json& body);

[[nodiscard]] write::Write parse_write(const nlohmann::json& wire);
[[nodiscard]] write::FieldTransform parse_field_transform(const nlohmann::json& wire);

/*
 * Response encoders
 */
[[nodiscard]] nlohmann::json encode_document(const storage::Document& doc);
[[nodiscard]] nlohmann::json encode_write_result(const write::WriteResult& result);

/**
 * @brief {"error": {"code": <http>, "message": ..., "status": <name>}}
 */
[[nodiscard]] nlohmann::json encode_error(const common::Status& status);

}  // namespace clouddoc::api

#endif  // CLOUDDOC_API_WIRE_FORMAT_HPP
