/**
 * @file document_service.cpp
 * @brief Document RPC handlers
 *
 * @defgroup service Document Service
 * @{
 */

#include "api/document_service.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "api/wire_format.hpp"
#include "common/codec.hpp"
#include "storage/document_path.hpp"
#include "storage/field_path.hpp"
#include "transaction/transaction.hpp"

namespace clouddoc::api {

namespace {

using json = nlohmann::json;
using common::Status;

/* Maps exceptions escaping a handler onto an error response */
template <typename Fn>
ApiResponse run_guarded(const char* rpc, Fn&& fn) {
    try {
        return fn();
    } catch (const common::CodecError& e) {
        return DocumentService::error_response(Status::invalid_argument(e.what()));
    } catch (const std::invalid_argument& e) {
        return DocumentService::error_response(Status::invalid_argument(e.what()));
    } catch (const std::exception& e) {
        std::cerr << rpc << " failed: " << e.what() << "\n";
        return DocumentService::error_response(Status::internal(e.what()));
    }
}

}  // anonymous namespace

DocumentService::DocumentService(storage::DocumentStore& store, const config::Config& config)
    : store_(store),
      config_(config),
      txn_manager_(store, std::chrono::milliseconds(config.transaction_timeout_ms)),
      write_engine_(store) {}

ApiResponse DocumentService::error_response(const common::Status& status) {
    return ApiResponse{status.http_status(), encode_error(status)};
}

Status DocumentService::check_live(const transaction::Transaction* txn) {
    if (txn == nullptr) {
        return Status::invalid_argument("Invalid transaction ID");
    }
    if (txn->is_terminal()) {
        return Status::invalid_argument("Transaction has already been committed or rolled back");
    }
    return Status::ok();
}

ApiResponse DocumentService::batch_get(const json& body) {
    const std::scoped_lock<std::mutex> lock(service_mutex_);
    return run_guarded("batchGet", [&]() { return do_batch_get(body); });
}

ApiResponse DocumentService::commit(const json& body) {
    const std::scoped_lock<std::mutex> lock(service_mutex_);
    std::optional<std::string> resolved_txn;
    auto response = run_guarded("commit", [&]() { return do_commit(body, resolved_txn); });

    /* A failed commit ends its transaction */
    if (!response.ok() && resolved_txn.has_value()) {
        static_cast<void>(txn_manager_.rollback_transaction(*resolved_txn));
    }
    return response;
}

ApiResponse DocumentService::begin_transaction(const json& body) {
    const std::scoped_lock<std::mutex> lock(service_mutex_);
    return run_guarded("beginTransaction", [&]() { return do_begin_transaction(body); });
}

ApiResponse DocumentService::rollback(const json& body) {
    const std::scoped_lock<std::mutex> lock(service_mutex_);
    return run_guarded("rollback", [&]() { return do_rollback(body); });
}

ApiResponse DocumentService::do_batch_get(const json& body) {
    const auto request = parse_batch_get_request(body);

    if (request.documents.empty()) {
        return error_response(Status::invalid_argument("documents array cannot be empty"));
    }
    if (request.documents.size() > static_cast<size_t>(config_.max_batch_get_documents)) {
        return error_response(Status::invalid_argument(
            "documents array cannot exceed " + std::to_string(config_.max_batch_get_documents) +
            " items"));
    }
    if (request.transaction.has_value() && request.new_transaction.has_value()) {
        return error_response(
            Status::invalid_argument("Cannot specify both transaction and newTransaction"));
    }

    for (const auto& path : request.documents) {
        auto status = storage::validate_document_name(path);
        if (!status.is_ok()) {
            return error_response(status);
        }
    }

    std::vector<storage::FieldPath> mask;
    if (request.mask.has_value()) {
        for (const auto& field : *request.mask) {
            mask.push_back(storage::FieldPath::parse(field));
        }
    }

    std::optional<std::string> txn_id;
    bool created = false;
    common::Timestamp read_time = common::Timestamp::now();

    if (request.transaction.has_value()) {
        const auto* txn = txn_manager_.get_transaction(*request.transaction);
        auto status = check_live(txn);
        if (!status.is_ok()) {
            return error_response(status);
        }
        txn_id = txn->get_id();
        read_time = txn->get_start_time();
    } else if (request.new_transaction.has_value()) {
        const auto& options = *request.new_transaction;
        if (options.retry_transaction.has_value()) {
            static_cast<void>(txn_manager_.rollback_transaction(*options.retry_transaction));
        }
        const auto id = txn_manager_.generate_id();
        const auto* txn = txn_manager_.create_transaction(id, options.read_only);
        txn_id = id;
        created = true;
        read_time = txn->get_start_time();
        if (config_.debug) {
            std::cout << "[batchGet] started transaction " << id << "\n";
        }
    }

    const std::string read_time_text = read_time.to_string();
    json entries = json::array();
    for (const auto& path : request.documents) {
        const auto doc = txn_id.has_value() ? txn_manager_.read_in_transaction(*txn_id, path)
                                            : store_.get(path);

        json entry = json::object();
        if (doc.has_value()) {
            storage::Document shown = *doc;
            if (request.mask.has_value()) {
                shown.fields = storage::apply_field_mask(doc->fields, mask);
            }
            entry["found"] = encode_document(shown);
        } else {
            entry["missing"] = path;
        }
        entry["readTime"] = read_time_text;
        if (created) {
            entry["transaction"] = *txn_id;
        }
        entries.push_back(std::move(entry));
    }

    return ApiResponse{200, std::move(entries)};
}

ApiResponse DocumentService::do_commit(const json& body,
                                       std::optional<std::string>& resolved_txn) {
    const auto request = parse_commit_request(body);

    if (request.writes.size() > static_cast<size_t>(config_.max_commit_writes)) {
        return error_response(Status::invalid_argument(
            "writes array cannot exceed " + std::to_string(config_.max_commit_writes) + " items"));
    }

    if (request.transaction.has_value()) {
        const auto* txn = txn_manager_.get_transaction(*request.transaction);
        auto status = check_live(txn);
        if (!status.is_ok()) {
            return error_response(status);
        }
        resolved_txn = txn->get_id();

        if (txn->is_read_only() && !request.writes.empty()) {
            return error_response(
                Status::invalid_argument("Cannot commit writes in a read-only transaction"));
        }

        const auto conflict = txn_manager_.find_conflict(*resolved_txn);
        if (conflict.has_value()) {
            if (config_.debug) {
                std::cout << "[commit] transaction " << *resolved_txn << " conflicts on "
                          << *conflict << "\n";
            }
            return error_response(
                Status::aborted("Transaction aborted due to conflicting modifications"));
        }
    }

    std::vector<write::PendingWrite> pending;
    auto status = write_engine_.validate(request.writes, pending);
    if (!status.is_ok()) {
        if (config_.debug) {
            std::cout << "[commit] rejected: " << status.message() << "\n";
        }
        return error_response(status);
    }

    /* The transaction must still be live when its writes go in */
    if (resolved_txn.has_value() && !txn_manager_.commit_transaction(*resolved_txn)) {
        return error_response(Status::invalid_argument(
            "Transaction has already been committed or rolled back"));
    }

    const auto commit_time = clock_.next();
    const auto results = write_engine_.apply(pending, commit_time);

    json write_results = json::array();
    for (const auto& result : results) {
        write_results.push_back(encode_write_result(result));
    }
    return ApiResponse{200,
                       json{{"writeResults", std::move(write_results)},
                            {"commitTime", commit_time.to_string()}}};
}

ApiResponse DocumentService::do_begin_transaction(const json& body) {
    const auto request = parse_begin_transaction_request(body);

    if (request.options.retry_transaction.has_value()) {
        const auto& retry = *request.options.retry_transaction;
        if (txn_manager_.rollback_transaction(retry) && config_.debug) {
            std::cout << "[beginTransaction] retrying " << retry << "\n";
        }
    }

    const auto id = txn_manager_.generate_id();
    static_cast<void>(txn_manager_.create_transaction(id, request.options.read_only));
    if (config_.debug) {
        std::cout << "[beginTransaction] " << id
                  << (request.options.read_only ? " (read-only)" : "") << "\n";
    }
    return ApiResponse{200, json{{"transaction", id}}};
}

ApiResponse DocumentService::do_rollback(const json& body) {
    const auto request = parse_rollback_request(body);

    const auto* txn = txn_manager_.get_transaction(request.transaction);
    if (txn == nullptr) {
        return error_response(Status::invalid_argument("Invalid transaction ID"));
    }
    if (txn->get_state() == transaction::TransactionState::COMMITTED) {
        return error_response(Status::invalid_argument("Cannot rollback a committed transaction"));
    }
    if (txn->get_state() == transaction::TransactionState::ROLLED_BACK) {
        return error_response(Status::invalid_argument("Transaction has already been rolled back"));
    }

    static_cast<void>(txn_manager_.rollback_transaction(request.transaction));
    txn_manager_.cleanup_transaction(request.transaction);
    return ApiResponse{200, json::object()};
}

}  // namespace clouddoc::api

/** @} */ /* service */
