/**
 * @file transaction_manager.hpp
 * @brief Transaction Manager for lifecycle management
 */

#ifndef CLOUDDOC_TRANSACTION_TRANSACTION_MANAGER_HPP
#define CLOUDDOC_TRANSACTION_TRANSACTION_MANAGER_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

#include "storage/document.hpp"
#include "storage/document_store.hpp"
#include "transaction/transaction.hpp"

namespace clouddoc {
namespace transaction {

class TransactionManager {
public:
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{60000};
    static constexpr size_t ID_BYTES = 16;

private:
    std::unordered_map<txn_id_t, std::unique_ptr<Transaction>> active_transactions_;
    storage::DocumentStore& store_;
    std::chrono::milliseconds timeout_;
    std::mt19937_64 rng_;
    std::mutex manager_latch_;

    Transaction* find_live(const txn_id_t& txn_id);
    void retire(const txn_id_t& txn_id, TransactionState state);

public:
    explicit TransactionManager(storage::DocumentStore& store,
                                std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    /**
     * @brief Fresh id: 16 random bytes as 32 lowercase hex characters
     */
    [[nodiscard]] txn_id_t generate_id();

    /**
     * @brief Start a transaction over a deep copy of the current store
     * @throws std::invalid_argument if the id is already in use
     */
    Transaction* create_transaction(const txn_id_t& txn_id, bool read_only);

    /**
     * @brief Look up a transaction; an overdue one is rolled back on the way
     * and stays visible in that state until it is pruned.
     * @return nullptr for unknown, committed or explicitly rolled back ids
     */
    [[nodiscard]] Transaction* get_transaction(const txn_id_t& txn_id);

    /**
     * @brief Read a document as of the transaction's start.
     *
     * The first read of a path copies it from the global snapshot and records
     * it; later reads of the same path return the recorded value.
     * @throws std::invalid_argument if the transaction is unknown or finished
     */
    std::optional<storage::Document> read_in_transaction(const txn_id_t& txn_id,
                                                         const std::string& path);

    /**
     * @brief First recorded read whose live document differs from what was seen
     * @throws std::invalid_argument if the transaction is unknown, finished or overdue
     */
    [[nodiscard]] std::optional<std::string> find_conflict(const txn_id_t& txn_id);

    bool commit_transaction(const txn_id_t& txn_id);
    bool rollback_transaction(const txn_id_t& txn_id);

    /**
     * @brief Forget a transaction regardless of its state
     */
    void cleanup_transaction(const txn_id_t& txn_id);

    [[nodiscard]] size_t active_count();
    [[nodiscard]] std::chrono::milliseconds get_timeout() const { return timeout_; }
};

} // namespace transaction
} // namespace clouddoc

#endif // CLOUDDOC_TRANSACTION_TRANSACTION_MANAGER_HPP
