/**
 * @file transaction.hpp
 * @brief Transaction context definitions
 */

#ifndef CLOUDDOC_TRANSACTION_TRANSACTION_HPP
#define CLOUDDOC_TRANSACTION_TRANSACTION_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "common/timestamp.hpp"
#include "storage/document.hpp"

namespace clouddoc::transaction {

using txn_id_t = std::string;
using steady_clock = std::chrono::steady_clock;

/**
 * @brief CREATED -> ACTIVE -> COMMITTED | ROLLED_BACK; terminal states are final
 */
enum class TransactionState : uint8_t { CREATED, ACTIVE, COMMITTED, ROLLED_BACK };

/**
 * @brief Documents a transaction observed, keyed by path (nullopt = missing)
 */
using ReadSnapshot = std::map<std::string, std::optional<storage::Document>>;

/**
 * @brief Point-in-time copy of the whole store taken at transaction start
 */
using GlobalSnapshot = std::map<std::string, storage::Document>;

/**
 * @brief Represents a single transaction context
 */
class Transaction {
   private:
    txn_id_t txn_id_;
    bool read_only_;
    common::Timestamp start_time_;
    steady_clock::time_point deadline_;
    std::atomic<TransactionState> state_;

    ReadSnapshot read_snapshot_;
    GlobalSnapshot global_snapshot_;

   public:
    Transaction(txn_id_t txn_id, bool read_only, const common::Timestamp& start_time,
                steady_clock::time_point deadline, GlobalSnapshot snapshot)
        : txn_id_(std::move(txn_id)),
          read_only_(read_only),
          start_time_(start_time),
          deadline_(deadline),
          state_(TransactionState::CREATED),
          global_snapshot_(std::move(snapshot)) {}

    ~Transaction() = default;

    // Disable copy/move for transaction
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) = delete;
    Transaction& operator=(Transaction&&) = delete;

    [[nodiscard]] const txn_id_t& get_id() const { return txn_id_; }
    [[nodiscard]] bool is_read_only() const { return read_only_; }
    [[nodiscard]] const common::Timestamp& get_start_time() const { return start_time_; }
    [[nodiscard]] steady_clock::time_point get_deadline() const { return deadline_; }

    [[nodiscard]] TransactionState get_state() const { return state_.load(); }
    void set_state(TransactionState state) { state_.store(state); }

    [[nodiscard]] bool is_terminal() const {
        const auto state = get_state();
        return state == TransactionState::COMMITTED || state == TransactionState::ROLLED_BACK;
    }

    [[nodiscard]] bool is_expired(steady_clock::time_point now) const { return now >= deadline_; }

    [[nodiscard]] const ReadSnapshot& get_read_snapshot() const { return read_snapshot_; }
    [[nodiscard]] ReadSnapshot& get_read_snapshot() { return read_snapshot_; }
    [[nodiscard]] const GlobalSnapshot& get_global_snapshot() const { return global_snapshot_; }

    /**
     * @brief Drop both snapshots once the transaction is over
     */
    void release_snapshots() {
        ReadSnapshot().swap(read_snapshot_);
        GlobalSnapshot().swap(global_snapshot_);
    }
};

}  // namespace clouddoc::transaction

#endif  // CLOUDDOC_TRANSACTION_TRANSACTION_HPP
