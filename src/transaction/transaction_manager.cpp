/**
 * @file transaction_manager.cpp
 * @brief Transaction Manager implementation
 */

#include "transaction/transaction_manager.hpp"

#include <array>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/timestamp.hpp"
#include "storage/document.hpp"
#include "transaction/transaction.hpp"

namespace clouddoc::transaction {

namespace {

std::mt19937_64 make_rng() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
}

}  // anonymous namespace

TransactionManager::TransactionManager(storage::DocumentStore& store,
                                       std::chrono::milliseconds timeout)
    : store_(store), timeout_(timeout), rng_(make_rng()) {}

txn_id_t TransactionManager::generate_id() {
    const std::scoped_lock<std::mutex> lock(manager_latch_);

    txn_id_t id;
    do {
        id.clear();
        for (size_t i = 0; i < ID_BYTES / sizeof(uint64_t); ++i) {
            std::array<char, 17> hex{};
            static_cast<void>(std::snprintf(hex.data(), hex.size(), "%016llx",
                                            static_cast<unsigned long long>(rng_())));
            id += hex.data();
        }
    } while (active_transactions_.find(id) != active_transactions_.end());
    return id;
}

Transaction* TransactionManager::create_transaction(const txn_id_t& txn_id, bool read_only) {
    /* Snapshot first; the store has its own latch */
    auto snapshot = store_.get_all_documents();
    const auto now = steady_clock::now();

    const std::scoped_lock<std::mutex> lock(manager_latch_);

    /* Prune overdue and already-expired entries */
    for (auto it = active_transactions_.begin(); it != active_transactions_.end();) {
        if (it->second->is_expired(now)) {
            it = active_transactions_.erase(it);
        } else {
            ++it;
        }
    }

    const auto existing = active_transactions_.find(txn_id);
    if (existing != active_transactions_.end() && !existing->second->is_terminal()) {
        throw std::invalid_argument("Transaction " + txn_id + " already exists");
    }

    auto txn = std::make_unique<Transaction>(txn_id, read_only, common::Timestamp::now(),
                                             now + timeout_, std::move(snapshot));
    Transaction* const txn_ptr = txn.get();
    active_transactions_[txn_id] = std::move(txn);
    return txn_ptr;
}

Transaction* TransactionManager::get_transaction(const txn_id_t& txn_id) {
    const std::scoped_lock<std::mutex> lock(manager_latch_);
    auto it = active_transactions_.find(txn_id);
    if (it == active_transactions_.end()) {
        return nullptr;
    }

    Transaction* const txn = it->second.get();
    if (!txn->is_terminal() && txn->is_expired(steady_clock::now())) {
        txn->set_state(TransactionState::ROLLED_BACK);
        txn->release_snapshots();
    }
    return txn;
}

Transaction* TransactionManager::find_live(const txn_id_t& txn_id) {
    auto it = active_transactions_.find(txn_id);
    if (it == active_transactions_.end()) {
        return nullptr;
    }
    Transaction* const txn = it->second.get();
    if (txn->is_terminal()) {
        return nullptr;
    }
    if (txn->is_expired(steady_clock::now())) {
        txn->set_state(TransactionState::ROLLED_BACK);
        txn->release_snapshots();
        return nullptr;
    }
    return txn;
}

std::optional<storage::Document> TransactionManager::read_in_transaction(const txn_id_t& txn_id,
                                                                         const std::string& path) {
    const std::scoped_lock<std::mutex> lock(manager_latch_);
    Transaction* const txn = find_live(txn_id);
    if (txn == nullptr) {
        throw std::invalid_argument("Invalid transaction ID");
    }

    auto& reads = txn->get_read_snapshot();
    const auto seen = reads.find(path);
    if (seen != reads.end()) {
        return seen->second;
    }

    std::optional<storage::Document> doc;
    const auto& global = txn->get_global_snapshot();
    const auto it = global.find(path);
    if (it != global.end()) {
        doc = it->second;
    }
    reads.emplace(path, doc);

    if (txn->get_state() == TransactionState::CREATED) {
        txn->set_state(TransactionState::ACTIVE);
    }
    return doc;
}

std::optional<std::string> TransactionManager::find_conflict(const txn_id_t& txn_id) {
    const std::scoped_lock<std::mutex> lock(manager_latch_);
    Transaction* const txn = find_live(txn_id);
    if (txn == nullptr) {
        throw std::invalid_argument("Invalid transaction ID");
    }

    for (const auto& [path, seen] : txn->get_read_snapshot()) {
        if (!storage::documents_equal(seen, store_.get(path))) {
            return path;
        }
    }
    return std::nullopt;
}

void TransactionManager::retire(const txn_id_t& txn_id, TransactionState state) {
    auto it = active_transactions_.find(txn_id);
    if (it == active_transactions_.end()) {
        return;
    }
    it->second->set_state(state);
    it->second->release_snapshots();
    static_cast<void>(active_transactions_.erase(it));
}

bool TransactionManager::commit_transaction(const txn_id_t& txn_id) {
    const std::scoped_lock<std::mutex> lock(manager_latch_);
    if (find_live(txn_id) == nullptr) {
        return false;
    }
    retire(txn_id, TransactionState::COMMITTED);
    return true;
}

bool TransactionManager::rollback_transaction(const txn_id_t& txn_id) {
    const std::scoped_lock<std::mutex> lock(manager_latch_);
    if (find_live(txn_id) == nullptr) {
        return false;
    }
    retire(txn_id, TransactionState::ROLLED_BACK);
    return true;
}

void TransactionManager::cleanup_transaction(const txn_id_t& txn_id) {
    const std::scoped_lock<std::mutex> lock(manager_latch_);
    auto it = active_transactions_.find(txn_id);
    if (it == active_transactions_.end()) {
        return;
    }
    it->second->release_snapshots();
    static_cast<void>(active_transactions_.erase(it));
}

size_t TransactionManager::active_count() {
    const std::scoped_lock<std::mutex> lock(manager_latch_);
    const auto now = steady_clock::now();
    size_t count = 0;
    for (const auto& [id, txn] : active_transactions_) {
        if (!txn->is_terminal() && !txn->is_expired(now)) {
            ++count;
        }
    }
    return count;
}

}  // namespace clouddoc::transaction
