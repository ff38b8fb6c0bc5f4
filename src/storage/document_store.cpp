/**
 * @file document_store.cpp
 * @brief In-memory document storage implementation
 *
 * @defgroup storage Document Storage
 * @{
 */

#include "storage/document_store.hpp"

#include <exception>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clouddoc::storage {

std::optional<Document> DocumentStore::get(const std::string& path) const {
    const std::scoped_lock<std::mutex> lock(latch_);
    static_cast<void>(stats_.reads.fetch_add(1));
    const auto it = documents_.find(path);
    if (it == documents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void DocumentStore::set(const std::string& path, Document doc) {
    std::vector<DocumentChange> changes{DocumentChange{path, doc}};
    {
        const std::scoped_lock<std::mutex> lock(latch_);
        documents_[path] = std::move(doc);
        static_cast<void>(stats_.writes.fetch_add(1));
    }
    notify(changes);
}

bool DocumentStore::remove(const std::string& path) {
    {
        const std::scoped_lock<std::mutex> lock(latch_);
        if (documents_.erase(path) == 0) {
            return false;
        }
        static_cast<void>(stats_.deletes.fetch_add(1));
    }
    notify({DocumentChange{path, std::nullopt}});
    return true;
}

void DocumentStore::apply_batch(DocumentBatch batch) {
    std::vector<DocumentChange> changes;
    changes.reserve(batch.size());
    {
        const std::scoped_lock<std::mutex> lock(latch_);
        for (auto& [path, doc] : batch) {
            if (doc.has_value()) {
                documents_[path] = *doc;
                static_cast<void>(stats_.writes.fetch_add(1));
                changes.push_back(DocumentChange{std::move(path), std::move(doc)});
            } else if (documents_.erase(path) > 0) {
                static_cast<void>(stats_.deletes.fetch_add(1));
                changes.push_back(DocumentChange{std::move(path), std::nullopt});
            }
        }
    }
    notify(changes);
}

bool DocumentStore::exists(const std::string& path) const {
    const std::scoped_lock<std::mutex> lock(latch_);
    return documents_.find(path) != documents_.end();
}

std::map<std::string, Document> DocumentStore::get_all_documents() const {
    const std::scoped_lock<std::mutex> lock(latch_);
    static_cast<void>(stats_.reads.fetch_add(documents_.size()));
    return {documents_.begin(), documents_.end()};
}

void DocumentStore::clear() {
    const std::scoped_lock<std::mutex> lock(latch_);
    documents_.clear();
}

size_t DocumentStore::size() const {
    const std::scoped_lock<std::mutex> lock(latch_);
    return documents_.size();
}

listener_id_t DocumentStore::subscribe(ChangeListener listener) {
    const std::scoped_lock<std::mutex> lock(listener_latch_);
    const listener_id_t id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void DocumentStore::unsubscribe(listener_id_t id) {
    const std::scoped_lock<std::mutex> lock(listener_latch_);
    static_cast<void>(listeners_.erase(id));
}

void DocumentStore::notify(const std::vector<DocumentChange>& changes) {
    if (changes.empty()) {
        return;
    }
    std::vector<ChangeListener> targets;
    {
        const std::scoped_lock<std::mutex> lock(listener_latch_);
        targets.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            targets.push_back(listener);
        }
    }

    for (const auto& change : changes) {
        for (const auto& listener : targets) {
            static_cast<void>(stats_.notifications.fetch_add(1));
            try {
                listener(change);
            } catch (const std::exception& e) {
                std::cerr << "Change listener failed for " << change.path << ": " << e.what()
                          << "\n";
            }
        }
    }
}

}  // namespace clouddoc::storage

/** @} */ /* storage */
