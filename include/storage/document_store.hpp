/**
 * @file document_store.hpp
 * @brief In-memory path-keyed document storage
 */

#ifndef CLOUDDOC_STORAGE_DOCUMENT_STORE_HPP
#define CLOUDDOC_STORAGE_DOCUMENT_STORE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "storage/document.hpp"

namespace clouddoc::storage {

/**
 * @brief Emitted after a document is written or removed
 */
struct DocumentChange {
    std::string path;
    std::optional<Document> document;  // nullopt for a removal
};

using ChangeListener = std::function<void(const DocumentChange&)>;
using listener_id_t = uint64_t;

/* A document to store, or nullopt to remove the path */
using DocumentBatch = std::vector<std::pair<std::string, std::optional<Document>>>;

/**
 * @brief Thread-safe map from full document name to document.
 *
 * Every call is linearizable. Reads hand out copies, so callers never alias
 * stored state.
 */
class DocumentStore {
   public:
    struct Stats {
        std::atomic<uint64_t> reads{0};
        std::atomic<uint64_t> writes{0};
        std::atomic<uint64_t> deletes{0};
        std::atomic<uint64_t> notifications{0};
    };

    DocumentStore() = default;
    ~DocumentStore() = default;

    // Disable copy/move for document store (due to atomic stats)
    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;
    DocumentStore(DocumentStore&&) = delete;
    DocumentStore& operator=(DocumentStore&&) = delete;

    [[nodiscard]] std::optional<Document> get(const std::string& path) const;

    /**
     * @brief Insert or replace the document stored at path
     */
    void set(const std::string& path, Document doc);

    /**
     * @brief Remove the document at path
     * @return true if a document was removed
     */
    bool remove(const std::string& path);

    /**
     * @brief Apply a set of writes and removals under a single latch
     *
     * Listeners are told about the changes only once the whole batch is
     * visible. Removing an absent path produces no change.
     */
    void apply_batch(DocumentBatch batch);

    [[nodiscard]] bool exists(const std::string& path) const;

    /**
     * @brief Deep copy of every stored document, ordered by path
     */
    [[nodiscard]] std::map<std::string, Document> get_all_documents() const;

    /**
     * @brief Drop all documents without notifying listeners
     */
    void clear();

    [[nodiscard]] size_t size() const;

    /**
     * @brief Register a change listener
     *
     * Listeners run on the mutating thread after the store latch is released.
     * An exception escaping a listener is reported on stderr and otherwise
     * ignored.
     */
    [[nodiscard]] listener_id_t subscribe(ChangeListener listener);
    void unsubscribe(listener_id_t id);

    [[nodiscard]] const Stats& get_stats() const { return stats_; }

   private:
    void notify(const std::vector<DocumentChange>& changes);

    mutable std::mutex latch_;
    std::unordered_map<std::string, Document> documents_;

    std::mutex listener_latch_;
    std::map<listener_id_t, ChangeListener> listeners_;
    listener_id_t next_listener_id_ = 1;

    mutable Stats stats_;
};

}  // namespace clouddoc::storage

#endif  // CLOUDDOC_STORAGE_DOCUMENT_STORE_HPP
