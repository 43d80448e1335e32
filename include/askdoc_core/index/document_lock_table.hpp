#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>

namespace askdoc_core {

/**
 * @brief Hands out one mutex per document id.
 *
 * Slots are created on first use and dropped once no guard refers to them,
 * so the table only grows with the number of documents being mutated at the
 * same time.
 */
class DocumentLockTable {
 private:
  struct Slot {
    std::mutex mutex;
    size_t users = 0;
  };

 public:
  class Guard {
   public:
    Guard(DocumentLockTable &table, int document_id);
    ~Guard();

    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;
    Guard(Guard &&other) noexcept;
    Guard &operator=(Guard &&) = delete;

   private:
    void release();

    DocumentLockTable *table_;
    int document_id_;
    std::shared_ptr<Slot> slot_;
    std::unique_lock<std::mutex> lock_;
  };

  DocumentLockTable() = default;
  DocumentLockTable(const DocumentLockTable &) = delete;
  DocumentLockTable &operator=(const DocumentLockTable &) = delete;

  // Blocks until no other guard holds the document.
  Guard lock(int document_id) {
    return Guard(*this, document_id);
  }

  // Number of documents that currently have a slot. Used by tests.
  size_t active_slots() const;

 private:
  std::shared_ptr<Slot> acquire_slot(int document_id);
  void release_slot(int document_id);

  mutable std::mutex table_mutex_;
  std::unordered_map<int, std::shared_ptr<Slot>> slots_;
};

}  // namespace askdoc_core
