#include "askdoc_core/index/document_lock_table.hpp"

namespace askdoc_core {

DocumentLockTable::Guard::Guard(DocumentLockTable &table, int document_id)
    : table_(&table), document_id_(document_id), slot_(table.acquire_slot(document_id)) {
  lock_ = std::unique_lock<std::mutex>(slot_->mutex);
}

DocumentLockTable::Guard::Guard(Guard &&other) noexcept
    : table_(other.table_),
      document_id_(other.document_id_),
      slot_(std::move(other.slot_)),
      lock_(std::move(other.lock_)) {
  other.table_ = nullptr;
}

DocumentLockTable::Guard::~Guard() {
  release();
}

void DocumentLockTable::Guard::release() {
  if (!table_) {
    return;
  }
  if (lock_.owns_lock()) {
    lock_.unlock();
  }
  slot_.reset();
  table_->release_slot(document_id_);
  table_ = nullptr;
}

std::shared_ptr<DocumentLockTable::Slot> DocumentLockTable::acquire_slot(int document_id) {
  std::lock_guard<std::mutex> lock(table_mutex_);
  auto &slot = slots_[document_id];
  if (!slot) {
    slot = std::make_shared<Slot>();
  }
  ++slot->users;
  return slot;
}

void DocumentLockTable::release_slot(int document_id) {
  std::lock_guard<std::mutex> lock(table_mutex_);
  auto it = slots_.find(document_id);
  if (it == slots_.end()) {
    return;
  }
  if (--it->second->users == 0) {
    slots_.erase(it);
  }
}

size_t DocumentLockTable::active_slots() const {
  std::lock_guard<std::mutex> lock(table_mutex_);
  return slots_.size();
}

}  // namespace askdoc_core
