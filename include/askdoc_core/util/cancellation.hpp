#pragma once

#include <atomic>

namespace askdoc_core {

// Set from any thread; polled by long-running operations at safe points.
class CancellationToken {
 public:
  void cancel() noexcept {
    cancelled_.store(true, std::memory_order_release);
  }

  bool is_cancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace askdoc_core
