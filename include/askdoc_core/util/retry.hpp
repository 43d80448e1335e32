#pragma once

#include <chrono>
#include <iostream>
#include <thread>
#include <type_traits>

#include "askdoc_core/errors.hpp"

namespace askdoc_core {

struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds initial_backoff{200};
};

/**
 * @brief Runs `call` until it succeeds or the attempts are used up.
 *
 * Only external-service failures (EmbeddingUnavailableError, SynthesisError)
 * are retried; the wait doubles after every failed attempt. Any other
 * exception, and the last external failure, propagates unchanged.
 */
template <typename Call>
auto retry_with_backoff(const RetryPolicy &policy, const char *operation, Call &&call)
    -> std::invoke_result_t<Call &> {
  const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
  auto backoff = policy.initial_backoff;

  for (int attempt = 1;; ++attempt) {
    try {
      return call();
    } catch (const EmbeddingUnavailableError &e) {
      if (attempt >= attempts) {
        throw;
      }
      std::cerr << "Warning: " << operation << " failed (attempt " << attempt << "/" << attempts
                << "): " << e.what() << std::endl;
    } catch (const SynthesisError &e) {
      if (attempt >= attempts) {
        throw;
      }
      std::cerr << "Warning: " << operation << " failed (attempt " << attempt << "/" << attempts
                << "): " << e.what() << std::endl;
    }
    if (backoff.count() > 0) {
      std::this_thread::sleep_for(backoff);
    }
    backoff *= 2;
  }
}

}  // namespace askdoc_core
