#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include "askdoc_core/errors.hpp"
#include "askdoc_core/util/retry.hpp"

namespace askdoc_core {

class RetryTest : public ::testing::Test {
 protected:
  RetryPolicy policy_{3, std::chrono::milliseconds(0)};
};

TEST_F(RetryTest, Success_OnFirstAttempt_CallsOnce) {
  int calls = 0;

  int result = retry_with_backoff(policy_, "test", [&calls]() {
    ++calls;
    return 42;
  });

  EXPECT_EQ(result, 42);
  EXPECT_EQ(calls, 1);
}

TEST_F(RetryTest, TransientEmbeddingFailure_IsRetried) {
  int calls = 0;

  int result = retry_with_backoff(policy_, "embed", [&calls]() {
    if (++calls < 3) {
      throw EmbeddingUnavailableError("timeout");
    }
    return 7;
  });

  EXPECT_EQ(result, 7);
  EXPECT_EQ(calls, 3);
}

TEST_F(RetryTest, PersistentFailure_RethrowsAfterMaxAttempts) {
  int calls = 0;

  EXPECT_THROW(retry_with_backoff(policy_, "synthesize",
                                  [&calls]() -> int {
                                    ++calls;
                                    throw SynthesisError("model down");
                                  }),
               SynthesisError);
  EXPECT_EQ(calls, 3);
}

TEST_F(RetryTest, NonTransientError_IsNotRetried) {
  int calls = 0;

  EXPECT_THROW(retry_with_backoff(policy_, "insert",
                                  [&calls]() -> int {
                                    ++calls;
                                    throw DimensionMismatchError("bad vector");
                                  }),
               DimensionMismatchError);
  EXPECT_EQ(calls, 1);
}

TEST_F(RetryTest, ZeroAttempts_StillRunsOnce) {
  int calls = 0;
  RetryPolicy policy{0, std::chrono::milliseconds(0)};

  EXPECT_THROW(retry_with_backoff(policy, "embed",
                                  [&calls]() -> int {
                                    ++calls;
                                    throw EmbeddingUnavailableError("down");
                                  }),
               EmbeddingUnavailableError);
  EXPECT_EQ(calls, 1);
}

TEST_F(RetryTest, VoidCalls_AreSupported) {
  int calls = 0;

  retry_with_backoff(policy_, "void", [&calls]() {
    if (++calls == 1) {
      throw EmbeddingUnavailableError("once");
    }
  });

  EXPECT_EQ(calls, 2);
}

}  // namespace askdoc_core
