#include <gtest/gtest.h>

#include "askdoc_core/util/content_hash.hpp"

namespace askdoc_core {

TEST(ContentHashTest, Sha256_MatchesKnownDigests) {
  EXPECT_EQ(compute_content_hash(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(compute_content_hash("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ContentHashTest, DependsOnEveryByte) {
  EXPECT_EQ(compute_content_hash("same text"), compute_content_hash("same text"));
  EXPECT_NE(compute_content_hash("same text"), compute_content_hash("same text "));
}

}  // namespace askdoc_core
