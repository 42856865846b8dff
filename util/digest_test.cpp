#include "util/digest.hpp"

#include "gtest/gtest.h"

namespace {

// NOLINTNEXTLINE
TEST(Digest, KnownDigests) {
  EXPECT_EQ(util::Sha256Hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(util::Sha256Hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// NOLINTNEXTLINE
TEST(Digest, IncrementalMatchesOneShot) {
  std::string data(1000, 'q');
  util::Sha256 hasher;
  hasher.Update(data.substr(0, 3));
  hasher.Update(data.substr(3, 500));
  hasher.Update(data.substr(503));
  EXPECT_EQ(hasher.HexDigest(), util::Sha256Hex(data));
}

}  // namespace
