#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "crypto/hex.h"

namespace s3bulk {
namespace crypto {
namespace tests {

TEST(Hex, Encode) {
  const std::vector<uint8_t> in = {0x00, 0x01, 0x7f, 0x80, 0xab, 0xff};

  EXPECT_EQ("00017f80abff", Hex::Encode(in));
  EXPECT_EQ("", Hex::Encode(std::vector<uint8_t>()));
}

TEST(Hex, Decode) {
  const std::vector<uint8_t> expected = {0xde, 0xad, 0xbe, 0xef};

  EXPECT_EQ(expected, Hex::Decode("deadbeef"));
  EXPECT_EQ(expected, Hex::Decode("DEADBEEF"));
}

TEST(Hex, DecodeInvalid) {
  EXPECT_THROW(Hex::Decode("abc"), std::runtime_error);
  EXPECT_THROW(Hex::Decode("zz"), std::runtime_error);
}

}  // namespace tests
}  // namespace crypto
}  // namespace s3bulk
