#include <cstdint>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "crypto/hex.h"
#include "crypto/hmac_sha256.h"

namespace s3bulk {
namespace crypto {
namespace tests {

namespace {
struct KnownAnswer {
  const char *key;   // hex
  const char *data;  // hex
  const char *mac;
};

constexpr KnownAnswer TESTS[] = {
    // RFC 4231, test cases 1, 2 and 6

    {"0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b0b", "4869205468657265",
     "b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7"},

    {"4a656665",
     "7768617420646f2079612077616e7420666f72206e6f7468696e673f",
     "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843"},

    {"aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"
     "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"
     "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"
     "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa",
     "54657374205573696e67204c6172676572205468616e20426c6f636b2d53697a65204b"
     "6579202d2048617368204b6579204669727374",
     "60e431591ee0b67f0d8a26aacbf5b77f8e0bc6213728c5140546040f0ee37f54"},
};
}  // namespace

TEST(HmacSha256, KnownAnswers) {
  for (const auto &kat : TESTS) {
    const auto key = Hex::Decode(kat.key);
    const auto data = Hex::Decode(kat.data);
    uint8_t mac[HmacSha256::MAC_LEN];

    HmacSha256::Sign(key.data(), key.size(), data.data(), data.size(), mac);
    EXPECT_EQ(std::string(kat.mac), Hex::Encode(mac, HmacSha256::MAC_LEN))
        << "for kat = " << kat.data;
  }
}

TEST(HmacSha256, StringAndVectorForms) {
  uint8_t mac[HmacSha256::MAC_LEN];
  const std::string key = "Jefe";

  HmacSha256::Sign(key, "what do ya want for nothing?", mac);
  const auto chained = HmacSha256::Sign(
      std::vector<uint8_t>(key.begin(), key.end()),
      "what do ya want for nothing?");

  EXPECT_EQ(Hex::Encode(mac, HmacSha256::MAC_LEN), Hex::Encode(chained));
  EXPECT_EQ("5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843",
            Hex::Encode(chained));
}

}  // namespace tests
}  // namespace crypto
}  // namespace s3bulk
