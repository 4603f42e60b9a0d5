// base64_test.cpp
#include <gtest/gtest.h>

#include <string>

#include "iconsolve/util/base64.hpp"

using iconsolve::util::Bytes;
namespace base64 = iconsolve::util::base64;

namespace {
Bytes bytes_of(const std::string& s) { return Bytes(s.begin(), s.end()); }
}

// ========== RFC 4648 第 10 节的测试向量 ==========
TEST(Base64Test, EncodesRfcVectors) {
  EXPECT_EQ(base64::encode(bytes_of("")), "");
  EXPECT_EQ(base64::encode(bytes_of("f")), "Zg==");
  EXPECT_EQ(base64::encode(bytes_of("fo")), "Zm8=");
  EXPECT_EQ(base64::encode(bytes_of("foo")), "Zm9v");
  EXPECT_EQ(base64::encode(bytes_of("foob")), "Zm9vYg==");
  EXPECT_EQ(base64::encode(bytes_of("fooba")), "Zm9vYmE=");
  EXPECT_EQ(base64::encode(bytes_of("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, DecodesRfcVectors) {
  auto r = base64::decode("Zm9vYmE=");
  ASSERT_TRUE(r.has_value()) << r.error();
  EXPECT_EQ(r.value(), bytes_of("fooba"));

  auto empty = base64::decode("");
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty.value().empty());
}

// ========== 任意字节可逆，且编码是确定的 ==========
TEST(Base64Test, EveryByteValueSurvivesRoundTrip) {
  Bytes all;
  for (int i = 0; i < 256; ++i) all.push_back(static_cast<std::uint8_t>(i));

  std::string text = base64::encode(all);
  EXPECT_EQ(text, base64::encode(all));
  EXPECT_EQ(text.find_first_not_of(
                "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/="),
            std::string::npos);

  auto back = base64::decode(text);
  ASSERT_TRUE(back.has_value()) << back.error();
  EXPECT_EQ(back.value(), all);
}

TEST(Base64Test, RejectsMalformedInput) {
  EXPECT_FALSE(base64::decode("Zm9").has_value());       // 长度不是 4 的倍数
  EXPECT_FALSE(base64::decode("Zm9v!A==").has_value());  // 非字母表字符
  EXPECT_FALSE(base64::decode("Zg==Zm9v").has_value());  // 填充在中间
  EXPECT_FALSE(base64::decode("Z=g=").has_value());      // 填充后又出现数据
  EXPECT_FALSE(base64::decode("Zm9v\n").has_value());
  EXPECT_FALSE(base64::decode("QR==").has_value());      // 填充前的低位不为 0
  EXPECT_FALSE(base64::decode("Zm9=").has_value());
  EXPECT_TRUE(base64::decode("QQ==").has_value());

  auto r = base64::decode("@@@@");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), "invalid base64");
}
