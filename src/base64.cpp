#include "iconsolve/util/base64.hpp"

#include <array>
#include <cstdint>
#include <utility>

namespace iconsolve::util::base64 {

namespace {
constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr std::uint8_t kInvalid = 0xFF;

constexpr std::array<std::uint8_t, 256> make_table() {
  std::array<std::uint8_t, 256> t{};
  for (auto& v : t) v = kInvalid;
  for (std::uint8_t i = 0; i < 64; ++i) {
    t[static_cast<unsigned char>(kAlphabet[i])] = i;
  }
  return t;
}

constexpr auto kTable = make_table();
}

std::string encode(const Bytes& data) {
  std::string out;
  out.reserve((data.size() + 2) / 3 * 4);

  std::size_t i = 0;
  for (; i + 3 <= data.size(); i += 3) {
    std::uint32_t n = (std::uint32_t(data[i]) << 16) |
                      (std::uint32_t(data[i + 1]) << 8) | data[i + 2];
    out.push_back(kAlphabet[(n >> 18) & 0x3F]);
    out.push_back(kAlphabet[(n >> 12) & 0x3F]);
    out.push_back(kAlphabet[(n >> 6) & 0x3F]);
    out.push_back(kAlphabet[n & 0x3F]);
  }

  std::size_t rest = data.size() - i;
  if (rest == 1) {
    std::uint32_t n = std::uint32_t(data[i]) << 16;
    out.push_back(kAlphabet[(n >> 18) & 0x3F]);
    out.push_back(kAlphabet[(n >> 12) & 0x3F]);
    out.append("==");
  } else if (rest == 2) {
    std::uint32_t n = (std::uint32_t(data[i]) << 16) | (std::uint32_t(data[i + 1]) << 8);
    out.push_back(kAlphabet[(n >> 18) & 0x3F]);
    out.push_back(kAlphabet[(n >> 12) & 0x3F]);
    out.push_back(kAlphabet[(n >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

Result<Bytes> decode(std::string_view text) {
  if (text.size() % 4 != 0) return Result<Bytes>::err("invalid base64");

  std::size_t pad = 0;
  if (!text.empty() && text.back() == '=') ++pad;
  if (text.size() >= 2 && text[text.size() - 2] == '=') ++pad;

  Bytes out;
  out.reserve(text.size() / 4 * 3);

  for (std::size_t i = 0; i < text.size(); i += 4) {
    bool last = i + 4 == text.size();
    std::uint32_t n = 0;
    for (std::size_t k = 0; k < 4; ++k) {
      char c = text[i + k];
      // 填充只允许出现在最后一组的末尾
      if (c == '=') {
        if (!last || k < 4 - pad) return Result<Bytes>::err("invalid base64");
        n <<= 6;
        continue;
      }
      std::uint8_t v = kTable[static_cast<unsigned char>(c)];
      if (v == kInvalid) return Result<Bytes>::err("invalid base64");
      n = (n << 6) | v;
    }
    // 填充前被丢弃的低位必须为 0（规范编码）
    if (last && pad == 1 && (n & 0xFF) != 0) return Result<Bytes>::err("invalid base64");
    if (last && pad == 2 && (n & 0xFFFF) != 0) return Result<Bytes>::err("invalid base64");
    out.push_back(static_cast<std::uint8_t>((n >> 16) & 0xFF));
    if (!last || pad < 2) out.push_back(static_cast<std::uint8_t>((n >> 8) & 0xFF));
    if (!last || pad < 1) out.push_back(static_cast<std::uint8_t>(n & 0xFF));
  }
  return Result<Bytes>::ok(std::move(out));
}

} // namespace iconsolve::util::base64
