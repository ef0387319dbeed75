#include "short_id.hpp"

#include <algorithm>
#include <array>
#include <random>
#include <stdexcept>

namespace blobkeep::util {

namespace {

constexpr char kAlphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int DigitOf(char c) {
  const char* end = kAlphabet + 58;
  const char* pos = std::find(kAlphabet, end, c);
  return pos == end ? -1 : static_cast<int>(pos - kAlphabet);
}

} // namespace

RandomSource DefaultRandomSource() {
  return [] {
    static thread_local std::mt19937 rng{std::random_device{}()};
    return static_cast<uint32_t>(rng());
  };
}

std::string EncodeShortId(const std::vector<uint8_t>& bytes) {
  std::size_t zeros = 0;
  while (zeros < bytes.size() && bytes[zeros] == 0) ++zeros;

  // base256 -> base58, digits stored little endian
  std::vector<uint8_t> digits;
  digits.reserve(bytes.size() * 138 / 100 + 1);

  for (std::size_t i = zeros; i < bytes.size(); ++i) {
    uint32_t carry = bytes[i];
    for (auto& digit : digits) {
      carry += static_cast<uint32_t>(digit) << 8;
      digit = static_cast<uint8_t>(carry % 58);
      carry /= 58;
    }
    while (carry > 0) {
      digits.push_back(static_cast<uint8_t>(carry % 58));
      carry /= 58;
    }
  }

  std::string out(zeros, kAlphabet[0]);
  out.reserve(zeros + digits.size());
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) out.push_back(kAlphabet[*it]);
  return out;
}

std::vector<uint8_t> DecodeShortId(std::string_view text) {
  std::size_t ones = 0;
  while (ones < text.size() && text[ones] == kAlphabet[0]) ++ones;

  // base58 -> base256, bytes stored little endian
  std::vector<uint8_t> bytes;
  for (std::size_t i = ones; i < text.size(); ++i) {
    const int value = DigitOf(text[i]);
    if (value < 0) throw std::invalid_argument("invalid base58 character in short id");

    uint32_t carry = static_cast<uint32_t>(value);
    for (auto& byte : bytes) {
      carry += static_cast<uint32_t>(byte) * 58;
      byte = static_cast<uint8_t>(carry & 0xFF);
      carry >>= 8;
    }
    while (carry > 0) {
      bytes.push_back(static_cast<uint8_t>(carry & 0xFF));
      carry >>= 8;
    }
  }

  std::vector<uint8_t> out(ones, 0);
  out.insert(out.end(), bytes.rbegin(), bytes.rend());
  return out;
}

std::string GenerateShortId(const RandomSource& source) {
  const uint32_t bits = source();

  std::vector<uint8_t> bytes(kShortIdBytes);
  for (std::size_t i = 0; i < kShortIdBytes; ++i) {
    bytes[i] = static_cast<uint8_t>(bits >> (8 * (kShortIdBytes - 1 - i)));
  }
  return EncodeShortId(bytes);
}

bool IsValidShortId(std::string_view text) {
  if (text.empty()) return false;
  return std::all_of(text.begin(), text.end(), [](char c) { return DigitOf(c) >= 0; });
}

} // namespace blobkeep::util
