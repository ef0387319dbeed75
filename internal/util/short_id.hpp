#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace blobkeep::util {

/*
  Short ID helpers

  Item IDs are 4 random bytes rendered as Base58 (Bitcoin alphabet).
  The alphabet leaves out 0, O, I and l, and contains nothing that is
  unsafe in a URL path segment or a file name.
*/

inline constexpr std::size_t kShortIdBytes = 4;

// Produces 32 random bits per call.
using RandomSource = std::function<uint32_t()>;

RandomSource DefaultRandomSource();

std::string          EncodeShortId(const std::vector<uint8_t>& bytes);
std::vector<uint8_t> DecodeShortId(std::string_view text);

// Draws kShortIdBytes from `source` and encodes them.
std::string GenerateShortId(const RandomSource& source);

bool IsValidShortId(std::string_view text);

} // namespace blobkeep::util
