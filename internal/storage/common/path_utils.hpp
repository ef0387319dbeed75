#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "internal/util/short_id.hpp"

namespace blobkeep::storage::common {

inline constexpr const char* kTempSuffix = ".tmp";

// Rejects anything that could escape the blob directory.
inline bool IsSafeBlobId(const std::string& id) {
  if (id.empty() || id == "." || id == "..") return false;
  for (char c : id) {
    if (c == '/' || c == '\\' || c == '\0') return false;
  }
  return true;
}

inline void ValidateBlobId(const std::string& id) {
  if (!IsSafeBlobId(id)) {
    throw std::invalid_argument("blob id is not a plain file name: '" + id + "'");
  }
}

// Blob files are named exactly by item ID.
inline std::filesystem::path BlobPath(const std::filesystem::path& root, const std::string& id) {
  ValidateBlobId(id);
  return root / id;
}

inline std::filesystem::path TempBlobPath(const std::filesystem::path& root, const std::string& id) {
  ValidateBlobId(id);
  return root / (id + kTempSuffix);
}

inline bool IsTempBlobName(const std::string& name) {
  const std::string suffix = kTempSuffix;
  return name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// A temp file this store could have written: "<short id>.tmp".
inline bool IsPartialWriteName(const std::string& name) {
  if (!IsTempBlobName(name)) return false;
  const std::string suffix = kTempSuffix;
  return util::IsValidShortId(name.substr(0, name.size() - suffix.size()));
}

} // namespace blobkeep::storage::common
