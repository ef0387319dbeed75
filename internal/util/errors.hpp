#pragma once

#include <stdexcept>
#include <string>

namespace blobkeep::util {

/*
  Central error types.

  Store operations report every failure as one of these.
  NotFound is the only one callers should treat as routine.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The ID allocator ran out of attempts before finding a free ID.
class AllocationExhausted : public std::runtime_error {
 public:
  explicit AllocationExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Any failure reported by the record index engine.
class StorageEngineError : public std::runtime_error {
 public:
  explicit StorageEngineError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Filesystem failure on blob files or store directories.
class IOError : public std::runtime_error {
 public:
  explicit IOError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace blobkeep::util
