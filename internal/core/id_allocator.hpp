#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/record_index.hpp"
#include "internal/util/short_id.hpp"

namespace blobkeep::core {

/*
  Hands out short random IDs that no live record uses.

  Each attempt draws 32 random bits, renders them as a short ID and
  probes the record index once. Nothing is written; the caller owns
  the insert. Two concurrent allocations can still pick the same
  free ID, in which case the later insert fails with AlreadyExists.
*/
class IdAllocator {
 public:
  static constexpr uint32_t kDefaultMaxAttempts = 32;

  IdAllocator(std::shared_ptr<db::RecordIndex> index, util::RandomSource random = util::DefaultRandomSource(),
              uint32_t max_attempts = kDefaultMaxAttempts);

  // Throws util::AllocationExhausted when every attempt collided, or
  // util::StorageEngineError when a probe fails.
  std::string Allocate();

  uint32_t MaxAttempts() const {
    return max_attempts_;
  }

 private:
  std::shared_ptr<db::RecordIndex> index_;
  util::RandomSource               random_;
  uint32_t                         max_attempts_;
};

} // namespace blobkeep::core
