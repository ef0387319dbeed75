#include "id_allocator.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace blobkeep::core {

using blobkeep::observability::IntField;
using blobkeep::observability::StringField;

IdAllocator::IdAllocator(std::shared_ptr<db::RecordIndex> index, util::RandomSource random, uint32_t max_attempts)
    : index_(std::move(index)), random_(std::move(random)), max_attempts_(max_attempts == 0 ? kDefaultMaxAttempts : max_attempts) {
  if (!index_) {
    throw std::invalid_argument("id allocator requires a record index");
  }
  if (!random_) {
    random_ = util::DefaultRandomSource();
  }
}

std::string IdAllocator::Allocate() {
  // 4 bytes -> 2^32 possible IDs
  for (uint32_t attempt = 1; attempt <= max_attempts_; ++attempt) {
    auto id = util::GenerateShortId(random_);

    if (!index_->Get(id).has_value()) {
      return id;
    }

    BLOBKEEP_LOG_DEBUG("Generated ID is already in use", {StringField("id", id), IntField("attempt", attempt)});
  }

  throw util::AllocationExhausted("no free item ID after " + std::to_string(max_attempts_) + " attempts");
}

} // namespace blobkeep::core
