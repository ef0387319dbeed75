#include "memory_record_index.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace blobkeep::db::memory {

MemoryRecordIndex::MemoryRecordIndex() = default;

void MemoryRecordIndex::ThrowIfClosedLocked() const {
  if (closed_) throw util::StorageEngineError("memory index is closed");
}

std::optional<model::Item> MemoryRecordIndex::Get(const std::string& id) {
  std::lock_guard lock(mutex_);
  ThrowIfClosedLocked();

  auto it = items_.find(id);
  if (it == items_.end()) return std::nullopt;
  return it->second;
}

Result MemoryRecordIndex::Insert(const model::Item& item) {
  std::lock_guard lock(mutex_);
  if (closed_) return Result::Err(ErrorCode::Closed, "memory index is closed");

  if (items_.contains(item.id)) return Result::Err(ErrorCode::AlreadyExists, "item " + item.id + " exists");
  items_.emplace(item.id, item);
  return Result::Ok();
}

Result MemoryRecordIndex::Delete(const std::string& id) {
  std::lock_guard lock(mutex_);
  if (closed_) return Result::Err(ErrorCode::Closed, "memory index is closed");

  if (items_.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "no item " + id);
  return Result::Ok();
}

std::vector<model::Item> MemoryRecordIndex::FindExpiredBefore(util::TimePoint cutoff) {
  std::lock_guard lock(mutex_);
  ThrowIfClosedLocked();

  std::vector<model::Item> out;
  for (const auto& [_, item] : items_) {
    if (item.expires < cutoff) out.push_back(item);
  }
  std::sort(out.begin(), out.end(), [](const model::Item& a, const model::Item& b) { return a.expires < b.expires; });
  return out;
}

std::vector<std::string> MemoryRecordIndex::ListIds() {
  std::lock_guard lock(mutex_);
  ThrowIfClosedLocked();

  std::vector<std::string> ids;
  ids.reserve(items_.size());
  for (const auto& [id, _] : items_) {
    ids.push_back(id);
  }
  return ids;
}

void MemoryRecordIndex::Close() {
  std::lock_guard lock(mutex_);
  closed_ = true;
  items_.clear();
}

} // namespace blobkeep::db::memory
