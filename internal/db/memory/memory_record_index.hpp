#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/db/api/record_index.hpp"

namespace blobkeep::db::memory {

/*
  Process-local record index. Nothing survives Close().
*/
class MemoryRecordIndex final : public db::RecordIndex {
public:
  MemoryRecordIndex();

  std::optional<model::Item> Get(const std::string& id) override;
  Result Insert(const model::Item& item) override;
  Result Delete(const std::string& id) override;
  std::vector<model::Item> FindExpiredBefore(util::TimePoint cutoff) override;
  std::vector<std::string> ListIds() override;
  void Close() override;

private:
  void ThrowIfClosedLocked() const;

  std::mutex mutex_;
  std::unordered_map<std::string, model::Item> items_;
  bool closed_ = false;
};

}
