#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/model/item.hpp"
#include "internal/util/time.hpp"

namespace blobkeep::db {

/*
  Record index abstraction.

  Holds one Item record per ID. The store, the ID allocator and the
  expiry reaper only ever talk to this interface.

  CRITICAL GUARANTEES:

  - Each single-record mutation is atomic
  - Insert of an existing ID fails with AlreadyExists, never overwrites
  - Delete of an absent ID reports NotFound
  - Safe to call from several threads at once

  Reads throw util::StorageEngineError on engine failure; an absent
  record is not a failure.
*/

class RecordIndex {
 public:
  virtual ~RecordIndex() = default;

  virtual std::optional<model::Item> Get(const std::string& id) = 0;

  virtual Result Insert(const model::Item& item) = 0;

  virtual Result Delete(const std::string& id) = 0;

  // All records with expires strictly before `cutoff`.
  virtual std::vector<model::Item> FindExpiredBefore(util::TimePoint cutoff) = 0;

  // Every ID currently indexed. Used by startup reconciliation.
  virtual std::vector<std::string> ListIds() = 0;

  // Releases engine resources. Further calls are invalid.
  virtual void Close() = 0;
};

} // namespace blobkeep::db
