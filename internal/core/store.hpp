#pragma once

#include <arrow/io/interfaces.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

#include "internal/core/expiry_reaper.hpp"
#include "internal/core/id_allocator.hpp"
#include "internal/db/api/record_index.hpp"
#include "internal/model/item.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/util/short_id.hpp"

namespace blobkeep::core {

inline constexpr const char* kDatabaseDir = "db";
inline constexpr const char* kStorageDir  = "data";

struct StoreOptions {
  std::filesystem::path base_dir;

  // Starts the expiry reaper and deletes expired items on Get.
  bool auto_cleanup = false;

  std::chrono::milliseconds sweep_interval = ExpiryReaper::kDefaultInterval;
  uint32_t                  id_max_attempts = IdAllocator::kDefaultMaxAttempts;

  // Repair leftovers of an earlier crash before serving requests.
  bool reconcile_on_open = true;

  std::string sqlite_synchronous = "NORMAL";

  // Injected collaborators. Null selects SQLite under <base>/db and
  // disk blobs under <base>/data.
  std::shared_ptr<db::RecordIndex>    index;
  std::shared_ptr<storage::BlobStore> blobs;
  util::RandomSource                  random;
};

struct ReconcileReport {
  std::size_t partial_writes   = 0;
  std::size_t orphan_blobs     = 0;
  std::size_t dangling_records = 0;
};

/*
  Store keeps an index of all Items as well as their payload files.

  Write protocol:
    Put    → allocate ID → insert record → write blob
    Delete → delete record → remove blob

  The record is the existence marker. A crash between the two steps
  leaves an orphan blob, never a record without a blob that readers
  could find. A failed blob write rolls the record back.

  Thread safety: Put/Get/GetFile/Delete may run concurrently with each
  other and with the expiry reaper. The two-step protocol is not atomic;
  a Get racing a Put on the same ID may see the record before the blob.
  Close waits for calls already in progress to finish; calls arriving
  after it throw util::InvalidState.
*/
class Store {
 public:
  static std::unique_ptr<Store> Open(StoreOptions options);
  static std::unique_ptr<Store> Open(const std::filesystem::path& base_dir, bool auto_cleanup);

  ~Store();

  Store(const Store&)            = delete;
  Store& operator=(const Store&) = delete;

  /*
    Stores a new Item. The ID is assigned here; any ID set by the caller
    is overwritten. `payload` is read to the end and closed, also when
    the operation fails.
  */
  std::string Put(model::Item item, const std::shared_ptr<arrow::io::InputStream>& payload);

  // Throws util::NotFound if there is no live Item, which includes an
  // Item that expired and was deleted by this call.
  model::Item Get(const std::string& id);

  // Raw access to an Item's payload; no expiry check. Caller closes it.
  std::shared_ptr<arrow::io::RandomAccessFile> GetFile(const std::string& id);

  // Deleting an Item that is already gone succeeds.
  void Delete(const std::string& id);

  // One synchronous expiry sweep. Returns the number of Items deleted.
  std::size_t SweepExpired();

  // Stops the reaper, then closes the record index. Later calls are no-ops.
  void Close();

  bool IsClosed() const;
  bool CleanupEnabled() const {
    return cleanup_;
  }

  const std::filesystem::path& BaseDir() const {
    return base_dir_;
  }
  std::filesystem::path DatabaseDir() const;
  std::filesystem::path StorageDir() const;

  db::RecordIndex& Index() {
    return *index_;
  }

  const ReconcileReport& LastReconcile() const {
    return reconcile_report_;
  }

 private:
  Store(const StoreOptions& options, std::shared_ptr<db::RecordIndex> index, std::shared_ptr<storage::BlobStore> blobs);

  // Shared hold on the open Store for the duration of one call.
  std::shared_lock<std::shared_mutex> LockOpen() const;

  // Unified delete path. Returns false if the record was already gone.
  bool DeleteItem(const std::string& id);

  std::size_t DeleteExpired();

  void RollbackInsert(const std::string& id);

  ReconcileReport Reconcile();

  std::filesystem::path               base_dir_;
  bool                                cleanup_;
  std::shared_ptr<db::RecordIndex>    index_;
  std::shared_ptr<storage::BlobStore> blobs_;
  IdAllocator                         allocator_;

  std::unique_ptr<ExpiryReaper> reaper_;
  ReconcileReport               reconcile_report_;

  std::mutex                close_mutex_;
  mutable std::shared_mutex state_mutex_;
  bool                      closed_ = false;
};

} // namespace blobkeep::core
