#include "store.hpp"

#include <optional>
#include <stdexcept>
#include <system_error>
#include <unordered_set>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_record_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/disk_blob_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace blobkeep::core {

using blobkeep::observability::BoolField;
using blobkeep::observability::IntField;
using blobkeep::observability::StringField;

namespace {

constexpr const char* kIndexFile = "index.sqlite";

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + ": " + db::ToString(result.code);
  if (!result.message.empty()) {
    message += " (" + result.message + ")";
  }
  throw util::StorageEngineError(message);
}

void CreateDirectory(const std::filesystem::path& dir) {
  std::error_code ec;
  if (std::filesystem::exists(dir, ec)) {
    return;
  }

  std::filesystem::create_directory(dir, ec);
  if (!ec) {
    std::filesystem::permissions(dir, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace, ec);
  }
  if (ec) {
    BLOBKEEP_LOG_ERROR("Cannot create directory", {StringField("directory", dir.string()), StringField("error", ec.message())});
    throw util::IOError("cannot create directory " + dir.string() + ": " + ec.message());
  }
}

// Put owns the payload stream on every path, including early failures.
void CloseStream(const std::shared_ptr<arrow::io::InputStream>& stream) {
  if (!stream || stream->closed()) {
    return;
  }
  auto status = stream->Close();
  if (!status.ok()) {
    BLOBKEEP_LOG_WARN("Failed to close payload stream", {StringField("error", status.ToString())});
  }
}

} // namespace

// ------------------------------------------------------------------
// Open / Close
// ------------------------------------------------------------------

std::unique_ptr<Store> Store::Open(const std::filesystem::path& base_dir, bool auto_cleanup) {
  StoreOptions options;
  options.base_dir     = base_dir;
  options.auto_cleanup = auto_cleanup;
  return Open(std::move(options));
}

std::unique_ptr<Store> Store::Open(StoreOptions options) {
  if (options.base_dir.empty()) {
    throw std::invalid_argument("store base directory must not be empty");
  }

  BLOBKEEP_LOG_INFO("Opening Store", {StringField("directory", options.base_dir.string()), BoolField("auto_cleanup", options.auto_cleanup)});

  for (const auto& dir : {options.base_dir, options.base_dir / kDatabaseDir, options.base_dir / kStorageDir}) {
    CreateDirectory(dir);
  }

  auto index = options.index;
  if (!index) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>((options.base_dir / kDatabaseDir / kIndexFile).string(), options.sqlite_synchronous);
    index          = std::make_shared<db::sqlite::SqliteRecordIndex>(std::move(sqlite_db));
  }

  auto blobs = options.blobs;
  if (!blobs) {
    blobs = std::make_shared<storage::DiskBlobStore>(options.base_dir / kStorageDir);
  }

  std::unique_ptr<Store> store(new Store(options, std::move(index), std::move(blobs)));

  if (options.reconcile_on_open) {
    try {
      store->reconcile_report_ = store->Reconcile();
    } catch (const std::exception& e) {
      BLOBKEEP_LOG_ERROR("Store reconciliation failed", {StringField("error", e.what())});
      store->Close();
      throw;
    }
  }

  if (store->cleanup_) {
    store->reaper_ = std::make_unique<ExpiryReaper>([raw = store.get()] { return raw->SweepExpired(); }, options.sweep_interval);
    store->reaper_->Start();
  }

  return store;
}

Store::Store(const StoreOptions& options, std::shared_ptr<db::RecordIndex> index, std::shared_ptr<storage::BlobStore> blobs)
    : base_dir_(options.base_dir),
      cleanup_(options.auto_cleanup),
      index_(std::move(index)),
      blobs_(std::move(blobs)),
      allocator_(index_, options.random, options.id_max_attempts) {
}

Store::~Store() {
  try {
    Close();
  } catch (const std::exception& e) {
    BLOBKEEP_LOG_ERROR("Closing Store failed", {StringField("error", e.what())});
  }
}

void Store::Close() {
  std::lock_guard close_lock(close_mutex_);
  if (IsClosed()) {
    return;
  }

  BLOBKEEP_LOG_INFO("Closing Store", {StringField("directory", base_dir_.string())});

  // the reaper sweeps under a shared lock, so stop it before going exclusive
  if (reaper_) {
    reaper_->Stop();
  }

  // drains Put/Get/GetFile/Delete calls still running
  std::unique_lock lock(state_mutex_);
  closed_ = true;
  index_->Close();
}

bool Store::IsClosed() const {
  std::shared_lock lock(state_mutex_);
  return closed_;
}

std::shared_lock<std::shared_mutex> Store::LockOpen() const {
  std::shared_lock lock(state_mutex_);
  if (closed_) {
    throw util::InvalidState("store is closed");
  }
  return lock;
}

std::filesystem::path Store::DatabaseDir() const {
  return base_dir_ / kDatabaseDir;
}

std::filesystem::path Store::StorageDir() const {
  return base_dir_ / kStorageDir;
}

// ------------------------------------------------------------------
// Put
// ------------------------------------------------------------------

std::string Store::Put(model::Item item, const std::shared_ptr<arrow::io::InputStream>& payload) {
  if (!payload) {
    throw std::invalid_argument("payload stream must not be null");
  }

  BLOBKEEP_LOG_DEBUG("Requested insertion of Item into the Store");

  std::shared_lock<std::shared_mutex> lock;
  try {
    lock = LockOpen();
  } catch (const util::InvalidState&) {
    BLOBKEEP_LOG_WARN("Rejected insertion into closed Store");
    CloseStream(payload);
    throw;
  }

  try {
    item.id = allocator_.Allocate();
  } catch (const std::exception& e) {
    BLOBKEEP_LOG_ERROR("Failed to create an ID for a new Item", {StringField("error", e.what())});
    CloseStream(payload);
    throw;
  }

  BLOBKEEP_LOG_DEBUG("Insert Item with assigned ID", {StringField("id", item.id)});

  const auto inserted = index_->Insert(item);
  if (!inserted) {
    BLOBKEEP_LOG_ERROR("Failed to insert Item into database",
                       {StringField("id", item.id), StringField("error", inserted.message)});
    CloseStream(payload);
    ThrowIfDbError(inserted, "insert item " + item.id);
  }

  try {
    const auto bytes = blobs_->Write(item.id, payload);
    BLOBKEEP_LOG_DEBUG("Stored Item payload", {StringField("id", item.id), IntField("bytes", static_cast<int64_t>(bytes))});
  } catch (const std::exception& e) {
    BLOBKEEP_LOG_ERROR("Failed to write Item's file", {StringField("id", item.id), StringField("error", e.what())});
    CloseStream(payload);
    RollbackInsert(item.id);
    throw;
  }

  return item.id;
}

void Store::RollbackInsert(const std::string& id) {
  const auto removed = index_->Delete(id);
  if (!removed && !removed.Is(db::ErrorCode::NotFound)) {
    BLOBKEEP_LOG_ERROR("Rollback of Item record failed, record has no file",
                       {StringField("id", id), StringField("error", removed.message)});
  }

  try {
    blobs_->Remove(id);
  } catch (const std::exception& e) {
    BLOBKEEP_LOG_ERROR("Rollback of Item file failed", {StringField("id", id), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------------
// Get / GetFile
// ------------------------------------------------------------------

model::Item Store::Get(const std::string& id) {
  const auto lock = LockOpen();
  BLOBKEEP_LOG_DEBUG("Requested Item from Store", {StringField("id", id)});

  if (!storage::common::IsSafeBlobId(id)) {
    throw util::NotFound("no Item found for ID '" + id + "'");
  }

  std::optional<model::Item> item;
  try {
    item = index_->Get(id);
  } catch (const std::exception& e) {
    BLOBKEEP_LOG_ERROR("Requesting Item failed", {StringField("id", id), StringField("error", e.what())});
    throw;
  }

  if (!item) {
    BLOBKEEP_LOG_DEBUG("Requested Item was not found", {StringField("id", id)});
    throw util::NotFound("no Item found for ID '" + id + "'");
  }

  if (cleanup_ && item->expires <= util::Now()) {
    BLOBKEEP_LOG_INFO("Requested Item is expired, will be deleted",
                      {StringField("id", id), StringField("expires", util::FormatUtc(item->expires))});

    try {
      DeleteItem(id);
    } catch (const std::exception& e) {
      BLOBKEEP_LOG_ERROR("Failed to delete expired Item", {StringField("id", id), StringField("error", e.what())});
      throw;
    }

    throw util::NotFound("Item '" + id + "' has expired");
  }

  return *item;
}

std::shared_ptr<arrow::io::RandomAccessFile> Store::GetFile(const std::string& id) {
  const auto lock = LockOpen();

  if (!storage::common::IsSafeBlobId(id)) {
    throw util::NotFound("no Item found for ID '" + id + "'");
  }
  return blobs_->Open(id);
}

// ------------------------------------------------------------------
// Delete
// ------------------------------------------------------------------

void Store::Delete(const std::string& id) {
  const auto lock = LockOpen();
  BLOBKEEP_LOG_DEBUG("Requested deletion of Item", {StringField("id", id)});

  if (!storage::common::IsSafeBlobId(id)) {
    throw util::NotFound("no Item found for ID '" + id + "'");
  }
  DeleteItem(id);
}

bool Store::DeleteItem(const std::string& id) {
  const auto removed = index_->Delete(id);
  if (removed.Is(db::ErrorCode::NotFound)) {
    // another deleter got there first and owns the file removal
    BLOBKEEP_LOG_DEBUG("Item was already deleted", {StringField("id", id)});
    return false;
  }
  if (!removed) {
    BLOBKEEP_LOG_ERROR("Failed to delete Item from database", {StringField("id", id), StringField("error", removed.message)});
    ThrowIfDbError(removed, "delete item " + id);
  }

  try {
    if (!blobs_->Remove(id)) {
      BLOBKEEP_LOG_WARN("Deleted Item had no file", {StringField("id", id)});
    }
  } catch (const std::exception& e) {
    BLOBKEEP_LOG_ERROR("Failed to delete Item's file", {StringField("id", id), StringField("error", e.what())});
    throw;
  }

  return true;
}

// ------------------------------------------------------------------
// Expiry
// ------------------------------------------------------------------

std::size_t Store::SweepExpired() {
  const auto lock = LockOpen();
  return DeleteExpired();
}

std::size_t Store::DeleteExpired() {
  const auto expired = index_->FindExpiredBefore(util::Now());

  std::size_t deleted = 0;
  for (const auto& item : expired) {
    BLOBKEEP_LOG_DEBUG("Delete expired Item", {StringField("id", item.id)});
    if (DeleteItem(item.id)) {
      ++deleted;
    }
  }
  return deleted;
}

// ------------------------------------------------------------------
// Reconciliation
// ------------------------------------------------------------------

ReconcileReport Store::Reconcile() {
  ReconcileReport report;

  report.partial_writes = blobs_->RemovePartialWrites();

  const auto record_ids = index_->ListIds();
  const auto blob_ids   = blobs_->List();

  const std::unordered_set<std::string> records(record_ids.begin(), record_ids.end());
  const std::unordered_set<std::string> files(blob_ids.begin(), blob_ids.end());

  for (const auto& id : blob_ids) {
    if (records.contains(id)) {
      continue;
    }
    if (!util::IsValidShortId(id)) {
      BLOBKEEP_LOG_WARN("Ignoring foreign file in storage directory", {StringField("name", id)});
      continue;
    }

    BLOBKEEP_LOG_WARN("Removing orphan file without Item record", {StringField("id", id)});
    blobs_->Remove(id);
    ++report.orphan_blobs;
  }

  for (const auto& id : record_ids) {
    if (files.contains(id)) {
      continue;
    }

    BLOBKEEP_LOG_WARN("Removing Item record without file", {StringField("id", id)});
    const auto removed = index_->Delete(id);
    if (!removed && !removed.Is(db::ErrorCode::NotFound)) {
      ThrowIfDbError(removed, "delete dangling item " + id);
    }
    ++report.dangling_records;
  }

  BLOBKEEP_LOG_INFO("Store reconciled", {IntField("partial_writes", static_cast<int64_t>(report.partial_writes)),
                                         IntField("orphan_files", static_cast<int64_t>(report.orphan_blobs)),
                                         IntField("dangling_records", static_cast<int64_t>(report.dangling_records))});
  return report;
}

} // namespace blobkeep::core
