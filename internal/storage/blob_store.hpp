#pragma once

#include <arrow/io/interfaces.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace blobkeep::storage {

/*
  Blob storage abstraction.

  One immutable byte container per item ID. Failures are reported as
  util::IOError.

  Implementations:
    DISK  → one file per ID, Arrow file IO
*/

class BlobStore {
 public:
  virtual ~BlobStore() = default;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Copy the whole of `source` into a new blob named `id`.

    `source` is closed before returning, whether or not the copy
    succeeded. A failed write leaves no blob behind.
    Returns the number of bytes stored.
  */
  virtual uint64_t Write(const std::string& id, const std::shared_ptr<arrow::io::InputStream>& source) = 0;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  /*
    Open a blob for reading. The caller closes the returned file.
  */
  virtual std::shared_ptr<arrow::io::RandomAccessFile> Open(const std::string& id) = 0;

  virtual bool Exists(const std::string& id) = 0;

  // ------------------------------------------------------------------
  // Delete
  // ------------------------------------------------------------------
  /*
    Remove a blob. Returns false if there was nothing to remove.
  */
  virtual bool Remove(const std::string& id) = 0;

  // ------------------------------------------------------------------
  // Maintenance
  // ------------------------------------------------------------------
  // IDs of all complete blobs; partial writes are not listed.
  virtual std::vector<std::string> List() = 0;

  // Drops partial writes left by a crash. Temp files not named after a
  // short ID are left alone. Returns how many were removed.
  virtual std::size_t RemovePartialWrites() = 0;
};

using BlobStorePtr = std::shared_ptr<BlobStore>;

} // namespace blobkeep::storage
