#include "disk_blob_store.hpp"

#include <arrow/io/file.h>

#include <filesystem>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace blobkeep::storage {

using namespace blobkeep::storage::common;
using blobkeep::observability::StringField;

namespace {

constexpr int64_t kCopyChunkBytes = 1 << 16;

// Best-effort close on a failure path; the original error wins.
template <typename Stream>
void CloseQuietly(const std::shared_ptr<Stream>& stream, const std::string& id, const char* what) {
  if (!stream || stream->closed()) return;
  auto status = stream->Close();
  if (!status.ok()) {
    BLOBKEEP_LOG_WARN("Failed to close stream after blob write error",
                      {StringField("id", id), StringField("stream", what), StringField("error", status.ToString())});
  }
}

} // namespace

DiskBlobStore::DiskBlobStore(std::filesystem::path root)
    : root_(std::move(root)) {

  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) throw util::IOError("cannot create blob directory " + root_.string() + ": " + ec.message());
}

/*
  Atomic write:
      copy into tmp → close → rename
*/
uint64_t DiskBlobStore::Write(const std::string& id,
                              const std::shared_ptr<arrow::io::InputStream>& source) {

  const auto final_path = BlobPath(root_, id);
  const auto tmp_path = TempBlobPath(root_, id);

  uint64_t total = 0;
  std::shared_ptr<arrow::io::FileOutputStream> out;

  try {
    out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()));

    while (true) {
      auto chunk = Unwrap(source->Read(kCopyChunkBytes));
      if (chunk->size() == 0) break;

      Unwrap(out->Write(chunk));
      total += static_cast<uint64_t>(chunk->size());
    }

    Unwrap(out->Close());
    Unwrap(source->Close());
  } catch (const std::exception& e) {
    CloseQuietly(source, id, "source");
    CloseQuietly(out, id, "blob");

    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    throw util::IOError("write blob " + id + ": " + e.what());
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    throw util::IOError("publish blob " + id + ": " + ec.message());
  }

  return total;
}

std::shared_ptr<arrow::io::RandomAccessFile> DiskBlobStore::Open(const std::string& id) {
  const auto path = BlobPath(root_, id);

  auto file = arrow::io::ReadableFile::Open(path.string());
  if (!file.ok()) throw util::IOError("open blob " + id + ": " + file.status().ToString());
  return *file;
}

bool DiskBlobStore::Exists(const std::string& id) {
  std::error_code ec;
  const bool exists = std::filesystem::is_regular_file(BlobPath(root_, id), ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw util::IOError("stat blob " + id + ": " + ec.message());
  }
  return exists;
}

/*
  Remove payload from disk
*/
bool DiskBlobStore::Remove(const std::string& id) {
  std::error_code ec;
  const bool removed = std::filesystem::remove(BlobPath(root_, id), ec);
  if (ec) throw util::IOError("remove blob " + id + ": " + ec.message());
  return removed;
}

std::vector<std::string> DiskBlobStore::List() {
  std::vector<std::string> ids;

  std::error_code ec;
  for (std::filesystem::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) continue;

    auto name = it->path().filename().string();
    if (IsTempBlobName(name)) continue;
    ids.push_back(std::move(name));
  }
  if (ec) throw util::IOError("list blobs in " + root_.string() + ": " + ec.message());

  return ids;
}

std::size_t DiskBlobStore::RemovePartialWrites() {
  std::vector<std::filesystem::path> partial;

  std::error_code ec;
  for (std::filesystem::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    if (IsPartialWriteName(it->path().filename().string())) partial.push_back(it->path());
  }
  if (ec) throw util::IOError("list blobs in " + root_.string() + ": " + ec.message());

  std::size_t removed = 0;
  for (const auto& path : partial) {
    if (std::filesystem::remove(path, ec)) {
      BLOBKEEP_LOG_WARN("Removed partial blob write", {StringField("path", path.string())});
      ++removed;
    } else if (ec) {
      throw util::IOError("remove partial blob " + path.string() + ": " + ec.message());
    }
  }
  return removed;
}

}
