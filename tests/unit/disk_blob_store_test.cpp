#include "internal/storage/disk_blob_store.hpp"

#include <arrow/buffer.h>
#include <arrow/io/memory.h>
#include <arrow/status.h>

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace {

using blobkeep::storage::DiskBlobStore;
using blobkeep::storage::common::ReadAll;

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "blobkeep_disk_blob_store_tests" / name;
  std::filesystem::remove_all(dir);
  return dir;
}

std::shared_ptr<arrow::io::BufferReader> StreamOf(std::string data) {
  return std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(std::move(data)));
}

std::string ReadBlob(DiskBlobStore& store, const std::string& id) {
  auto file   = store.Open(id);
  auto buffer = ReadAll(file);
  assert(file->Close().ok());
  return buffer->ToString();
}

// Yields `good_bytes` and then fails every read.
class BrokenStream final : public arrow::io::InputStream {
 public:
  explicit BrokenStream(int64_t good_bytes) : remaining_(good_bytes) {
  }

  arrow::Status Close() override {
    closed_ = true;
    return arrow::Status::OK();
  }

  bool closed() const override {
    return closed_;
  }

  arrow::Result<int64_t> Tell() const override {
    return position_;
  }

  arrow::Result<int64_t> Read(int64_t nbytes, void* out) override {
    if (remaining_ <= 0) {
      return arrow::Status::IOError("connection reset by peer");
    }
    const auto n = std::min(nbytes, remaining_);
    std::fill_n(static_cast<char*>(out), n, 'x');
    remaining_ -= n;
    position_ += n;
    return n;
  }

  arrow::Result<std::shared_ptr<arrow::Buffer>> Read(int64_t nbytes) override {
    if (remaining_ <= 0) {
      return arrow::Status::IOError("connection reset by peer");
    }
    const auto n = std::min(nbytes, remaining_);
    remaining_ -= n;
    position_ += n;
    return arrow::Buffer::FromString(std::string(static_cast<std::size_t>(n), 'x'));
  }

 private:
  int64_t remaining_;
  int64_t position_ = 0;
  bool    closed_   = false;
};

void TestWriteOpenRemove() {
  const auto    root = FreshDir("write_open_remove");
  DiskBlobStore store(root);
  assert(std::filesystem::is_directory(root));

  auto source = StreamOf("hello blob");
  assert(store.Write("2g", source) == 10);
  assert(source->closed());

  assert(store.Exists("2g"));
  assert(std::filesystem::is_regular_file(root / "2g"));
  assert(!std::filesystem::exists(root / "2g.tmp"));
  assert(ReadBlob(store, "2g") == "hello blob");

  assert(store.Remove("2g"));
  assert(!store.Exists("2g"));
  assert(!store.Remove("2g"));
}

void TestLargePayloadIsCopiedInChunks() {
  DiskBlobStore store(FreshDir("large"));

  std::string payload(300 * 1024 + 17, '\0');
  for (std::size_t i = 0; i < payload.size(); ++i) {
    payload[i] = static_cast<char>(i % 251);
  }

  assert(store.Write("big", StreamOf(payload)) == payload.size());
  assert(ReadBlob(store, "big") == payload);
}

void TestEmptyPayload() {
  DiskBlobStore store(FreshDir("empty"));

  assert(store.Write("nil", StreamOf("")) == 0);
  assert(store.Exists("nil"));
  assert(ReadBlob(store, "nil").empty());
}

void TestFailedWriteLeavesNothingBehind() {
  const auto    root = FreshDir("failed_write");
  DiskBlobStore store(root);

  auto source = std::make_shared<BrokenStream>(100 * 1024);

  bool threw = false;
  try {
    (void)store.Write("broken", source);
  } catch (const blobkeep::util::IOError& e) {
    threw = std::string(e.what()).find("connection reset") != std::string::npos;
  }

  assert(threw);
  assert(source->closed());
  assert(!store.Exists("broken"));
  assert(!std::filesystem::exists(root / "broken.tmp"));
  assert(store.List().empty());
}

void TestOpenMissingBlobIsIOError() {
  DiskBlobStore store(FreshDir("missing"));

  bool threw = false;
  try {
    (void)store.Open("absent");
  } catch (const blobkeep::util::IOError&) {
    threw = true;
  }
  assert(threw);
}

void TestListSkipsPartialWritesAndRemovePartialWritesDropsThem() {
  const auto    root = FreshDir("partial");
  DiskBlobStore store(root);

  assert(store.Write("done", StreamOf("complete")) == 8);
  std::ofstream(root / "3yZe7d.tmp") << "half";
  std::ofstream(root / "editor-swap.tmp") << "someone else's";
  std::ofstream(root / "0OIl.tmp") << "not base58";
  std::filesystem::create_directory(root / "subdir");

  const auto listed = store.List();
  assert((listed == std::vector<std::string>{"done"}));

  assert(store.RemovePartialWrites() == 1);
  assert(!std::filesystem::exists(root / "3yZe7d.tmp"));
  assert(std::filesystem::exists(root / "editor-swap.tmp"));
  assert(std::filesystem::exists(root / "0OIl.tmp"));
  assert(store.Exists("done"));
  assert(store.RemovePartialWrites() == 0);
}

void TestUnsafeIdsAreRejected() {
  DiskBlobStore store(FreshDir("unsafe"));

  for (const std::string id : {"", ".", "..", "../escape", "a/b", "a\\b"}) {
    bool threw = false;
    try {
      (void)store.Remove(id);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestWriteOpenRemove();
  TestLargePayloadIsCopiedInChunks();
  TestEmptyPayload();
  TestFailedWriteLeavesNothingBehind();
  TestOpenMissingBlobIsIOError();
  TestListSkipsPartialWritesAndRemovePartialWritesDropsThem();
  TestUnsafeIdsAreRejected();

  std::filesystem::remove_all(std::filesystem::temp_directory_path() / "blobkeep_disk_blob_store_tests");
  std::cout << "blobkeep_unit_disk_blob_store: pass\n";
  return 0;
}
