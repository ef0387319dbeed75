#pragma once

#include <filesystem>

#include "internal/storage/blob_store.hpp"

namespace blobkeep::storage {

/*
  Durable disk storage using Arrow IO.

  Properties:
    - file named exactly by item ID
    - atomic publish: write <id>.tmp → close → rename
*/

class DiskBlobStore final : public BlobStore {
public:
  explicit DiskBlobStore(std::filesystem::path root);

  uint64_t Write(const std::string& id,
                 const std::shared_ptr<arrow::io::InputStream>& source) override;

  std::shared_ptr<arrow::io::RandomAccessFile> Open(const std::string& id) override;

  bool Exists(const std::string& id) override;

  bool Remove(const std::string& id) override;

  std::vector<std::string> List() override;

  std::size_t RemovePartialWrites() override;

  const std::filesystem::path& Root() const { return root_; }

private:
  std::filesystem::path root_;
};

}
