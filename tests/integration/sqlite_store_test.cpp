#include <arrow/buffer.h>
#include <arrow/io/memory.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/store.hpp"
#include "internal/db/sqlite/sqlite_record_index.hpp"
#include "internal/factory.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using blobkeep::core::Store;
using blobkeep::model::Item;
using blobkeep::util::NotFound;
using namespace std::chrono_literals;

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "blobkeep_sqlite_store_tests" / name;
  std::filesystem::remove_all(dir);
  return dir;
}

std::shared_ptr<arrow::io::BufferReader> StreamOf(std::string data) {
  return std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(std::move(data)));
}

Item MakeItem(std::chrono::milliseconds ttl) {
  Item item;
  item.expires      = blobkeep::util::Now() + ttl;
  item.filename     = "backup.tar.gz";
  item.content_type = "application/gzip";
  item.created      = blobkeep::util::Now();
  item.attributes   = R"({"labels":["nightly"]})";
  return item;
}

std::string ReadPayload(Store& store, const std::string& id) {
  auto file   = store.GetFile(id);
  auto buffer = blobkeep::storage::common::ReadAll(file);
  assert(file->Close().ok());
  return buffer->ToString();
}

bool IsNotFound(Store& store, const std::string& id) {
  try {
    (void)store.Get(id);
  } catch (const NotFound&) {
    return true;
  }
  return false;
}

void TestDefaultBackendPersistsAcrossReopen() {
  const auto base = FreshDir("reopen");

  Item        original = MakeItem(1h);
  std::string id;
  {
    auto store = Store::Open(base, /*auto_cleanup=*/false);
    assert(dynamic_cast<blobkeep::db::sqlite::SqliteRecordIndex*>(&store->Index()) != nullptr);

    id = store->Put(original, StreamOf("tarball bytes"));
    store->Close();
  }

  assert(std::filesystem::is_regular_file(base / "db" / "index.sqlite"));
  assert(std::filesystem::is_regular_file(base / "data" / id));

  auto store = Store::Open(base, /*auto_cleanup=*/false);
  original.id = id;
  assert(store->Get(id) == original);
  assert(ReadPayload(*store, id) == "tarball bytes");

  const auto& report = store->LastReconcile();
  assert(report.partial_writes == 0 && report.orphan_blobs == 0 && report.dangling_records == 0);
}

void TestReopenRepairsCrashLeftovers() {
  const auto base = FreshDir("crash");

  std::string kept;
  std::string lost_blob;
  {
    auto store = Store::Open(base, false);
    kept       = store->Put(MakeItem(1h), StreamOf("kept"));
    lost_blob  = store->Put(MakeItem(1h), StreamOf("blob vanishes"));
  }

  // blob removed behind the store's back, then a crash mid-Put and mid-Delete
  std::filesystem::remove(base / "data" / lost_blob);
  std::ofstream(base / "data" / "5Hue.tmp") << "partial";
  std::ofstream(base / "data" / "3yZe7d") << "record already deleted";

  auto store = Store::Open(base, false);

  const auto& report = store->LastReconcile();
  assert(report.partial_writes == 1);
  assert(report.orphan_blobs == 1);
  assert(report.dangling_records == 1);

  assert(IsNotFound(*store, lost_blob));
  assert(ReadPayload(*store, kept) == "kept");
  assert(!std::filesystem::exists(base / "data" / "3yZe7d"));
  assert(!std::filesystem::exists(base / "data" / "5Hue.tmp"));
}

void TestConcurrentPutsAndDeletes() {
  auto store = Store::Open(FreshDir("concurrent"), false);

  constexpr int kThreads       = 6;
  constexpr int kPutsPerThread = 20;

  std::mutex               mutex;
  std::vector<std::string> ids;
  std::atomic<int>         failures{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kPutsPerThread; ++i) {
        try {
          const auto id = store->Put(MakeItem(1h), StreamOf("payload-" + std::to_string(i)));
          if (i % 2 == 0) {
            store->Delete(id);
            continue;
          }
          std::lock_guard lock(mutex);
          ids.push_back(id);
        } catch (const std::exception& e) {
          std::cerr << "unexpected failure: " << e.what() << "\n";
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  assert(failures.load() == 0);

  const std::unordered_set<std::string> unique(ids.begin(), ids.end());
  assert(unique.size() == ids.size());
  assert(ids.size() == static_cast<std::size_t>(kThreads * kPutsPerThread / 2));
  assert(store->Index().ListIds().size() == ids.size());

  std::size_t files = 0;
  for (const auto& entry : std::filesystem::directory_iterator(store->StorageDir())) {
    (void)entry;
    ++files;
  }
  assert(files == ids.size());
}

void TestExpiryOnReadAndReaper() {
  auto options           = blobkeep::core::StoreOptions{};
  options.base_dir       = FreshDir("expiry");
  options.auto_cleanup   = true;
  options.sweep_interval = 50ms;
  auto store             = Store::Open(options);

  const auto stale = store->Put(MakeItem(-1000ms), StreamOf("stale"));
  assert(IsNotFound(*store, stale));
  assert(!std::filesystem::exists(store->StorageDir() / stale));

  const auto soon = store->Put(MakeItem(100ms), StreamOf("soon"));
  const auto live = store->Put(MakeItem(1h), StreamOf("live"));

  bool reaped = false;
  for (int i = 0; i < 300 && !reaped; ++i) {
    std::this_thread::sleep_for(10ms);
    reaped = !store->Index().Get(soon).has_value() && !std::filesystem::exists(store->StorageDir() / soon);
  }
  assert(reaped);
  assert(store->Get(live).id == live);

  store->Close();
  assert(store->IsClosed());
}

void TestCloseDrainsReadersOnSqliteHandle() {
  auto store = Store::Open(FreshDir("close_drain"), /*auto_cleanup=*/true);

  auto       original = MakeItem(1h);
  const auto id       = store->Put(original, StreamOf("read me"));
  original.id         = id;

  constexpr int    kReaders = 6;
  std::atomic<int> reads{0};
  std::atomic<int> rejected{0};
  std::atomic<int> unexpected{0};

  std::vector<std::thread> readers;
  for (int i = 0; i < kReaders; ++i) {
    readers.emplace_back([&] {
      for (;;) {
        try {
          if (store->Get(id) != original) {
            ++unexpected;
            return;
          }
          ++reads;
        } catch (const blobkeep::util::InvalidState&) {
          ++rejected;
          return;
        } catch (const std::exception&) {
          ++unexpected;
          return;
        }
      }
    });
  }

  for (int i = 0; i < 500 && reads.load() < kReaders * 10; ++i) {
    std::this_thread::sleep_for(2ms);
  }
  store->Close();
  for (auto& reader : readers) {
    reader.join();
  }

  assert(reads.load() > 0);
  assert(unexpected.load() == 0);
  assert(rejected.load() == kReaders);
}

void TestFactoryBuildsStoreFromYaml() {
  const auto base      = FreshDir("factory");
  const auto yaml_path = base.parent_path() / "factory.yaml";
  std::filesystem::create_directories(base.parent_path());
  {
    std::ofstream out(yaml_path);
    out << "store:\n"
        << "  base_dir: \"" << base.string() << "\"\n"
        << "  auto_cleanup: true\n"
        << "  sweep_interval_ms: 60000\n"
        << "database:\n"
        << "  sqlite:\n"
        << "    synchronous: \"FULL\"\n";
  }

  const auto config = blobkeep::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  auto       store  = blobkeep::factory::BuildStore(config);

  assert(store->CleanupEnabled());
  assert(store->BaseDir() == base);

  const auto id = store->Put(MakeItem(1h), StreamOf("configured"));
  assert(ReadPayload(*store, id) == "configured");
  assert(std::filesystem::is_regular_file(base / "db" / "index.sqlite"));
}

} // namespace

int main() {
  TestDefaultBackendPersistsAcrossReopen();
  TestReopenRepairsCrashLeftovers();
  TestConcurrentPutsAndDeletes();
  TestExpiryOnReadAndReaper();
  TestCloseDrainsReadersOnSqliteHandle();
  TestFactoryBuildsStoreFromYaml();

  std::filesystem::remove_all(std::filesystem::temp_directory_path() / "blobkeep_sqlite_store_tests");
  std::cout << "blobkeep_integration_sqlite_store: pass\n";
  return 0;
}
