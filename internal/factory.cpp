#include "factory.hpp"

#include <chrono>
#include <cstdint>
#include <memory>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_record_index.hpp"

namespace blobkeep::factory {

core::StoreOptions ToStoreOptions(const blobkeep::runtime::config::RuntimeConfig& config) {
  config::Validate(config);

  const auto& store = config.store();

  core::StoreOptions options;
  options.base_dir          = store.base_dir();
  options.auto_cleanup      = store.auto_cleanup();
  options.reconcile_on_open = store.has_reconcile_on_open() ? store.reconcile_on_open() : true;

  if (store.sweep_interval_ms() > 0) {
    options.sweep_interval = std::chrono::milliseconds(static_cast<int64_t>(store.sweep_interval_ms()));
  }
  if (store.id_max_attempts() > 0) {
    options.id_max_attempts = store.id_max_attempts();
  }

  // ------------------------------------------------------------------
  // Record index
  // ------------------------------------------------------------------
  const auto& database = config.database();
  if (database.has_memory()) {
    options.index = std::make_shared<db::memory::MemoryRecordIndex>();
  } else if (database.has_sqlite() && !database.sqlite().synchronous().empty()) {
    options.sqlite_synchronous = database.sqlite().synchronous();
  }

  return options;
}

std::unique_ptr<core::Store> BuildStore(const blobkeep::runtime::config::RuntimeConfig& config) {
  return core::Store::Open(ToStoreOptions(config));
}

} // namespace blobkeep::factory
