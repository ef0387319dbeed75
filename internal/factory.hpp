#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/store.hpp"

namespace blobkeep::factory {

/*
  Translates runtime configuration into StoreOptions.

  Fills in defaults for every unset field.
*/
core::StoreOptions ToStoreOptions(const blobkeep::runtime::config::RuntimeConfig& config);

/*
  BuildStore

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to pick a concrete record index.
*/
std::unique_ptr<core::Store> BuildStore(const blobkeep::runtime::config::RuntimeConfig& config);

} // namespace blobkeep::factory
