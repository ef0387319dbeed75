#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace blobkeep::model {

/*
  Stored item metadata.

  IMPORTANT:
  - id is assigned by Store::Put, never by the caller.
  - expires is absolute; at or after it the item is stale.
  - Everything else is caller metadata and opaque to the store.
  - Items are immutable once stored.
*/

struct Item {
  std::string id;

  util::TimePoint expires{};

  std::string     filename;
  std::string     content_type;
  util::TimePoint created{};

  // opaque JSON text, stored verbatim
  std::string attributes;

  bool operator==(const Item&) const = default;
};

} // namespace blobkeep::model
