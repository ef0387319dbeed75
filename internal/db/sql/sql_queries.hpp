#pragma once

namespace blobkeep::db::sql {

/*
  Canonical SQL for the item index.

  Timestamps are unix epoch nanoseconds.
*/

static constexpr const char* CREATE_ITEM_TABLE =
    "CREATE TABLE IF NOT EXISTS item ("
    " id TEXT PRIMARY KEY,"
    " filename TEXT NOT NULL DEFAULT '',"
    " content_type TEXT NOT NULL DEFAULT '',"
    " attributes TEXT NOT NULL DEFAULT '',"
    " created_at_ns INTEGER NOT NULL,"
    " expires_at_ns INTEGER NOT NULL);";

static constexpr const char* CREATE_ITEM_EXPIRY_INDEX =
    "CREATE INDEX IF NOT EXISTS item_expires_at_ns ON item(expires_at_ns);";

static constexpr const char* INSERT_ITEM =
    "INSERT INTO item(id,filename,content_type,attributes,created_at_ns,expires_at_ns)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_ITEM =
    "SELECT id,filename,content_type,attributes,created_at_ns,expires_at_ns"
    " FROM item WHERE id=?;";

// RETURNING keeps "was anything deleted" inside the one statement;
// sqlite3_changes() is racy on a handle shared between threads.
static constexpr const char* DELETE_ITEM =
    "DELETE FROM item WHERE id=? RETURNING id;";

static constexpr const char* SELECT_EXPIRED_ITEMS =
    "SELECT id,filename,content_type,attributes,created_at_ns,expires_at_ns"
    " FROM item WHERE expires_at_ns<? ORDER BY expires_at_ns;";

static constexpr const char* SELECT_ITEM_IDS =
    "SELECT id FROM item;";

} // namespace blobkeep::db::sql
