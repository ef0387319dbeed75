#include "sqlite_record_index.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace blobkeep::db::sqlite {

using blobkeep::db::ErrorCode;
using blobkeep::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

// Column order matches SELECT_ITEM / SELECT_EXPIRED_ITEMS.
static model::Item ReadItem(sqlite3_stmt* st) {
    model::Item item;
    item.id = ColText(st, 0);
    item.filename = ColText(st, 1);
    item.content_type = ColText(st, 2);
    item.attributes = ColText(st, 3);
    item.created = util::FromUnixNanos(ColI64(st, 4));
    item.expires = util::FromUnixNanos(ColI64(st, 5));
    return item;
}

static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        throw util::StorageEngineError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    return st;
}

SqliteRecordIndex::SqliteRecordIndex(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {
    db_->Exec(sql::CREATE_ITEM_TABLE);
    db_->Exec(sql::CREATE_ITEM_EXPIRY_INDEX);
}

sqlite3* SqliteRecordIndex::Handle() const {
    auto* db = db_->Handle();
    if (!db) throw util::StorageEngineError("sqlite index is closed");
    return db;
}

Result SqliteRecordIndex::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

std::optional<model::Item> SqliteRecordIndex::Get(const std::string& id) {
    auto* db = Handle();
    auto* st = PrepareOrThrow(db, sql::SELECT_ITEM);

    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(st);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        auto result = Translate(db, rc);
        sqlite3_finalize(st);
        throw util::StorageEngineError("get item " + id + ": " + result.message);
    }

    auto item = ReadItem(st);
    sqlite3_finalize(st);
    return item;
}

Result SqliteRecordIndex::Insert(const model::Item& item) {
    auto* db = db_->Handle();
    if (!db)
        return Result::Err(ErrorCode::Closed, "sqlite index is closed");

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_ITEM, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, item.id);
    BindText(st, 2, item.filename);
    BindText(st, 3, item.content_type);
    BindText(st, 4, item.attributes);
    BindI64(st, 5, util::ToUnixNanos(item.created));
    BindI64(st, 6, util::ToUnixNanos(item.expires));

    int rc = sqlite3_step(st);
    auto result = Translate(db, rc);
    sqlite3_finalize(st);

    return result;
}

Result SqliteRecordIndex::Delete(const std::string& id) {
    auto* db = db_->Handle();
    if (!db)
        return Result::Err(ErrorCode::Closed, "sqlite index is closed");

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_ITEM, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    const bool deleted = rc == SQLITE_ROW;
    if (deleted)
        rc = sqlite3_step(st);

    auto result = Translate(db, rc);
    sqlite3_finalize(st);

    if (result && !deleted)
        return Result::Err(ErrorCode::NotFound, "no item " + id);
    return result;
}

std::vector<model::Item> SqliteRecordIndex::FindExpiredBefore(util::TimePoint cutoff) {
    auto* db = Handle();
    auto* st = PrepareOrThrow(db, sql::SELECT_EXPIRED_ITEMS);

    BindI64(st, 1, util::ToUnixNanos(cutoff));

    std::vector<model::Item> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadItem(st));
    }

    if (rc != SQLITE_DONE) {
        auto result = Translate(db, rc);
        sqlite3_finalize(st);
        throw util::StorageEngineError("find expired items: " + result.message);
    }

    sqlite3_finalize(st);
    return out;
}

std::vector<std::string> SqliteRecordIndex::ListIds() {
    auto* db = Handle();
    auto* st = PrepareOrThrow(db, sql::SELECT_ITEM_IDS);

    std::vector<std::string> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ColText(st, 0));
    }

    if (rc != SQLITE_DONE) {
        auto result = Translate(db, rc);
        sqlite3_finalize(st);
        throw util::StorageEngineError("list item ids: " + result.message);
    }

    sqlite3_finalize(st);
    return out;
}

void SqliteRecordIndex::Close() {
    db_->Close();
}

} // namespace blobkeep::db::sqlite
