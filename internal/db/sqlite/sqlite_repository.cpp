#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>

#include "internal/db/sql/sql_queries.hpp"

namespace assetdb::db::sqlite {

using assetdb::db::ErrorCode;
using assetdb::db::Result;

namespace {

// Finalizes on scope exit so early returns cannot leak statements.
struct Stmt {
    sqlite3_stmt* st = nullptr;
    ~Stmt() {
        if (st) sqlite3_finalize(st);
    }
};

void BindBlob(sqlite3_stmt* st, int idx, const util::Bytes& b) {
    // zero-length blobs must still bind as non-NULL
    sqlite3_bind_blob(st, idx, b.empty() ? "" : static_cast<const void*>(b.data()), static_cast<int>(b.size()), SQLITE_TRANSIENT);
}

void BindOptBlob(sqlite3_stmt* st, int idx, const std::optional<util::Bytes>& b) {
    if (b.has_value()) {
        BindBlob(st, idx, *b);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

// explicit length so tags with embedded NUL bytes survive
void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

template <typename T>
void BindOptInt(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
    if (v.has_value()) {
        sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*v));
    } else {
        sqlite3_bind_null(st, idx);
    }
}

util::Bytes ColBlob(sqlite3_stmt* st, int col) {
    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(st, col));
    const int   size = sqlite3_column_bytes(st, col);
    if (!data || size <= 0) return {};
    return util::Bytes(data, data + size);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    if (!t) return {};
    return std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int32_t ColI32(sqlite3_stmt* st, int col) {
    return static_cast<int32_t>(sqlite3_column_int(st, col));
}

bool ColNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Genesis
// ------------------------------------------------------------------

Result SqliteRepository::UpsertGenesisPoint(Transaction& t, model::GenesisPointRecord& r) {
    auto* db = TX(t).Handle();

    {
        Stmt s;
        if (sqlite3_prepare_v2(db, sql::INSERT_GENESIS_POINT, -1, &s.st, nullptr) != SQLITE_OK)
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindBlob(s.st, 1, r.prev_out);
        int rc = sqlite3_step(s.st);
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }

    Stmt s;
    if (sqlite3_prepare_v2(db, sql::SELECT_GENESIS_POINT_ID, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindBlob(s.st, 1, r.prev_out);
    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_ROW) return rc == SQLITE_DONE ? Result::Err(ErrorCode::InternalError, "genesis point vanished after upsert") : Translate(db, rc);

    r.genesis_id = ColI64(s.st, 0);
    return Result::Ok();
}

Result SqliteRepository::UpsertGenesisAsset(Transaction& t, model::GenesisAssetRecord& r) {
    auto* db = TX(t).Handle();

    {
        Stmt s;
        if (sqlite3_prepare_v2(db, sql::INSERT_GENESIS_ASSET, -1, &s.st, nullptr) != SQLITE_OK)
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindBlob(s.st, 1, r.asset_id);
        BindText(s.st, 2, r.asset_tag);
        BindBlob(s.st, 3, r.meta_data);
        BindI64(s.st, 4, r.output_index);
        BindI64(s.st, 5, r.asset_type);
        BindI64(s.st, 6, r.genesis_point_id);
        int rc = sqlite3_step(s.st);
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }

    Stmt s;
    if (sqlite3_prepare_v2(db, sql::SELECT_GENESIS_ASSET_ID, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindBlob(s.st, 1, r.asset_id);
    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_ROW) return rc == SQLITE_DONE ? Result::Err(ErrorCode::InternalError, "genesis asset vanished after upsert") : Translate(db, rc);

    r.gen_asset_id = ColI64(s.st, 0);
    return Result::Ok();
}

Result SqliteRepository::FetchGenesisByID(Transaction& t, int64_t gen_asset_id, model::GenesisRecord& out) {
    auto* db = TX(t).Handle();

    Stmt s;
    if (sqlite3_prepare_v2(db, sql::SELECT_GENESIS_BY_ID, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindI64(s.st, 1, gen_asset_id);

    int rc = sqlite3_step(s.st);
    if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound, "no genesis asset with id " + std::to_string(gen_asset_id));
    if (rc != SQLITE_ROW) return Translate(db, rc);

    out.gen_asset_id = ColI64(s.st, 0);
    out.asset_id     = ColBlob(s.st, 1);
    out.asset_tag    = ColText(s.st, 2);
    out.meta_data    = ColBlob(s.st, 3);
    out.output_index = ColI32(s.st, 4);
    out.asset_type   = static_cast<int16_t>(ColI32(s.st, 5));
    out.prev_out     = ColBlob(s.st, 6);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Keys
// ------------------------------------------------------------------

Result SqliteRepository::UpsertInternalKey(Transaction& t, model::InternalKeyRecord& r) {
    auto* db = TX(t).Handle();

    {
        Stmt s;
        if (sqlite3_prepare_v2(db, sql::UPSERT_INTERNAL_KEY, -1, &s.st, nullptr) != SQLITE_OK)
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindBlob(s.st, 1, r.raw_key);
        BindI64(s.st, 2, r.key_family);
        BindI64(s.st, 3, r.key_index);
        int rc = sqlite3_step(s.st);
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }

    Stmt s;
    if (sqlite3_prepare_v2(db, sql::SELECT_INTERNAL_KEY_BY_RAW, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindBlob(s.st, 1, r.raw_key);
    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_ROW) return rc == SQLITE_DONE ? Result::Err(ErrorCode::InternalError, "internal key vanished after upsert") : Translate(db, rc);

    const int32_t stored_family = ColI32(s.st, 1);
    const int32_t stored_index  = ColI32(s.st, 2);
    const bool    incoming_zero = r.key_family == 0 && r.key_index == 0;
    if (!incoming_zero && (stored_family != r.key_family || stored_index != r.key_index)) {
        return Result::Err(ErrorCode::Conflict, "internal key already stored with a different key locator");
    }

    r.key_id     = ColI64(s.st, 0);
    r.key_family = stored_family;
    r.key_index  = stored_index;
    return Result::Ok();
}

Result SqliteRepository::FetchInternalKey(Transaction& t, int64_t key_id, model::InternalKeyRecord& out) {
    auto* db = TX(t).Handle();

    Stmt s;
    if (sqlite3_prepare_v2(db, sql::SELECT_INTERNAL_KEY_BY_ID, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindI64(s.st, 1, key_id);

    int rc = sqlite3_step(s.st);
    if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound);
    if (rc != SQLITE_ROW) return Translate(db, rc);

    out.key_id     = ColI64(s.st, 0);
    out.raw_key    = ColBlob(s.st, 1);
    out.key_family = ColI32(s.st, 2);
    out.key_index  = ColI32(s.st, 3);
    return Result::Ok();
}

Result SqliteRepository::FetchScriptKeyIDByTweakedKey(Transaction& t, const util::Bytes& tweaked_key, int64_t& script_key_id) {
    auto* db = TX(t).Handle();

    Stmt s;
    if (sqlite3_prepare_v2(db, sql::SELECT_SCRIPT_KEY_ID_BY_TWEAKED, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindBlob(s.st, 1, tweaked_key);

    int rc = sqlite3_step(s.st);
    if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound);
    if (rc != SQLITE_ROW) return Translate(db, rc);

    script_key_id = ColI64(s.st, 0);
    return Result::Ok();
}

Result SqliteRepository::UpsertScriptKey(Transaction& t, model::ScriptKeyRecord& r) {
    auto* db = TX(t).Handle();

    {
        Stmt s;
        if (sqlite3_prepare_v2(db, sql::UPSERT_SCRIPT_KEY, -1, &s.st, nullptr) != SQLITE_OK)
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindI64(s.st, 1, r.internal_key_id);
        BindBlob(s.st, 2, r.tweaked_script_key);
        BindOptBlob(s.st, 3, r.tweak);
        int rc = sqlite3_step(s.st);
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }

    return FetchScriptKeyIDByTweakedKey(t, r.tweaked_script_key, r.script_key_id);
}

Result SqliteRepository::FetchScriptKey(Transaction& t, int64_t script_key_id, model::ScriptKeyRecord& out) {
    auto* db = TX(t).Handle();

    Stmt s;
    if (sqlite3_prepare_v2(db, sql::SELECT_SCRIPT_KEY_BY_ID, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindI64(s.st, 1, script_key_id);

    int rc = sqlite3_step(s.st);
    if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound);
    if (rc != SQLITE_ROW) return Translate(db, rc);

    out.script_key_id      = ColI64(s.st, 0);
    out.internal_key_id    = ColI64(s.st, 1);
    out.tweaked_script_key = ColBlob(s.st, 2);
    if (ColNull(s.st, 3)) {
        out.tweak.reset();
    } else {
        out.tweak = ColBlob(s.st, 3);
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Asset groups
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAssetGroupKey(Transaction& t, model::GroupKeyRecord& r) {
    auto* db = TX(t).Handle();

    {
        Stmt s;
        if (sqlite3_prepare_v2(db, sql::INSERT_GROUP_KEY, -1, &s.st, nullptr) != SQLITE_OK)
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindBlob(s.st, 1, r.tweaked_group_key);
        BindI64(s.st, 2, r.internal_key_id);
        BindI64(s.st, 3, r.genesis_point_id);
        int rc = sqlite3_step(s.st);
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }

    Stmt s;
    if (sqlite3_prepare_v2(db, sql::SELECT_GROUP_KEY_ID, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindBlob(s.st, 1, r.tweaked_group_key);
    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_ROW) return rc == SQLITE_DONE ? Result::Err(ErrorCode::InternalError, "group key vanished after upsert") : Translate(db, rc);

    r.group_id = ColI64(s.st, 0);
    return Result::Ok();
}

Result SqliteRepository::UpsertAssetGroupSig(Transaction& t, model::GroupSigRecord& r) {
    auto* db = TX(t).Handle();

    {
        Stmt s;
        if (sqlite3_prepare_v2(db, sql::INSERT_GROUP_SIG, -1, &s.st, nullptr) != SQLITE_OK)
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindBlob(s.st, 1, r.genesis_sig);
        BindI64(s.st, 2, r.gen_asset_id);
        BindI64(s.st, 3, r.group_key_id);
        int rc = sqlite3_step(s.st);
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }

    Stmt s;
    if (sqlite3_prepare_v2(db, sql::SELECT_GROUP_SIG_ID, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindI64(s.st, 1, r.gen_asset_id);
    BindI64(s.st, 2, r.group_key_id);
    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_ROW) return rc == SQLITE_DONE ? Result::Err(ErrorCode::InternalError, "group sig vanished after upsert") : Translate(db, rc);

    r.sig_id = ColI64(s.st, 0);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Assets
// ------------------------------------------------------------------

Result SqliteRepository::InsertNewAsset(Transaction& t, model::AssetRecord& r) {
    auto* db = TX(t).Handle();

    {
        Stmt s;
        if (sqlite3_prepare_v2(db, sql::INSERT_ASSET, -1, &s.st, nullptr) != SQLITE_OK)
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindI64(s.st, 1, r.genesis_id);
        BindI64(s.st, 2, r.version);
        BindI64(s.st, 3, r.script_key_id);
        BindOptInt(s.st, 4, r.asset_group_sig_id);
        BindI64(s.st, 5, r.script_version);
        BindI64(s.st, 6, r.amount);
        BindOptInt(s.st, 7, r.lock_time);
        BindOptInt(s.st, 8, r.relative_lock_time);
        BindOptInt(s.st, 9, r.anchor_utxo_id);

        int rc = sqlite3_step(s.st);
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }

    // an existing row with the same identity wins over the insert
    Stmt s;
    if (sqlite3_prepare_v2(db, sql::SELECT_ASSET_ID_BY_IDENTITY, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindI64(s.st, 1, r.genesis_id);
    BindI64(s.st, 2, r.script_key_id);
    BindOptInt(s.st, 3, r.anchor_utxo_id);
    int rc = sqlite3_step(s.st);
    if (rc == SQLITE_DONE) return Result::Err(ErrorCode::InternalError, "asset vanished after upsert");
    if (rc != SQLITE_ROW) return Translate(db, rc);
    r.asset_id = ColI64(s.st, 0);
    return Result::Ok();
}

Result SqliteRepository::FetchAsset(Transaction& t, int64_t asset_id, model::AssetRecord& out) {
    auto* db = TX(t).Handle();

    Stmt s;
    if (sqlite3_prepare_v2(db, sql::SELECT_ASSET_BY_ID, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindI64(s.st, 1, asset_id);

    int rc = sqlite3_step(s.st);
    if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound);
    if (rc != SQLITE_ROW) return Translate(db, rc);

    out.asset_id       = ColI64(s.st, 0);
    out.genesis_id     = ColI64(s.st, 1);
    out.version        = ColI32(s.st, 2);
    out.script_key_id  = ColI64(s.st, 3);
    out.asset_group_sig_id = ColNull(s.st, 4) ? std::nullopt : std::optional<int64_t>(ColI64(s.st, 4));
    out.script_version = ColI32(s.st, 5);
    out.amount         = ColI64(s.st, 6);
    out.lock_time          = ColNull(s.st, 7) ? std::nullopt : std::optional<int32_t>(ColI32(s.st, 7));
    out.relative_lock_time = ColNull(s.st, 8) ? std::nullopt : std::optional<int32_t>(ColI32(s.st, 8));
    out.anchor_utxo_id     = ColNull(s.st, 9) ? std::nullopt : std::optional<int64_t>(ColI64(s.st, 9));
    return Result::Ok();
}

Result SqliteRepository::CountRows(Transaction& t, std::string_view table, int64_t& count) {
    auto*             db = TX(t).Handle();
    const std::string name(table);
    if (!sql::IsKnownTable(name)) return Result::Err(ErrorCode::Unsupported, "unknown table " + name);

    const std::string query = "SELECT COUNT(*) FROM " + name + ";";
    Stmt              s;
    if (sqlite3_prepare_v2(db, query.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_ROW) return Translate(db, rc);
    count = ColI64(s.st, 0);
    return Result::Ok();
}

} // namespace assetdb::db::sqlite
