#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace assetdb::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertGenesisPoint(Transaction&, model::GenesisPointRecord&) override;
  Result UpsertGenesisAsset(Transaction&, model::GenesisAssetRecord&) override;
  Result FetchGenesisByID(Transaction&, int64_t gen_asset_id, model::GenesisRecord& out) override;

  Result UpsertInternalKey(Transaction&, model::InternalKeyRecord&) override;
  Result FetchInternalKey(Transaction&, int64_t key_id, model::InternalKeyRecord& out) override;
  Result FetchScriptKeyIDByTweakedKey(Transaction&, const util::Bytes& tweaked_key, int64_t& script_key_id) override;
  Result UpsertScriptKey(Transaction&, model::ScriptKeyRecord&) override;
  Result FetchScriptKey(Transaction&, int64_t script_key_id, model::ScriptKeyRecord& out) override;

  Result UpsertAssetGroupKey(Transaction&, model::GroupKeyRecord&) override;
  Result UpsertAssetGroupSig(Transaction&, model::GroupSigRecord&) override;

  Result InsertNewAsset(Transaction&, model::AssetRecord&) override;
  Result FetchAsset(Transaction&, int64_t asset_id, model::AssetRecord& out) override;

  Result CountRows(Transaction&, std::string_view table, int64_t& count) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
