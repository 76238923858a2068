#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace assetdb::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
