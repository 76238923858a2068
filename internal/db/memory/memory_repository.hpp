#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace assetdb::db::memory {

class MemoryTransaction;

/*
  In-process backend with the same upsert semantics as the SQL
  backends. Used by tests and when no database is configured.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // Rows keyed by primary key; identity lookups scan, tables stay small.
  struct State {
    std::map<int64_t, model::GenesisPointRecord> genesis_points;
    std::map<int64_t, model::GenesisAssetRecord> genesis_assets;
    std::map<int64_t, model::InternalKeyRecord>  internal_keys;
    std::map<int64_t, model::ScriptKeyRecord>    script_keys;
    std::map<int64_t, model::GroupKeyRecord>     group_keys;
    std::map<int64_t, model::GroupSigRecord>     group_sigs;
    std::map<int64_t, model::AssetRecord>        assets;
    int64_t                                      next_id = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
