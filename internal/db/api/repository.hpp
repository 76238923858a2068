#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/asset_record.hpp"
#include "internal/db/model/genesis_asset_record.hpp"
#include "internal/db/model/genesis_point_record.hpp"
#include "internal/db/model/group_key_record.hpp"
#include "internal/db/model/internal_key_record.hpp"
#include "internal/db/model/script_key_record.hpp"

namespace assetdb::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Upserts are insert-or-return-existing: repeating one with the same
    identity returns the same primary key and writes no new row
  - Upserts fill the primary key into the record passed in

  Concurrent importers of overlapping data rely on these upserts, not
  on any lock held above this layer.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Genesis
  // ---------------------------------------------------------------------

  virtual Result UpsertGenesisPoint(Transaction&, model::GenesisPointRecord&) = 0;

  virtual Result UpsertGenesisAsset(Transaction&, model::GenesisAssetRecord&) = 0;

  // NotFound if no genesis asset has this primary key.
  virtual Result FetchGenesisByID(Transaction&, int64_t gen_asset_id, model::GenesisRecord& out) = 0;

  // ---------------------------------------------------------------------
  // Keys
  // ---------------------------------------------------------------------

  // Identity is raw_key. A stored zero locator is replaced by a non-zero
  // incoming one; an incoming zero locator matches any stored locator;
  // two different non-zero locators fail with Conflict. On return the
  // record carries the stored locator.
  virtual Result UpsertInternalKey(Transaction&, model::InternalKeyRecord&) = 0;

  virtual Result FetchInternalKey(Transaction&, int64_t key_id, model::InternalKeyRecord& out) = 0;

  // NotFound on miss; the caller treats that as a control signal.
  virtual Result FetchScriptKeyIDByTweakedKey(Transaction&, const util::Bytes& tweaked_key, int64_t& script_key_id) = 0;

  // Identity is tweaked_script_key. A stored row without a tweak takes
  // the internal key and tweak of an incoming row that has one.
  virtual Result UpsertScriptKey(Transaction&, model::ScriptKeyRecord&) = 0;

  virtual Result FetchScriptKey(Transaction&, int64_t script_key_id, model::ScriptKeyRecord& out) = 0;

  // ---------------------------------------------------------------------
  // Asset groups
  // ---------------------------------------------------------------------

  // Identity is tweaked_group_key.
  virtual Result UpsertAssetGroupKey(Transaction&, model::GroupKeyRecord&) = 0;

  // Identity is (gen_asset_id, group_key_id).
  virtual Result UpsertAssetGroupSig(Transaction&, model::GroupSigRecord&) = 0;

  // ---------------------------------------------------------------------
  // Assets
  // ---------------------------------------------------------------------

  // Identity is (genesis_id, script_key_id, anchor_utxo_id) with a NULL
  // anchor comparing equal to NULL.
  virtual Result InsertNewAsset(Transaction&, model::AssetRecord&) = 0;

  virtual Result FetchAsset(Transaction&, int64_t asset_id, model::AssetRecord& out) = 0;

  // Row count of one of the tables above, by table name.
  virtual Result CountRows(Transaction&, std::string_view table, int64_t& count) = 0;
};

} // namespace assetdb::db
