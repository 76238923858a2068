#include "internal/core/asset_store.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fault_injecting_repository.hpp"
#include "tests/support/fixtures.hpp"

namespace {

using assetdb::core::AssetStore;
using assetdb::db::memory::MemoryRepository;
using assetdb::model::Asset;
using assetdb::testing::AssetFor;
using assetdb::testing::Count;
using assetdb::testing::Derived;
using assetdb::testing::FaultInjectingRepository;
using assetdb::testing::GenesisFor;
using assetdb::testing::GroupFor;
using assetdb::testing::Key;
using assetdb::testing::Observed;
using assetdb::testing::OutPointFor;

const auto kCtx = assetdb::util::Context::Background();

const std::vector<std::string> kTables = {"genesis_points", "genesis_assets",   "internal_keys", "script_keys",
                                          "asset_groups",   "asset_group_sigs", "assets"};

struct Fixture {
  std::shared_ptr<MemoryRepository>         memory = std::make_shared<MemoryRepository>();
  std::shared_ptr<FaultInjectingRepository> repo   = std::make_shared<FaultInjectingRepository>(memory);
  AssetStore                                store{repo};

  std::vector<int64_t> Counts() {
    std::vector<int64_t> counts;
    for (const auto& table : kTables) counts.push_back(Count(*memory, table));
    return counts;
  }

  assetdb::db::model::AssetRecord FetchAsset(int64_t id) {
    auto                            tx = memory->Begin();
    assetdb::db::model::AssetRecord record;
    const auto                      result = memory->FetchAsset(*tx, id, record);
    assert(result);
    (void)result;
    tx->Rollback();
    return record;
  }
};

std::vector<Asset> ExampleBatch(const assetdb::model::OutPoint& outpoint) {
  auto a1 = AssetFor(GenesisFor(outpoint, "a1", 0), Derived(1, 2, 212, 1), 1000);

  auto a2      = AssetFor(GenesisFor(outpoint, "a2", 1), Observed(3), 1);
  a2.group_key = GroupFor(4);

  return {a1, a2};
}

void TestExampleScenario() {
  Fixture    f;
  const auto outpoint = OutPointFor(0x10);

  const auto result = f.store.ImportAssetBatch(kCtx, outpoint, ExampleBatch(outpoint));
  assert(result.asset_ids.size() == 2);
  assert(result.asset_ids[0] != result.asset_ids[1]);

  const auto a1 = f.FetchAsset(result.asset_ids[0]);
  const auto a2 = f.FetchAsset(result.asset_ids[1]);
  assert(a1.genesis_id != a2.genesis_id);
  assert(!a1.asset_group_sig_id.has_value());
  assert(a2.asset_group_sig_id.has_value());
  assert(a1.amount == 1000);

  // both genesis assets hang off the one genesis point
  assert(f.store.FetchGenesis(kCtx, a1.genesis_id).first_prev_out == outpoint);
  assert(f.store.FetchGenesis(kCtx, a2.genesis_id).first_prev_out == outpoint);
  assert(Count(*f.memory, "genesis_points") == 1);

  // K2 was never seen: placeholder internal key with a zero locator
  auto                                tx = f.memory->Begin();
  assetdb::db::model::ScriptKeyRecord k2;
  assert(f.memory->FetchScriptKey(*tx, a2.script_key_id, k2));
  assert(!k2.tweak.has_value());
  assetdb::db::model::InternalKeyRecord k2_internal;
  assert(f.memory->FetchInternalKey(*tx, k2.internal_key_id, k2_internal));
  assert(k2_internal.raw_key == Key(3, 0x03));
  assert(k2_internal.key_family == 0 && k2_internal.key_index == 0);

  assetdb::db::model::ScriptKeyRecord k1;
  assert(f.memory->FetchScriptKey(*tx, a1.script_key_id, k1));
  assetdb::db::model::InternalKeyRecord k1_internal;
  assert(f.memory->FetchInternalKey(*tx, k1.internal_key_id, k1_internal));
  assert(k1_internal.key_family == 212 && k1_internal.key_index == 1);
  tx->Rollback();

  assert((f.Counts() == std::vector<int64_t>{1, 2, 3, 2, 1, 1, 2}));
}

void TestReimportIsIdempotent() {
  Fixture    f;
  const auto outpoint = OutPointFor(0x20);
  const auto batch    = ExampleBatch(outpoint);
  const assetdb::core::AnchorRefs anchors = {11, std::nullopt};

  const auto first  = f.store.ImportAssetBatch(kCtx, outpoint, batch, anchors);
  const auto counts = f.Counts();

  const auto second = f.store.ImportAssetBatch(kCtx, outpoint, batch, anchors);
  assert(second.genesis_point_id == first.genesis_point_id);
  assert(second.asset_ids == first.asset_ids);
  assert(f.Counts() == counts);
}

void TestIdsFollowInputOrder() {
  const auto outpoint = OutPointFor(0x30);

  std::vector<Asset> assets;
  for (uint32_t i = 0; i < 3; ++i) {
    assets.push_back(AssetFor(GenesisFor(outpoint, "tag-" + std::to_string(i), i), Derived(40 + i, 50 + i), 10 + i));
  }

  std::vector<std::size_t> order = {0, 1, 2};
  do {
    Fixture            f;
    std::vector<Asset> permuted;
    for (auto i : order) permuted.push_back(assets[i]);

    const auto result = f.store.ImportAssetBatch(kCtx, outpoint, permuted);
    assert(result.asset_ids.size() == permuted.size());
    for (std::size_t i = 0; i < permuted.size(); ++i) {
      const auto row = f.FetchAsset(result.asset_ids[i]);
      assert(f.store.FetchGenesis(kCtx, row.genesis_id).tag == permuted[i].genesis.tag);
      assert(row.amount == static_cast<int64_t>(permuted[i].amount));
    }
  } while (std::next_permutation(order.begin(), order.end()));
}

void TestFailureOnLastAssetRollsBackBatch() {
  Fixture    f;
  const auto outpoint = OutPointFor(0x40);

  std::vector<Asset> assets;
  for (uint32_t i = 0; i < 3; ++i) {
    assets.push_back(AssetFor(GenesisFor(outpoint, "atomic-" + std::to_string(i), i), Observed(60 + i)));
  }
  assets[1].group_key = GroupFor(70);

  f.repo->FailOn("InsertNewAsset", 3, assetdb::db::ErrorCode::IOError);

  bool threw = false;
  try {
    (void)f.store.ImportAssetBatch(kCtx, outpoint, assets);
  } catch (const assetdb::util::StoreError& e) {
    threw = e.Code() == assetdb::db::ErrorCode::IOError && std::string(e.what()).find("insert asset") != std::string::npos;
  }
  assert(threw);
  assert((f.Counts() == std::vector<int64_t>(kTables.size(), 0)));

  // the same batch goes through once the fault is gone
  const auto result = f.store.ImportAssetBatch(kCtx, outpoint, assets);
  assert(result.asset_ids.size() == 3);
  assert(Count(*f.memory, "assets") == 3);
}

void TestCancelledBeforeStartTouchesNothing() {
  Fixture f;
  auto    ctx = assetdb::util::Context::Background();
  ctx.Cancel();

  bool threw = false;
  try {
    (void)f.store.ImportAssetBatch(ctx, OutPointFor(0x50), ExampleBatch(OutPointFor(0x50)));
  } catch (const assetdb::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
  assert(f.repo->TotalCalls() == 0);

  auto expired = assetdb::util::Context::WithTimeout(std::chrono::milliseconds(-1));
  threw        = false;
  try {
    (void)f.store.ImportAssetBatch(expired, OutPointFor(0x50), ExampleBatch(OutPointFor(0x50)));
  } catch (const assetdb::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
}

void TestCancelMidBatchLeavesNoRows() {
  Fixture f;
  auto    ctx = assetdb::util::Context::Background();

  // cancel once the second asset's genesis is being written
  int genesis_assets = 0;
  f.repo->OnCall([&](const std::string& operation) {
    if (operation == "UpsertGenesisAsset" && ++genesis_assets == 2) ctx.Cancel();
  });

  bool threw = false;
  try {
    (void)f.store.ImportAssetBatch(ctx, OutPointFor(0x51), ExampleBatch(OutPointFor(0x51)));
  } catch (const assetdb::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
  assert(f.repo->Calls("InsertNewAsset") == 1);
  assert((f.Counts() == std::vector<int64_t>(kTables.size(), 0)));
}

void TestAnchorsUsedOnlyWhenLengthsMatch() {
  Fixture    f;
  const auto outpoint = OutPointFor(0x60);
  const auto batch    = ExampleBatch(outpoint);

  const auto short_refs = f.store.ImportAssetBatch(kCtx, outpoint, batch, {5});
  assert(!f.FetchAsset(short_refs.asset_ids[0]).anchor_utxo_id.has_value());
  assert(!f.FetchAsset(short_refs.asset_ids[1]).anchor_utxo_id.has_value());

  const auto anchored = f.store.ImportAssetBatch(kCtx, outpoint, batch, {5, 6});
  assert(f.FetchAsset(anchored.asset_ids[0]).anchor_utxo_id == std::optional<int64_t>(5));
  assert(f.FetchAsset(anchored.asset_ids[1]).anchor_utxo_id == std::optional<int64_t>(6));

  // a different anchor is a different asset row over the same genesis and script key
  assert(anchored.asset_ids[0] != short_refs.asset_ids[0]);
  assert(anchored.genesis_point_id == short_refs.genesis_point_id);
  assert(Count(*f.memory, "assets") == 4);
  assert(Count(*f.memory, "genesis_assets") == 2);
}

void TestLockTimesAndVersions() {
  Fixture    f;
  const auto outpoint = OutPointFor(0x70);

  auto locked               = AssetFor(GenesisFor(outpoint, "locked", 0), Derived(80, 81), 5);
  locked.version            = 1;
  locked.script_version     = 2;
  locked.lock_time          = 800000;
  locked.relative_lock_time = 144;
  auto unlocked             = AssetFor(GenesisFor(outpoint, "unlocked", 1), Derived(82, 83), 6);

  const auto result = f.store.ImportAssetBatch(kCtx, outpoint, {locked, unlocked});

  const auto row = f.FetchAsset(result.asset_ids[0]);
  assert(row.version == 1);
  assert(row.script_version == 2);
  assert(row.lock_time == std::optional<int32_t>(800000));
  assert(row.relative_lock_time == std::optional<int32_t>(144));

  const auto free_row = f.FetchAsset(result.asset_ids[1]);
  assert(!free_row.lock_time.has_value());
  assert(!free_row.relative_lock_time.has_value());
}

void TestOutOfRangeAmountIsRejected() {
  Fixture    f;
  const auto outpoint = OutPointFor(0x71);
  auto       asset    = AssetFor(GenesisFor(outpoint, "huge"), Derived(84, 85), std::numeric_limits<uint64_t>::max());

  bool threw = false;
  try {
    (void)f.store.ImportAssetBatch(kCtx, outpoint, {asset});
  } catch (const assetdb::util::InvalidArgument& e) {
    threw = std::string(e.what()).find("amount") != std::string::npos;
  }
  assert(threw);
  assert(Count(*f.memory, "assets") == 0);
  assert(Count(*f.memory, "genesis_points") == 0);
}

void TestAssetFromOtherOutpointIsRejected() {
  Fixture    f;
  const auto outpoint = OutPointFor(0x75);
  auto       batch    = ExampleBatch(outpoint);
  batch[1].genesis    = GenesisFor(OutPointFor(0x76), "a2", 1);

  bool threw = false;
  try {
    (void)f.store.ImportAssetBatch(kCtx, outpoint, batch);
  } catch (const assetdb::util::InvalidArgument& e) {
    threw = std::string(e.what()).find("batch outpoint") != std::string::npos;
  }
  assert(threw);
  assert((f.Counts() == std::vector<int64_t>{0, 0, 0, 0, 0, 0, 0}));
  assert(f.repo->TotalCalls() == 0);
}

void TestCallerOwnedTransaction() {
  Fixture    f;
  const auto outpoint = OutPointFor(0x80);

  {
    auto tx     = f.repo->Begin();
    auto result = f.store.ImportAssetBatch(kCtx, *tx, outpoint, ExampleBatch(outpoint));
    assert(result.asset_ids.size() == 2);
    tx->Rollback();
  }
  assert(Count(*f.memory, "assets") == 0);

  {
    auto tx = f.repo->Begin();
    (void)f.store.ImportAssetBatch(kCtx, *tx, outpoint, ExampleBatch(outpoint));
    tx->Commit();
  }
  assert(Count(*f.memory, "assets") == 2);
}

void TestEmptyBatchStillRecordsGenesisPoint() {
  Fixture    f;
  const auto result = f.store.ImportAssetBatch(kCtx, OutPointFor(0x90), {});
  assert(result.asset_ids.empty());
  assert(result.genesis_point_id != 0);
  assert(Count(*f.memory, "genesis_points") == 1);
}

void TestFetchMissingGenesis() {
  Fixture f;
  bool    threw = false;
  try {
    (void)f.store.FetchGenesis(kCtx, 77);
  } catch (const assetdb::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestExampleScenario();
  TestReimportIsIdempotent();
  TestIdsFollowInputOrder();
  TestFailureOnLastAssetRollsBackBatch();
  TestCancelledBeforeStartTouchesNothing();
  TestCancelMidBatchLeavesNoRows();
  TestAnchorsUsedOnlyWhenLengthsMatch();
  TestLockTimesAndVersions();
  TestOutOfRangeAmountIsRejected();
  TestAssetFromOtherOutpointIsRejected();
  TestCallerOwnedTransaction();
  TestEmptyBatchStillRecordsGenesisPoint();
  TestFetchMissingGenesis();

  std::cout << "assetdb_unit_asset_importer: pass\n";
  return 0;
}
