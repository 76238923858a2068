#include "internal/core/group_key_resolver.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/genesis_resolver.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fault_injecting_repository.hpp"
#include "tests/support/fixtures.hpp"

namespace {

using assetdb::core::GenesisResolver;
using assetdb::core::GroupKeyResolver;
using assetdb::core::InternalKeyResolver;
using assetdb::db::memory::MemoryRepository;
using assetdb::testing::Count;
using assetdb::testing::FaultInjectingRepository;
using assetdb::testing::GenesisFor;
using assetdb::testing::GroupFor;
using assetdb::testing::Key;
using assetdb::testing::OutPointFor;

const auto kCtx = assetdb::util::Context::Background();

struct Fixture {
  std::shared_ptr<MemoryRepository>         memory = std::make_shared<MemoryRepository>();
  std::shared_ptr<FaultInjectingRepository> repo   = std::make_shared<FaultInjectingRepository>(memory);
  InternalKeyResolver                       internal_keys{*repo};
  GroupKeyResolver                          resolver{*repo, internal_keys};
  GenesisResolver                           genesis{*repo};
};

void TestAbsentGroupKeyWritesNothing() {
  Fixture f;
  auto    tx = f.repo->Begin();

  const auto point = f.genesis.UpsertGenesisPoint(kCtx, *tx, OutPointFor(1));
  const auto gen   = f.genesis.UpsertGenesisAsset(kCtx, *tx, point, GenesisFor(OutPointFor(1), "plain"));

  const int before = f.repo->TotalCalls();
  assert(!f.resolver.Upsert(kCtx, *tx, std::nullopt, point, gen).has_value());
  assert(f.repo->TotalCalls() == before);
  tx->Commit();

  assert(Count(*f.memory, "asset_groups") == 0);
  assert(Count(*f.memory, "asset_group_sigs") == 0);
}

void TestObservedGroupUsesGroupKeyAsInternalKey() {
  Fixture f;
  auto    tx = f.repo->Begin();

  const auto point = f.genesis.UpsertGenesisPoint(kCtx, *tx, OutPointFor(1));
  const auto gen   = f.genesis.UpsertGenesisAsset(kCtx, *tx, point, GenesisFor(OutPointFor(1), "grouped"));

  const auto sig = f.resolver.Upsert(kCtx, *tx, GroupFor(7), point, gen);
  assert(sig.has_value());

  // the tweaked group key was stored as a zero-locator internal key
  const auto key_id = f.internal_keys.Upsert(kCtx, *tx, GroupFor(7).group_pub_key, {});
  assetdb::db::model::InternalKeyRecord internal;
  assert(f.repo->FetchInternalKey(*tx, key_id, internal));
  assert(internal.key_family == 0);
  assert(internal.key_index == 0);
  tx->Commit();

  assert(Count(*f.memory, "internal_keys") == 1);
  assert(Count(*f.memory, "asset_groups") == 1);
  assert(Count(*f.memory, "asset_group_sigs") == 1);
}

void TestKnownRawKeyIsRecorded() {
  Fixture f;
  auto    tx = f.repo->Begin();

  const auto point = f.genesis.UpsertGenesisPoint(kCtx, *tx, OutPointFor(2));
  const auto gen   = f.genesis.UpsertGenesisAsset(kCtx, *tx, point, GenesisFor(OutPointFor(2), "owned"));

  auto group    = GroupFor(8);
  group.raw_key = assetdb::model::KeyDescriptor{Key(42), assetdb::model::KeyLocator{6, 1}};
  (void)f.resolver.Upsert(kCtx, *tx, group, point, gen);

  // only the raw key becomes an internal key, not the tweaked group key
  const auto raw_key_id = f.internal_keys.Upsert(kCtx, *tx, Key(42), {});
  assetdb::db::model::InternalKeyRecord internal;
  assert(f.repo->FetchInternalKey(*tx, raw_key_id, internal));
  assert(internal.key_family == 6);
  assert(internal.key_index == 1);
  tx->Commit();

  assert(Count(*f.memory, "internal_keys") == 1);
}

void TestOneSigPerGenesisAssetAndGroup() {
  Fixture f;
  auto    tx = f.repo->Begin();

  const auto point = f.genesis.UpsertGenesisPoint(kCtx, *tx, OutPointFor(3));
  const auto gen_a = f.genesis.UpsertGenesisAsset(kCtx, *tx, point, GenesisFor(OutPointFor(3), "a", 0));
  const auto gen_b = f.genesis.UpsertGenesisAsset(kCtx, *tx, point, GenesisFor(OutPointFor(3), "b", 1));

  const auto sig_a  = f.resolver.Upsert(kCtx, *tx, GroupFor(9), point, gen_a);
  const auto sig_a2 = f.resolver.Upsert(kCtx, *tx, GroupFor(9), point, gen_a);
  const auto sig_b  = f.resolver.Upsert(kCtx, *tx, GroupFor(9), point, gen_b);
  assert(sig_a == sig_a2);
  assert(sig_a != sig_b);
  tx->Commit();

  // reissuance shares the group key row
  assert(Count(*f.memory, "asset_groups") == 1);
  assert(Count(*f.memory, "asset_group_sigs") == 2);
}

void TestEmptyGroupKeyIsRejected() {
  Fixture f;
  auto    tx = f.repo->Begin();

  auto group          = GroupFor(1);
  group.group_pub_key = {};

  bool threw = false;
  try {
    (void)f.resolver.Upsert(kCtx, *tx, group, 1, 1);
  } catch (const assetdb::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(f.repo->TotalCalls() == 0);
}

void TestSigFailureCarriesEntityName() {
  Fixture f;
  auto    tx = f.repo->Begin();

  const auto point = f.genesis.UpsertGenesisPoint(kCtx, *tx, OutPointFor(4));
  const auto gen   = f.genesis.UpsertGenesisAsset(kCtx, *tx, point, GenesisFor(OutPointFor(4), "x"));

  f.repo->FailOn("UpsertAssetGroupSig", 1, assetdb::db::ErrorCode::Busy);
  bool threw = false;
  try {
    (void)f.resolver.Upsert(kCtx, *tx, GroupFor(5), point, gen);
  } catch (const assetdb::util::StoreError& e) {
    threw = e.Code() == assetdb::db::ErrorCode::Busy && std::string(e.what()).find("group sig") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestAbsentGroupKeyWritesNothing();
  TestObservedGroupUsesGroupKeyAsInternalKey();
  TestKnownRawKeyIsRecorded();
  TestOneSigPerGenesisAssetAndGroup();
  TestEmptyGroupKeyIsRejected();
  TestSigFailureCarriesEntityName();

  std::cout << "assetdb_unit_group_key_resolver: pass\n";
  return 0;
}
