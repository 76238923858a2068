#include "import_batch.hpp"

#include <algorithm>

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace assetdb::wire {

namespace {

util::Bytes Hex(const std::string& value, const char* field) {
  try {
    return util::FromHex(value);
  } catch (const util::EncodingError& e) {
    throw util::EncodingError(std::string(field) + ": " + e.what());
  }
}

model::OutPoint ToOutPoint(const assetdb::v1::OutPoint& proto) {
  const auto hash = Hex(proto.hash(), "outpoint hash");
  model::OutPoint outpoint;
  if (hash.size() != outpoint.hash.size()) {
    throw util::EncodingError("outpoint hash: expected 32 bytes, got " + std::to_string(hash.size()));
  }
  std::copy(hash.begin(), hash.end(), outpoint.hash.begin());
  outpoint.index = proto.index();
  return outpoint;
}

model::KeyDescriptor ToKeyDescriptor(const assetdb::v1::KeyDescriptor& proto, const char* field) {
  model::KeyDescriptor key;
  key.pub_key        = Hex(proto.pub_key(), field);
  key.locator.family = proto.locator().family();
  key.locator.index  = proto.locator().index();
  return key;
}

model::AssetType ToAssetType(assetdb::v1::AssetType type) {
  switch (type) {
    case assetdb::v1::ASSET_TYPE_NORMAL:
      return model::AssetType::kNormal;
    case assetdb::v1::ASSET_TYPE_COLLECTIBLE:
      return model::AssetType::kCollectible;
    default:
      throw util::InvalidArgument("unknown asset type " + std::to_string(static_cast<int>(type)));
  }
}

model::ScriptKey ToScriptKey(const assetdb::v1::Asset& proto) {
  switch (proto.script_key_case()) {
    case assetdb::v1::Asset::kDerived: {
      const auto&             derived = proto.derived();
      model::DerivedScriptKey key;
      key.raw_key     = ToKeyDescriptor(derived.raw_key(), "script raw key");
      key.tweaked_key = Hex(derived.tweaked_key(), "script tweaked key");
      if (!derived.tweak().empty()) {
        key.tweak = Hex(derived.tweak(), "script tweak");
      }
      return key;
    }
    case assetdb::v1::Asset::kObserved:
      return model::ObservedScriptKey{Hex(proto.observed().tweaked_key(), "script tweaked key")};
    default:
      throw util::InvalidArgument("asset has no script key");
  }
}

model::Asset ToAsset(const assetdb::v1::Asset& proto) {
  model::Asset asset;

  const auto& genesis          = proto.genesis();
  asset.genesis.first_prev_out = ToOutPoint(genesis.first_prev_out());
  asset.genesis.tag            = genesis.tag();
  asset.genesis.metadata       = Hex(genesis.metadata(), "genesis metadata");
  asset.genesis.output_index   = genesis.output_index();
  asset.genesis.type           = ToAssetType(genesis.type());

  asset.version    = proto.version();
  asset.script_key = ToScriptKey(proto);

  if (proto.has_group_key()) {
    const auto&     group = proto.group_key();
    model::GroupKey key;
    if (group.has_raw_key()) {
      key.raw_key = ToKeyDescriptor(group.raw_key(), "group raw key");
    }
    key.group_pub_key = Hex(group.group_pub_key(), "group public key");
    key.sig           = Hex(group.sig(), "group signature");
    asset.group_key   = std::move(key);
  }

  asset.script_version     = proto.script_version();
  asset.amount             = proto.amount();
  asset.lock_time          = proto.lock_time();
  asset.relative_lock_time = proto.relative_lock_time();
  return asset;
}

} // namespace

ImportBatch FromProto(const assetdb::v1::ImportBatchRequest& request) {
  ImportBatch batch;
  batch.genesis_outpoint = ToOutPoint(request.genesis_outpoint());

  bool any_anchor = false;
  for (const auto& asset : request.assets()) {
    batch.assets.push_back(ToAsset(asset));
    if (asset.anchor_utxo_id() != 0) {
      batch.anchor_refs.emplace_back(asset.anchor_utxo_id());
      any_anchor = true;
    } else {
      batch.anchor_refs.emplace_back(std::nullopt);
    }
  }
  if (!any_anchor) {
    batch.anchor_refs.clear();
  }
  return batch;
}

ImportBatch ParseImportBatchJson(const std::string& json) {
  assetdb::v1::ImportBatchRequest request;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &request, options);
  if (!status.ok()) {
    throw util::InvalidArgument("invalid import batch: " + std::string(status.message()));
  }
  return FromProto(request);
}

} // namespace assetdb::wire
