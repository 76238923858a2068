#pragma once

#include <string>
#include <vector>

#include "assetdb/v1/import.pb.h"
#include "internal/core/asset_importer.hpp"
#include "internal/model/asset.hpp"
#include "internal/model/outpoint.hpp"

namespace assetdb::wire {

// Decoded form of an assetdb.v1.ImportBatchRequest.
struct ImportBatch {
  model::OutPoint           genesis_outpoint;
  std::vector<model::Asset> assets;
  core::AnchorRefs          anchor_refs;
};

// Throws util::EncodingError on malformed hex and util::InvalidArgument
// on a missing script key or an unknown asset type.
ImportBatch FromProto(const assetdb::v1::ImportBatchRequest& request);

// Parses the JSON mapping of ImportBatchRequest.
ImportBatch ParseImportBatchJson(const std::string& json);

} // namespace assetdb::wire
