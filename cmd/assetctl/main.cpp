#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/asset_store.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/bytes.hpp"
#include "internal/util/context.hpp"
#include "internal/util/errors.hpp"
#include "internal/wire/import_batch.hpp"

static void Usage() {
  std::cout << "Usage:\n"
            << "  assetctl [--config <config.yaml>] import <batch.json>\n"
            << "  assetctl [--config <config.yaml>] genesis <gen_asset_id>\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

static int Import(assetdb::core::AssetStore& store, const std::string& batch_path) {
  const auto batch = assetdb::wire::ParseImportBatchJson(ReadFile(batch_path));

  const auto result = store.ImportAssetBatch(assetdb::util::Context::Background(), batch.genesis_outpoint, batch.assets,
                                             batch.anchor_refs);

  std::cout << "genesis_point_id=" << result.genesis_point_id << "\n";
  for (std::size_t i = 0; i < result.asset_ids.size(); ++i) {
    std::cout << "asset[" << i << "]=" << result.asset_ids[i] << "\n";
  }
  return 0;
}

static int Genesis(assetdb::core::AssetStore& store, const std::string& id) {
  const auto genesis = store.FetchGenesis(assetdb::util::Context::Background(), std::stoll(id));
  const auto asset_id = genesis.Id();

  std::cout << "asset_id=" << assetdb::util::ToHex(asset_id.data(), asset_id.size()) << "\n"
            << "outpoint="
            << assetdb::util::ToHex(genesis.first_prev_out.hash.data(), genesis.first_prev_out.hash.size()) << ":"
            << genesis.first_prev_out.index << "\n"
            << "tag=" << genesis.tag << "\n"
            << "metadata=" << assetdb::util::ToHex(genesis.metadata) << "\n"
            << "output_index=" << genesis.output_index << "\n"
            << "type=" << assetdb::model::ToString(genesis.type) << "\n";
  return 0;
}

int main(int argc, char** argv) {
  int         arg = 1;
  std::string config_path;
  if (argc > 2 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    arg         = 3;
  }

  if (argc - arg != 2) {
    Usage();
    return 1;
  }

  const std::string cmd   = argv[arg];
  const std::string value = argv[arg + 1];

  try {
    auto config = config_path.empty() ? assetdb::runtime::config::RuntimeConfig{}
                                      : assetdb::config::ConfigLoader::LoadFromYaml(config_path);

    assetdb::observability::InitializeLogging(config);

    assetdb::core::AssetStore store(assetdb::factory::BuildRepository(config));

    int rc = 1;
    if (cmd == "import") {
      rc = Import(store, value);
    } else if (cmd == "genesis") {
      rc = Genesis(store, value);
    } else {
      Usage();
    }

    assetdb::observability::ShutdownLogging();
    return rc;
  } catch (const assetdb::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    assetdb::observability::ShutdownLogging();
    return 3;
  } catch (const std::exception& e) {
    ASSETDB_LOG_ERROR("assetctl failed", {assetdb::observability::StringField("error", e.what())});
    assetdb::observability::ShutdownLogging();
    return 2;
  }
}
