#include "internal/model/genesis.hpp"

#include <openssl/sha.h>

#include <cassert>
#include <iostream>

#include "internal/util/bytes.hpp"

namespace {

using assetdb::model::AssetType;
using assetdb::model::Genesis;

Genesis Sample() {
  Genesis genesis;
  genesis.first_prev_out.hash.fill(0x11);
  genesis.first_prev_out.index = 2;
  genesis.tag                  = "silver";
  genesis.metadata             = {0xde, 0xad, 0xbe, 0xef};
  genesis.output_index         = 0x0a0b0c0d;
  genesis.type                 = AssetType::kCollectible;
  return genesis;
}

// Preimage assembled by hand with the one-shot SHA256() API.
assetdb::model::AssetID ExpectedId(const Genesis& genesis) {
  assetdb::util::Bytes preimage(genesis.first_prev_out.hash.begin(), genesis.first_prev_out.hash.end());
  const uint32_t       index = genesis.first_prev_out.index;
  preimage.push_back(static_cast<uint8_t>(index));
  preimage.push_back(static_cast<uint8_t>(index >> 8));
  preimage.push_back(static_cast<uint8_t>(index >> 16));
  preimage.push_back(static_cast<uint8_t>(index >> 24));

  uint8_t digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const uint8_t*>(genesis.tag.data()), genesis.tag.size(), digest);
  preimage.insert(preimage.end(), digest, digest + sizeof(digest));
  SHA256(genesis.metadata.data(), genesis.metadata.size(), digest);
  preimage.insert(preimage.end(), digest, digest + sizeof(digest));

  preimage.push_back(static_cast<uint8_t>(genesis.output_index >> 24));
  preimage.push_back(static_cast<uint8_t>(genesis.output_index >> 16));
  preimage.push_back(static_cast<uint8_t>(genesis.output_index >> 8));
  preimage.push_back(static_cast<uint8_t>(genesis.output_index));
  preimage.push_back(static_cast<uint8_t>(genesis.type));

  assetdb::model::AssetID id{};
  SHA256(preimage.data(), preimage.size(), id.data());
  return id;
}

void TestIdMatchesPreimageLayout() {
  const auto genesis = Sample();
  assert(genesis.Id() == ExpectedId(genesis));
}

void TestIdIsDeterministic() {
  assert(Sample().Id() == Sample().Id());
}

void TestEveryFieldChangesId() {
  const auto base = Sample().Id();

  auto g = Sample();
  g.first_prev_out.index++;
  assert(g.Id() != base);

  g = Sample();
  g.first_prev_out.hash[0] ^= 1;
  assert(g.Id() != base);

  g = Sample();
  g.tag = "gold";
  assert(g.Id() != base);

  g = Sample();
  g.metadata.push_back(0);
  assert(g.Id() != base);

  g = Sample();
  g.output_index = 0;
  assert(g.Id() != base);

  g = Sample();
  g.type = AssetType::kNormal;
  assert(g.Id() != base);
}

void TestEmptyTagAndMetadata() {
  Genesis genesis;
  assert(genesis.Id() == ExpectedId(genesis));
}

} // namespace

int main() {
  TestIdMatchesPreimageLayout();
  TestIdIsDeterministic();
  TestEveryFieldChangesId();
  TestEmptyTagAndMetadata();

  std::cout << "assetdb_unit_genesis_id: pass\n";
  return 0;
}
