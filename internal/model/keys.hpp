#pragma once

#include <cstdint>
#include <optional>
#include <variant>

#include "internal/util/bytes.hpp"

namespace assetdb::model {

// Compressed public key serialization (33 bytes for secp256k1).
using PubKey = util::Bytes;

// Wallet derivation path of a key. Zero/zero means unknown.
struct KeyLocator {
  uint32_t family = 0;
  uint32_t index  = 0;

  bool operator==(const KeyLocator&) const = default;
};

struct KeyDescriptor {
  PubKey     pub_key;
  KeyLocator locator;

  bool operator==(const KeyDescriptor&) const = default;
};

// Wallet-owned script key: raw key and tweak are known.
struct DerivedScriptKey {
  KeyDescriptor              raw_key;
  PubKey                     tweaked_key;
  std::optional<util::Bytes> tweak;
};

// Script key seen in a foreign proof: only the tweaked key is known.
struct ObservedScriptKey {
  PubKey tweaked_key;
};

using ScriptKey = std::variant<DerivedScriptKey, ObservedScriptKey>;

const PubKey& TweakedKey(const ScriptKey& key);

/*
  Reissuance key of an asset group.

  raw_key is only present when the group was created by this wallet;
  proofs from other nodes carry just the tweaked group key and the
  signature tying the genesis to it.
*/
struct GroupKey {
  std::optional<KeyDescriptor> raw_key;
  PubKey                       group_pub_key;
  util::Bytes                  sig;
};

} // namespace assetdb::model
