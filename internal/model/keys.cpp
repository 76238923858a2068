#include "keys.hpp"

namespace assetdb::model {

const PubKey& TweakedKey(const ScriptKey& key) {
  return std::visit([](const auto& k) -> const PubKey& { return k.tweaked_key; }, key);
}

} // namespace assetdb::model
