#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace assetdb::testing {

/*
  Repository decorator for tests.

  Forwards every call to the wrapped repository, counts calls per
  operation and can fail the nth call of an operation with a chosen
  error code. A failed call never reaches the wrapped repository.
*/
class FaultInjectingRepository final : public db::Repository {
 public:
  explicit FaultInjectingRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  // nth is 1-based and counts calls made after this point.
  void FailOn(const std::string& operation, int nth, db::ErrorCode code = db::ErrorCode::IOError) {
    faults_[operation] = Fault{Calls(operation) + nth, code};
  }

  // Runs before every forwarded call, with the operation name.
  void OnCall(std::function<void(const std::string&)> hook) {
    hook_ = std::move(hook);
  }

  // Truncates prev_out in FetchGenesisByID results.
  void CorruptStoredOutPoints() {
    corrupt_outpoints_ = true;
  }

  int Calls(const std::string& operation) const {
    const auto it = calls_.find(operation);
    return it == calls_.end() ? 0 : it->second;
  }

  int TotalCalls() const {
    int total = 0;
    for (const auto& [_, count] : calls_) total += count;
    return total;
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result UpsertGenesisPoint(db::Transaction& tx, db::model::GenesisPointRecord& r) override {
    if (auto fault = Hit("UpsertGenesisPoint"); !fault) return fault;
    return inner_->UpsertGenesisPoint(tx, r);
  }

  db::Result UpsertGenesisAsset(db::Transaction& tx, db::model::GenesisAssetRecord& r) override {
    if (auto fault = Hit("UpsertGenesisAsset"); !fault) return fault;
    return inner_->UpsertGenesisAsset(tx, r);
  }

  db::Result FetchGenesisByID(db::Transaction& tx, int64_t id, db::model::GenesisRecord& out) override {
    if (auto fault = Hit("FetchGenesisByID"); !fault) return fault;
    auto result = inner_->FetchGenesisByID(tx, id, out);
    if (result && corrupt_outpoints_ && !out.prev_out.empty()) {
      out.prev_out.pop_back();
    }
    return result;
  }

  db::Result UpsertInternalKey(db::Transaction& tx, db::model::InternalKeyRecord& r) override {
    if (auto fault = Hit("UpsertInternalKey"); !fault) return fault;
    return inner_->UpsertInternalKey(tx, r);
  }

  db::Result FetchInternalKey(db::Transaction& tx, int64_t id, db::model::InternalKeyRecord& out) override {
    if (auto fault = Hit("FetchInternalKey"); !fault) return fault;
    return inner_->FetchInternalKey(tx, id, out);
  }

  db::Result FetchScriptKeyIDByTweakedKey(db::Transaction& tx, const util::Bytes& key, int64_t& id) override {
    if (auto fault = Hit("FetchScriptKeyIDByTweakedKey"); !fault) return fault;
    return inner_->FetchScriptKeyIDByTweakedKey(tx, key, id);
  }

  db::Result UpsertScriptKey(db::Transaction& tx, db::model::ScriptKeyRecord& r) override {
    if (auto fault = Hit("UpsertScriptKey"); !fault) return fault;
    return inner_->UpsertScriptKey(tx, r);
  }

  db::Result FetchScriptKey(db::Transaction& tx, int64_t id, db::model::ScriptKeyRecord& out) override {
    if (auto fault = Hit("FetchScriptKey"); !fault) return fault;
    return inner_->FetchScriptKey(tx, id, out);
  }

  db::Result UpsertAssetGroupKey(db::Transaction& tx, db::model::GroupKeyRecord& r) override {
    if (auto fault = Hit("UpsertAssetGroupKey"); !fault) return fault;
    return inner_->UpsertAssetGroupKey(tx, r);
  }

  db::Result UpsertAssetGroupSig(db::Transaction& tx, db::model::GroupSigRecord& r) override {
    if (auto fault = Hit("UpsertAssetGroupSig"); !fault) return fault;
    return inner_->UpsertAssetGroupSig(tx, r);
  }

  db::Result InsertNewAsset(db::Transaction& tx, db::model::AssetRecord& r) override {
    if (auto fault = Hit("InsertNewAsset"); !fault) return fault;
    return inner_->InsertNewAsset(tx, r);
  }

  db::Result FetchAsset(db::Transaction& tx, int64_t id, db::model::AssetRecord& out) override {
    return inner_->FetchAsset(tx, id, out);
  }

  db::Result CountRows(db::Transaction& tx, std::string_view table, int64_t& count) override {
    return inner_->CountRows(tx, table, count);
  }

 private:
  struct Fault {
    int           at_call = 0;
    db::ErrorCode code    = db::ErrorCode::IOError;
  };

  db::Result Hit(const std::string& operation) {
    if (hook_) hook_(operation);
    const int  call = ++calls_[operation];
    const auto it   = faults_.find(operation);
    if (it != faults_.end() && it->second.at_call == call) {
      return db::Result::Err(it->second.code, "injected fault in " + operation);
    }
    return db::Result::Ok();
  }

  std::shared_ptr<db::Repository> inner_;
  std::map<std::string, int>      calls_;
  std::map<std::string, Fault>    faults_;
  bool                            corrupt_outpoints_ = false;

  std::function<void(const std::string&)> hook_;
};

} // namespace assetdb::testing
