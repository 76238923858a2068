#include "genesis.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

#include "internal/wire/outpoint_codec.hpp"

namespace assetdb::model {

namespace {

struct DigestCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using DigestCtx = std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter>;

DigestCtx NewSha256() {
  DigestCtx ctx(EVP_MD_CTX_new());
  if (!ctx) throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("OpenSSL: sha256 init failed");
  }
  return ctx;
}

void Update(const DigestCtx& ctx, const void* data, std::size_t size) {
  if (EVP_DigestUpdate(ctx.get(), data, size) != 1) {
    throw std::runtime_error("OpenSSL: sha256 update failed");
  }
}

std::array<uint8_t, 32> Final(const DigestCtx& ctx) {
  std::array<uint8_t, 32> out{};
  unsigned int            out_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1 || out_len != out.size()) {
    throw std::runtime_error("OpenSSL: sha256 final failed");
  }
  return out;
}

std::array<uint8_t, 32> Sha256(const void* data, std::size_t size) {
  auto ctx = NewSha256();
  Update(ctx, data, size);
  return Final(ctx);
}

} // namespace

AssetID Genesis::Id() const {
  const auto tag_hash  = Sha256(tag.data(), tag.size());
  const auto meta_hash = Sha256(metadata.data(), metadata.size());
  const auto prev_out  = wire::EncodeOutPoint(first_prev_out);

  const uint8_t index_be[4] = {
      static_cast<uint8_t>(output_index >> 24),
      static_cast<uint8_t>(output_index >> 16),
      static_cast<uint8_t>(output_index >> 8),
      static_cast<uint8_t>(output_index),
  };
  const auto type_byte = static_cast<uint8_t>(type);

  auto ctx = NewSha256();
  Update(ctx, prev_out.data(), prev_out.size());
  Update(ctx, tag_hash.data(), tag_hash.size());
  Update(ctx, meta_hash.data(), meta_hash.size());
  Update(ctx, index_be, sizeof(index_be));
  Update(ctx, &type_byte, 1);
  return Final(ctx);
}

} // namespace assetdb::model
