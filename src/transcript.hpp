// transcript.hpp
#pragma once

#include "errors.hpp"

#include <libff/algebra/fields/bigint.hpp>
#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace spartan {

/* -------------------------------------------------------------------- *
 *  Fiat-Shamir transcript.                                             *
 *  absorb() appends labelled bytes to a pending buffer; squeeze()      *
 *  hashes  state || pending || label  with SHA-256, makes the digest   *
 *  the new state and maps it to a field element.  Prover and verifier *
 *  must call absorb/squeeze in exactly the same order.                 *
 * -------------------------------------------------------------------- */
class Transcript {
public:
  using Digest = std::array<uint8_t, 32>;

  explicit Transcript(const std::string &protocol_label) {
    state.fill(0);
    absorb_bytes("protocol", protocol_label.data(), protocol_label.size());
    state = hash({});
    pending.clear();
  }

  void absorb_bytes(const std::string &label, const void *data, size_t len) {
    append_label(label);
    const uint64_t n = len;
    append_raw(&n, sizeof(n));
    append_raw(data, len);
  }

  void absorb_u64(const std::string &label, uint64_t value) {
    absorb_bytes(label, &value, sizeof(value));
  }

  // Canonical (non-Montgomery) limbs of the element
  template <typename FieldT>
  void absorb(const std::string &label, const FieldT &value) {
    const auto repr = value.as_bigint();
    absorb_bytes(label, repr.data, sizeof(repr.data));
  }

  template <typename FieldT>
  void absorb(const std::string &label, const std::vector<FieldT> &values) {
    absorb_u64(label, values.size());
    for (const auto &v : values)
      absorb(label, v);
  }

  // Group elements go through libff's stream serialisation (affine form)
  template <typename GroupT>
  void absorb_point(const std::string &label, const GroupT &point) {
    std::ostringstream ss;
    ss << point;
    const std::string bytes = ss.str();
    absorb_bytes(label, bytes.data(), bytes.size());
  }

  template <typename FieldT> FieldT squeeze(const std::string &label) {
    append_label(label);
    state = hash({});
    pending.clear();
    return field_from_state<FieldT>();
  }

  template <typename FieldT>
  std::vector<FieldT> squeeze_vector(const std::string &label, size_t n) {
    std::vector<FieldT> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i)
      out.emplace_back(squeeze<FieldT>(label));
    return out;
  }

  const Digest &current_state() const { return state; }

private:
  Digest state;
  std::vector<uint8_t> pending;

  void append_raw(const void *data, size_t len) {
    const uint8_t *p = static_cast<const uint8_t *>(data);
    pending.insert(pending.end(), p, p + len);
  }

  void append_label(const std::string &label) {
    const uint32_t n = static_cast<uint32_t>(label.size());
    append_raw(&n, sizeof(n));
    append_raw(label.data(), label.size());
  }

  struct MdCtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
  };

  // SHA-256( state || pending || extra )
  Digest hash(const std::vector<uint8_t> &extra) const {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx)
      throw TranscriptError("failed to create EVP_MD_CTX");
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
      throw TranscriptError("failed to initialize SHA256 digest");
    if (EVP_DigestUpdate(ctx.get(), state.data(), state.size()) != 1 ||
        EVP_DigestUpdate(ctx.get(), pending.data(), pending.size()) != 1 ||
        EVP_DigestUpdate(ctx.get(), extra.data(), extra.size()) != 1)
      throw TranscriptError("failed to update digest");
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1)
      throw TranscriptError("failed to finalize digest");
    if (out_len != 32)
      throw TranscriptError("unexpected digest length");
    Digest d;
    std::memcpy(d.data(), out, d.size());
    return d;
  }

  /*
   * Fill the limbs of a bigint from SHA-256(state || counter) blocks,
   * then clear every bit from num_bits - 1 upwards so the value is
   * below the modulus.
   */
  template <typename FieldT> FieldT field_from_state() const {
    libff::bigint<FieldT::num_limbs> repr;
    const size_t limb_bytes = sizeof(repr.data);
    std::vector<uint8_t> bytes;
    for (uint8_t counter = 0; bytes.size() < limb_bytes; ++counter) {
      const Digest block = hash({counter});
      bytes.insert(bytes.end(), block.begin(), block.end());
    }
    std::memcpy(repr.data, bytes.data(), limb_bytes);

    const size_t limb_bits = 8 * sizeof(repr.data[0]);
    const size_t keep = FieldT::num_bits - 1;
    const size_t num_limbs = limb_bytes / sizeof(repr.data[0]);
    for (size_t i = 0; i < num_limbs; ++i) {
      const size_t lo = i * limb_bits;
      if (lo >= keep) {
        repr.data[i] = 0;
      } else if (lo + limb_bits > keep) {
        const size_t bits = keep - lo;
        repr.data[i] &= (mp_limb_t(1) << bits) - 1;
      }
    }
    return FieldT(repr);
  }
};

} // namespace spartan
