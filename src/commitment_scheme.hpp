// commitment_scheme.hpp
#pragma once

#include "errors.hpp"
#include "multilinear.hpp"
#include "transcript.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace spartan {

/* -------------------------------------------------------------------- *
 *  Multilinear commitment scheme seen from the SNARK.  A scheme is a   *
 *  class with static members only:                                     *
 *                                                                      *
 *    Field, ProverKey, VerifierKey, Commitment, Proof                  *
 *    commit(pk, poly)                                  -> Commitment   *
 *    open(pk, poly, point, eval, transcript)           -> Proof        *
 *    verify(vk, transcript, com, point, eval, proof)   -> void         *
 *    combine(commitments, coeffs)                      -> Commitment   *
 *    absorb(transcript, label, com)                                    *
 *    protocol_name()                                                   *
 *                                                                      *
 *  combine must be additively homomorphic: the SNARK batches several   *
 *  openings at one point into one by a random linear combination.     *
 *  verify reports a rejected opening by throwing OpeningError.         *
 * -------------------------------------------------------------------- */
template <typename PCS> struct CommitmentSchemeTraits {
  using Field = typename PCS::Field;
  using ProverKey = typename PCS::ProverKey;
  using VerifierKey = typename PCS::VerifierKey;
  using Commitment = typename PCS::Commitment;
  using Proof = typename PCS::Proof;
  using Poly = DenseMultilinearPolynomial<Field>;

  static_assert(
      std::is_same<decltype(PCS::commit(std::declval<const ProverKey &>(),
                                        std::declval<const Poly &>())),
                   Commitment>::value,
      "commit(pk, poly) must return a Commitment");
  static_assert(
      std::is_same<decltype(PCS::open(std::declval<const ProverKey &>(),
                                      std::declval<const Poly &>(),
                                      std::declval<const std::vector<Field> &>(),
                                      std::declval<const Field &>(),
                                      std::declval<Transcript &>())),
                   Proof>::value,
      "open(pk, poly, point, eval, transcript) must return a Proof");
  static_assert(
      std::is_same<decltype(PCS::verify(std::declval<const VerifierKey &>(),
                                        std::declval<Transcript &>(),
                                        std::declval<const Commitment &>(),
                                        std::declval<const std::vector<Field> &>(),
                                        std::declval<const Field &>(),
                                        std::declval<const Proof &>())),
                   void>::value,
      "verify(vk, transcript, commitment, point, eval, proof) must return void");
  static_assert(
      std::is_same<decltype(PCS::combine(
                       std::declval<const std::vector<Commitment> &>(),
                       std::declval<const std::vector<Field> &>())),
                   Commitment>::value,
      "combine(commitments, coeffs) must return a Commitment");

  static void absorb(Transcript &transcript, const std::string &label,
                     const std::vector<Commitment> &commitments) {
    transcript.absorb_u64(label, commitments.size());
    for (const auto &com : commitments)
      PCS::absorb(transcript, label, com);
  }
};

} // namespace spartan
