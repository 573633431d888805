// uniform_spartan.hpp
#pragma once

#include "commitment_scheme.hpp"
#include "common.hpp"
#include "eq_poly.hpp"
#include "errors.hpp"
#include "multilinear.hpp"
#include "r1cs.hpp"
#include "sumcheck.hpp"
#include "transcript.hpp"
#include "uniform_shape.hpp"

#include <array>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace spartan {

template <typename FieldT> struct UniformSpartanKey {
  R1CSShape<FieldT> shape_single_step;
  R1CSShape<FieldT> shape_full;
  size_t num_cons_total; // next_pow2(num_cons * num_steps)
  size_t num_vars_total; // next_pow2(num_vars * num_steps)
  size_t num_steps;
  FieldT vk_digest;

  size_t num_rounds_x() const { return log2_exact(num_cons_total); }
  size_t num_rounds_y() const { return log2_exact(num_vars_total) + 1; }

  // Leading bits of r_y that select the segment (plus the constant half)
  size_t num_prefix_bits() const {
    return log2_exact(num_vars_total) - log2_exact(num_steps) + 1;
  }
};

/*
 * Hash of everything the verifier trusts about the circuit: the
 * single-step matrices and the step count.
 */
template <typename FieldT>
FieldT compute_vk_digest(const R1CSShape<FieldT> &single, size_t num_steps) {
  Transcript t("UniformSpartanKey");
  t.absorb_u64("num_cons", single.num_cons);
  t.absorb_u64("num_vars", single.num_vars);
  t.absorb_u64("num_steps", num_steps);
  for (const SparseMatrix<FieldT> *M : {&single.A, &single.B, &single.C}) {
    t.absorb_u64("nnz", M->size());
    for (const auto &e : *M) {
      t.absorb_u64("row", e.row);
      if (e.col.is_constant()) {
        t.absorb_u64("const", 1);
      } else {
        t.absorb_u64("const", 0);
        t.absorb_u64("col", e.col.index());
      }
      t.absorb("val", e.val);
    }
  }
  return t.squeeze<FieldT>("digest");
}

/* ===================================================================== *
 *  Spartan for a uniform R1CS: N copies of one step circuit.            *
 *  The witness arrives as one N-long segment per step variable.        *
 *                                                                       *
 *  outer:  0 = \SUM_x eq(tau, x) (Az(x) Bz(x) - Cz(x))                  *
 *  inner:  Az(r_x) + r Bz(r_x) + r^2 Cz(r_x)                            *
 *            = \SUM_y (A + r B + r^2 C)(r_x, y) z(y)                    *
 *  then the segments are opened at the tail of r_y, batched by powers  *
 *  of c into a single opening of the commitment scheme.                *
 * ===================================================================== */
template <typename PCS> class UniformSpartanProof {
public:
  using FieldT = typename PCS::Field;
  using Traits = CommitmentSchemeTraits<PCS>;
  using Commitment = typename PCS::Commitment;
  using Poly = DenseMultilinearPolynomial<FieldT>;
  using Key = UniformSpartanKey<FieldT>;
  using Expander = UniformShapeExpander<FieldT>;

  std::vector<Commitment> witness_segment_commitments;
  SumcheckInstanceProof<FieldT> outer_sumcheck_proof;
  std::array<FieldT, 3> outer_sumcheck_claims; // Az, Bz, Cz at r_x
  SumcheckInstanceProof<FieldT> inner_sumcheck_proof;
  std::vector<FieldT> eval_W; // each segment at r_y[n_prefix..]
  typename PCS::Proof eval_arg;

  static Key setup(const UniformShapeBuilder<FieldT> &circuit,
                   size_t num_steps) {
    if (!is_power_of_two(num_steps))
      throw std::invalid_argument("setup: num_steps must be a power of two");

    libff::enter_block("UniformSpartan::setup");
    Key key;
    key.shape_single_step = circuit.single_step_shape();
    key.shape_single_step.check_indices();
    if (key.shape_single_step.num_cons == 0 || key.shape_single_step.num_vars == 0)
      throw std::invalid_argument("setup: empty step circuit");
    key.shape_full = circuit.full_shape(num_steps, key.shape_single_step);
    key.num_cons_total =
        next_power_of_two(key.shape_single_step.num_cons * num_steps);
    key.num_vars_total =
        next_power_of_two(key.shape_single_step.num_vars * num_steps);
    key.num_steps = num_steps;
    key.vk_digest = compute_vk_digest(key.shape_single_step, num_steps);
    libff::leave_block("UniformSpartan::setup");
    return key;
  }

  // Commits each segment, then proves
  static UniformSpartanProof
  prove(const typename PCS::ProverKey &pk, const Key &key,
        const std::vector<std::vector<FieldT>> &witness_segments) {
    check_segments(key, witness_segments);
    libff::enter_block("Commit to witness segments");
    std::vector<Commitment> commitments;
    commitments.reserve(witness_segments.size());
    for (const auto &segment : witness_segments)
      commitments.emplace_back(PCS::commit(pk, Poly(segment)));
    libff::leave_block("Commit to witness segments");
    return prove_precommitted(pk, key, witness_segments, std::move(commitments));
  }

  // Same as prove() with the segment commitments computed by the caller
  static UniformSpartanProof
  prove_precommitted(const typename PCS::ProverKey &pk, const Key &key,
                     const std::vector<std::vector<FieldT>> &witness_segments,
                     std::vector<Commitment> commitments) {
    check_segments(key, witness_segments);
    if (commitments.size() != witness_segments.size())
      throw SpartanError(SpartanErrorCode::kInvalidWitnessLength,
                         VerificationStage::kSetup,
                         "one commitment per witness segment expected");

    libff::enter_block("UniformSpartan::prove");
    const size_t N = key.num_steps;
    const size_t num_vars_total = key.num_vars_total;

    UniformSpartanProof proof;
    proof.witness_segment_commitments = std::move(commitments);

    Transcript transcript(transcript_label());
    transcript.absorb("vk", key.vk_digest);
    Traits::absorb(transcript, "U", proof.witness_segment_commitments);

    std::vector<FieldT> witness;
    witness.reserve(num_vars_total);
    for (const auto &segment : witness_segments)
      witness.insert(witness.end(), segment.begin(), segment.end());
    witness.resize(num_vars_total, FieldT::zero());

    /* ---------------------------- outer ---------------------------- */
    libff::enter_block("Outer sum-check");
    const size_t num_rounds_x = key.num_rounds_x();
    const std::vector<FieldT> tau = transcript.squeeze_vector<FieldT>("t", num_rounds_x);

    Poly poly_tau(EqPolynomial<FieldT>(tau).evals());
    auto abc = Expander::multiply_vec_uniform(key.shape_single_step, witness, N,
                                              key.num_cons_total);
    Poly poly_Az(std::move(abc[0]));
    Poly poly_Bz(std::move(abc[1]));
    Poly poly_Cz(std::move(abc[2]));

    auto outer = SumcheckInstanceProof<FieldT>::prove_cubic_with_additive_term(
        FieldT::zero(), num_rounds_x, poly_tau, poly_Az, poly_Bz, poly_Cz,
        OuterCombination<FieldT>(), transcript);
    proof.outer_sumcheck_proof = std::move(std::get<0>(outer));
    const std::vector<FieldT> r_x = std::move(std::get<1>(outer));
    const std::array<FieldT, 4> &outer_final = std::get<2>(outer);
    proof.outer_sumcheck_claims = {outer_final[1], outer_final[2], outer_final[3]};
    absorb_outer_claims(transcript, proof.outer_sumcheck_claims);
    libff::leave_block("Outer sum-check");

    /* ---------------------------- inner ---------------------------- */
    libff::enter_block("Inner sum-check");
    const FieldT r = transcript.squeeze<FieldT>("r");
    const FieldT claim_inner_joint = joint_claim(proof.outer_sumcheck_claims, r);

    Poly poly_ABC(Expander::compute_rlc_evals(key.shape_single_step, N,
                                              num_vars_total, r_x, r));
    // z = (W padded) || (1, 0, ..., 0)
    std::vector<FieldT> z = std::move(witness);
    z.resize(2 * num_vars_total, FieldT::zero());
    z[num_vars_total] = FieldT::one();
    Poly poly_z(std::move(z));

    auto inner = SumcheckInstanceProof<FieldT>::prove_quadratic(
        claim_inner_joint, key.num_rounds_y(), poly_ABC, poly_z,
        InnerCombination<FieldT>(), transcript);
    proof.inner_sumcheck_proof = std::move(std::get<0>(inner));
    const std::vector<FieldT> r_y = std::move(std::get<1>(inner));
    libff::leave_block("Inner sum-check");

    /* ------------------------ witness opening ---------------------- */
    libff::enter_block("Witness opening");
    const std::vector<FieldT> r_y_point(r_y.begin() + key.num_prefix_bits(),
                                        r_y.end());
    proof.eval_W = Poly::batch_evaluate(witness_segments, r_y_point);

    transcript.absorb("eval_W", proof.eval_W);
    const FieldT c = transcript.squeeze<FieldT>("c");
    const std::vector<FieldT> coeffs = powers_of(c, witness_segments.size());

    std::vector<FieldT> batched(N, FieldT::zero());
    for (size_t i = 0; i < witness_segments.size(); ++i) {
      const std::vector<FieldT> &segment = witness_segments[i];
      const FieldT &ci = coeffs[i];
      parallel_for(N, [&](size_t t) { batched[t] += ci * segment[t]; });
    }
    const FieldT batched_eval = batch_eval(proof.eval_W, coeffs);

    proof.eval_arg = PCS::open(pk, Poly(std::move(batched)), r_y_point,
                               batched_eval, transcript);
    libff::leave_block("Witness opening");

    libff::leave_block("UniformSpartan::prove");
    return proof;
  }

  // Throws SpartanError naming the stage that rejected the proof
  void verify(const typename PCS::VerifierKey &vk, const Key &key) const {
    const size_t num_vars = key.shape_single_step.num_vars;
    if (witness_segment_commitments.size() != num_vars)
      fail(SpartanErrorCode::kInvalidWitnessLength, VerificationStage::kSetup,
           "expected " + std::to_string(num_vars) + " segment commitments");
    if (eval_W.size() != num_vars)
      fail(SpartanErrorCode::kInvalidWitnessLength, VerificationStage::kSetup,
           "expected " + std::to_string(num_vars) + " segment evaluations");

    libff::enter_block("UniformSpartan::verify");
    Transcript transcript(transcript_label());
    transcript.absorb("vk", key.vk_digest);
    Traits::absorb(transcript, "U", witness_segment_commitments);

    /* ---------------------------- outer ---------------------------- */
    const size_t num_rounds_x = key.num_rounds_x();
    const std::vector<FieldT> tau = transcript.squeeze_vector<FieldT>("t", num_rounds_x);

    const auto outer = outer_sumcheck_proof.verify(
        FieldT::zero(), num_rounds_x, 3, transcript,
        VerificationStage::kOuterSumcheck);
    const FieldT &claim_outer_final = outer.first;
    const std::vector<FieldT> &r_x = outer.second;

    const FieldT &claim_Az = outer_sumcheck_claims[0];
    const FieldT &claim_Bz = outer_sumcheck_claims[1];
    const FieldT &claim_Cz = outer_sumcheck_claims[2];
    const FieldT taus_bound_rx = EqPolynomial<FieldT>(tau).evaluate(r_x);
    if (claim_outer_final != taus_bound_rx * (claim_Az * claim_Bz - claim_Cz))
      fail(SpartanErrorCode::kInvalidSumcheckProof,
           VerificationStage::kOuterFinalClaim,
           "eq(tau, r_x) * (Az * Bz - Cz) mismatch");
    absorb_outer_claims(transcript, outer_sumcheck_claims);

    /* ---------------------------- inner ---------------------------- */
    const FieldT r = transcript.squeeze<FieldT>("r");
    const FieldT claim_inner_joint = joint_claim(outer_sumcheck_claims, r);

    const auto inner = inner_sumcheck_proof.verify(
        claim_inner_joint, key.num_rounds_y(), 2, transcript,
        VerificationStage::kInnerSumcheck);
    const FieldT &claim_inner_final = inner.first;
    const std::vector<FieldT> &r_y = inner.second;

    // Z(r_y) from the segment evaluations and the constant slot
    const size_t n_prefix = key.num_prefix_bits();
    const std::vector<FieldT> r_seg(r_y.begin() + 1, r_y.begin() + n_prefix);
    FieldT eval_vars = FieldT::zero();
    for (size_t i = 0; i < num_vars; ++i)
      eval_vars += EqPolynomial<FieldT>::selector(r_seg, i) * eval_W[i];
    FieldT eval_const = r_y[0];
    for (size_t j = 1; j < r_y.size(); ++j)
      eval_const *= FieldT::one() - r_y[j];
    const FieldT eval_Z = (FieldT::one() - r_y[0]) * eval_vars + eval_const;

    const std::array<FieldT, 3> evals = Expander::evaluate_uniform(
        key.shape_single_step, key.num_steps, key.num_vars_total, r_x, r_y);
    const FieldT claim_inner_final_expected =
        (evals[0] + r * evals[1] + r * r * evals[2]) * eval_Z;
    if (claim_inner_final != claim_inner_final_expected)
      fail(SpartanErrorCode::kInvalidSumcheckProof,
           VerificationStage::kInnerFinalClaim,
           "(A + r B + r^2 C)(r_x, r_y) * Z(r_y) mismatch");

    /* ------------------------ witness opening ---------------------- */
    const std::vector<FieldT> r_y_point(r_y.begin() + n_prefix, r_y.end());
    transcript.absorb("eval_W", eval_W);
    const FieldT c = transcript.squeeze<FieldT>("c");
    const std::vector<FieldT> coeffs = powers_of(c, num_vars);
    const Commitment batched_com = PCS::combine(witness_segment_commitments, coeffs);
    const FieldT batched_eval = batch_eval(eval_W, coeffs);

    try {
      PCS::verify(vk, transcript, batched_com, r_y_point, batched_eval, eval_arg);
    } catch (const OpeningError &e) {
      fail(SpartanErrorCode::kInvalidOpeningProof,
           VerificationStage::kWitnessOpening,
           std::string(PCS::protocol_name()) + " opening rejected: " + e.what());
    }
    libff::leave_block("UniformSpartan::verify");
  }

private:
  static std::string transcript_label() {
    return std::string("R1CSSNARK/") + PCS::protocol_name();
  }

  static void check_segments(const Key &key,
                             const std::vector<std::vector<FieldT>> &segments) {
    if (segments.size() != key.shape_single_step.num_vars)
      throw SpartanError(SpartanErrorCode::kInvalidWitnessLength,
                         VerificationStage::kSetup,
                         "expected " +
                             std::to_string(key.shape_single_step.num_vars) +
                             " segments, got " + std::to_string(segments.size()));
    for (size_t i = 0; i < segments.size(); ++i)
      if (segments[i].size() != key.num_steps)
        throw SpartanError(SpartanErrorCode::kInvalidWitnessLength,
                           VerificationStage::kSetup,
                           "segment " + std::to_string(i) + " has length " +
                               std::to_string(segments[i].size()));
  }

  static void absorb_outer_claims(Transcript &transcript,
                                  const std::array<FieldT, 3> &claims) {
    transcript.absorb("claims_outer",
                      std::vector<FieldT>(claims.begin(), claims.end()));
  }

  static FieldT joint_claim(const std::array<FieldT, 3> &claims, const FieldT &r) {
    return claims[0] + r * claims[1] + r * r * claims[2];
  }

  static FieldT batch_eval(const std::vector<FieldT> &evals,
                           const std::vector<FieldT> &coeffs) {
    FieldT acc = FieldT::zero();
    for (size_t i = 0; i < evals.size(); ++i)
      acc += coeffs[i] * evals[i];
    return acc;
  }

  [[noreturn]] static void fail(SpartanErrorCode code, VerificationStage stage,
                                const std::string &detail) {
    if (!libff::inhibit_profiling_info) {
      libff::print_indent();
      printf("* UniformSpartan rejected in %s: %s\n", to_string(stage),
             detail.c_str());
    }
    throw SpartanError(code, stage, detail);
  }
};

} // namespace spartan
