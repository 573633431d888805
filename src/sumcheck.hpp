// sumcheck.hpp
#pragma once

#include "common.hpp"
#include "errors.hpp"
#include "multilinear.hpp"
#include "transcript.hpp"
#include "univariate.hpp"

#include <array>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace spartan {

/* -------------------------------------------------------------------- *
 *  Combination functions used by the SNARK.  Both skip work on zero    *
 *  inputs but always return exactly the generic value.                 *
 * -------------------------------------------------------------------- */

// A * (B * C - D)
template <typename FieldT> struct OuterCombination {
  FieldT operator()(const FieldT &a, const FieldT &b, const FieldT &c,
                    const FieldT &d) const {
    if (b.is_zero() || c.is_zero()) {
      if (d.is_zero())
        return FieldT::zero();
      return a * (-d);
    }
    return a * (b * c - d);
  }
};

// A * B
template <typename FieldT> struct InnerCombination {
  FieldT operator()(const FieldT &a, const FieldT &b) const {
    if (a.is_zero() || b.is_zero())
      return FieldT::zero();
    return a * b;
  }
};

/* ===================================================================== *
 *  Non-interactive sum-check over dense multilinear tables.             *
 *  Round j binds the most significant free variable.  The prover sends  *
 *  g_j(X) = \SUM_{x in {0,1}^{rest}} comb(T_1(X, x), ..., T_k(X, x))    *
 *  in coefficient form; the challenge r_j comes from the transcript     *
 *  after absorbing g_j, and every table is folded at r_j (O(2^n) total  *
 *  prover time, tables halve every round).                              *
 * ===================================================================== */
template <typename FieldT> class SumcheckInstanceProof {
public:
  using Poly = DenseMultilinearPolynomial<FieldT>;
  using Univariate = UnivariatePolynomial<FieldT>;

  std::vector<Univariate> polys; // one per round

  SumcheckInstanceProof() = default;
  explicit SumcheckInstanceProof(std::vector<Univariate> p)
      : polys(std::move(p)) {}

  /*
   * Degree-3 sum-check of \SUM comb(A, B, C, D).  Returns the proof, the
   * challenge point r and the final values (A(r), B(r), C(r), D(r)).
   */
  template <typename Comb>
  static std::tuple<SumcheckInstanceProof, std::vector<FieldT>,
                    std::array<FieldT, 4>>
  prove_cubic_with_additive_term(const FieldT &claim, size_t num_rounds,
                                 Poly &A, Poly &B, Poly &C, Poly &D, Comb comb,
                                 Transcript &transcript) {
    std::array<Poly *, 4> tables = {&A, &B, &C, &D};
    auto result = prove_rounds<4, 3>(
        claim, num_rounds, tables,
        [&](const std::array<FieldT, 4> &v) {
          return comb(v[0], v[1], v[2], v[3]);
        },
        transcript);
    return std::make_tuple(std::move(result.first), std::move(result.second),
                           std::array<FieldT, 4>{A[0], B[0], C[0], D[0]});
  }

  // Degree-2 sum-check of \SUM comb(A, B); final values (A(r), B(r))
  template <typename Comb>
  static std::tuple<SumcheckInstanceProof, std::vector<FieldT>,
                    std::array<FieldT, 2>>
  prove_quadratic(const FieldT &claim, size_t num_rounds, Poly &A, Poly &B,
                  Comb comb, Transcript &transcript) {
    std::array<Poly *, 2> tables = {&A, &B};
    auto result = prove_rounds<2, 2>(
        claim, num_rounds, tables,
        [&](const std::array<FieldT, 2> &v) { return comb(v[0], v[1]); },
        transcript);
    return std::make_tuple(std::move(result.first), std::move(result.second),
                           std::array<FieldT, 2>{A[0], B[0]});
  }

  /*
   * Replays the rounds: each g_j must have degree <= degree_bound and
   * satisfy g_j(0) + g_j(1) = e_{j-1} (e_{-1} = claim).  Returns the
   * final claim e_{n-1} = g_{n-1}(r_{n-1}) and the point r, which the
   * caller still has to check against the oracle.
   */
  std::pair<FieldT, std::vector<FieldT>>
  verify(const FieldT &claim, size_t num_rounds, size_t degree_bound,
         Transcript &transcript, VerificationStage stage) const {
    if (polys.size() != num_rounds)
      fail(stage, "expected " + std::to_string(num_rounds) + " rounds, got " +
                      std::to_string(polys.size()));

    FieldT e = claim;
    std::vector<FieldT> r;
    r.reserve(num_rounds);
    for (size_t j = 0; j < num_rounds; ++j) {
      const Univariate &g = polys[j];
      if (g.degree() > degree_bound)
        fail(stage, "round " + std::to_string(j) + " degree " +
                        std::to_string(g.degree()) + " > " +
                        std::to_string(degree_bound));
      if (g.sum_over_binary() != e)
        fail(stage, "round " + std::to_string(j) + " g(0) + g(1) != claim");

      transcript.absorb("poly", g.coeffs);
      const FieldT r_j = transcript.squeeze<FieldT>("challenge_nextround");
      r.emplace_back(r_j);
      e = g.evaluate(r_j);
    }
    return std::make_pair(e, std::move(r));
  }

private:
  [[noreturn]] static void fail(VerificationStage stage,
                                const std::string &detail) {
    if (!libff::inhibit_profiling_info) {
      libff::print_indent();
      printf("* sum-check rejected in %s: %s\n", to_string(stage),
             detail.c_str());
    }
    throw SpartanError(SpartanErrorCode::kInvalidSumcheckProof, stage, detail);
  }

  /*
   * Shared round loop for K tables and round polynomials of degree DEG.
   * Only g(0), g(2), ..., g(DEG) are summed over the cube; g(1) is
   * claim - g(0).
   */
  template <size_t K, size_t DEG, typename Comb>
  static std::pair<SumcheckInstanceProof, std::vector<FieldT>>
  prove_rounds(const FieldT &claim, size_t num_rounds,
               const std::array<Poly *, K> &tables, Comb comb,
               Transcript &transcript) {
    for (const Poly *t : tables)
      if (t->num_variables() != num_rounds)
        throw std::invalid_argument(
            "sum-check: table size does not match the number of rounds");

    SumcheckInstanceProof proof;
    std::vector<FieldT> r;
    r.reserve(num_rounds);
    FieldT e = claim;

    for (size_t j = 0; j < num_rounds; ++j) {
      const size_t half = tables[0]->size() >> 1;

      // acc[0] = g(0), acc[k - 1] = g(k) for k = 2..DEG
      const std::array<FieldT, DEG> sums =
          parallel_accumulate<DEG, FieldT>(half, [&](size_t i,
                                                     std::array<FieldT, DEG> &acc) {
            std::array<FieldT, K> cur, step;
            for (size_t k = 0; k < K; ++k) {
              const Poly &t = *tables[k];
              cur[k] = t[i];
              step[k] = t[i + half] - t[i];
            }
            acc[0] += comb(cur);
            for (size_t k = 0; k < K; ++k)
              cur[k] += step[k]; // X = 1
            for (size_t x = 2; x <= DEG; ++x) {
              for (size_t k = 0; k < K; ++k)
                cur[k] += step[k];
              acc[x - 1] += comb(cur);
            }
          });

      std::vector<FieldT> evals(DEG + 1);
      evals[0] = sums[0];
      evals[1] = e - sums[0];
      for (size_t x = 2; x <= DEG; ++x)
        evals[x] = sums[x - 1];
      Univariate g = Univariate::from_evals(evals);

      transcript.absorb("poly", g.coeffs);
      const FieldT r_j = transcript.squeeze<FieldT>("challenge_nextround");
      r.emplace_back(r_j);
      e = g.evaluate(r_j);

      for (Poly *t : tables)
        t->bind_top_variable(r_j);
      proof.polys.emplace_back(std::move(g));
    }
    return std::make_pair(std::move(proof), std::move(r));
  }
};

} // namespace spartan
