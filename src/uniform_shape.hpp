// uniform_shape.hpp
#pragma once

#include "common.hpp"
#include "eq_poly.hpp"
#include "r1cs.hpp"

#include <array>
#include <stdexcept>
#include <vector>

namespace spartan {

/* ===================================================================== *
 *  Uniform (step-repeated) R1CS.                                        *
 *  A single-step entry (row, col, val) stands for the N entries         *
 *      (row * N + t, col * N + t, val),   t in [0, N)                   *
 *  of the full shape, while entries in the constant column stay in the  *
 *  one global constant slot.  Row and column indices therefore split    *
 *  into (step-local | time) bits, and every sum over the full shape     *
 *  factors into a step-local table times a time table.                 *
 *                                                                       *
 *  Full witness layout: W[col * N + t] is variable col at step t, i.e.  *
 *  W is the concatenation of N-long segments, one per variable.  The    *
 *  full z = (W padded to num_vars_total) || (1, 0, ..., 0).            *
 * ===================================================================== */
template <typename FieldT> class UniformShapeExpander {
public:
  // Explicit full shape; only setup and tests ever build it
  static R1CSShape<FieldT> materialize(const R1CSShape<FieldT> &single,
                                       size_t num_steps) {
    if (!is_power_of_two(num_steps))
      throw std::invalid_argument("num_steps must be a power of two");
    auto expand = [&](const SparseMatrix<FieldT> &small) {
      SparseMatrix<FieldT> big;
      big.reserve(small.size() * num_steps);
      for (const auto &e : small) {
        for (size_t t = 0; t < num_steps; ++t) {
          const Column col =
              e.col.is_constant()
                  ? Column::constant()
                  : Column::variable(e.col.index() * num_steps + t);
          big.emplace_back(e.row * num_steps + t, col, e.val);
        }
      }
      return big;
    };
    return R1CSShape<FieldT>::create(single.num_cons * num_steps,
                                     single.num_vars * num_steps,
                                     expand(single.A), expand(single.B),
                                     expand(single.C));
  }

  /*
   * (Az, Bz, Cz) of the full shape without materialising it.
   * Each step t writes only rows row * N + t, so steps run in parallel.
   */
  static std::array<std::vector<FieldT>, 3>
  multiply_vec_uniform(const R1CSShape<FieldT> &single,
                       const std::vector<FieldT> &witness, size_t num_steps,
                       size_t num_cons_total) {
    if (witness.size() < single.num_vars * num_steps)
      throw SpartanError(SpartanErrorCode::kInvalidWitnessLength,
                         VerificationStage::kSetup,
                         "witness shorter than num_vars * num_steps");
    if (num_cons_total < single.num_cons * num_steps)
      throw std::invalid_argument("num_cons_total too small");

    std::array<std::vector<FieldT>, 3> out;
    const SparseMatrix<FieldT> *mats[3] = {&single.A, &single.B, &single.C};
    for (size_t m = 0; m < 3; ++m) {
      out[m].assign(num_cons_total, FieldT::zero());
      const SparseMatrix<FieldT> &M = *mats[m];
      std::vector<FieldT> &dst = out[m];
      parallel_for(num_steps, [&](size_t t) {
        for (const auto &e : M) {
          const FieldT z = e.col.is_constant()
                               ? FieldT::one()
                               : witness[e.col.index() * num_steps + t];
          dst[e.row * num_steps + t] += e.val * z;
        }
      });
    }
    return out;
  }

  /*
   * Table of RLC(y) = A(r_x, y) + r B(r_x, y) + r^2 C(r_x, y) over all
   * 2 * num_vars_total columns y, in O(nnz + num_vars_total):
   *   1. small_M(col) = \SUM_row eq(rx_con, row) * M[row][col]
   *   2. RLC(col * N + t) = eq(rx_ts, t) * small_RLC(col)
   *   3. RLC(num_vars_total) = small_RLC(const) * \SUM_t eq(rx_ts, t)
   */
  static std::vector<FieldT>
  compute_rlc_evals(const R1CSShape<FieldT> &single, size_t num_steps,
                    size_t num_vars_total, const std::vector<FieldT> &r_x,
                    const FieldT &r) {
    const size_t step_bits = log2_exact(num_steps);
    if (r_x.size() < step_bits)
      throw std::invalid_argument("compute_rlc_evals: r_x too short");
    if (single.num_vars * num_steps > num_vars_total)
      throw std::invalid_argument("compute_rlc_evals: num_vars_total too small");

    const std::vector<FieldT> rx_con(r_x.begin(), r_x.end() - step_bits);
    const std::vector<FieldT> rx_ts(r_x.end() - step_bits, r_x.end());
    const std::vector<FieldT> eq_rx_con = EqPolynomial<FieldT>(rx_con).evals();
    const std::vector<FieldT> eq_rx_ts = EqPolynomial<FieldT>(rx_ts).evals();
    if (eq_rx_con.size() < single.num_cons)
      throw std::invalid_argument("compute_rlc_evals: r_x too short");

    // slot num_vars holds the constant column
    auto small_evals = [&](const SparseMatrix<FieldT> &M) {
      std::vector<FieldT> evals(single.num_vars + 1, FieldT::zero());
      for (const auto &e : M) {
        const size_t slot = e.col.is_constant() ? single.num_vars : e.col.index();
        evals[slot] += eq_rx_con[e.row] * e.val;
      }
      return evals;
    };
    const std::vector<FieldT> a = small_evals(single.A);
    const std::vector<FieldT> b = small_evals(single.B);
    const std::vector<FieldT> c = small_evals(single.C);

    const FieldT r_sq = r * r;
    std::vector<FieldT> small_rlc(a.size());
    for (size_t i = 0; i < a.size(); ++i)
      small_rlc[i] = a[i] + r * b[i] + r_sq * c[i];

    std::vector<FieldT> rlc(2 * num_vars_total, FieldT::zero());
    parallel_for(num_vars_total, [&](size_t col) {
      const size_t var = col / num_steps;
      if (var < single.num_vars)
        rlc[col] = eq_rx_ts[col % num_steps] * small_rlc[var];
    });

    FieldT eq_sum = FieldT::zero();
    for (const auto &v : eq_rx_ts)
      eq_sum += v;
    rlc[num_vars_total] = small_rlc[single.num_vars] * eq_sum;
    return rlc;
  }

  /*
   * (A, B, C)(r_x, r_y) from the single-step shape in O(nnz + log):
   *   var col:   eq(rx_con,row) * (1 - r_y[0]) * eq(ry_seg,col) * eq(rx_ts,ry_ts)
   *   const col: eq(rx_con,row) * r_y[0] * \PROD_{j>=1} (1 - r_y[j])
   * using \SUM_t eq(rx_ts, t) eq(ry_ts, t) = eq(rx_ts, ry_ts) and
   * \SUM_t eq(rx_ts, t) = 1.
   */
  static std::array<FieldT, 3>
  evaluate_uniform(const R1CSShape<FieldT> &single, size_t num_steps,
                   size_t num_vars_total, const std::vector<FieldT> &r_x,
                   const std::vector<FieldT> &r_y) {
    const size_t step_bits = log2_exact(num_steps);
    const size_t var_bits = log2_exact(num_vars_total);
    if (r_y.size() != var_bits + 1 || r_x.size() < step_bits ||
        var_bits < step_bits)
      throw std::invalid_argument("evaluate_uniform: bad point length");
    const size_t n_prefix = var_bits - step_bits + 1;

    const std::vector<FieldT> rx_con(r_x.begin(), r_x.end() - step_bits);
    const std::vector<FieldT> rx_ts(r_x.end() - step_bits, r_x.end());
    const std::vector<FieldT> ry_seg(r_y.begin() + 1, r_y.begin() + n_prefix);
    const std::vector<FieldT> ry_ts(r_y.begin() + n_prefix, r_y.end());

    const std::vector<FieldT> eq_rx_con = EqPolynomial<FieldT>(rx_con).evals();
    const std::vector<FieldT> eq_ry_seg = EqPolynomial<FieldT>(ry_seg).evals();
    if (eq_rx_con.size() < single.num_cons || eq_ry_seg.size() < single.num_vars)
      throw std::invalid_argument("evaluate_uniform: point too short for shape");
    const FieldT eq_ts = EqPolynomial<FieldT>(rx_ts).evaluate(ry_ts);

    const FieldT var_weight = (FieldT::one() - r_y[0]) * eq_ts;
    FieldT const_weight = r_y[0];
    for (size_t j = 1; j < r_y.size(); ++j)
      const_weight *= FieldT::one() - r_y[j];

    auto eval = [&](const SparseMatrix<FieldT> &M) {
      FieldT acc = FieldT::zero();
      for (const auto &e : M) {
        const FieldT col_weight =
            e.col.is_constant() ? const_weight
                                : var_weight * eq_ry_seg[e.col.index()];
        acc += e.val * eq_rx_con[e.row] * col_weight;
      }
      return acc;
    };
    return {eval(single.A), eval(single.B), eval(single.C)};
  }

  /*
   * Reference evaluation over an explicitly materialised full shape with
   * full eq tables T_x = eq(r_x, .) and T_y = eq(r_y, .).  O(N * nnz).
   */
  static std::array<FieldT, 3>
  evaluate_materialized(const R1CSShape<FieldT> &full, size_t num_vars_total,
                        const std::vector<FieldT> &r_x,
                        const std::vector<FieldT> &r_y) {
    const std::vector<FieldT> T_x = EqPolynomial<FieldT>(r_x).evals();
    const std::vector<FieldT> T_y = EqPolynomial<FieldT>(r_y).evals();
    if (T_y.size() != 2 * num_vars_total || T_x.size() < full.num_cons ||
        full.num_vars > num_vars_total)
      throw std::invalid_argument("evaluate_materialized: bad point length");

    auto eval = [&](const SparseMatrix<FieldT> &M) {
      FieldT acc = FieldT::zero();
      for (const auto &e : M) {
        const size_t col =
            e.col.is_constant() ? num_vars_total : e.col.index();
        acc += e.val * T_x[e.row] * T_y[col];
      }
      return acc;
    };
    return {eval(full.A), eval(full.B), eval(full.C)};
  }
};

/*
 * Implemented by circuit authors: the one-step shape, and optionally a
 * custom expansion over num_steps steps.
 */
template <typename FieldT> class UniformShapeBuilder {
public:
  virtual ~UniformShapeBuilder() = default;
  virtual R1CSShape<FieldT> single_step_shape() const = 0;
  virtual R1CSShape<FieldT>
  full_shape(size_t num_steps, const R1CSShape<FieldT> &single_step) const {
    return UniformShapeExpander<FieldT>::materialize(single_step, num_steps);
  }
};

} // namespace spartan
