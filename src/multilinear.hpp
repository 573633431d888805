// multilinear.hpp
#pragma once

#include "common.hpp"
#include "eq_poly.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace spartan {

/* ----------------------------------------------------------- *
 *  Dense multilinear extension, stored as its evaluations on  *
 *  the Boolean cube.  Index bits are read big-endian: the     *
 *  first coordinate of a point is the most significant bit.   *
 * ----------------------------------------------------------- */
template <typename FieldT> class DenseMultilinearPolynomial {
  size_t n;                   // #variables  (= log_2 |values|)
  std::vector<FieldT> values; // evaluations on the Boolean cube

public:
  explicit DenseMultilinearPolynomial(std::vector<FieldT> cube_values)
      : n(0), values(std::move(cube_values)) {
    while ((size_t(1) << n) < values.size())
      ++n; // derive n
    if (values.size() != (size_t(1) << n))
      throw std::invalid_argument("table size must be power of two");
  }

  size_t num_variables() const { return n; }
  size_t size() const { return values.size(); }

  const FieldT &operator[](size_t i) const { return values[i]; }

  /*
   * g(r_0,...,r_{n-1}) in O(2^n): bind the top variable n times.
   * After the i-th iteration the table holds g(r_0, ..., r_i, ...),
   * so the length halves each time: 2^n -> 2^{n-1} -> ... -> 1.
   */
  FieldT evaluate(const std::vector<FieldT> &point) const {
    if (point.size() != n)
      throw std::invalid_argument("bad point length");
    std::vector<FieldT> tmp = values;
    for (size_t i = 0; i < n; ++i)
      bind_top_inplace(tmp, point[i]);
    return tmp.front(); // single value left
  }

  // Fix the most significant variable to r, in place (one sum-check round)
  void bind_top_variable(const FieldT &r) {
    if (n == 0)
      throw std::invalid_argument("no variable left to bind");
    bind_top_inplace(values, r);
    --n;
  }

  /*
   * Fold the top variable: for every pair (x_0 = 0, x_0 = 1) at
   * distance half, keep the affine interpolation lo + r * (hi - lo).
   * With all other coordinates fixed, g is linear in x_0.
   */
  static void bind_top_inplace(std::vector<FieldT> &vec, const FieldT &r) {
    const size_t half = vec.size() >> 1;
    parallel_for(half, [&](size_t i) {
      vec[i] += r * (vec[i + half] - vec[i]);
    });
    vec.resize(half); // drop the now-unused half
  }

  // Evaluate several tables of equal size at one point, sharing eq(point, .)
  static std::vector<FieldT>
  batch_evaluate(const std::vector<std::vector<FieldT>> &polys,
                 const std::vector<FieldT> &point) {
    const std::vector<FieldT> eq = EqPolynomial<FieldT>(point).evals();
    for (const auto &poly : polys)
      if (poly.size() != eq.size())
        throw std::invalid_argument("batch_evaluate: bad table length");
    std::vector<FieldT> out(polys.size(), FieldT::zero());
    parallel_for(polys.size(), [&](size_t p) {
      FieldT acc = FieldT::zero();
      for (size_t i = 0; i < eq.size(); ++i)
        acc += eq[i] * polys[p][i];
      out[p] = acc;
    });
    return out;
  }

  /* ---------------------------------------------------------------- *
   *  Read-only access to the full table on {0,1}^n.                   *
   * ---------------------------------------------------------------- */
  const std::vector<FieldT> &evals() const { return values; }
};

} // namespace spartan
