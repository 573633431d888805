// eq_poly.hpp
#pragma once

#include "common.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace spartan {

/* -------------------------------------------------------------------- *
 *  eq(r, x) = \PROD_i ( r_i x_i + (1 - r_i)(1 - x_i) )                 *
 *  Lagrange indicator of the boolean point x, big-endian: r_0 selects  *
 *  the most significant bit of the hypercube index.                    *
 * -------------------------------------------------------------------- */
template <typename FieldT> class EqPolynomial {
  std::vector<FieldT> r;

public:
  explicit EqPolynomial(std::vector<FieldT> r_) : r(std::move(r_)) {}

  size_t num_variables() const { return r.size(); }

  // eq(r, rx) in O(|r|)
  FieldT evaluate(const std::vector<FieldT> &rx) const {
    if (rx.size() != r.size())
      throw std::invalid_argument("EqPolynomial: bad point length");
    FieldT acc = FieldT::one();
    for (size_t i = 0; i < r.size(); ++i)
      acc *= r[i] * rx[i] + (FieldT::one() - r[i]) * (FieldT::one() - rx[i]);
    return acc;
  }

  /*
   * Table of eq(r, x) for every x in {0,1}^n, built by doubling:
   * after processing r_0..r_j the prefix holds eq((r_0..r_j), .).
   * Entries are written back to front so the update is in place.
   */
  std::vector<FieldT> evals() const {
    const size_t n = r.size();
    std::vector<FieldT> table(size_t(1) << n, FieldT::zero());
    table[0] = FieldT::one();
    size_t size = 1;
    for (size_t j = 0; j < n; ++j) {
      const FieldT rj = r[j];
      for (size_t i = size; i-- > 0;) {
        const FieldT scalar = table[i];
        table[2 * i + 1] = scalar * rj;
        table[2 * i] = scalar - table[2 * i + 1];
      }
      size <<= 1;
    }
    return table;
  }

  // eq(bits, binary(index)) with bits[0] the most significant bit
  static FieldT selector(const std::vector<FieldT> &bits, size_t index) {
    const size_t width = bits.size();
    FieldT acc = FieldT::one();
    for (size_t j = 0; j < width; ++j) {
      const bool bit = (index >> (width - 1 - j)) & 1;
      acc *= bit ? bits[j] : (FieldT::one() - bits[j]);
    }
    return acc;
  }
};

} // namespace spartan
