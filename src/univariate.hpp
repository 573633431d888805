// univariate.hpp
#pragma once

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace spartan {

/* -------------------------------------------------------------------- *
 *  Univariate polynomial, dense coefficients lowest degree first.      *
 *  Sum-check rounds send these; Zeromorph uses them for quotients.     *
 * -------------------------------------------------------------------- */
template <typename FieldT> class UnivariatePolynomial {
public:
  std::vector<FieldT> coeffs;

  UnivariatePolynomial() = default;
  explicit UnivariatePolynomial(std::vector<FieldT> c) : coeffs(std::move(c)) {}

  /*
   * Interpolate from g(0), g(1), ..., g(d).  Builds each Lagrange basis
   * numerator \PROD_{j != i} (X - j) explicitly; d is tiny (<= 3 in the
   * sum-checks), so the O(d^2) cost does not matter.
   */
  static UnivariatePolynomial from_evals(const std::vector<FieldT> &evals) {
    const size_t d1 = evals.size();
    if (d1 == 0)
      throw std::invalid_argument("from_evals: no evaluations");
    std::vector<FieldT> out(d1, FieldT::zero());
    for (size_t i = 0; i < d1; ++i) {
      std::vector<FieldT> basis(1, FieldT::one());
      FieldT denom = FieldT::one();
      for (size_t j = 0; j < d1; ++j) {
        if (j == i)
          continue;
        const FieldT xj = FieldT(static_cast<long>(j));
        // basis *= (X - xj)
        std::vector<FieldT> next(basis.size() + 1, FieldT::zero());
        for (size_t k = 0; k < basis.size(); ++k) {
          next[k + 1] += basis[k];
          next[k] -= xj * basis[k];
        }
        basis.swap(next);
        denom *= FieldT(static_cast<long>(i)) - xj;
      }
      const FieldT scale = evals[i] * denom.inverse();
      for (size_t k = 0; k < d1; ++k)
        out[k] += scale * basis[k];
    }
    return UnivariatePolynomial(std::move(out));
  }

  size_t degree() const {
    size_t d = coeffs.size();
    while (d > 1 && coeffs[d - 1].is_zero())
      --d;
    return d == 0 ? 0 : d - 1;
  }

  // Horner
  FieldT evaluate(const FieldT &x) const {
    FieldT acc = FieldT::zero();
    for (size_t i = coeffs.size(); i-- > 0;)
      acc = acc * x + coeffs[i];
    return acc;
  }

  // g(0) + g(1)
  FieldT sum_over_binary() const {
    if (coeffs.empty())
      return FieldT::zero();
    FieldT acc = coeffs[0];
    for (const auto &c : coeffs)
      acc += c;
    return acc;
  }

  UnivariatePolynomial &operator+=(const UnivariatePolynomial &other) {
    if (other.coeffs.size() > coeffs.size())
      coeffs.resize(other.coeffs.size(), FieldT::zero());
    for (size_t i = 0; i < other.coeffs.size(); ++i)
      coeffs[i] += other.coeffs[i];
    return *this;
  }

  UnivariatePolynomial &operator*=(const FieldT &scalar) {
    for (auto &c : coeffs)
      c *= scalar;
    return *this;
  }

  bool operator==(const UnivariatePolynomial &other) const {
    const size_t len = std::max(coeffs.size(), other.coeffs.size());
    for (size_t i = 0; i < len; ++i) {
      const FieldT a = i < coeffs.size() ? coeffs[i] : FieldT::zero();
      const FieldT b = i < other.coeffs.size() ? other.coeffs[i] : FieldT::zero();
      if (a != b)
        return false;
    }
    return true;
  }

  /*
   * Synthetic division by (X - x).  Returns the quotient; the remainder,
   * which equals g(x), is written to *remainder when requested.
   */
  UnivariatePolynomial divide_by_linear(const FieldT &x,
                                        FieldT *remainder = nullptr) const {
    if (coeffs.empty()) {
      if (remainder)
        *remainder = FieldT::zero();
      return UnivariatePolynomial();
    }
    std::vector<FieldT> q(coeffs.size() - 1, FieldT::zero());
    FieldT carry = FieldT::zero();
    for (size_t i = coeffs.size(); i-- > 1;) {
      carry = coeffs[i] + carry * x;
      q[i - 1] = carry;
    }
    if (remainder)
      *remainder = coeffs[0] + carry * x;
    return UnivariatePolynomial(std::move(q));
  }
};

} // namespace spartan
