// common.hpp
#pragma once

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libff/common/profiling.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <vector>

#ifdef MULTICORE
#include <omp.h>
#endif

namespace spartan {

using default_pp = libff::alt_bn128_pp;
using Fr = libff::Fr<default_pp>;

/* -------------------------------------------------------------------- *
 *  One-time libff curve initialisation.  Every entry point (tests,     *
 *  drivers) calls this before touching field or group elements.        *
 * -------------------------------------------------------------------- */
template <typename ppT = default_pp> void init_public_params() {
  static std::once_flag flag;
  std::call_once(flag, [] { ppT::init_public_params(); });
}

inline bool is_power_of_two(size_t n) { return n != 0 && (n & (n - 1)) == 0; }

inline size_t next_power_of_two(size_t n) {
  size_t p = 1;
  while (p < n)
    p <<= 1;
  return p;
}

// log2 of an exact power of two
inline size_t log2_exact(size_t n) {
  if (!is_power_of_two(n))
    throw std::invalid_argument("log2_exact: argument is not a power of two");
  size_t k = 0;
  while ((size_t(1) << k) < n)
    ++k;
  return k;
}

template <typename FieldT>
std::vector<FieldT> powers_of(const FieldT &base, size_t n) {
  std::vector<FieldT> out;
  out.reserve(n);
  FieldT acc = FieldT::one();
  for (size_t i = 0; i < n; ++i) {
    out.emplace_back(acc);
    acc *= base;
  }
  return out;
}

/*
 * Montgomery's trick: one inversion plus 3(n-1) multiplications.
 * Every element must be non-zero.
 */
template <typename FieldT> void batch_invert(std::vector<FieldT> &vec) {
  if (vec.empty())
    return;
  std::vector<FieldT> prefix(vec.size());
  FieldT acc = FieldT::one();
  for (size_t i = 0; i < vec.size(); ++i) {
    if (vec[i].is_zero())
      throw std::invalid_argument("batch_invert: zero element");
    prefix[i] = acc;
    acc *= vec[i];
  }
  FieldT inv = acc.inverse();
  for (size_t i = vec.size(); i-- > 0;) {
    const FieldT tmp = inv * prefix[i];
    inv *= vec[i];
    vec[i] = tmp;
  }
}

/* -------------------------------------------------------------------- *
 *  Data-parallel helpers.  With MULTICORE the loop is split into        *
 *  contiguous chunks whose partial sums are combined in chunk order;   *
 *  field addition is exact, so both builds give identical results.    *
 * -------------------------------------------------------------------- */
template <typename Func> void parallel_for(size_t n, Func f) {
#ifdef MULTICORE
#pragma omp parallel for
  for (long long i = 0; i < static_cast<long long>(n); ++i)
    f(static_cast<size_t>(i));
#else
  for (size_t i = 0; i < n; ++i)
    f(i);
#endif
}

// acc[j] = \SUM_i f_j(i); f(i, acc) adds its terms into acc
template <size_t D, typename FieldT, typename Func>
std::array<FieldT, D> parallel_accumulate(size_t n, Func f) {
  std::array<FieldT, D> total;
  total.fill(FieldT::zero());
#ifdef MULTICORE
  const size_t chunks = static_cast<size_t>(omp_get_max_threads());
  std::vector<std::array<FieldT, D>> partial(chunks, total);
  const size_t per_chunk = (n + chunks - 1) / chunks;
#pragma omp parallel for
  for (long long c = 0; c < static_cast<long long>(chunks); ++c) {
    const size_t begin = static_cast<size_t>(c) * per_chunk;
    const size_t end = std::min(n, begin + per_chunk);
    for (size_t i = begin; i < end; ++i)
      f(i, partial[c]);
  }
  for (const auto &p : partial)
    for (size_t j = 0; j < D; ++j)
      total[j] += p[j];
#else
  for (size_t i = 0; i < n; ++i)
    f(i, total);
#endif
  return total;
}

} // namespace spartan
