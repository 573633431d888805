// zeromorph.hpp
#pragma once

#include "common.hpp"
#include "errors.hpp"
#include "multilinear.hpp"
#include "transcript.hpp"
#include "univariate.hpp"

#include <libff/algebra/scalar_multiplication/multiexp.hpp>

#include <algorithm>
#include <cstdio>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace spartan {

/* ===================================================================== *
 *  Zeromorph: multilinear commitments from univariate KZG.              *
 *  A table f on {0,1}^n is committed as the univariate polynomial whose *
 *  i-th coefficient is f[i].  Index bit j (LSB = bit 0) is the point    *
 *  coordinate u[n-1-j], so the last coordinate is the least significant *
 *  bit, matching the big-endian tables everywhere else.                 *
 * ===================================================================== */

/*
 * Multilinear quotients of f at u.  Step i splits the table into halves
 * lo/hi of size 2^{n-1-i}, records q = hi - lo and folds lo += u_i * q.
 * The output is reversed, so q_k has 2^k entries and depends only on the
 * last k coordinates:
 *   f(z) - f(u) = \SUM_k (z_{n-1-k} - u_{n-1-k}) * q_k(z_{n-k}, ..., z_{n-1})
 * The second component is the constant term left after n folds, f(u).
 */
template <typename FieldT>
std::pair<std::vector<std::vector<FieldT>>, FieldT>
compute_multilinear_quotients(const std::vector<FieldT> &f,
                              const std::vector<FieldT> &u) {
  const size_t n = u.size();
  if (f.size() != (size_t(1) << n))
    throw std::invalid_argument(
        "compute_multilinear_quotients: table size does not match the point");

  std::vector<FieldT> g = f;
  std::vector<std::vector<FieldT>> quotients;
  quotients.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    const size_t half = size_t(1) << (n - 1 - i);
    std::vector<FieldT> q(half);
    const FieldT u_i = u[i];
    parallel_for(half, [&](size_t j) {
      q[j] = g[j + half] - g[j];
      g[j] += u_i * q[j];
    });
    g.resize(half);
    quotients.emplace_back(std::move(q));
  }
  std::reverse(quotients.begin(), quotients.end());
  return std::make_pair(std::move(quotients), g[0]);
}

/*
 * q_hat(X) = \SUM_k y^k * X^{N - 2^k} * q_k(X).  Each y^k q_k lands at
 * offset N - 2^k of an N-long coefficient buffer, so no shifted copy of
 * q_k is ever built.
 */
template <typename FieldT>
std::vector<FieldT>
compute_batched_lifted_degree_quotient(size_t N,
                                       const std::vector<std::vector<FieldT>> &quotients,
                                       const FieldT &y) {
  std::vector<FieldT> q_hat(N, FieldT::zero());
  FieldT scalar = FieldT::one(); // y^k
  for (size_t k = 0; k < quotients.size(); ++k) {
    const std::vector<FieldT> &q = quotients[k];
    const size_t len = size_t(1) << k;
    if (q.size() != len || len > N)
      throw std::invalid_argument(
          "compute_batched_lifted_degree_quotient: bad quotient length");
    const size_t offset = N - len;
    parallel_for(len, [&](size_t i) { q_hat[offset + i] += scalar * q[i]; });
    scalar *= y;
  }
  return q_hat;
}

// Phi_k(x) = \SUM_{i < 2^k} x^i = (x^{2^k} - 1) / (x - 1)
template <typename FieldT> FieldT phi(const FieldT &x, size_t k) {
  FieldT x_pow = x;
  for (size_t i = 0; i < k; ++i)
    x_pow = x_pow.squared();
  if (x == FieldT::one())
    return FieldT(static_cast<long>(size_t(1) << k));
  return (x_pow - FieldT::one()) * (x - FieldT::one()).inverse();
}

template <typename FieldT> struct ZeromorphScalars {
  FieldT eval_scalar;          // -z * Phi_n(x)
  std::vector<FieldT> zeta;    // -y^k * x^{N - 2^k}
  std::vector<FieldT> z_terms; // -z * (x^{2^k} v_{k+1} - u_{n-1-k} v_k)
};

/*
 * Scalars the verifier (and the prover, for F) needs at x:
 *   squares  x^{2^i}, i = 0..n
 *   offset_k = \PROD_{k <= j < n} x^{2^j} = x^{N - 2^k}
 *   v_i      = (x^{2^n} - 1) / (x^{2^i} - 1) = Phi_{n-i}(x^{2^i})
 * All n + 1 denominators are inverted in one batch.
 */
template <typename FieldT>
ZeromorphScalars<FieldT> eval_and_quotient_scalars(const FieldT &y,
                                                   const FieldT &x,
                                                   const FieldT &z,
                                                   const std::vector<FieldT> &u) {
  const size_t n = u.size();

  std::vector<FieldT> squares(n + 1);
  squares[0] = x;
  for (size_t i = 1; i <= n; ++i)
    squares[i] = squares[i - 1].squared();

  std::vector<FieldT> offsets(n);
  FieldT acc = FieldT::one();
  for (size_t k = n; k-- > 0;) {
    acc *= squares[k];
    offsets[k] = acc;
  }

  const FieldT v_numer = squares[n] - FieldT::one();
  std::vector<FieldT> vs(n + 1);
  for (size_t i = 0; i <= n; ++i)
    vs[i] = squares[i] - FieldT::one();
  batch_invert(vs);
  for (auto &v : vs)
    v *= v_numer;

  ZeromorphScalars<FieldT> out;
  out.zeta.reserve(n);
  out.z_terms.reserve(n);
  FieldT y_pow = FieldT::one();
  for (size_t k = 0; k < n; ++k) {
    out.zeta.emplace_back(-(y_pow * offsets[k]));
    out.z_terms.emplace_back(-(z * (squares[k] * vs[k + 1] - u[n - 1 - k] * vs[k])));
    y_pow *= y;
  }
  out.eval_scalar = -(vs[0] * z);
  return out;
}

/* -------------------------------------------------------------------- *
 *  Keys, commitments and proofs                                        *
 * -------------------------------------------------------------------- */
template <typename ppT> struct ZeromorphProverKey {
  std::vector<libff::G1<ppT>> g1_powers;         // tau^i G1, i < max_degree
  std::vector<libff::G1<ppT>> shifted_g1_powers; // tau^{N_max - max_degree + i} G1
};

template <typename ppT> struct ZeromorphVerifierKey {
  size_t max_degree;
  libff::G1<ppT> g1;
  libff::G2<ppT> g2;
  libff::G2<ppT> tau_2;
  libff::G2<ppT> tau_shift_2; // tau^{N_max - max_degree} G2
};

template <typename ppT> struct ZeromorphCommitment {
  libff::G1<ppT> point;

  ZeromorphCommitment() : point(libff::G1<ppT>::zero()) {}
  explicit ZeromorphCommitment(const libff::G1<ppT> &p) : point(p) {}

  bool operator==(const ZeromorphCommitment &other) const {
    return point == other.point;
  }
};

template <typename ppT> struct ZeromorphProof {
  libff::G1<ppT> pi;
  libff::G1<ppT> q_hat_com;
  libff::G1<ppT> q_hat_shifted_com; // [X^{N_max - N} q_hat], bounds deg q_hat < N
  std::vector<libff::G1<ppT>> q_k_com;
};

/*
 * Structured reference string: tau^i G1 for i < N_max and tau^i G2 for
 * i <= N_max.  Built once and shared read-only between keys and tests.
 */
template <typename ppT> class ZeromorphSRS {
public:
  using Field = libff::Fr<ppT>;

  std::vector<libff::G1<ppT>> g1_powers;
  std::vector<libff::G2<ppT>> g2_powers;

  // tau is toxic waste; it only lives inside this call
  static std::shared_ptr<const ZeromorphSRS> setup(size_t max_degree,
                                                   const Field &tau) {
    libff::enter_block("Zeromorph SRS setup");
    auto srs = std::make_shared<ZeromorphSRS>();
    const std::vector<Field> powers = powers_of(tau, max_degree + 1);

    libff::enter_block("Compute G1 powers");
    const size_t g1_window = libff::get_exp_window_size<libff::G1<ppT>>(max_degree);
    const libff::window_table<libff::G1<ppT>> g1_table = libff::get_window_table(
        Field::size_in_bits(), g1_window, libff::G1<ppT>::one());
    srs->g1_powers = libff::batch_exp(
        Field::size_in_bits(), g1_window, g1_table,
        std::vector<Field>(powers.begin(), powers.begin() + max_degree));
    libff::leave_block("Compute G1 powers");

    libff::enter_block("Compute G2 powers");
    const size_t g2_window = libff::get_exp_window_size<libff::G2<ppT>>(max_degree + 1);
    const libff::window_table<libff::G2<ppT>> g2_table = libff::get_window_table(
        Field::size_in_bits(), g2_window, libff::G2<ppT>::one());
    srs->g2_powers = libff::batch_exp(Field::size_in_bits(), g2_window, g2_table, powers);
    libff::leave_block("Compute G2 powers");

    libff::leave_block("Zeromorph SRS setup");
    return srs;
  }

  static std::shared_ptr<const ZeromorphSRS> setup(size_t max_degree) {
    return setup(max_degree, Field::random_element());
  }

  size_t size() const { return g1_powers.size(); }

  /*
   * Keys for tables of exactly max_degree entries.  The prover also gets
   * the top max_degree G1 powers and the verifier tau^{N_max - max_degree}
   * G2, so that [q_hat] can be checked against a commitment shifted to the
   * end of the SRS.
   */
  std::pair<ZeromorphProverKey<ppT>, ZeromorphVerifierKey<ppT>>
  trim(size_t max_degree) const {
    if (max_degree > g1_powers.size())
      throw ZeromorphError(max_degree, g1_powers.size());
    const size_t offset = g1_powers.size() - max_degree;

    ZeromorphProverKey<ppT> pk;
    pk.g1_powers.assign(g1_powers.begin(), g1_powers.begin() + max_degree);
    pk.shifted_g1_powers.assign(g1_powers.begin() + offset, g1_powers.end());

    ZeromorphVerifierKey<ppT> vk;
    vk.max_degree = max_degree;
    vk.g1 = libff::G1<ppT>::one();
    vk.g2 = g2_powers[0];
    vk.tau_2 = g2_powers.size() > 1 ? g2_powers[1] : g2_powers[0];
    vk.tau_shift_2 = g2_powers[offset];
    return std::make_pair(std::move(pk), vk);
  }
};

/*
 * Owner of the process-wide SRS.  init() runs the setup under a once
 * flag at program start; later init() calls keep the first SRS.
 */
template <typename ppT> class SharedZeromorphSRS {
public:
  using SRS = ZeromorphSRS<ppT>;
  using Field = libff::Fr<ppT>;

  SharedZeromorphSRS() = default;
  SharedZeromorphSRS(const SharedZeromorphSRS &) = delete;
  SharedZeromorphSRS &operator=(const SharedZeromorphSRS &) = delete;

  std::shared_ptr<const SRS> init(size_t max_degree, const Field &tau) {
    std::call_once(flag_, [&] { srs_ = SRS::setup(max_degree, tau); });
    return srs_;
  }

  std::shared_ptr<const SRS> get() const {
    if (!srs_)
      throw std::logic_error("SharedZeromorphSRS: init() has not run");
    return srs_;
  }

private:
  std::once_flag flag_;
  std::shared_ptr<const SRS> srs_;
};

/* ===================================================================== *
 *  The scheme.  Opening f at u with value v:                            *
 *    1. commit q_k, squeeze y, commit q_hat and its shift to the top of *
 *       the SRS, squeeze x and z;                                       *
 *    2. F = q_hat + z f + eval_scalar * v + \SUM_k (zeta_k + Z_k) q_k   *
 *       vanishes at x;                                                  *
 *    3. pi = [F / (X - x)].                                             *
 *  The verifier checks                                                  *
 *    e([q_hat], tau^{N_max - N} G2) == e([X^{N_max - N} q_hat], G2)     *
 *  so deg q_hat < N, rebuilds C = [F] from commitments and checks       *
 *    e(C + x pi, G2) == e(pi, tau G2).                                  *
 *  Rejections throw OpeningError.                                       *
 * ===================================================================== */
template <typename ppT> class Zeromorph {
public:
  using Field = libff::Fr<ppT>;
  using G1 = libff::G1<ppT>;
  using ProverKey = ZeromorphProverKey<ppT>;
  using VerifierKey = ZeromorphVerifierKey<ppT>;
  using Commitment = ZeromorphCommitment<ppT>;
  using Proof = ZeromorphProof<ppT>;
  using SRS = ZeromorphSRS<ppT>;

  static const char *protocol_name() { return "zeromorph"; }

  static Commitment commit(const ProverKey &pk,
                           const DenseMultilinearPolynomial<Field> &poly) {
    return Commitment(commit_coeffs(pk.g1_powers, poly.evals()));
  }

  static void absorb(Transcript &transcript, const std::string &label,
                     const Commitment &com) {
    transcript.absorb_point(label, com.point);
  }

  // \SUM_i coeffs[i] * commitments[i]
  static Commitment combine(const std::vector<Commitment> &commitments,
                            const std::vector<Field> &coeffs) {
    if (commitments.size() != coeffs.size())
      throw std::invalid_argument("Zeromorph::combine: length mismatch");
    G1 acc = G1::zero();
    for (size_t i = 0; i < commitments.size(); ++i)
      acc = acc + coeffs[i] * commitments[i].point;
    return Commitment(acc);
  }

  static Proof open(const ProverKey &pk,
                    const DenseMultilinearPolynomial<Field> &poly,
                    const std::vector<Field> &point, const Field &eval,
                    Transcript &transcript) {
    const size_t n = point.size();
    if (poly.num_variables() != n)
      throw std::invalid_argument("Zeromorph::open: point length mismatch");
    const size_t N = poly.size();
    if (N != pk.g1_powers.size())
      throw std::invalid_argument("Zeromorph::open: key not trimmed to the polynomial size");

    libff::enter_block("Zeromorph::open");
    transcript.absorb("zm_point", point);
    transcript.absorb("zm_eval", eval);

    auto quotients = compute_multilinear_quotients(poly.evals(), point);
    if (quotients.second != eval)
      throw std::invalid_argument(
          "Zeromorph::open: claimed evaluation does not match polynomial");

    Proof proof;
    libff::enter_block("Commit to quotients");
    proof.q_k_com.reserve(n);
    for (const auto &q : quotients.first) {
      proof.q_k_com.emplace_back(commit_coeffs(pk.g1_powers, q));
      transcript.absorb_point("quo", proof.q_k_com.back());
    }
    libff::leave_block("Commit to quotients");

    const Field y = transcript.squeeze<Field>("y");
    const std::vector<Field> q_hat =
        compute_batched_lifted_degree_quotient(N, quotients.first, y);
    proof.q_hat_com = commit_coeffs(pk.g1_powers, q_hat);
    proof.q_hat_shifted_com = commit_coeffs(pk.shifted_g1_powers, q_hat);
    transcript.absorb_point("q_hat", proof.q_hat_com);

    const Field x = transcript.squeeze<Field>("x");
    const Field z = transcript.squeeze<Field>("z");
    const ZeromorphScalars<Field> s = eval_and_quotient_scalars(y, x, z, point);

    // F = q_hat + z f + eval_scalar * v + \SUM_k (zeta_k + Z_k) q_k
    std::vector<Field> F = q_hat;
    const std::vector<Field> &f = poly.evals();
    parallel_for(N, [&](size_t i) { F[i] += z * f[i]; });
    F[0] += s.eval_scalar * eval;
    for (size_t k = 0; k < n; ++k) {
      const Field scalar = s.zeta[k] + s.z_terms[k];
      const std::vector<Field> &q = quotients.first[k];
      parallel_for(q.size(), [&](size_t i) { F[i] += scalar * q[i]; });
    }

    Field remainder;
    const UnivariatePolynomial<Field> witness =
        UnivariatePolynomial<Field>(std::move(F)).divide_by_linear(x, &remainder);
    if (!remainder.is_zero())
      throw std::logic_error("Zeromorph::open: F does not vanish at x");
    proof.pi = commit_coeffs(pk.g1_powers, witness.coeffs);

    libff::leave_block("Zeromorph::open");
    return proof;
  }

  static void verify(const VerifierKey &vk, Transcript &transcript,
                     const Commitment &commitment,
                     const std::vector<Field> &point, const Field &eval,
                     const Proof &proof) {
    const size_t n = point.size();
    if (proof.q_k_com.size() != n)
      reject(OpeningFailure::kQuotientCount);
    if (n >= 8 * sizeof(size_t) || vk.max_degree != (size_t(1) << n))
      reject(OpeningFailure::kKeySize);

    libff::enter_block("Zeromorph::verify");
    transcript.absorb("zm_point", point);
    transcript.absorb("zm_eval", eval);
    for (const auto &com : proof.q_k_com)
      transcript.absorb_point("quo", com);
    const Field y = transcript.squeeze<Field>("y");
    transcript.absorb_point("q_hat", proof.q_hat_com);
    const Field x = transcript.squeeze<Field>("x");
    const Field z = transcript.squeeze<Field>("z");

    if (ppT::reduced_pairing(proof.q_hat_com, vk.tau_shift_2) !=
        ppT::reduced_pairing(proof.q_hat_shifted_com, vk.g2)) {
      libff::leave_block("Zeromorph::verify");
      reject(OpeningFailure::kDegreeBound);
    }

    const ZeromorphScalars<Field> s = eval_and_quotient_scalars(y, x, z, point);

    G1 C = proof.q_hat_com + z * commitment.point +
           (s.eval_scalar * eval) * vk.g1;
    for (size_t k = 0; k < n; ++k)
      C = C + (s.zeta[k] + s.z_terms[k]) * proof.q_k_com[k];

    const libff::GT<ppT> lhs = ppT::reduced_pairing(C + x * proof.pi, vk.g2);
    const libff::GT<ppT> rhs = ppT::reduced_pairing(proof.pi, vk.tau_2);
    libff::leave_block("Zeromorph::verify");

    if (lhs != rhs)
      reject(OpeningFailure::kPairing);
  }

private:
  static G1 commit_coeffs(const std::vector<G1> &bases,
                          const std::vector<Field> &coeffs) {
    if (coeffs.size() > bases.size())
      throw std::invalid_argument("Zeromorph: polynomial exceeds key length");
    if (coeffs.empty())
      return G1::zero();
    return libff::multi_exp<G1, Field, libff::multi_exp_method_BDLO12>(
        bases.cbegin(), bases.cbegin() + coeffs.size(),
        coeffs.cbegin(), coeffs.cend(), 1);
  }

  [[noreturn]] static void reject(OpeningFailure reason) {
    if (!libff::inhibit_profiling_info) {
      libff::print_indent();
      printf("* Zeromorph opening rejected: %s\n", to_string(reason));
    }
    throw OpeningError(reason);
  }
};

} // namespace spartan
