// tests/test_zeromorph.cpp
// ----------------------------------------------
#include <gtest/gtest.h>

#include "common.hpp"
#include "errors.hpp"
#include "multilinear.hpp"
#include "transcript.hpp"
#include "univariate.hpp"
#include "zeromorph.hpp"

#include <memory>
#include <random>
#include <vector>

using ppT = spartan::default_pp;
using FieldT = spartan::Fr;
using Poly = spartan::DenseMultilinearPolynomial<FieldT>;
using ZM = spartan::Zeromorph<ppT>;
using SRS = spartan::ZeromorphSRS<ppT>;
using spartan::OpeningFailure;
using spartan::Transcript;

static spartan::SharedZeromorphSRS<ppT> shared_srs;
static constexpr size_t kMaxVars = 7;

/* ---------------------------- helpers ----------------------------- */
static std::vector<FieldT> random_vec(size_t len, std::mt19937_64 &rng) {
  std::uniform_int_distribution<uint64_t> dist;
  std::vector<FieldT> v(len);
  for (auto &x : v)
    x = FieldT(dist(rng));
  return v;
}

static FieldT random_field(std::mt19937_64 &rng) { return random_vec(1, rng)[0]; }

// \SUM_{i < 2^k} x^i by direct summation
static FieldT phi_direct(const FieldT &x, size_t k) {
  FieldT acc = FieldT::zero(), pow = FieldT::one();
  for (size_t i = 0; i < (size_t(1) << k); ++i) {
    acc += pow;
    pow *= x;
  }
  return acc;
}

static void expect_rejected(const ZM::VerifierKey &vk, const ZM::Commitment &com,
                            const std::vector<FieldT> &u, const FieldT &v,
                            const ZM::Proof &proof, OpeningFailure reason) {
  Transcript vt("zeromorph-test");
  try {
    ZM::verify(vk, vt, com, u, v, proof);
    FAIL() << "tampered opening accepted";
  } catch (const spartan::OpeningError &e) {
    EXPECT_EQ(e.reason(), reason) << e.what();
  }
}

static FieldT pow_u64(const FieldT &x, size_t e) {
  FieldT acc = FieldT::one();
  for (size_t i = 0; i < e; ++i)
    acc *= x;
  return acc;
}

/* ------------------------------------------------------------------ *
 * Fixture: the SRS is built once in main() (setup is the slow part).  *
 * ------------------------------------------------------------------ */
class ZeromorphFixture : public ::testing::Test {
protected:
  static std::shared_ptr<const SRS> srs;

  std::mt19937_64 rng;

  static void SetUpTestSuite() { srs = shared_srs.get(); }
  static void TearDownTestSuite() { srs.reset(); }

  void SetUp() override { rng.seed(777); }
};

std::shared_ptr<const SRS> ZeromorphFixture::srs;

/* ------------------------------------------------------------------ *
 * 1. quotient algebra                                                *
 * ------------------------------------------------------------------ */
TEST_F(ZeromorphFixture, QuotientIdentityHolds) {
  for (size_t n = 1; n <= 6; ++n) {
    const auto f = random_vec(size_t(1) << n, rng);
    const auto u = random_vec(n, rng);
    const FieldT v = Poly(f).evaluate(u);

    const auto quotients = spartan::compute_multilinear_quotients(f, u);
    ASSERT_EQ(quotients.second, v) << "constant term must be f(u)";
    ASSERT_EQ(quotients.first.size(), n);

    // f(z) - v = \SUM_k (z_{n-k-1} - u_{n-k-1}) q_k(z_{n-k}, ..., z_{n-1})
    const auto z = random_vec(n, rng);
    FieldT res = Poly(f).evaluate(z) - v;
    for (size_t k = 0; k < n; ++k) {
      const auto &q = quotients.first[k];
      ASSERT_EQ(q.size(), size_t(1) << k);
      const std::vector<FieldT> z_tail(z.end() - k, z.end());
      res -= (z[n - k - 1] - u[n - k - 1]) * Poly(q).evaluate(z_tail);
    }
    ASSERT_EQ(res, FieldT::zero()) << "n = " << n;
  }
}

TEST_F(ZeromorphFixture, QuotientsRejectWrongPointLength) {
  const auto f = random_vec(8, rng);
  EXPECT_THROW(spartan::compute_multilinear_quotients(f, random_vec(2, rng)),
               std::invalid_argument);
}

TEST_F(ZeromorphFixture, BatchedLiftedDegreeQuotient) {
  const size_t n = 4, N = size_t(1) << n;
  std::vector<std::vector<FieldT>> quotients;
  for (size_t k = 0; k < n; ++k)
    quotients.emplace_back(random_vec(size_t(1) << k, rng));
  const FieldT y = random_field(rng);

  const auto q_hat = spartan::compute_batched_lifted_degree_quotient(N, quotients, y);
  ASSERT_EQ(q_hat.size(), N);

  // compare with \SUM_k y^k X^{N - 2^k} q_k(X) at a random point
  const FieldT x = random_field(rng);
  FieldT expected = FieldT::zero();
  for (size_t k = 0; k < n; ++k)
    expected += pow_u64(y, k) * pow_u64(x, N - (size_t(1) << k)) *
                spartan::UnivariatePolynomial<FieldT>(quotients[k]).evaluate(x);
  ASSERT_EQ(spartan::UnivariatePolynomial<FieldT>(q_hat).evaluate(x), expected);

  // the shifts of all q_k together fill exactly [N - 2^{n-1}, N)
  for (size_t i = 0; i < N - (size_t(1) << (n - 1)); ++i)
    ASSERT_EQ(q_hat[i], FieldT::zero());
}

TEST_F(ZeromorphFixture, PhiClosedFormMatchesDirectSum) {
  const FieldT x = random_field(rng);
  for (size_t k = 0; k <= 16; ++k)
    ASSERT_EQ(spartan::phi(x, k), phi_direct(x, k)) << "k = " << k;
  ASSERT_EQ(spartan::phi(FieldT::one(), 5), FieldT(32));
}

TEST_F(ZeromorphFixture, EvalAndQuotientScalars) {
  for (size_t n = 1; n <= 6; ++n) {
    const size_t N = size_t(1) << n;
    const FieldT x = random_field(rng), y = random_field(rng), z = random_field(rng);
    const auto u = random_vec(n, rng);
    const auto s = spartan::eval_and_quotient_scalars(y, x, z, u);
    ASSERT_EQ(s.zeta.size(), n);
    ASSERT_EQ(s.z_terms.size(), n);
    ASSERT_EQ(s.eval_scalar, -(z * spartan::phi(x, n)));

    for (size_t k = 0; k < n; ++k) {
      ASSERT_EQ(s.zeta[k], -(pow_u64(y, k) * pow_u64(x, N - (size_t(1) << k))));
      // v_i = Phi_{n-i}(x^{2^i})
      const FieldT x_2k = pow_u64(x, size_t(1) << k);
      const FieldT x_2k1 = x_2k * x_2k;
      const FieldT expected =
          -(z * (x_2k * spartan::phi(x_2k1, n - k - 1) -
                 u[n - 1 - k] * spartan::phi(x_2k, n - k)));
      ASSERT_EQ(s.z_terms[k], expected) << "n = " << n << ", k = " << k;
    }
  }
}

/* ------------------------------------------------------------------ *
 * 2. keys                                                            *
 * ------------------------------------------------------------------ */
TEST_F(ZeromorphFixture, TrimBeyondSrsLengthFails) {
  const size_t len = srs->size();
  try {
    srs->trim(len + 1);
    FAIL() << "trim past the SRS must fail";
  } catch (const spartan::ZeromorphError &e) {
    EXPECT_EQ(e.requested(), len + 1);
    EXPECT_EQ(e.available(), len);
  }
  const auto keys = srs->trim(len);
  EXPECT_EQ(keys.first.g1_powers.size(), len);
  EXPECT_EQ(keys.second.g1, libff::G1<ppT>::one());

  // shifted powers are the top of the SRS, tau^{N_max - N} G2 matches them
  const auto small = srs->trim(16);
  ASSERT_EQ(small.first.shifted_g1_powers.size(), 16u);
  EXPECT_EQ(small.first.shifted_g1_powers.front(), srs->g1_powers[len - 16]);
  EXPECT_EQ(small.first.shifted_g1_powers.back(), srs->g1_powers.back());
  EXPECT_EQ(small.second.max_degree, 16u);
  EXPECT_EQ(ppT::reduced_pairing(srs->g1_powers[3], small.second.tau_shift_2),
            ppT::reduced_pairing(small.first.shifted_g1_powers[3], small.second.g2));
}

TEST_F(ZeromorphFixture, SharedSrsIsBuiltOnce) {
  EXPECT_EQ(shared_srs.get(), srs);
  EXPECT_EQ(shared_srs.init(4, FieldT(1)), srs) << "second init must keep the first SRS";
  EXPECT_EQ(srs->size(), size_t(1) << kMaxVars);
  EXPECT_EQ(srs->g2_powers.size(), srs->size() + 1);

  spartan::SharedZeromorphSRS<ppT> fresh;
  EXPECT_THROW(fresh.get(), std::logic_error);
}

TEST_F(ZeromorphFixture, CommitmentsAreHomomorphic) {
  const auto keys = srs->trim(16);
  const auto f = random_vec(16, rng), g = random_vec(16, rng);
  const FieldT a = random_field(rng), b = random_field(rng);
  std::vector<FieldT> h(16);
  for (size_t i = 0; i < 16; ++i)
    h[i] = a * f[i] + b * g[i];

  const auto cf = ZM::commit(keys.first, Poly(f));
  const auto cg = ZM::commit(keys.first, Poly(g));
  const auto ch = ZM::commit(keys.first, Poly(h));
  ASSERT_EQ(ZM::combine({cf, cg}, {a, b}), ch);

  EXPECT_THROW(ZM::commit(keys.first, Poly(random_vec(32, rng))),
               std::invalid_argument);
}

/* ------------------------------------------------------------------ *
 * 3. open / verify                                                   *
 * ------------------------------------------------------------------ */
TEST_F(ZeromorphFixture, OpenVerifyRoundTrip) {
  for (size_t n = 1; n <= kMaxVars; ++n) {
    const auto keys = srs->trim(size_t(1) << n);
    const Poly f(random_vec(size_t(1) << n, rng));
    const auto u = random_vec(n, rng);
    const FieldT v = f.evaluate(u);
    const auto com = ZM::commit(keys.first, f);

    Transcript pt("zeromorph-test");
    const auto proof = ZM::open(keys.first, f, u, v, pt);
    ASSERT_EQ(proof.q_k_com.size(), n);

    Transcript vt("zeromorph-test");
    ASSERT_NO_THROW(ZM::verify(keys.second, vt, com, u, v, proof)) << "n = " << n;
    ASSERT_EQ(vt.current_state(), pt.current_state());
  }
}

TEST_F(ZeromorphFixture, TamperedOpeningsAreRejected) {
  const size_t n = 5;
  const auto keys = srs->trim(size_t(1) << n);
  const Poly f(random_vec(size_t(1) << n, rng));
  const auto u = random_vec(n, rng);
  const FieldT v = f.evaluate(u);
  const auto com = ZM::commit(keys.first, f);

  Transcript pt("zeromorph-test");
  const auto proof = ZM::open(keys.first, f, u, v, pt);
  const auto g1 = libff::G1<ppT>::one();

  expect_rejected(keys.second, com, u, v + FieldT::one(), proof,
                  OpeningFailure::kPairing);
  {
    auto bad = proof;
    bad.pi = bad.pi + g1;
    expect_rejected(keys.second, com, u, v, bad, OpeningFailure::kPairing);
  }
  {
    auto bad = proof;
    bad.q_k_com[2] = bad.q_k_com[2] + g1;
    expect_rejected(keys.second, com, u, v, bad, OpeningFailure::kPairing);
  }
  {
    auto bad = proof;
    bad.q_k_com.pop_back();
    expect_rejected(keys.second, com, u, v, bad, OpeningFailure::kQuotientCount);
  }
  {
    const auto other = ZM::commit(keys.first, Poly(random_vec(size_t(1) << n, rng)));
    expect_rejected(keys.second, other, u, v, proof, OpeningFailure::kPairing);
  }
  {
    // key trimmed for a larger table
    const auto big = srs->trim(size_t(1) << (n + 1));
    expect_rejected(big.second, com, u, v, proof, OpeningFailure::kKeySize);
  }
}

TEST_F(ZeromorphFixture, DegreeBoundIsEnforced) {
  const size_t n = 4, N = size_t(1) << n;
  const auto keys = srs->trim(N);
  const Poly f(random_vec(N, rng));
  const auto u = random_vec(n, rng);
  const FieldT v = f.evaluate(u);
  const auto com = ZM::commit(keys.first, f);

  Transcript pt("zeromorph-test");
  const auto proof = ZM::open(keys.first, f, u, v, pt);

  // q_hat + X^N committed with the untrimmed SRS.  Its shift would need
  // tau^{N_max} G1, which the SRS does not hold; use the top power instead.
  {
    auto bad = proof;
    bad.q_hat_com = bad.q_hat_com + srs->g1_powers[N];
    bad.q_hat_shifted_com = bad.q_hat_shifted_com + srs->g1_powers.back();
    expect_rejected(keys.second, com, u, v, bad, OpeningFailure::kDegreeBound);
  }
  {
    auto bad = proof;
    bad.q_hat_shifted_com = bad.q_hat_shifted_com + libff::G1<ppT>::one();
    expect_rejected(keys.second, com, u, v, bad, OpeningFailure::kDegreeBound);
  }
  // a q_hat of degree N - 1 with its honest shift passes the bound
  {
    auto shifted = proof;
    shifted.q_hat_com = shifted.q_hat_com + srs->g1_powers[N - 1];
    shifted.q_hat_shifted_com =
        shifted.q_hat_shifted_com + keys.first.shifted_g1_powers[N - 1];
    expect_rejected(keys.second, com, u, v, shifted, OpeningFailure::kPairing);
  }
}

TEST_F(ZeromorphFixture, OpenRejectsWrongEvaluation) {
  const auto keys = srs->trim(8);
  const Poly f(random_vec(8, rng));
  const auto u = random_vec(3, rng);
  Transcript pt("zeromorph-test");
  EXPECT_THROW(ZM::open(keys.first, f, u, f.evaluate(u) + FieldT::one(), pt),
               std::invalid_argument);
}

/* ------------------------------------------------------------------ *
 * 4. main()                                                          *
 * ------------------------------------------------------------------ */
int main(int argc, char **argv) {
  spartan::init_public_params();
  libff::inhibit_profiling_info = true;
  shared_srs.init(size_t(1) << kMaxVars, FieldT(0x5EED));
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
