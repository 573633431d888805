// tests/test_multilinear.cpp
// ----------------------------------------------
#include <gtest/gtest.h>

#include "common.hpp"
#include "eq_poly.hpp"
#include "multilinear.hpp"
#include "univariate.hpp"

#include <random>
#include <vector>

using FieldT = spartan::Fr;
using Poly = spartan::DenseMultilinearPolynomial<FieldT>;
using Eq = spartan::EqPolynomial<FieldT>;
using Uni = spartan::UnivariatePolynomial<FieldT>;

/* ---------------------------- helpers ----------------------------- */
static std::vector<FieldT> random_vec(size_t len, std::mt19937_64 &rng) {
  std::uniform_int_distribution<uint64_t> dist;
  std::vector<FieldT> v(len);
  for (auto &x : v)
    x = FieldT(dist(rng));
  return v;
}

// big-endian: bit 0 of the point is the MSB of the index
static std::vector<FieldT> boolean_point(size_t index, size_t n) {
  std::vector<FieldT> pt(n);
  for (size_t j = 0; j < n; ++j)
    pt[j] = ((index >> (n - 1 - j)) & 1) ? FieldT::one() : FieldT::zero();
  return pt;
}

// \SUM_x eq(r, x) f(x), straight from the definition
static FieldT brute_mle(const std::vector<FieldT> &table,
                        const std::vector<FieldT> &r) {
  const size_t n = r.size();
  FieldT acc = FieldT::zero();
  for (size_t i = 0; i < table.size(); ++i) {
    FieldT w = FieldT::one();
    for (size_t j = 0; j < n; ++j) {
      const bool bit = (i >> (n - 1 - j)) & 1;
      w *= bit ? r[j] : (FieldT::one() - r[j]);
    }
    acc += w * table[i];
  }
  return acc;
}

class MultilinearFixture : public ::testing::Test {
protected:
  std::mt19937_64 rng;
  void SetUp() override { rng.seed(0xC0FFEE); }
};

/* ------------------------------------------------------------------ *
 * 1. eq polynomial                                                   *
 * ------------------------------------------------------------------ */
TEST_F(MultilinearFixture, EqTableMatchesPointwiseEvaluation) {
  for (size_t n = 0; n <= 6; ++n) {
    const auto r = random_vec(n, rng);
    const Eq eq(r);
    const auto table = eq.evals();
    ASSERT_EQ(table.size(), size_t(1) << n);
    FieldT sum = FieldT::zero();
    for (size_t i = 0; i < table.size(); ++i) {
      ASSERT_EQ(table[i], eq.evaluate(boolean_point(i, n))) << "n = " << n;
      sum += table[i];
    }
    ASSERT_EQ(sum, FieldT::one()) << "eq table must sum to one, n = " << n;
  }
}

TEST_F(MultilinearFixture, EqIsIndicatorOnTheCube) {
  const size_t n = 4;
  for (size_t a = 0; a < (1u << n); ++a) {
    const auto table = Eq(boolean_point(a, n)).evals();
    for (size_t b = 0; b < table.size(); ++b)
      ASSERT_EQ(table[b], a == b ? FieldT::one() : FieldT::zero());
  }
}

TEST_F(MultilinearFixture, SelectorIsBigEndian) {
  const auto bits = random_vec(3, rng);
  const auto table = Eq(bits).evals();
  for (size_t i = 0; i < table.size(); ++i)
    ASSERT_EQ(Eq::selector(bits, i), table[i]);
  // index 1 = (0, 0, 1): only the last coordinate is "on"
  ASSERT_EQ(Eq::selector(bits, 1),
            (FieldT::one() - bits[0]) * (FieldT::one() - bits[1]) * bits[2]);
}

TEST_F(MultilinearFixture, EqRejectsLengthMismatch) {
  const Eq eq(random_vec(3, rng));
  EXPECT_THROW(eq.evaluate(random_vec(2, rng)), std::invalid_argument);
}

/* ------------------------------------------------------------------ *
 * 2. dense multilinear tables                                        *
 * ------------------------------------------------------------------ */
TEST_F(MultilinearFixture, EvaluateMatchesDefinition) {
  for (size_t n = 0; n <= 6; ++n) {
    const auto table = random_vec(size_t(1) << n, rng);
    const Poly g(table);
    ASSERT_EQ(g.num_variables(), n);
    const auto r = random_vec(n, rng);
    ASSERT_EQ(g.evaluate(r), brute_mle(table, r)) << "n = " << n;
  }
}

TEST_F(MultilinearFixture, EvaluateOnCubeReturnsTableEntry) {
  const size_t n = 5;
  const Poly g(random_vec(size_t(1) << n, rng));
  for (size_t i = 0; i < g.size(); ++i)
    ASSERT_EQ(g.evaluate(boolean_point(i, n)), g[i]);
}

TEST_F(MultilinearFixture, BindTopVariableFixesFirstCoordinate) {
  const size_t n = 5;
  Poly g(random_vec(size_t(1) << n, rng));
  const Poly original = g;
  const auto r = random_vec(n, rng);

  g.bind_top_variable(r[0]);
  ASSERT_EQ(g.num_variables(), n - 1);
  ASSERT_EQ(g.size(), size_t(1) << (n - 1));
  const std::vector<FieldT> rest(r.begin() + 1, r.end());
  ASSERT_EQ(g.evaluate(rest), original.evaluate(r));

  for (size_t j = 1; j < n; ++j)
    g.bind_top_variable(r[j]);
  ASSERT_EQ(g.num_variables(), 0u);
  ASSERT_EQ(g[0], original.evaluate(r));
  EXPECT_THROW(g.bind_top_variable(r[0]), std::invalid_argument);
}

TEST_F(MultilinearFixture, BatchEvaluateSharesOneEqTable) {
  const size_t n = 4;
  std::vector<std::vector<FieldT>> polys;
  for (size_t p = 0; p < 5; ++p)
    polys.emplace_back(random_vec(size_t(1) << n, rng));
  const auto r = random_vec(n, rng);
  const auto evals = Poly::batch_evaluate(polys, r);
  ASSERT_EQ(evals.size(), polys.size());
  for (size_t p = 0; p < polys.size(); ++p)
    ASSERT_EQ(evals[p], Poly(polys[p]).evaluate(r));

  polys.emplace_back(random_vec(size_t(1) << (n - 1), rng));
  EXPECT_THROW(Poly::batch_evaluate(polys, r), std::invalid_argument);
}

TEST_F(MultilinearFixture, RejectsNonPowerOfTwoTable) {
  EXPECT_THROW(Poly(random_vec(6, rng)), std::invalid_argument);
  const Poly g(random_vec(8, rng));
  EXPECT_THROW(g.evaluate(random_vec(2, rng)), std::invalid_argument);
}

/* ------------------------------------------------------------------ *
 * 3. univariate helpers                                              *
 * ------------------------------------------------------------------ */
TEST_F(MultilinearFixture, InterpolationRecoversCoefficients) {
  for (size_t d = 0; d <= 4; ++d) {
    const Uni g(random_vec(d + 1, rng));
    std::vector<FieldT> evals;
    for (size_t x = 0; x <= d; ++x)
      evals.emplace_back(g.evaluate(FieldT(static_cast<long>(x))));
    ASSERT_EQ(Uni::from_evals(evals), g) << "degree " << d;
  }
}

TEST_F(MultilinearFixture, SumOverBinaryAndDegree) {
  const Uni g(std::vector<FieldT>{FieldT(3), FieldT(5), FieldT(7), FieldT::zero()});
  ASSERT_EQ(g.degree(), 2u);
  ASSERT_EQ(g.sum_over_binary(), g.evaluate(FieldT::zero()) + g.evaluate(FieldT::one()));
  ASSERT_EQ(g.sum_over_binary(), FieldT(18));
}

TEST_F(MultilinearFixture, DivideByLinear) {
  const Uni g(random_vec(9, rng));
  const FieldT x = random_vec(1, rng)[0];
  FieldT remainder;
  const Uni q = g.divide_by_linear(x, &remainder);
  ASSERT_EQ(remainder, g.evaluate(x));

  // g(t) = q(t) (t - x) + g(x) at a fresh point
  const FieldT t = random_vec(1, rng)[0];
  ASSERT_EQ(g.evaluate(t), q.evaluate(t) * (t - x) + remainder);
}

TEST_F(MultilinearFixture, BatchInvert) {
  auto v = random_vec(17, rng);
  const auto original = v;
  spartan::batch_invert(v);
  for (size_t i = 0; i < v.size(); ++i)
    ASSERT_EQ(v[i] * original[i], FieldT::one());

  std::vector<FieldT> with_zero = {FieldT(2), FieldT::zero()};
  EXPECT_THROW(spartan::batch_invert(with_zero), std::invalid_argument);
}

/* ------------------------------------------------------------------ *
 * 4. main()                                                          *
 * ------------------------------------------------------------------ */
int main(int argc, char **argv) {
  spartan::init_public_params();
  libff::inhibit_profiling_info = true;
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
