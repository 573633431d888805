// r1cs.hpp
#pragma once

#include "errors.hpp"

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace spartan {

/*
 * Column of a sparse entry: an ordinary witness variable, or the shared
 * constant/IO slot that holds the value 1.
 */
class Column {
public:
  enum class Kind { kVariable, kConstant };

  static Column variable(size_t index) { return Column(Kind::kVariable, index); }
  static Column constant() { return Column(Kind::kConstant, 0); }

  bool is_constant() const { return kind_ == Kind::kConstant; }
  Kind kind() const { return kind_; }

  size_t index() const {
    if (kind_ != Kind::kVariable)
      throw std::logic_error("Column: constant column has no variable index");
    return index_;
  }

  bool operator==(const Column &other) const {
    return kind_ == other.kind_ && index_ == other.index_;
  }

private:
  Column(Kind k, size_t i) : kind_(k), index_(i) {}
  Kind kind_;
  size_t index_;
};

template <typename FieldT> struct SparseEntry {
  size_t row;
  Column col;
  FieldT val;
  SparseEntry(size_t r, Column c, const FieldT &v) : row(r), col(c), val(v) {}
};

template <typename FieldT> using SparseMatrix = std::vector<SparseEntry<FieldT>>;

/* -------------------------------------------------------------------- *
 *  R1CS shape: (A z) o (B z) = (C z), z = (vars, 1).                    *
 * -------------------------------------------------------------------- */
template <typename FieldT> class R1CSShape {
public:
  size_t num_cons;
  size_t num_vars;
  SparseMatrix<FieldT> A;
  SparseMatrix<FieldT> B;
  SparseMatrix<FieldT> C;

  R1CSShape() : num_cons(0), num_vars(0) {}

  // Validates every (row, col) against the declared bounds
  static R1CSShape create(size_t num_cons, size_t num_vars,
                          SparseMatrix<FieldT> A, SparseMatrix<FieldT> B,
                          SparseMatrix<FieldT> C) {
    R1CSShape s;
    s.num_cons = num_cons;
    s.num_vars = num_vars;
    s.A = std::move(A);
    s.B = std::move(B);
    s.C = std::move(C);
    s.check_indices();
    return s;
  }

  void check_indices() const {
    for (const SparseMatrix<FieldT> *M : {&A, &B, &C}) {
      for (const auto &e : *M) {
        if (e.row >= num_cons)
          throw SpartanError(SpartanErrorCode::kInvalidIndex,
                             VerificationStage::kSetup,
                             "row " + std::to_string(e.row) + " >= " +
                                 std::to_string(num_cons));
        if (!e.col.is_constant() && e.col.index() >= num_vars)
          throw SpartanError(SpartanErrorCode::kInvalidIndex,
                             VerificationStage::kSetup,
                             "column " + std::to_string(e.col.index()) +
                                 " >= " + std::to_string(num_vars));
      }
    }
  }

  size_t num_nonzero() const { return A.size() + B.size() + C.size(); }

  // M z for an explicit shape; the constant column reads 1
  std::vector<FieldT> multiply(const SparseMatrix<FieldT> &M,
                               const std::vector<FieldT> &vars) const {
    if (vars.size() != num_vars)
      throw std::invalid_argument("R1CSShape: bad assignment length");
    std::vector<FieldT> out(num_cons, FieldT::zero());
    for (const auto &e : M) {
      const FieldT z = e.col.is_constant() ? FieldT::one() : vars[e.col.index()];
      out[e.row] += e.val * z;
    }
    return out;
  }

  std::array<std::vector<FieldT>, 3>
  multiply_vec(const std::vector<FieldT> &vars) const {
    return {multiply(A, vars), multiply(B, vars), multiply(C, vars)};
  }

  bool is_satisfied(const std::vector<FieldT> &vars) const {
    const auto abc = multiply_vec(vars);
    for (size_t i = 0; i < num_cons; ++i)
      if (abc[0][i] * abc[1][i] != abc[2][i])
        return false;
    return true;
  }
};

} // namespace spartan
