// errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace spartan {

enum class SpartanErrorCode {
  kInvalidIndex,         // (row, col, val) outside the declared shape
  kInvalidSumcheckProof, // round inequality or final-claim mismatch
  kInvalidWitnessLength, // wrong number or length of witness segments
  kInvalidOpeningProof,  // commitment-scheme opening rejected
};

// Which part of the protocol rejected the proof
enum class VerificationStage {
  kSetup,
  kOuterSumcheck,
  kOuterFinalClaim,
  kInnerSumcheck,
  kInnerFinalClaim,
  kWitnessOpening,
};

inline const char *to_string(SpartanErrorCode code) {
  switch (code) {
  case SpartanErrorCode::kInvalidIndex:
    return "InvalidIndex";
  case SpartanErrorCode::kInvalidSumcheckProof:
    return "InvalidSumcheckProof";
  case SpartanErrorCode::kInvalidWitnessLength:
    return "InvalidWitnessLength";
  case SpartanErrorCode::kInvalidOpeningProof:
    return "InvalidOpeningProof";
  }
  return "Unknown";
}

inline const char *to_string(VerificationStage stage) {
  switch (stage) {
  case VerificationStage::kSetup:
    return "setup";
  case VerificationStage::kOuterSumcheck:
    return "outer sum-check rounds";
  case VerificationStage::kOuterFinalClaim:
    return "outer sum-check final claim";
  case VerificationStage::kInnerSumcheck:
    return "inner sum-check rounds";
  case VerificationStage::kInnerFinalClaim:
    return "inner sum-check final claim";
  case VerificationStage::kWitnessOpening:
    return "witness opening";
  }
  return "unknown";
}

class SpartanError : public std::runtime_error {
public:
  SpartanError(SpartanErrorCode code, VerificationStage stage,
               const std::string &detail = "")
      : std::runtime_error(std::string(to_string(code)) + " (" +
                           to_string(stage) + ")" +
                           (detail.empty() ? "" : ": " + detail)),
        code_(code), stage_(stage) {}

  SpartanErrorCode code() const { return code_; }
  VerificationStage stage() const { return stage_; }

  // round inequalities are "malformed", everything after them a mismatch
  bool is_malformed_sumcheck() const {
    return stage_ == VerificationStage::kOuterSumcheck ||
           stage_ == VerificationStage::kInnerSumcheck;
  }

private:
  SpartanErrorCode code_;
  VerificationStage stage_;
};

// Requested SRS trim is longer than the SRS itself
class ZeromorphError : public std::runtime_error {
public:
  ZeromorphError(size_t requested, size_t available)
      : std::runtime_error("Length Error: SRS Length: " +
                           std::to_string(available) +
                           ", Key Length: " + std::to_string(requested)),
        requested_(requested), available_(available) {}

  size_t requested() const { return requested_; }
  size_t available() const { return available_; }

private:
  size_t requested_;
  size_t available_;
};

// Why a commitment-scheme opening was rejected
enum class OpeningFailure {
  kQuotientCount, // wrong number of quotient commitments for the point
  kKeySize,       // verifier key trimmed for another table size
  kDegreeBound,   // shifted q_hat commitment does not match q_hat
  kPairing,       // final KZG pairing equation
};

inline const char *to_string(OpeningFailure reason) {
  switch (reason) {
  case OpeningFailure::kQuotientCount:
    return "wrong number of quotient commitments";
  case OpeningFailure::kKeySize:
    return "key size does not match the point";
  case OpeningFailure::kDegreeBound:
    return "degree check failed";
  case OpeningFailure::kPairing:
    return "pairing check failed";
  }
  return "unknown";
}

class OpeningError : public std::runtime_error {
public:
  explicit OpeningError(OpeningFailure reason)
      : std::runtime_error(to_string(reason)), reason_(reason) {}

  OpeningFailure reason() const { return reason_; }

private:
  OpeningFailure reason_;
};

class TranscriptError : public std::runtime_error {
public:
  explicit TranscriptError(const std::string &what)
      : std::runtime_error("transcript: " + what) {}
};

} // namespace spartan
