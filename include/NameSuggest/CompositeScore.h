#pragma once

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

namespace namesug {

constexpr double ExactMatchBonus = 0.3;
constexpr double ContainmentBonus = 0.2;
constexpr double TokenEqualBonus = 0.2;
constexpr double TokenPrefixBonus = 0.1;
constexpr double MultiTokenBonus = 0.2;
constexpr unsigned MultiTokenThreshold = 2;
constexpr double LengthPenaltyPerChar = 0.01;

struct ScoreBreakdown {
  double Base = 0.0;
  double Exact = 0.0;
  double Containment = 0.0;
  double Tokens = 0.0;
  unsigned TokenMatches = 0;
  double LengthPenalty = 0.0;

  double total() const {
    return Base + Exact + Containment + Tokens - LengthPenalty;
  }
};

ScoreBreakdown explainCompositeScore(llvm::StringRef Unknown,
                                     llvm::StringRef Candidate);

double computeCompositeScore(llvm::StringRef Unknown,
                             llvm::StringRef Candidate);

void printScoreBreakdown(const ScoreBreakdown &B, llvm::raw_ostream &OS);

}
