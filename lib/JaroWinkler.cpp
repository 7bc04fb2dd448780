#include "NameSuggest/JaroWinkler.h"

#include <algorithm>

namespace namesug {

// computes the half-length search radius used when pairing characters
unsigned jaroMatchWindow(size_t LHSLength, size_t RHSLength) {
  size_t Half = std::max(LHSLength, RHSLength) / 2;
  return Half > 0 ? static_cast<unsigned>(Half - 1) : 0;
}

// pairs each character of lhs with the first unused equal character of rhs inside the window
JaroMatches findJaroMatches(llvm::StringRef LHS, llvm::StringRef RHS,
                            unsigned Window) {
  JaroMatches M;
  M.LHSMatched.resize(LHS.size());
  M.RHSMatched.resize(RHS.size());

  for (size_t I = 0, E = LHS.size(); I != E; ++I) {
    size_t Start = I > Window ? I - Window : 0;
    size_t End   = std::min(I + Window + 1, RHS.size());

    for (size_t J = Start; J < End; ++J) {
      if (M.RHSMatched[J] || LHS[I] != RHS[J])
        continue;
      M.LHSMatched.set(I);
      M.RHSMatched.set(J);
      ++M.Count;
      break;
    }
  }
  return M;
}

// walks both matched subsequences in order and counts disagreeing positions
unsigned countTranspositions(llvm::StringRef LHS, llvm::StringRef RHS,
                             const JaroMatches &Matches) {
  unsigned Mismatches = 0;
  size_t K = 0;
  for (size_t I = 0, E = LHS.size(); I != E; ++I) {
    if (!Matches.LHSMatched[I])
      continue;
    while (!Matches.RHSMatched[K])
      ++K;
    if (LHS[I] != RHS[K])
      ++Mismatches;
    ++K;
  }
  return Mismatches;
}

double jaro(llvm::StringRef LHS, llvm::StringRef RHS) {
  if (LHS.empty() && RHS.empty())
    return 1.0;
  if (LHS.empty() || RHS.empty())
    return 0.0;
  if (LHS == RHS)
    return 1.0;

  JaroMatches Matches =
      findJaroMatches(LHS, RHS, jaroMatchWindow(LHS.size(), RHS.size()));
  if (Matches.Count == 0)
    return 0.0;

  // the mismatch count is halved in floating point, not with integer division
  double M = Matches.Count;
  double Transpositions = countTranspositions(LHS, RHS, Matches) / 2.0;
  return (M / LHS.size() + M / RHS.size() + (M - Transpositions) / M) / 3.0;
}

double jaroWinkler(llvm::StringRef LHS, llvm::StringRef RHS) {
  double J = jaro(LHS, RHS);

  size_t Limit = std::min<size_t>(JaroWinklerMaxPrefix,
                                  std::min(LHS.size(), RHS.size()));
  unsigned Prefix = 0;
  while (Prefix < Limit && LHS[Prefix] == RHS[Prefix])
    ++Prefix;

  return J + Prefix * JaroWinklerScaling * (1 - J);
}

}
