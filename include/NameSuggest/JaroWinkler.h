#pragma once

#include "llvm/ADT/BitVector.h"
#include "llvm/ADT/StringRef.h"

namespace namesug {

struct JaroMatches {
  unsigned Count = 0;
  llvm::BitVector LHSMatched;
  llvm::BitVector RHSMatched;
};

unsigned jaroMatchWindow(size_t LHSLength, size_t RHSLength);

JaroMatches findJaroMatches(llvm::StringRef LHS, llvm::StringRef RHS,
                            unsigned Window);

unsigned countTranspositions(llvm::StringRef LHS, llvm::StringRef RHS,
                             const JaroMatches &Matches);

double jaro(llvm::StringRef LHS, llvm::StringRef RHS);

double jaroWinkler(llvm::StringRef LHS, llvm::StringRef RHS);

constexpr unsigned JaroWinklerMaxPrefix = 4;
constexpr double JaroWinklerScaling = 0.1;

}
