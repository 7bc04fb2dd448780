#include "NameSuggest/CompositeScore.h"
#include "NameSuggest/Identifier.h"
#include "NameSuggest/JaroWinkler.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Format.h"

#include <string>

namespace namesug {

namespace {

// tokenizes an identifier and drops repeated tokens, keeping first-seen order
llvm::SmallVector<std::string, 4> uniqueTokens(llvm::StringRef Identifier) {
  llvm::SmallVector<std::string, 4> Result;
  llvm::StringSet<> Seen;
  for (std::string &Token : splitIdentifier(Identifier))
    if (Seen.insert(Token).second)
      Result.push_back(std::move(Token));
  return Result;
}

}

// scores every token pair: equal tokens and prefix-related tokens each count as a match
static void addTokenBonus(llvm::StringRef Unknown, llvm::StringRef Candidate,
                          ScoreBreakdown &B) {
  llvm::SmallVector<std::string, 4> QueryTokens     = uniqueTokens(Unknown);
  llvm::SmallVector<std::string, 4> CandidateTokens = uniqueTokens(Candidate);

  for (const std::string &Q : QueryTokens) {
    for (const std::string &C : CandidateTokens) {
      llvm::StringRef QRef = Q, CRef = C;
      if (QRef == CRef) {
        B.Tokens += TokenEqualBonus;
        ++B.TokenMatches;
      } else if (QRef.startswith(CRef) || CRef.startswith(QRef)) {
        B.Tokens += TokenPrefixBonus;
        ++B.TokenMatches;
      }
    }
  }

  if (B.TokenMatches >= MultiTokenThreshold)
    B.Tokens += MultiTokenBonus;
}

// breaks the composite relevance score into its additive components
ScoreBreakdown explainCompositeScore(llvm::StringRef Unknown,
                                     llvm::StringRef Candidate) {
  std::string NormQuery     = normalizeIdentifier(Unknown);
  std::string NormCandidate = normalizeIdentifier(Candidate);
  llvm::StringRef Q = NormQuery, C = NormCandidate;

  ScoreBreakdown B;
  B.Base = jaroWinkler(Q, C);
  if (Q == C)
    B.Exact = ExactMatchBonus;
  if (C.contains(Q) || Q.contains(C))
    B.Containment = ContainmentBonus;

  addTokenBonus(Unknown, Candidate, B);

  // only candidates longer than the query are penalized, on their raw length
  if (Candidate.size() > Unknown.size())
    B.LengthPenalty = (Candidate.size() - Unknown.size()) * LengthPenaltyPerChar;
  return B;
}

double computeCompositeScore(llvm::StringRef Unknown,
                             llvm::StringRef Candidate) {
  return explainCompositeScore(Unknown, Candidate).total();
}

void printScoreBreakdown(const ScoreBreakdown &B, llvm::raw_ostream &OS) {
  OS << "base="         << llvm::format("%.4f", B.Base)
     << " exact="       << llvm::format("%.2f", B.Exact)
     << " containment=" << llvm::format("%.2f", B.Containment)
     << " tokens="      << llvm::format("%.2f", B.Tokens)
     << " (" << B.TokenMatches << " matched)"
     << " length=-"     << llvm::format("%.2f", B.LengthPenalty)
     << " total="       << llvm::format("%.4f", B.total());
}

}
