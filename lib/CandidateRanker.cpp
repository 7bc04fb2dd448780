#include "NameSuggest/CandidateRanker.h"
#include "NameSuggest/CompositeScore.h"

#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>

#define DEBUG_TYPE "namesug-ranker"

namespace namesug {

// scores the valid keys, orders them by descending score and keeps the best few
std::vector<RankedIndex> rankCandidateKeys(llvm::StringRef Unknown,
                                           llvm::ArrayRef<llvm::StringRef> Keys,
                                           bool ExcludeExactKey) {
  std::vector<RankedIndex> Ranked;
  if (Unknown.empty() || Keys.empty())
    return Ranked;

  Ranked.reserve(Keys.size());
  unsigned Skipped = 0;
  for (size_t I = 0, E = Keys.size(); I != E; ++I) {
    llvm::StringRef Key = Keys[I];
    if (Key.empty()) {
      ++Skipped;
      continue;
    }
    // the unresolved name itself is never offered as its own replacement
    if (ExcludeExactKey && Key == Unknown)
      continue;
    Ranked.push_back({I, computeCompositeScore(Unknown, Key)});
  }

  std::stable_sort(Ranked.begin(), Ranked.end(),
                   [](const RankedIndex &A, const RankedIndex &B) {
                     return A.Score > B.Score;
                   });
  if (Ranked.size() > MaxSuggestions)
    Ranked.resize(MaxSuggestions);

  LLVM_DEBUG({
    llvm::dbgs() << "ranked '" << Unknown << "' against " << Keys.size()
                 << " candidates (" << Skipped << " empty)";
    if (!Ranked.empty())
      llvm::dbgs() << ", best '" << Keys[Ranked.front().Index] << "' = "
                   << Ranked.front().Score;
    llvm::dbgs() << "\n";
  });
  return Ranked;
}

}
