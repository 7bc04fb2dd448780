#include "NameSuggest/ContextualSuggester.h"
#include "NameSuggest/CompositeScore.h"
#include "NameSuggest/Identifier.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>

#define DEBUG_TYPE "namesug-context"

namespace namesug {

llvm::StringRef symbolContextName(SymbolContext C) {
  switch (C) {
  case SymbolContext::Unknown:         return "unknown";
  case SymbolContext::LocalScope:      return "local";
  case SymbolContext::CurrentClass:    return "class";
  case SymbolContext::CurrentProject:  return "project";
  case SymbolContext::ExternalLibrary: return "library";
  }
  return "unknown";
}

// maps a candidate's origin to the bonus added on top of its similarity
llvm::Expected<double> contextBonus(SymbolContext C, const ContextBonuses &B) {
  switch (C) {
  case SymbolContext::LocalScope:      return B.LocalScope;
  case SymbolContext::CurrentClass:    return B.CurrentClass;
  case SymbolContext::CurrentProject:  return B.CurrentProject;
  case SymbolContext::ExternalLibrary: return B.ExternalLibrary;
  case SymbolContext::Unknown:
    break;
  }
  return makeStringError("candidates with an unknown symbol context cannot be ranked");
}

// rewards a frequently used name only when it already looks like a near miss
static double wellKnownBonus(llvm::StringRef Identity, double Similarity,
                             const SuggestConfig &Cfg,
                             const llvm::StringSet<> &WellKnown) {
  if (Similarity < Cfg.Bonuses.WellKnownThreshold || WellKnown.empty())
    return 0.0;
  return WellKnown.count(shortTypeName(Identity)) ? Cfg.Bonuses.WellKnownName
                                                  : 0.0;
}

std::vector<PrioritizedIndex>
prioritizeCandidates(llvm::StringRef Unknown, llvm::ArrayRef<TieredKey> Keys,
                     const SuggestConfig &Cfg,
                     const llvm::StringSet<> &WellKnown) {
  std::vector<PrioritizedIndex> Selected;
  if (Unknown.empty())
    return Selected;

  // identity -> slot in Selected; a group keeps the slot of its first member
  llvm::StringMap<size_t> SlotByIdentity;

  for (size_t I = 0, E = Keys.size(); I != E; ++I) {
    const TieredKey &K = Keys[I];
    if (K.Key.empty())
      continue;

    double Similarity = computeCompositeScore(Unknown, K.Key);
    if (Similarity < Cfg.MinSimilarity)
      continue;

    double Final = Similarity + K.ContextBonus +
                   wellKnownBonus(K.Identity, Similarity, Cfg, WellKnown);
    PrioritizedIndex Candidate{I, Similarity, Final};

    auto Inserted = SlotByIdentity.try_emplace(K.Identity, Selected.size());
    if (Inserted.second) {
      Selected.push_back(Candidate);
      continue;
    }
    PrioritizedIndex &Existing = Selected[Inserted.first->second];
    if (Final > Existing.FinalScore)
      Existing = Candidate;
  }

  std::stable_sort(Selected.begin(), Selected.end(),
                   [](const PrioritizedIndex &A, const PrioritizedIndex &B) {
                     if (A.FinalScore != B.FinalScore)
                       return A.FinalScore > B.FinalScore;
                     return A.Similarity > B.Similarity;
                   });
  if (Selected.size() > Cfg.MaxResults)
    Selected.resize(Cfg.MaxResults);

  LLVM_DEBUG(llvm::dbgs() << "prioritized " << Keys.size() << " tiered keys for '"
                          << Unknown << "', kept " << Selected.size() << "\n");
  return Selected;
}

}
