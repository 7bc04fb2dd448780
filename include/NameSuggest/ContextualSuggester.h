#pragma once

#include "NameSuggest/Support.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace namesug {

enum class SymbolContext : uint8_t {
  Unknown,
  LocalScope,
  CurrentClass,
  CurrentProject,
  ExternalLibrary,
};

struct ContextBonuses {
  double LocalScope = 0.3;
  double CurrentClass = 0.2;
  double CurrentProject = 0.1;
  double ExternalLibrary = 0.0;

  double WellKnownName = 0.25;
  double WellKnownThreshold = 0.8;
};

struct SuggestConfig {
  double MinSimilarity = DefaultMinScore;
  size_t MaxResults = MaxSuggestions;
  ContextBonuses Bonuses;
  std::vector<std::string> WellKnownNames;
};

llvm::StringRef symbolContextName(SymbolContext C);

llvm::Expected<double> contextBonus(SymbolContext C, const ContextBonuses &B);

struct TieredKey {
  llvm::StringRef Key;
  llvm::StringRef Identity;
  double ContextBonus;
};

struct PrioritizedIndex {
  size_t Index;
  double Similarity;
  double FinalScore;
};

std::vector<PrioritizedIndex>
prioritizeCandidates(llvm::StringRef Unknown, llvm::ArrayRef<TieredKey> Keys,
                     const SuggestConfig &Cfg,
                     const llvm::StringSet<> &WellKnown);

template <typename T>
struct ContextualCandidate {
  std::string Key;
  T Value;
  std::string Identity;
};

template <typename T>
struct PrioritizedSuggestion {
  std::string Name;
  T Value;
  SymbolContext Context;
  double Similarity;
  double FinalScore;
};

template <typename T>
class ContextualSuggester {
public:
  explicit ContextualSuggester(SuggestConfig Config = SuggestConfig())
      : Cfg(std::move(Config)) {
    for (const std::string &Name : Cfg.WellKnownNames)
      WellKnown.insert(Name);
  }

  llvm::Error addTier(SymbolContext Context,
                      std::vector<ContextualCandidate<T>> Entries) {
    llvm::Expected<double> Bonus = contextBonus(Context, Cfg.Bonuses);
    if (!Bonus)
      return Bonus.takeError();
    Tiers.push_back(Tier{Context, *Bonus, std::move(Entries)});
    return llvm::Error::success();
  }

  void clear() { Tiers.clear(); }

  std::vector<PrioritizedSuggestion<T>> suggest(llvm::StringRef Unknown) const {
    llvm::SmallVector<TieredKey, 64> Keys;
    llvm::SmallVector<std::pair<const Tier *, const ContextualCandidate<T> *>, 64>
        Origins;
    for (const Tier &Tr : Tiers) {
      for (const ContextualCandidate<T> &E : Tr.Entries) {
        llvm::StringRef Identity = E.Identity.empty() ? E.Key : E.Identity;
        Keys.push_back({E.Key, Identity, Tr.Bonus});
        Origins.push_back({&Tr, &E});
      }
    }

    std::vector<PrioritizedSuggestion<T>> Results;
    for (const PrioritizedIndex &P :
         prioritizeCandidates(Unknown, Keys, Cfg, WellKnown)) {
      const Tier *Tr = Origins[P.Index].first;
      const ContextualCandidate<T> *E = Origins[P.Index].second;
      Results.push_back(
          {E->Key, E->Value, Tr->Context, P.Similarity, P.FinalScore});
    }
    return Results;
  }

private:
  struct Tier {
    SymbolContext Context;
    double Bonus;
    std::vector<ContextualCandidate<T>> Entries;
  };

  SuggestConfig Cfg;
  llvm::StringSet<> WellKnown;
  std::vector<Tier> Tiers;
};

}
