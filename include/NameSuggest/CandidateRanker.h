#pragma once

#include "NameSuggest/Support.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

#include <iterator>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace namesug {

template <typename T>
struct ScoredCandidate {
  std::string Name;
  T Value;
  double Score;
};

struct ScoredName {
  std::string Name;
  double Score;
};

struct RankedIndex {
  size_t Index;
  double Score;
};

std::vector<RankedIndex> rankCandidateKeys(llvm::StringRef Unknown,
                                           llvm::ArrayRef<llvm::StringRef> Keys,
                                           bool ExcludeExactKey);

namespace detail {

template <typename RangeT>
using RangeEntry = std::remove_cv_t<
    std::remove_reference_t<decltype(*std::begin(std::declval<const RangeT &>()))>>;

template <typename RangeT>
using PayloadOf = std::decay_t<decltype(std::get<1>(std::declval<RangeEntry<RangeT>>()))>;

template <typename RangeT>
constexpr bool yieldsLValues() {
  return std::is_lvalue_reference<
      decltype(*std::begin(std::declval<const RangeT &>()))>::value;
}

}

template <typename RangeT>
std::vector<ScoredCandidate<detail::PayloadOf<RangeT>>>
rankKeyed(llvm::StringRef Unknown, const RangeT &Candidates) {
  static_assert(detail::yieldsLValues<RangeT>(),
                "candidate range must refer to entries that outlive the call");
  using EntryT = detail::RangeEntry<RangeT>;

  std::vector<ScoredCandidate<detail::PayloadOf<RangeT>>> Results;
  if (Unknown.empty())
    return Results;

  llvm::SmallVector<llvm::StringRef, 32> Keys;
  llvm::SmallVector<const EntryT *, 32> Entries;
  for (const EntryT &Entry : Candidates) {
    Keys.push_back(llvm::StringRef(std::get<0>(Entry)));
    Entries.push_back(&Entry);
  }

  for (const RankedIndex &R :
       rankCandidateKeys(Unknown, Keys, /*ExcludeExactKey=*/true))
    Results.push_back({Keys[R.Index].str(), std::get<1>(*Entries[R.Index]),
                       R.Score});
  return Results;
}

template <typename RangeT>
std::vector<ScoredName> rankFlat(llvm::StringRef Unknown,
                                 const RangeT &Candidates) {
  static_assert(detail::yieldsLValues<RangeT>(),
                "candidate range must refer to names that outlive the call");
  std::vector<ScoredName> Results;
  if (Unknown.empty())
    return Results;

  llvm::SmallVector<llvm::StringRef, 32> Keys;
  for (const auto &Name : Candidates)
    Keys.push_back(llvm::StringRef(Name));

  for (const RankedIndex &R :
       rankCandidateKeys(Unknown, Keys, /*ExcludeExactKey=*/false))
    Results.push_back({Keys[R.Index].str(), R.Score});
  return Results;
}

template <typename ResultT>
void filterByMinScore(std::vector<ResultT> &Results, double MinScore,
                      bool Inclusive = true) {
  llvm::erase_if(Results, [&](const ResultT &R) {
    return Inclusive ? R.Score < MinScore : R.Score <= MinScore;
  });
}

}
