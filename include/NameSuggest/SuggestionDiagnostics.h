#pragma once

#include "NameSuggest/CandidateRanker.h"
#include "NameSuggest/Support.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace namesug {

enum class SuggestionCategory : uint8_t {
  Member,
  Variable,
  Namespace,
  NamedArgument,
  Nameof,
};

struct CategoryInfo {
  SuggestionCategory Category;
  llvm::StringRef Id;
  llvm::StringRef Name;
  llvm::StringRef Title;
  llvm::StringRef MessageFormat;
  llvm::StringRef Description;
  double MinScore;
  bool InclusiveMinScore;
};

llvm::ArrayRef<CategoryInfo> allCategories();

const CategoryInfo &categoryInfo(SuggestionCategory C);

std::optional<SuggestionCategory> parseCategory(llvm::StringRef Name);

struct SuggestionLine {
  std::string Name;
  std::string Display;
  double Score;
};

struct SuggestionDiagnostic {
  SuggestionCategory Category;
  std::string Id;
  std::string Title;
  std::string UnknownName;
  std::string Container;
  std::string Message;
  std::vector<SuggestionLine> Suggestions;
  std::string FixProperty;
};

std::string formatSuggestionList(llvm::ArrayRef<SuggestionLine> Lines);

std::optional<SuggestionDiagnostic>
buildSuggestionDiagnostic(SuggestionCategory C, llvm::StringRef Unknown,
                          llvm::StringRef Container,
                          std::vector<SuggestionLine> Lines);

template <typename T>
std::vector<SuggestionLine>
renderSuggestions(const std::vector<ScoredCandidate<T>> &Ranked,
                  llvm::function_ref<std::string(const T &)> Render) {
  std::vector<SuggestionLine> Lines;
  Lines.reserve(Ranked.size());
  for (const ScoredCandidate<T> &R : Ranked)
    Lines.push_back({R.Name, Render(R.Value), R.Score});
  return Lines;
}

std::vector<SuggestionLine> renderSuggestions(const std::vector<ScoredName> &Ranked);

}
