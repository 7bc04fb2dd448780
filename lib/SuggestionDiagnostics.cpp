#include "NameSuggest/SuggestionDiagnostics.h"

#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/FormatVariadic.h"

namespace namesug {

namespace {

const CategoryInfo Categories[] = {
    {SuggestionCategory::Member, "SMB001", "member", "Member not found",
     "Member '{0}' does not exist on type '{1}'. Did you mean:{2}",
     "This member does not exist on the given type.",
     DefaultMinScore, /*InclusiveMinScore=*/true},
    {SuggestionCategory::Variable, "SMB002", "variable", "Variable not found",
     "{1} '{0}' does not exist in the current scope. Did you mean:{2}",
     "This variable does not exist in the current scope.",
     DefaultMinScore, /*InclusiveMinScore=*/true},
    {SuggestionCategory::Namespace, "SMB003", "namespace", "Namespace not found",
     "Namespace '{0}' does not exist, Did you mean:{2}",
     "This namespace does not exist.",
     DefaultMinScore, /*InclusiveMinScore=*/false},
    {SuggestionCategory::NamedArgument, "SMB004", "named-argument",
     "Named argument not found",
     "Parameter '{0}' does not exist for '{1}', Available signatures:{2}",
     "This named argument does not exist for the method or constructor.",
     DefaultMinScore, /*InclusiveMinScore=*/true},
    {SuggestionCategory::Nameof, "SMB005", "nameof", "Invalid nameof argument",
     "Nameof '{0}' does not exist, Did you mean:{2}",
     "The argument used in the nameof() operator does not exist in the "
     "current scope.",
     DefaultMinScore, /*InclusiveMinScore=*/true},
};

}

llvm::ArrayRef<CategoryInfo> allCategories() { return Categories; }

const CategoryInfo &categoryInfo(SuggestionCategory C) {
  for (const CategoryInfo &Info : Categories)
    if (Info.Category == C)
      return Info;
  llvm_unreachable("every suggestion category has a table entry");
}

// accepts the category name or its diagnostic id, case-insensitively
std::optional<SuggestionCategory> parseCategory(llvm::StringRef Name) {
  for (const CategoryInfo &Info : Categories)
    if (Name.equals_insensitive(Info.Name) || Name.equals_insensitive(Info.Id))
      return Info.Category;
  return std::nullopt;
}

std::string formatSuggestionList(llvm::ArrayRef<SuggestionLine> Lines) {
  std::string Out;
  for (const SuggestionLine &L : Lines) {
    Out += "\n- ";
    Out += L.Display.empty() ? L.Name : L.Display;
  }
  return Out;
}

std::optional<SuggestionDiagnostic>
buildSuggestionDiagnostic(SuggestionCategory C, llvm::StringRef Unknown,
                          llvm::StringRef Container,
                          std::vector<SuggestionLine> Lines) {
  if (Lines.empty())
    return std::nullopt;

  const CategoryInfo &Info = categoryInfo(C);
  SuggestionDiagnostic D;
  D.Category    = C;
  D.Id          = Info.Id.str();
  D.Title       = Info.Title.str();
  D.UnknownName = Unknown.str();
  D.Container   = Container.str();
  D.Message     = llvm::formatv(Info.MessageFormat.data(), Unknown, Container,
                                formatSuggestionList(Lines))
                      .str();
  for (const SuggestionLine &L : Lines) {
    if (!D.FixProperty.empty())
      D.FixProperty += '|';
    D.FixProperty += L.Name;
  }
  D.Suggestions = std::move(Lines);
  return D;
}

std::vector<SuggestionLine>
renderSuggestions(const std::vector<ScoredName> &Ranked) {
  std::vector<SuggestionLine> Lines;
  Lines.reserve(Ranked.size());
  for (const ScoredName &R : Ranked)
    Lines.push_back({R.Name, R.Name, R.Score});
  return Lines;
}

}
