#include "NameSuggest/SuggestionReport.h"
#include "NameSuggest/CompositeScore.h"
#include "NameSuggest/Identifier.h"

#include "llvm/Support/Format.h"

namespace namesug {

SuggestionReporter::SuggestionReporter(llvm::raw_ostream &OS,
                                       ReportConfig Config)
    : OS(OS), Cfg(std::move(Config)) {}

// prints a horizontal rule between diagnostics
void SuggestionReporter::printSeparator(char Ch, unsigned Width) {
  for (unsigned I = 0; I < Width; ++I)
    OS << Ch;
  OS << "\n";
}

// writes text in the given terminal colour when colour output is enabled
void SuggestionReporter::printColored(llvm::StringRef Text,
                                      llvm::raw_ostream::Colors Color,
                                      bool Bold) {
  if (Cfg.UseColor)
    OS.changeColor(Color, Bold);
  OS << Text;
  if (Cfg.UseColor)
    OS.resetColor();
}

// shows how an identifier was split into word tokens
void SuggestionReporter::printTokens(llvm::StringRef Label,
                                     llvm::StringRef Identifier) {
  OS << "  " << Label << " tokens: [";
  bool First = true;
  for (const std::string &T : splitIdentifier(Identifier)) {
    if (!First)
      OS << ", ";
    OS << T;
    First = false;
  }
  OS << "]  normalized: \"" << normalizeIdentifier(Identifier) << "\"\n";
}

void SuggestionReporter::printSuggestion(unsigned Index,
                                         const SuggestionDiagnostic &D,
                                         const SuggestionLine &L) {
  OS << "  ";
  printColored((llvm::Twine(Index) + ". ").str(), llvm::raw_ostream::YELLOW);
  OS << (L.Display.empty() ? L.Name : L.Display);
  OS << "  " << llvm::format("(%.4f)", L.Score) << "\n";

  if (Cfg.ShowTokens)
    printTokens("    candidate", L.Name);

  if (Cfg.Explain) {
    OS << "      ";
    printScoreBreakdown(explainCompositeScore(D.UnknownName, L.Name), OS);
    OS << "\n";
  }
}

// renders one suggestion diagnostic with its id, message and ranked candidates
void SuggestionReporter::report(const SuggestionDiagnostic &D) {
  ++Summary.Queries;
  ++Summary.Reported;

  printSeparator('=');
  printColored(D.Id, llvm::raw_ostream::RED, /*Bold=*/true);
  OS << " ";
  printColored(D.Title, llvm::raw_ostream::WHITE, /*Bold=*/true);
  OS << "\n";
  OS << "  " << llvm::StringRef(D.Message).split('\n').first << "\n";

  if (Cfg.ShowTokens)
    printTokens("query", D.UnknownName);

  printSeparator('-');
  unsigned Index = 0;
  for (const SuggestionLine &L : D.Suggestions)
    printSuggestion(++Index, D, L);
}

void SuggestionReporter::reportNoMatch(SuggestionCategory C,
                                       llvm::StringRef Unknown,
                                       double Threshold) {
  ++Summary.Queries;
  ++Summary.Unmatched;

  const CategoryInfo &Info = categoryInfo(C);
  printSeparator('=');
  printColored(Info.Id, llvm::raw_ostream::CYAN, /*Bold=*/true);
  OS << " no suggestion for '" << Unknown << "' above "
     << llvm::format("%.2f", Threshold) << "\n";
  if (Cfg.ShowTokens)
    printTokens("query", Unknown);
}

void SuggestionReporter::printSummary() {
  printSeparator('=');
  OS << "  Queries   : " << Summary.Queries << "\n";
  OS << "  Suggested : " << Summary.Reported << "\n";
  if (Summary.Unmatched > 0) {
    OS << "  Unmatched : ";
    printColored((llvm::Twine(Summary.Unmatched)).str(),
                 llvm::raw_ostream::YELLOW);
    OS << "\n";
  }
}

}
