#pragma once

#include "NameSuggest/SuggestionDiagnostics.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

namespace namesug {

struct ReportConfig {
  bool UseColor = true;
  bool Explain = false;
  bool ShowTokens = false;
};

struct ReportSummary {
  unsigned Queries = 0;
  unsigned Reported = 0;
  unsigned Unmatched = 0;
};

class SuggestionReporter {
public:
  SuggestionReporter(llvm::raw_ostream &OS, ReportConfig Config);

  void report(const SuggestionDiagnostic &D);
  void reportNoMatch(SuggestionCategory C, llvm::StringRef Unknown,
                     double Threshold);
  void printSummary();

  const ReportSummary &summary() const { return Summary; }

private:
  void printSeparator(char Ch = '=', unsigned Width = 72);
  void printColored(llvm::StringRef Text, llvm::raw_ostream::Colors Color,
                    bool Bold = false);
  void printTokens(llvm::StringRef Label, llvm::StringRef Identifier);
  void printSuggestion(unsigned Index, const SuggestionDiagnostic &D,
                       const SuggestionLine &L);

  llvm::raw_ostream &OS;
  ReportConfig Cfg;
  ReportSummary Summary;
};

}
