#include "NameSuggest/CandidatePool.h"
#include "NameSuggest/CandidatePoolCache.h"
#include "NameSuggest/CandidateRanker.h"
#include "NameSuggest/SuggestionDiagnostics.h"
#include "NameSuggest/SuggestionReport.h"

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Process.h"
#include "llvm/Support/raw_ostream.h"
#include "llvm/Support/WithColor.h"

using namespace llvm;
using namespace namesug;

static cl::OptionCategory NameSuggestCategory("name-suggest options");

static cl::list<std::string> UnknownNames(
    cl::Positional,
    cl::desc("<unresolved name>..."),
    cl::OneOrMore,
    cl::cat(NameSuggestCategory));

static cl::list<std::string> CandidateFiles(
    "candidates",
    cl::desc("Candidate pool file, one name per line (may be repeated)"),
    cl::value_desc("file"),
    cl::OneOrMore,
    cl::cat(NameSuggestCategory));

static cl::opt<std::string> CategoryName(
    "category",
    cl::desc("Kind of unresolved name: member, variable, namespace, "
             "named-argument, nameof (or its SMB id). Default: variable"),
    cl::value_desc("kind"),
    cl::init("variable"),
    cl::cat(NameSuggestCategory));

static cl::opt<std::string> Container(
    "container",
    cl::desc("Type, method or kind shown in the message "
             "(default: 'Identifier' for variables, the pool file name otherwise)"),
    cl::value_desc("text"),
    cl::cat(NameSuggestCategory));

static cl::opt<double> MinScore(
    "min-score",
    cl::desc("Drop suggestions scoring below this value "
             "(default: the category's threshold)"),
    cl::value_desc("score"),
    cl::cat(NameSuggestCategory));

static cl::opt<bool> Explain(
    "explain",
    cl::desc("Print the score breakdown of every suggestion"),
    cl::init(false),
    cl::cat(NameSuggestCategory));

static cl::opt<bool> ShowTokens(
    "tokens",
    cl::desc("Print the word tokens of the query and each suggestion"),
    cl::init(false),
    cl::cat(NameSuggestCategory));

static cl::opt<bool> NoColor(
    "no-color",
    cl::desc("Disable terminal color output"),
    cl::init(false),
    cl::cat(NameSuggestCategory));

namespace {

// formats and prints a standard usage error to standard error
void printUsageError(StringRef Msg) {
  WithColor::error(errs(), "name-suggest") << Msg << "\n";
  errs() << "Run 'name-suggest --help' for usage information.\n";
}

// merges every --candidates file into one pool; repeated files load once
Expected<CandidatePool> loadPools(CandidatePoolCache &Cache) {
  CandidatePool Merged("<candidates>");
  for (const std::string &Path : CandidateFiles) {
    Expected<CandidatePoolCache::PoolRef> PoolOrErr =
        Cache.getOrBuild(Path, [&]() { return loadCandidatePool(Path); });
    if (!PoolOrErr)
      return PoolOrErr.takeError();
    Merged.append(**PoolOrErr);
  }
  return std::move(Merged);
}

std::string defaultContainer(SuggestionCategory C) {
  if (C == SuggestionCategory::Variable)
    return "Identifier";
  return sys::path::stem(CandidateFiles[0]).str();
}

}

// entry point for the name-suggest executable
int main(int argc, char **argv) {
  InitLLVM X(argc, argv);

  cl::HideUnrelatedOptions(NameSuggestCategory);
  cl::ParseCommandLineOptions(
      argc, argv,
      "name-suggest: Did you mean...?\n\n"
      "Ranks the names of a candidate pool by similarity to each\n"
      "unresolved name and prints the resulting suggestion diagnostics.\n\n"
      "Examples:\n"
      "  name-suggest frstName --candidates=locals.txt\n"
      "  name-suggest Lenght --category=member --container=String "
      "--candidates=string.members\n"
      "  name-suggest Sytem.Colections --category=namespace "
      "--candidates=ns.txt --explain\n");

  std::optional<SuggestionCategory> Category = parseCategory(CategoryName);
  if (!Category) {
    printUsageError("Unknown category '" + CategoryName + "'");
    return 1;
  }
  const CategoryInfo &Info = categoryInfo(*Category);

  CandidatePoolCache Cache;
  Expected<CandidatePool> PoolOrErr = loadPools(Cache);
  if (!PoolOrErr) {
    WithColor::error(errs(), "name-suggest")
        << toString(PoolOrErr.takeError()) << "\n";
    return 1;
  }
  const CandidatePool &Pool = *PoolOrErr;
  if (Pool.empty())
    WithColor::warning(errs(), "name-suggest")
        << "candidate pool is empty, nothing can be suggested\n";

  double Threshold = MinScore.getNumOccurrences() ? double(MinScore)
                                                  : Info.MinScore;
  bool Inclusive = MinScore.getNumOccurrences() ? true
                                                : Info.InclusiveMinScore;
  std::string ContainerText =
      Container.empty() ? defaultContainer(*Category) : std::string(Container);

  ReportConfig RCfg;
  RCfg.UseColor   = !NoColor && sys::Process::StandardOutIsDisplayed();
  RCfg.Explain    = Explain;
  RCfg.ShowTokens = ShowTokens;
  SuggestionReporter Reporter(outs(), RCfg);

  std::vector<std::pair<StringRef, const CandidateEntry *>> Keyed = Pool.keyed();
  for (const std::string &Unknown : UnknownNames) {
    auto Ranked = rankKeyed(Unknown, Keyed);
    filterByMinScore(Ranked, Threshold, Inclusive);

    std::vector<SuggestionLine> Lines =
        renderSuggestions<const CandidateEntry *>(
            Ranked, [](const CandidateEntry *const &E) {
              return E->displayText().str();
            });

    std::optional<SuggestionDiagnostic> D = buildSuggestionDiagnostic(
        *Category, Unknown, ContainerText, std::move(Lines));
    if (D)
      Reporter.report(*D);
    else
      Reporter.reportNoMatch(*Category, Unknown, Threshold);
  }

  if (UnknownNames.size() > 1)
    Reporter.printSummary();

  return Reporter.summary().Unmatched > 0 ? 2 : 0;
}
