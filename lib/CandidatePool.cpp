#include "NameSuggest/CandidatePool.h"

#include "llvm/Support/Debug.h"
#include "llvm/Support/LineIterator.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "namesug-pool"

namespace namesug {

void CandidatePool::add(std::string Name, std::string Detail) {
  Entries.push_back(CandidateEntry{std::move(Name), std::move(Detail)});
}

std::vector<llvm::StringRef> CandidatePool::names() const {
  std::vector<llvm::StringRef> Result;
  Result.reserve(Entries.size());
  for (const CandidateEntry &E : Entries)
    Result.push_back(E.Name);
  return Result;
}

std::vector<std::pair<llvm::StringRef, const CandidateEntry *>>
CandidatePool::keyed() const {
  std::vector<std::pair<llvm::StringRef, const CandidateEntry *>> Result;
  Result.reserve(Entries.size());
  for (const CandidateEntry &E : Entries)
    Result.emplace_back(E.Name, &E);
  return Result;
}

void CandidatePool::append(const CandidatePool &Other) {
  Entries.insert(Entries.end(), Other.Entries.begin(), Other.Entries.end());
}

// reads "name[<TAB>display text]" records, one per line
llvm::Expected<CandidatePool> parseCandidatePool(llvm::StringRef Text,
                                                 llvm::StringRef Origin) {
  CandidatePool Pool(Origin.str());
  llvm::MemoryBufferRef Buffer(Text, Origin);

  unsigned Skipped = 0;
  for (llvm::line_iterator It(Buffer, /*SkipBlanks=*/true, '#'), End;
       It != End; ++It) {
    std::pair<llvm::StringRef, llvm::StringRef> Fields = It->split('\t');
    llvm::StringRef Name   = Fields.first.trim();
    llvm::StringRef Detail = Fields.second.trim();

    if (Name.startswith("#"))
      continue;
    if (Name.empty()) {
      ++Skipped;
      continue;
    }
    if (Name.find_first_of(" \t\v\f\r") != llvm::StringRef::npos)
      return makeStringError(Origin + ":" + llvm::Twine(It.line_number()) +
                             ": candidate name '" + Name +
                             "' contains whitespace");

    Pool.add(Name.str(), Detail.str());
  }

  LLVM_DEBUG(llvm::dbgs() << "loaded " << Pool.size() << " candidates from '"
                          << Origin << "' (" << Skipped << " without a name)\n");
  return std::move(Pool);
}

llvm::Expected<CandidatePool> loadCandidatePool(llvm::StringRef Path) {
  auto BufOrErr = llvm::MemoryBuffer::getFile(Path, /*IsText=*/true);
  if (!BufOrErr)
    return makeStringError("Cannot open candidate file '" + Path +
                           "': " + BufOrErr.getError().message());
  return parseCandidatePool((*BufOrErr)->getBuffer(), Path);
}

}
