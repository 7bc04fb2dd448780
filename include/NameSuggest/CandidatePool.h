#pragma once

#include "NameSuggest/Support.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <utility>
#include <vector>

namespace namesug {

struct CandidateEntry {
  std::string Name;
  std::string Detail;

  llvm::StringRef displayText() const {
    return Detail.empty() ? llvm::StringRef(Name) : llvm::StringRef(Detail);
  }
};

class CandidatePool {
public:
  CandidatePool() = default;
  explicit CandidatePool(std::string Origin) : Origin(std::move(Origin)) {}

  void add(std::string Name, std::string Detail = std::string());

  const std::vector<CandidateEntry> &entries() const { return Entries; }
  size_t size() const { return Entries.size(); }
  bool empty() const { return Entries.empty(); }
  llvm::StringRef origin() const { return Origin; }

  std::vector<llvm::StringRef> names() const;

  std::vector<std::pair<llvm::StringRef, const CandidateEntry *>> keyed() const;

  void append(const CandidatePool &Other);

private:
  std::string Origin;
  std::vector<CandidateEntry> Entries;
};

llvm::Expected<CandidatePool> parseCandidatePool(llvm::StringRef Text,
                                                 llvm::StringRef Origin);

llvm::Expected<CandidatePool> loadCandidatePool(llvm::StringRef Path);

}
