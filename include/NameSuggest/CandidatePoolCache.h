#pragma once

#include "NameSuggest/CandidatePool.h"

#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <memory>
#include <mutex>

namespace namesug {

class CandidatePoolCache {
public:
  using PoolRef = std::shared_ptr<const CandidatePool>;
  using Builder = llvm::function_ref<llvm::Expected<CandidatePool>()>;

  CandidatePoolCache() = default;

  CandidatePoolCache(const CandidatePoolCache &) = delete;
  CandidatePoolCache &operator=(const CandidatePoolCache &) = delete;

  // Build runs without the lock held and may call back into the cache. Two
  // threads missing the same key may both build; the first stored pool wins.
  llvm::Expected<PoolRef> getOrBuild(llvm::StringRef Key, Builder Build);

  PoolRef lookup(llvm::StringRef Key) const;

  bool invalidate(llvm::StringRef Key);
  void invalidateAll();

  size_t size() const;
  uint64_t generation() const;
  unsigned hits() const;
  unsigned misses() const;

private:
  mutable std::mutex Mutex;
  llvm::StringMap<PoolRef> Pools;
  uint64_t Generation = 0;
  unsigned Hits = 0;
  unsigned Misses = 0;
};

}
