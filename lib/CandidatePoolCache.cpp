#include "NameSuggest/CandidatePoolCache.h"

#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "namesug-pool"

namespace namesug {

// builds outside the lock so a builder may itself read the cache; the first stored pool wins
llvm::Expected<CandidatePoolCache::PoolRef>
CandidatePoolCache::getOrBuild(llvm::StringRef Key, Builder Build) {
  uint64_t BuildGeneration;
  {
    std::lock_guard<std::mutex> Guard(Mutex);
    auto It = Pools.find(Key);
    if (It != Pools.end()) {
      ++Hits;
      return It->second;
    }
    ++Misses;
    BuildGeneration = Generation;
  }

  llvm::Expected<CandidatePool> PoolOrErr = Build();
  if (!PoolOrErr)
    return PoolOrErr.takeError();
  PoolRef Pool = std::make_shared<const CandidatePool>(std::move(*PoolOrErr));

  std::lock_guard<std::mutex> Guard(Mutex);
  auto It = Pools.find(Key);
  if (It != Pools.end())
    return It->second;
  // an invalidateAll() during the build means the inputs may be stale
  if (BuildGeneration != Generation)
    return Pool;

  Pools[Key] = Pool;
  LLVM_DEBUG(llvm::dbgs() << "cached pool '" << Key << "' with " << Pool->size()
                          << " candidates (generation " << Generation << ")\n");
  return Pool;
}

CandidatePoolCache::PoolRef
CandidatePoolCache::lookup(llvm::StringRef Key) const {
  std::lock_guard<std::mutex> Guard(Mutex);
  auto It = Pools.find(Key);
  return It == Pools.end() ? nullptr : It->second;
}

bool CandidatePoolCache::invalidate(llvm::StringRef Key) {
  std::lock_guard<std::mutex> Guard(Mutex);
  return Pools.erase(Key);
}

// drops every pool; pools already handed out stay alive through their shared owners
void CandidatePoolCache::invalidateAll() {
  std::lock_guard<std::mutex> Guard(Mutex);
  Pools.clear();
  ++Generation;
}

size_t CandidatePoolCache::size() const {
  std::lock_guard<std::mutex> Guard(Mutex);
  return Pools.size();
}

uint64_t CandidatePoolCache::generation() const {
  std::lock_guard<std::mutex> Guard(Mutex);
  return Generation;
}

unsigned CandidatePoolCache::hits() const {
  std::lock_guard<std::mutex> Guard(Mutex);
  return Hits;
}

unsigned CandidatePoolCache::misses() const {
  std::lock_guard<std::mutex> Guard(Mutex);
  return Misses;
}

}
