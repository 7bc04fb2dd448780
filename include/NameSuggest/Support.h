#pragma once

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <string>

namespace namesug {

constexpr size_t MaxSuggestions = 5;

constexpr double DefaultMinScore = 0.3;

inline llvm::Error makeStringError(const llvm::Twine &Msg) {
  return llvm::make_error<llvm::StringError>(Msg, llvm::inconvertibleErrorCode());
}

bool isIdentifierSeparator(char C);

}
