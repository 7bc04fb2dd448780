#pragma once

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace namesug {

std::string normalizeIdentifier(llvm::StringRef Text);

std::vector<std::string> splitIdentifier(llvm::StringRef Text);

llvm::StringRef shortTypeName(llvm::StringRef QualifiedName);

}
