#include "NameSuggest/Support.h"

#include "llvm/ADT/StringExtras.h"

namespace namesug {

// underscores and ascii whitespace never take part in an identifier comparison
bool isIdentifierSeparator(char C) {
  return C == '_' || llvm::isSpace(C);
}

}
