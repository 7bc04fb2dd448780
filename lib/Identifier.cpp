#include "NameSuggest/Identifier.h"
#include "NameSuggest/Support.h"

#include "llvm/ADT/StringExtras.h"

namespace namesug {

// folds case and drops separators so that "Hello_World" and "hello world" compare equal
std::string normalizeIdentifier(llvm::StringRef Text) {
  std::string Out;
  Out.reserve(Text.size());
  for (char C : Text) {
    if (isIdentifierSeparator(C))
      continue;
    Out.push_back(llvm::toLower(C));
  }
  return Out;
}

// breaks an identifier on camel humps, separators and digits into lowercase words
std::vector<std::string> splitIdentifier(llvm::StringRef Text) {
  std::vector<std::string> Tokens;
  std::string Current;

  auto Flush = [&]() {
    if (!Current.empty())
      Tokens.push_back(std::move(Current));
    Current.clear();
  };

  for (char C : Text) {
    if (isIdentifierSeparator(C) || llvm::isDigit(C)) {
      Flush();
      continue;
    }
    // each capital opens a new token, so "XML" yields three one-letter tokens
    if (C >= 'A' && C <= 'Z')
      Flush();
    Current.push_back(llvm::toLower(C));
  }
  Flush();

  return Tokens;
}

// keeps only the unqualified, non-generic part of a type name
llvm::StringRef shortTypeName(llvm::StringRef QualifiedName) {
  // generic arguments may themselves be qualified, so cut them off first
  llvm::StringRef Name = QualifiedName;
  size_t GenericStart = Name.find_first_of("<`");
  if (GenericStart != llvm::StringRef::npos)
    Name = Name.substr(0, GenericStart);

  size_t LastDot = Name.rfind('.');
  if (LastDot != llvm::StringRef::npos)
    Name = Name.substr(LastDot + 1);
  return Name;
}

}
