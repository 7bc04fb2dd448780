#include <catch2/catch.hpp>

#include "NameSuggest/Identifier.h"

using namespace namesug;

using Tokens = std::vector<std::string>;

TEST_CASE("Normalize folds case and drops separators") {
  CHECK(normalizeIdentifier("") == "");
  CHECK(normalizeIdentifier("Hello_World") == "helloworld");
  CHECK(normalizeIdentifier("hello world") == "helloworld");
  CHECK(normalizeIdentifier("  __MAX\tVALUE__ ") == "maxvalue");
  CHECK(normalizeIdentifier("value42") == "value42");

  const char *Null = nullptr;
  CHECK(normalizeIdentifier(Null) == "");
}

TEST_CASE("Normalize is idempotent") {
  for (const char *Text : {"Hello_World", "hello world", "XMLHttpRequest",
                           "_", "get123Users456", ""}) {
    std::string Once = normalizeIdentifier(Text);
    CHECK(normalizeIdentifier(Once) == Once);
  }
}

TEST_CASE("Split identifiers into word tokens") {
  CHECK(splitIdentifier("").empty());
  CHECK(splitIdentifier("   ").empty());
  CHECK(splitIdentifier("123").empty());
  CHECK(splitIdentifier("_").empty());
  CHECK(splitIdentifier("a") == Tokens{"a"});
  CHECK(splitIdentifier("camelCase") == Tokens{"camel", "case"});
  CHECK(splitIdentifier("PascalCase") == Tokens{"pascal", "case"});
  CHECK(splitIdentifier("snake_case") == Tokens{"snake", "case"});
  CHECK(splitIdentifier("XMLHttpRequest") ==
        Tokens{"x", "m", "l", "http", "request"});
  CHECK(splitIdentifier("get123Users456") == Tokens{"get", "users"});
  CHECK(splitIdentifier("mixedCASE_with_123") ==
        Tokens{"mixed", "c", "a", "s", "e", "with"});
  CHECK(splitIdentifier("first name") == Tokens{"first", "name"});
}

TEST_CASE("Split keeps repeated tokens") {
  CHECK(splitIdentifier("countCount") == Tokens{"count", "count"});
}

TEST_CASE("Short type names drop qualifier and generic suffix") {
  CHECK(shortTypeName("System.Collections.Generic.List`1") == "List");
  CHECK(shortTypeName("Dictionary<K, V>") == "Dictionary");
  CHECK(shortTypeName("Foo") == "Foo");
  CHECK(shortTypeName("") == "");
  CHECK(shortTypeName("A.B.Map<System.String, System.Int32>") == "Map");
  CHECK(shortTypeName("Outer.") == "");
}
