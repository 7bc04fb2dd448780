#include <catch2/catch.hpp>

#include "NameSuggest/CandidateRanker.h"

#include "llvm/ADT/StringRef.h"

#include <map>

using namespace namesug;

TEST_CASE("Keyed ranking puts the closest name first") {
  std::vector<std::pair<std::string, int>> Locals = {
      {"firstName", 1}, {"lastName", 2}, {"fullName", 3}, {"username", 4}};

  auto Results = rankKeyed("frstName", Locals);
  REQUIRE(Results.size() == 4);
  CHECK(Results[0].Name == "firstName");
  CHECK(Results[0].Value == 1);
  CHECK(Results[0].Score == Approx(1.1566666666666665));
  CHECK(Results[1].Name == "lastName");
  CHECK(Results[2].Name == "fullName");
  CHECK(Results[3].Name == "username");
  CHECK(Results[3].Value == 4);
}

TEST_CASE("Keyed ranking never suggests the name itself") {
  std::vector<std::pair<std::string, int>> Methods = {
      {"getUsers", 0}, {"getUserName", 1}, {"setUser", 2},
      {"userGet", 3},  {"getUser", 4}};

  auto Results = rankKeyed("getUser", Methods);
  REQUIRE(Results.size() == 4);
  for (const auto &R : Results)
    CHECK(R.Name != "getUser");
  CHECK(Results[0].Name == "getUserName");
  CHECK(Results[1].Name == "getUsers");
}

TEST_CASE("Keyed ranking is case sensitive about exclusion") {
  std::vector<std::pair<std::string, int>> Entries = {{"Value", 0},
                                                      {"other", 1}};
  auto Results = rankKeyed("value", Entries);
  REQUIRE(!Results.empty());
  CHECK(Results[0].Name == "Value");
}

TEST_CASE("At most five results in descending order") {
  std::vector<std::pair<std::string, unsigned>> Entries;
  const char *Names[] = {"count",  "counter", "accountCount", "amount",
                         "cnt",    "total",   "mount",        "countX",
                         "counts", "Count"};
  for (unsigned I = 0; I < 10; ++I)
    Entries.push_back({Names[I], I});

  auto Results = rankKeyed("count", Entries);
  REQUIRE(Results.size() == MaxSuggestions);
  for (size_t I = 1; I < Results.size(); ++I)
    CHECK(Results[I - 1].Score >= Results[I].Score);
}

TEST_CASE("Ties keep their input order") {
  std::vector<std::pair<std::string, char>> Entries = {
      {"Last", 'a'}, {"List", 'b'}, {"Lost", 'c'}};
  auto Results = rankKeyed("Lst", Entries);
  REQUIRE(Results.size() == 3);
  CHECK(Results[0].Score == Results[1].Score);
  CHECK(Results[0].Value == 'a');
  CHECK(Results[1].Value == 'b');
  CHECK(Results[2].Value == 'c');
}

TEST_CASE("Empty inputs produce no suggestions") {
  std::vector<std::pair<std::string, int>> Empty;
  CHECK(rankKeyed("anything", Empty).empty());

  std::vector<std::pair<std::string, int>> Some = {{"a", 1}, {"b", 2}};
  CHECK(rankKeyed("", Some).empty());

  std::vector<std::pair<std::string, int>> Blank = {{"", 1}, {"", 2}};
  CHECK(rankKeyed("x", Blank).empty());
}

TEST_CASE("Keyed ranking accepts maps and tuples") {
  std::map<std::string, double> Fields = {{"width", 1.5}, {"height", 2.5}};
  auto FromMap = rankKeyed("heigth", Fields);
  REQUIRE(!FromMap.empty());
  CHECK(FromMap[0].Name == "height");
  CHECK(FromMap[0].Value == 2.5);

  std::vector<std::tuple<llvm::StringRef, std::string>> Signatures = {
      {"Append", "Append(string value)"}, {"Insert", "Insert(int index)"}};
  auto FromTuples = rankKeyed("Apend", Signatures);
  REQUIRE(!FromTuples.empty());
  CHECK(FromTuples[0].Name == "Append");
  CHECK(FromTuples[0].Value == "Append(string value)");
}

TEST_CASE("Flat ranking over plain names") {
  std::vector<std::string> Names = {"firstName", "lastName", "fullName",
                                    "username"};
  auto Results = rankFlat("frstName", Names);
  REQUIRE(Results.size() == 4);
  CHECK(Results[0].Name == "firstName");
  CHECK(Results[0].Score == Approx(1.1566666666666665));
}

TEST_CASE("Flat ranking returns at most five names in descending order") {
  std::vector<std::string> Names = {"count",  "counter", "counts", "countX",
                                    "Count",  "county",  "counted", "counting",
                                    "counto", "counta",  "countr"};
  auto Results = rankFlat("count", Names);
  REQUIRE(Results.size() == MaxSuggestions);
  CHECK(Results[0].Name == "count");
  for (size_t I = 1; I < Results.size(); ++I)
    CHECK(Results[I - 1].Score >= Results[I].Score);
}

TEST_CASE("Flat ranking skips null and empty names") {
  const char *Names[] = {nullptr, "", "value", nullptr, "valve"};
  auto Results = rankFlat("valeu", Names);
  REQUIRE(Results.size() == 2);
  CHECK(Results[0].Name == "value");
  CHECK(Results[1].Name == "valve");
}

TEST_CASE("Flat ranking keeps an exact match") {
  std::vector<llvm::StringRef> Names = {"other", "value"};
  auto Results = rankFlat("value", Names);
  REQUIRE(Results.size() == 2);
  CHECK(Results[0].Name == "value");
  CHECK(Results[0].Score > 1.0);
}

TEST_CASE("Minimum score filter") {
  std::vector<ScoredName> Results = {{"a", 0.9}, {"b", 0.3}, {"c", 0.1}};

  auto Inclusive = Results;
  filterByMinScore(Inclusive, 0.3);
  REQUIRE(Inclusive.size() == 2);
  CHECK(Inclusive[1].Name == "b");

  auto Exclusive = Results;
  filterByMinScore(Exclusive, 0.3, /*Inclusive=*/false);
  REQUIRE(Exclusive.size() == 1);
  CHECK(Exclusive[0].Name == "a");
}

TEST_CASE("Ranking candidate keys directly") {
  llvm::StringRef Keys[] = {"alpha", "", "alpine", "alpha"};
  std::vector<RankedIndex> Kept =
      rankCandidateKeys("alpha", Keys, /*ExcludeExactKey=*/false);
  REQUIRE(Kept.size() == 3);
  CHECK(Kept[0].Index == 0);
  CHECK(Kept[1].Index == 3);
  CHECK(Kept[2].Index == 2);

  std::vector<RankedIndex> Excluded =
      rankCandidateKeys("alpha", Keys, /*ExcludeExactKey=*/true);
  REQUIRE(Excluded.size() == 1);
  CHECK(Excluded[0].Index == 2);
}
