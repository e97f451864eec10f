#include "comparison/comparator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

using jsoncheck::comparison::CompareError;
using jsoncheck::comparison::DocumentRole;
using jsoncheck::comparison::Mismatch;

std::vector<Mismatch> CompareOk(const std::string& expected, const std::string& actual) {
  std::vector<Mismatch> mismatches;
  CompareError error;
  const bool ok = jsoncheck::comparison::Compare(expected, actual, mismatches, error);
  INFO(jsoncheck::comparison::Describe(error));
  REQUIRE(ok);
  return mismatches;
}

} // namespace

TEST_CASE("Comparing a document with itself reports nothing", "[comparison][reflexive]") {
  const std::vector<std::string> documents = {
      "{}",
      "[]",
      "42",
      "-0.5e-3",
      R"("text")",
      "null",
      "true",
      R"({"user":{"name":"ada","tags":["a","b"],"score":9.75,"active":false,"extra":null}})",
      R"([[1,[2,[3]]],{"k":[{}]}])",
  };

  for (const auto& document : documents) {
    INFO(document);
    REQUIRE(CompareOk(document, document).empty());
  }
}

TEST_CASE("Object member order is not significant", "[comparison][object]") {
  REQUIRE(CompareOk(R"({"a":1,"b":[1,2],"c":{"x":true,"y":null}})",
                    R"({"c":{"y":null,"x":true},"b":[1,2],"a":1})")
              .empty());

  const std::vector<Mismatch> forward = CompareOk(R"({"a":1,"b":2})", R"({"a":1,"b":3})");
  const std::vector<Mismatch> permuted = CompareOk(R"({"b":2,"a":1})", R"({"b":3,"a":1})");
  REQUIRE(forward == permuted);
  REQUIRE(forward == std::vector<Mismatch>{{"$.b", "2", "3"}});
}

TEST_CASE("Integral and fractional literals of the same value are equal", "[comparison][number]") {
  REQUIRE(CompareOk("42", "42.0").empty());
  REQUIRE(CompareOk("4.2e1", "42").empty());
  REQUIRE(CompareOk(R"({"n":[1,2.0]})", R"({"n":[1.0,2]})").empty());
}

TEST_CASE("Floating point round-off is tolerated", "[comparison][number]") {
  REQUIRE(CompareOk("0.3", "0.30000000000000004").empty());
  REQUIRE(CompareOk("-0", "0").empty());
}

TEST_CASE("Numeric tolerance scales with magnitude", "[comparison][number][tolerance]") {
  using jsoncheck::comparison::NumbersEquivalent;

  REQUIRE(NumbersEquivalent(1.0, 1.0));
  REQUIRE(NumbersEquivalent(1.0, 1.0 + 5e-11));
  REQUIRE_FALSE(NumbersEquivalent(1.0, 1.0 + 2e-10));

  REQUIRE(NumbersEquivalent(1e10, 1e10 + 0.5));
  REQUIRE_FALSE(NumbersEquivalent(1e10, 1e10 + 2.0));
  REQUIRE(NumbersEquivalent(-1e10 - 0.5, -1e10));

  REQUIRE(NumbersEquivalent(1e6, 1e6 + 1e-4 - 1e-9));
  REQUIRE_FALSE(NumbersEquivalent(1e6, 1e6 + 1e-4 + 1e-9));
  REQUIRE(NumbersEquivalent(1e-6 + 1e-16 - 1e-21, 1e-6));
  REQUIRE_FALSE(NumbersEquivalent(1e-6, 1e-6 + 1e-16 + 1e-21));
  REQUIRE(NumbersEquivalent(-100.0, -100.0 - 1e-8 + 1e-13));
  REQUIRE_FALSE(NumbersEquivalent(-100.0, -100.0 - 1e-8 - 1e-13));

  REQUIRE(NumbersEquivalent(0.0, -0.0));
  REQUIRE_FALSE(NumbersEquivalent(0.0, 1e-16));
  REQUIRE_FALSE(NumbersEquivalent(1.0, 2.0));
}

TEST_CASE("Numeric mismatches quote the raw literals", "[comparison][number]") {
  REQUIRE(CompareOk("1.50", "2") == std::vector<Mismatch>{{"$", "1.50", "2"}});
  REQUIRE(CompareOk(R"({"x":1e3})", R"({"x":1001})") ==
          std::vector<Mismatch>{{"$.x", "1e3", "1001"}});
}

TEST_CASE("Missing keys are reported in both directions", "[comparison][object]") {
  REQUIRE(CompareOk(R"({"a":1})", "{}") == std::vector<Mismatch>{{"$.a", "1", "(missing)"}});
  REQUIRE(CompareOk("{}", R"({"b":2})") == std::vector<Mismatch>{{"$.b", "(missing)", "2"}});
}

TEST_CASE("Missing values keep their source formatting", "[comparison][object]") {
  REQUIRE(CompareOk(R"({"a": {"x": 1, "y": [true]}})", "{}") ==
          std::vector<Mismatch>{{"$.a", R"({"x": 1, "y": [true]})", "(missing)"}});
  REQUIRE(CompareOk("{}", R"({"s": "hi"})") ==
          std::vector<Mismatch>{{"$.s", "(missing)", R"("hi")"}});
}

TEST_CASE("Actual-only keys follow the expected-driven pass", "[comparison][object][order]") {
  const std::vector<Mismatch> expected = {
      {"$.a", "1", "(missing)"},
      {"$.b", "2", "3"},
      {"$.z", "(missing)", "0"},
  };
  REQUIRE(CompareOk(R"({"a":1,"b":2})", R"({"z":0,"b":3})") == expected);
}

TEST_CASE("Array length and element mismatches coexist", "[comparison][array]") {
  const std::vector<Mismatch> expected = {
      {"$.length", "3", "2"},
      {"$[1]", "2", "9"},
  };
  REQUIRE(CompareOk("[1,2,3]", "[1,9]") == expected);
  REQUIRE(CompareOk("[]", "[1,2]") == std::vector<Mismatch>{{"$.length", "0", "2"}});
}

TEST_CASE("Nested paths combine member and index segments", "[comparison][path]") {
  REQUIRE(CompareOk(R"({"user":{"scores":[1,2]}})", R"({"user":{"scores":[1,5]}})") ==
          std::vector<Mismatch>{{"$.user.scores[1]", "2", "5"}});
  REQUIRE(CompareOk(R"({"rows":[{"id":1},{"id":2,"tags":["a"]}]})",
                    R"({"rows":[{"id":1},{"id":2,"tags":["a","b"]}]})") ==
          std::vector<Mismatch>{{"$.rows[1].tags.length", "1", "2"}});
}

TEST_CASE("Null matches null", "[comparison][null]") {
  REQUIRE(CompareOk(R"({"x":null})", R"({"x":null})").empty());
}

TEST_CASE("Kind mismatches carry kind names and raw text", "[comparison][kind]") {
  REQUIRE(CompareOk(R"({"a":"42"})", R"({"a":42})") ==
          std::vector<Mismatch>{{"$.a", R"(String: "42")", "Number: 42"}});
  REQUIRE(CompareOk(R"({"a":[1, 2]})", R"({"a":{}})") ==
          std::vector<Mismatch>{{"$.a", "Array: [1, 2]", "Object: {}"}});
  REQUIRE(CompareOk("null", "false") ==
          std::vector<Mismatch>{{"$", "Null: null", "Boolean: false"}});
}

TEST_CASE("Kind mismatches stop descent at that node", "[comparison][kind]") {
  REQUIRE(CompareOk(R"({"a":{"b":1,"c":2}})", R"({"a":[1,2]})").size() == 1U);
}

TEST_CASE("Boolean mismatches render literal text", "[comparison][bool]") {
  REQUIRE(CompareOk("[true]", "[false]") == std::vector<Mismatch>{{"$[0]", "true", "false"}});
}

TEST_CASE("Strings compare and render decoded", "[comparison][string]") {
  REQUIRE(CompareOk(R"("\u0041")", R"("A")").empty());
  REQUIRE(CompareOk(R"({"s":"caf\u00e9"})", R"({"s":"cafe"})") ==
          std::vector<Mismatch>{{"$.s", "caf\xC3\xA9", "cafe"}});
  REQUIRE(CompareOk(R"("line\nbreak")", R"("line break")") ==
          std::vector<Mismatch>{{"$", "line\nbreak", "line break"}});
}

TEST_CASE("Every mismatch is collected in one pass", "[comparison][exhaustive]") {
  const std::vector<Mismatch> expected = {
      {"$.a", "1", "2"},
      {"$.b[0]", R"(String: "x")", "Number: 1"},
      {"$.b[1].c", "true", "false"},
      {"$.d", "null", "(missing)"},
      {"$.e", "(missing)", "[]"},
  };
  REQUIRE(CompareOk(R"({"a":1,"b":["x",{"c":true}],"d":null})",
                    R"({"a":2,"b":[1,{"c":false}],"e":[]})") == expected);
}

TEST_CASE("Duplicate keys resolve to the last occurrence", "[comparison][object]") {
  REQUIRE(CompareOk(R"({"a":1,"a":2})", R"({"a":2})").empty());
  REQUIRE(CompareOk(R"({"a":1,"a":2})", R"({"a":1,"a":2})").empty());
}

TEST_CASE("Malformed input fails instead of producing mismatches", "[comparison][error]") {
  std::vector<Mismatch> mismatches = {{"$", "stale", "stale"}};
  CompareError error;

  REQUIRE_FALSE(jsoncheck::comparison::Compare("{", "{}", mismatches, error));
  REQUIRE(mismatches.empty());
  REQUIRE(error.role == DocumentRole::kExpected);

  REQUIRE_FALSE(jsoncheck::comparison::Compare("{}", "[1,]", mismatches, error));
  REQUIRE(error.role == DocumentRole::kActual);
  REQUIRE(error.parse.line == 1U);
  REQUIRE(error.parse.column == 4U);
  REQUIRE(jsoncheck::comparison::Describe(error) ==
          "actual document: parse error at line 1, col 4: expected JSON value");
}

TEST_CASE("Expected document is parsed before the actual one", "[comparison][error]") {
  std::vector<Mismatch> mismatches;
  CompareError error;
  REQUIRE_FALSE(jsoncheck::comparison::Compare("nope", "also nope", mismatches, error));
  REQUIRE(error.role == DocumentRole::kExpected);
}

TEST_CASE("Nesting limit applies to both documents", "[comparison][error]") {
  jsoncheck::comparison::CompareOptions options;
  options.parse.max_depth = 2;
  std::vector<Mismatch> mismatches;
  CompareError error;

  REQUIRE(jsoncheck::comparison::Compare("[[1]]", "[[1]]", mismatches, error, options));
  REQUIRE_FALSE(jsoncheck::comparison::Compare("[[1]]", "[[[1]]]", mismatches, error, options));
  REQUIRE(error.role == DocumentRole::kActual);
}
