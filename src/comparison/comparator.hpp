#pragma once

#include "core/json_dom.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace jsoncheck::comparison {

inline constexpr std::string_view kRootPath = "$";
inline constexpr std::string_view kMissingMarker = "(missing)";

// One point of disagreement between the expected and actual documents.
// `expected`/`actual` are human-readable renderings of the two sides, or
// `(missing)` when the location exists on one side only.
struct Mismatch {
  std::string path;
  std::string expected;
  std::string actual;

  bool operator==(const Mismatch& other) const {
    return path == other.path && expected == other.expected && actual == other.actual;
  }
  bool operator!=(const Mismatch& other) const {
    return !(*this == other);
  }
};

enum class DocumentRole {
  kExpected,
  kActual,
};

const char* ToString(DocumentRole role);

// Malformed input is a hard failure and never becomes a Mismatch.
struct CompareError {
  DocumentRole role = DocumentRole::kExpected;
  core::json::ParseError parse;
};

std::string Describe(const CompareError& error);

struct CompareOptions {
  core::json::ParseOptions parse;
};

// Tolerant numeric equality. Exact matches pass; otherwise the allowed absolute
// difference is max(|e|, |a|) * 1e-10, or 1e-15 when that magnitude is zero.
bool NumbersEquivalent(double expected, double actual);

// Walks both trees depth-first, driven by the expected tree, and returns every
// mismatch in discovery order. Keys found only in an actual object are reported
// after that object's expected-driven pass.
std::vector<Mismatch> CompareDocuments(const core::json::Document& expected,
                                       const core::json::Document& actual);

// Parses both texts (expected first) and compares them.
//
// Contract:
// - returns false and sets `error` when either text is not valid JSON;
//   `mismatches` is left empty in that case.
// - otherwise returns true; an empty `mismatches` means the documents are
//   equivalent.
bool Compare(std::string_view expected_text, std::string_view actual_text,
             std::vector<Mismatch>& mismatches, CompareError& error, CompareOptions options = {});

} // namespace jsoncheck::comparison
