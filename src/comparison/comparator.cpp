#include "comparison/comparator.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <unordered_set>

namespace jsoncheck::comparison {

namespace {

using JsonValue = core::json::Value;
using JsonDocument = core::json::Document;

constexpr double kRelativeTolerance = 1e-10;
constexpr double kZeroMagnitudeTolerance = 1e-15;

// Traversal state for one comparison call. Nothing here outlives the call.
class TreeWalker {
public:
  TreeWalker(const JsonDocument& expected, const JsonDocument& actual,
             std::vector<Mismatch>& mismatches)
      : expected_doc_(expected), actual_doc_(actual), mismatches_(mismatches) {}

  void Walk(const JsonValue& expected, const JsonValue& actual, const std::string& path) {
    if (expected.type != actual.type) {
      Emit(path, KindAndRaw(expected_doc_, expected), KindAndRaw(actual_doc_, actual));
      return;
    }

    switch (expected.type) {
    case JsonValue::Type::kObject:
      WalkObject(expected, actual, path);
      break;
    case JsonValue::Type::kArray:
      WalkArray(expected, actual, path);
      break;
    case JsonValue::Type::kNumber:
      // Integral and fractional literals share one kind; only the value counts.
      if (!NumbersEquivalent(expected.number_value, actual.number_value)) {
        Emit(path, Raw(expected_doc_, expected), Raw(actual_doc_, actual));
      }
      break;
    case JsonValue::Type::kString:
      if (expected.string_value != actual.string_value) {
        Emit(path, expected.string_value, actual.string_value);
      }
      break;
    case JsonValue::Type::kBool:
      if (expected.bool_value != actual.bool_value) {
        Emit(path, Raw(expected_doc_, expected), Raw(actual_doc_, actual));
      }
      break;
    case JsonValue::Type::kNull:
      break;
    }
  }

private:
  void WalkObject(const JsonValue& expected, const JsonValue& actual, const std::string& path) {
    std::unordered_set<std::string> expected_keys;
    expected_keys.reserve(expected.object_value.size());

    for (const auto& member : expected.object_value) {
      expected_keys.insert(member.key);
      const std::string member_path = path + "." + member.key;
      const JsonValue* actual_member = actual.Find(member.key);
      if (actual_member != nullptr) {
        Walk(member.value, *actual_member, member_path);
      } else {
        Emit(member_path, Raw(expected_doc_, member.value), std::string(kMissingMarker));
      }
    }

    for (const auto& member : actual.object_value) {
      if (expected_keys.count(member.key) == 0U) {
        Emit(path + "." + member.key, std::string(kMissingMarker), Raw(actual_doc_, member.value));
      }
    }
  }

  void WalkArray(const JsonValue& expected, const JsonValue& actual, const std::string& path) {
    const std::size_t expected_len = expected.array_value.size();
    const std::size_t actual_len = actual.array_value.size();
    if (expected_len != actual_len) {
      Emit(path + ".length", std::to_string(expected_len), std::to_string(actual_len));
    }

    // Elements past the shorter array are covered by the length mismatch alone.
    const std::size_t common_len = std::min(expected_len, actual_len);
    for (std::size_t i = 0; i < common_len; ++i) {
      Walk(expected.array_value[i], actual.array_value[i], path + "[" + std::to_string(i) + "]");
    }
  }

  static std::string Raw(const JsonDocument& document, const JsonValue& value) {
    return std::string(document.RawText(value));
  }

  static std::string KindAndRaw(const JsonDocument& document, const JsonValue& value) {
    return std::string(core::json::ToString(value.type)) + ": " + Raw(document, value);
  }

  void Emit(std::string path, std::string expected, std::string actual) {
    mismatches_.push_back({std::move(path), std::move(expected), std::move(actual)});
  }

  const JsonDocument& expected_doc_;
  const JsonDocument& actual_doc_;
  std::vector<Mismatch>& mismatches_;
};

} // namespace

const char* ToString(DocumentRole role) {
  switch (role) {
  case DocumentRole::kExpected:
    return "expected";
  case DocumentRole::kActual:
    return "actual";
  }

  return "expected";
}

std::string Describe(const CompareError& error) {
  return std::string(ToString(error.role)) + " document: " + core::json::Describe(error.parse);
}

bool NumbersEquivalent(double expected, double actual) {
  if (expected == actual) {
    return true;
  }

  const double magnitude = std::max(std::fabs(expected), std::fabs(actual));
  const double tolerance =
      magnitude == 0.0 ? kZeroMagnitudeTolerance : magnitude * kRelativeTolerance;
  return !(std::fabs(expected - actual) > tolerance);
}

std::vector<Mismatch> CompareDocuments(const JsonDocument& expected, const JsonDocument& actual) {
  std::vector<Mismatch> mismatches;
  TreeWalker walker(expected, actual, mismatches);
  walker.Walk(expected.root, actual.root, std::string(kRootPath));
  return mismatches;
}

bool Compare(std::string_view expected_text, std::string_view actual_text,
             std::vector<Mismatch>& mismatches, CompareError& error, CompareOptions options) {
  mismatches.clear();

  JsonDocument expected;
  if (!core::json::Parse(std::string(expected_text), expected, error.parse, options.parse)) {
    error.role = DocumentRole::kExpected;
    return false;
  }

  JsonDocument actual;
  if (!core::json::Parse(std::string(actual_text), actual, error.parse, options.parse)) {
    error.role = DocumentRole::kActual;
    return false;
  }

  mismatches = CompareDocuments(expected, actual);
  return true;
}

} // namespace jsoncheck::comparison
