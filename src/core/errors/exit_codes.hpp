#pragma once

namespace jsoncheck::core::errors {

// Process exit contract for test automation.
//
// 0 and 1 carry the comparison verdict so wrappers can branch on it directly:
// - 0 documents are equivalent
// - 1 documents differ
// - 2 usage/argument failure
//
// Higher values classify why no verdict could be produced.
enum class ExitCode : int {
  kSuccess = 0,
  kDocumentsDiffer = 1,
  kUsage = 2,
  kInputInvalid = 10,
  kIoFailed = 20,
  kConfigInvalid = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace jsoncheck::core::errors
