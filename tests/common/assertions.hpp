#ifndef JSONCHECK_TESTS_COMMON_ASSERTIONS_HPP_
#define JSONCHECK_TESTS_COMMON_ASSERTIONS_HPP_

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

namespace jsoncheck::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    return;
  }
  std::cerr << "expected to find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertNotContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    return;
  }
  std::cerr << "expected to not find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertExitCode(int actual, int expected, std::string_view context) {
  if (actual == expected) {
    return;
  }
  std::cerr << context << ": expected exit code " << expected << ", got " << actual << '\n';
  std::abort();
}

inline std::string ReadFileToString(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    Fail("failed to open file: " + path.string());
  }
  return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

inline void WriteStringToFile(const std::filesystem::path& path, std::string_view contents) {
  std::ofstream output(path, std::ios::binary | std::ios::trunc);
  if (!output) {
    Fail("failed to open file for writing: " + path.string());
  }
  output << contents;
  if (!output) {
    Fail("failed while writing file: " + path.string());
  }
}

} // namespace jsoncheck::tests::common

#endif // JSONCHECK_TESTS_COMMON_ASSERTIONS_HPP_
