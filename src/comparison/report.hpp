#pragma once

#include "comparison/comparator.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace jsoncheck::comparison {

enum class ReportFormat {
  kText,
  kJson,
};

const char* ToString(ReportFormat format);
bool ParseReportFormat(std::string_view raw, ReportFormat& format, std::string& error);

// Outcome of one comparison, labelled with where each document came from.
struct ComparisonReport {
  std::string expected_label;
  std::string actual_label;
  std::vector<Mismatch> mismatches;

  bool Passed() const {
    return mismatches.empty();
  }
};

// Human-readable report. One header line, then on failure a count line and
// one `<path>: expected <e>, got <a>` line per mismatch.
std::string RenderText(const ComparisonReport& report);

// Machine-readable report with labels, verdict, count and mismatch list.
std::string RenderJson(const ComparisonReport& report);

std::string Render(const ComparisonReport& report, ReportFormat format);

// Writes RenderJson(report) to `output_path` via temp file + rename.
bool WriteReportJson(const ComparisonReport& report, const std::filesystem::path& output_path,
                     std::string& error);

} // namespace jsoncheck::comparison
