#include "comparison/report.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <sstream>

namespace jsoncheck::comparison {

namespace {

std::string ToLower(std::string_view raw) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return normalized;
}

} // namespace

const char* ToString(ReportFormat format) {
  switch (format) {
  case ReportFormat::kText:
    return "text";
  case ReportFormat::kJson:
    return "json";
  }

  return "text";
}

bool ParseReportFormat(std::string_view raw, ReportFormat& format, std::string& error) {
  const std::string normalized = ToLower(raw);
  if (normalized == "text") {
    format = ReportFormat::kText;
    return true;
  }
  if (normalized == "json") {
    format = ReportFormat::kJson;
    return true;
  }

  error = "invalid report format '" + std::string(raw) + "' (expected text|json)";
  return false;
}

std::string RenderText(const ComparisonReport& report) {
  std::ostringstream out;
  if (report.Passed()) {
    out << "[PASS]: " << report.actual_label << " matches " << report.expected_label << '\n';
    return out.str();
  }

  out << "[FAIL]: " << report.actual_label << " differs from " << report.expected_label << '\n'
      << "  " << report.mismatches.size() << " difference(s) found:\n";
  for (const auto& mismatch : report.mismatches) {
    out << "    " << mismatch.path << ": expected " << mismatch.expected << ", got "
        << mismatch.actual << '\n';
  }
  return out.str();
}

std::string RenderJson(const ComparisonReport& report) {
  std::ostringstream out;
  out << "{\n"
      << "  \"expected\":\"" << core::EscapeJson(report.expected_label) << "\",\n"
      << "  \"actual\":\"" << core::EscapeJson(report.actual_label) << "\",\n"
      << "  \"passed\":" << (report.Passed() ? "true" : "false") << ",\n"
      << "  \"mismatch_count\":" << report.mismatches.size() << ",\n"
      << "  \"mismatches\":[";

  for (std::size_t i = 0; i < report.mismatches.size(); ++i) {
    const auto& mismatch = report.mismatches[i];
    if (i != 0U) {
      out << ",";
    }
    out << "\n    {"
        << "\"path\":\"" << core::EscapeJson(mismatch.path) << "\","
        << "\"expected\":\"" << core::EscapeJson(mismatch.expected) << "\","
        << "\"actual\":\"" << core::EscapeJson(mismatch.actual) << "\"}";
  }

  if (!report.mismatches.empty()) {
    out << "\n  ";
  }
  out << "]\n"
      << "}\n";
  return out.str();
}

std::string Render(const ComparisonReport& report, ReportFormat format) {
  if (format == ReportFormat::kJson) {
    return RenderJson(report);
  }
  return RenderText(report);
}

bool WriteReportJson(const ComparisonReport& report, const std::filesystem::path& output_path,
                     std::string& error) {
  return core::WriteTextFileAtomic(output_path, RenderJson(report), error);
}

} // namespace jsoncheck::comparison
