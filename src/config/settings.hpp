#pragma once

#include "comparison/report.hpp"
#include "core/logging/logger.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace jsoncheck::config {

inline constexpr std::string_view kDefaultSettingsFileName = "jsoncheck.config.json";

// Effective settings for one invocation after all layers are applied.
struct Settings {
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  core::logging::LogFormat log_format = core::logging::LogFormat::kText;
  std::string log_file;
  bool console_logging = true;
  bool quiet = false;
  std::size_t max_depth = 64;
  comparison::ReportFormat report_format = comparison::ReportFormat::kText;
  bool stats = false;
};

// One configuration layer. Unset members leave lower layers untouched.
struct SettingsLayer {
  std::optional<core::logging::LogLevel> log_level;
  std::optional<core::logging::LogFormat> log_format;
  std::optional<std::string> log_file;
  std::optional<bool> console_logging;
  std::optional<bool> quiet;
  std::optional<std::size_t> max_depth;
  std::optional<comparison::ReportFormat> report_format;
  std::optional<bool> stats;
};

// Environment access is injectable so layering can be tested without
// mutating the process environment.
using EnvLookup = std::function<const char*(const char*)>;

void ApplyLayer(const SettingsLayer& layer, Settings& settings);

// Parses a JSON settings object. Unknown keys and wrongly typed values fail
// with the offending key path, e.g. "$.quiet: must be a boolean".
bool LoadSettingsText(std::string_view json_text, SettingsLayer& layer, std::string& error);

bool LoadSettingsFile(const std::filesystem::path& path, SettingsLayer& layer, std::string& error);

// Reads JSONCHECK_LOG_LEVEL, JSONCHECK_LOG_FORMAT, JSONCHECK_LOG_FILE and
// JSONCHECK_MAX_DEPTH. Empty variables are treated as unset.
bool LoadSettingsEnvironment(SettingsLayer& layer, std::string& error, const EnvLookup& lookup);

// Looks for jsoncheck.config.json in the working directory, then
// $HOME/.config/jsoncheck/, then $HOME.
std::optional<std::filesystem::path> FindDefaultSettingsFile(const EnvLookup& lookup);

// Defaults < settings file < environment < command line.
//
// Contract:
// - `explicit_path` must exist when given; otherwise the default search runs
//   and a missing file is not an error.
// - `used_path` receives the settings file that was applied, if any.
bool ResolveSettings(const std::optional<std::filesystem::path>& explicit_path,
                     const SettingsLayer& command_line, Settings& settings,
                     std::optional<std::filesystem::path>& used_path, std::string& error,
                     const EnvLookup& lookup);

// Nesting limits are accepted from 1 up to core::json::kMaxSupportedDepth.
bool ParseMaxDepth(std::string_view text, std::size_t& value);
std::string MaxDepthRangeText();

bool ParsePositiveSize(std::string_view text, std::size_t& value);
bool ParseBoolText(std::string_view text, bool& value);

} // namespace jsoncheck::config
