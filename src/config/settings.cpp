#include "config/settings.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <charconv>
#include <cmath>
#include <system_error>

namespace fs = std::filesystem;

namespace jsoncheck::config {

namespace {

using JsonValue = core::json::Value;

constexpr const char* kEnvLogLevel = "JSONCHECK_LOG_LEVEL";
constexpr const char* kEnvLogFormat = "JSONCHECK_LOG_FORMAT";
constexpr const char* kEnvLogFile = "JSONCHECK_LOG_FILE";
constexpr const char* kEnvMaxDepth = "JSONCHECK_MAX_DEPTH";

bool RequireString(const JsonValue& value, const std::string& path, std::string& error) {
  if (value.type != JsonValue::Type::kString) {
    error = path + ": must be a string";
    return false;
  }
  return true;
}

bool RequireBool(const JsonValue& value, const std::string& path, std::string& error) {
  if (value.type != JsonValue::Type::kBool) {
    error = path + ": must be a boolean";
    return false;
  }
  return true;
}

bool TryGetMaxDepth(const JsonValue& value, std::size_t& out) {
  if (value.type != JsonValue::Type::kNumber) {
    return false;
  }
  if (value.number_value < 1.0 || std::floor(value.number_value) != value.number_value) {
    return false;
  }
  if (value.number_value > static_cast<double>(core::json::kMaxSupportedDepth)) {
    return false;
  }
  out = static_cast<std::size_t>(value.number_value);
  return true;
}

const char* LookupNonEmpty(const EnvLookup& lookup, const char* name) {
  const char* raw = lookup(name);
  if (raw == nullptr || *raw == '\0') {
    return nullptr;
  }
  return raw;
}

bool IsUsableFile(const fs::path& candidate) {
  std::error_code ec;
  return fs::exists(candidate, ec) && !ec && fs::is_regular_file(candidate, ec) && !ec;
}

} // namespace

void ApplyLayer(const SettingsLayer& layer, Settings& settings) {
  if (layer.log_level.has_value()) {
    settings.log_level = *layer.log_level;
  }
  if (layer.log_format.has_value()) {
    settings.log_format = *layer.log_format;
  }
  if (layer.log_file.has_value()) {
    settings.log_file = *layer.log_file;
  }
  if (layer.console_logging.has_value()) {
    settings.console_logging = *layer.console_logging;
  }
  if (layer.quiet.has_value()) {
    settings.quiet = *layer.quiet;
  }
  if (layer.max_depth.has_value()) {
    settings.max_depth = *layer.max_depth;
  }
  if (layer.report_format.has_value()) {
    settings.report_format = *layer.report_format;
  }
  if (layer.stats.has_value()) {
    settings.stats = *layer.stats;
  }
}

std::string MaxDepthRangeText() {
  return "must be an integer between 1 and " + std::to_string(core::json::kMaxSupportedDepth);
}

bool ParseMaxDepth(std::string_view text, std::size_t& value) {
  std::size_t parsed = 0;
  if (!ParsePositiveSize(text, parsed) || parsed > core::json::kMaxSupportedDepth) {
    return false;
  }
  value = parsed;
  return true;
}

bool ParsePositiveSize(std::string_view text, std::size_t& value) {
  if (text.empty()) {
    return false;
  }
  std::size_t parsed = 0;
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end || parsed == 0U) {
    return false;
  }
  value = parsed;
  return true;
}

bool ParseBoolText(std::string_view text, bool& value) {
  if (text == "true" || text == "1" || text == "yes" || text == "on") {
    value = true;
    return true;
  }
  if (text == "false" || text == "0" || text == "no" || text == "off") {
    value = false;
    return true;
  }
  return false;
}

bool LoadSettingsText(std::string_view json_text, SettingsLayer& layer, std::string& error) {
  JsonValue root;
  core::json::ParseError parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = core::json::Describe(parse_error);
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "$: settings must be a JSON object";
    return false;
  }

  for (const auto& member : root.object_value) {
    const std::string path = "$." + member.key;
    const JsonValue& value = member.value;

    if (member.key == "log_level") {
      core::logging::LogLevel level = core::logging::LogLevel::kInfo;
      std::string level_error;
      if (!RequireString(value, path, error)) {
        return false;
      }
      if (!core::logging::ParseLogLevel(value.string_value, level, level_error)) {
        error = path + ": " + level_error;
        return false;
      }
      layer.log_level = level;
    } else if (member.key == "log_format") {
      core::logging::LogFormat format = core::logging::LogFormat::kText;
      std::string format_error;
      if (!RequireString(value, path, error)) {
        return false;
      }
      if (!core::logging::ParseLogFormat(value.string_value, format, format_error)) {
        error = path + ": " + format_error;
        return false;
      }
      layer.log_format = format;
    } else if (member.key == "log_file") {
      if (!RequireString(value, path, error)) {
        return false;
      }
      layer.log_file = value.string_value;
    } else if (member.key == "console_logging") {
      if (!RequireBool(value, path, error)) {
        return false;
      }
      layer.console_logging = value.bool_value;
    } else if (member.key == "quiet") {
      if (!RequireBool(value, path, error)) {
        return false;
      }
      layer.quiet = value.bool_value;
    } else if (member.key == "max_depth") {
      std::size_t depth = 0;
      if (!TryGetMaxDepth(value, depth)) {
        error = path + ": " + MaxDepthRangeText();
        return false;
      }
      layer.max_depth = depth;
    } else if (member.key == "report_format") {
      comparison::ReportFormat format = comparison::ReportFormat::kText;
      std::string format_error;
      if (!RequireString(value, path, error)) {
        return false;
      }
      if (!comparison::ParseReportFormat(value.string_value, format, format_error)) {
        error = path + ": " + format_error;
        return false;
      }
      layer.report_format = format;
    } else if (member.key == "stats") {
      if (!RequireBool(value, path, error)) {
        return false;
      }
      layer.stats = value.bool_value;
    } else {
      error = path + ": unknown setting";
      return false;
    }
  }

  return true;
}

bool LoadSettingsFile(const fs::path& path, SettingsLayer& layer, std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(path, contents, error)) {
    return false;
  }
  if (!LoadSettingsText(contents, layer, error)) {
    error = "invalid settings file " + path.string() + ": " + error;
    return false;
  }
  return true;
}

bool LoadSettingsEnvironment(SettingsLayer& layer, std::string& error, const EnvLookup& lookup) {
  if (const char* raw = LookupNonEmpty(lookup, kEnvLogLevel); raw != nullptr) {
    core::logging::LogLevel level = core::logging::LogLevel::kInfo;
    std::string level_error;
    if (!core::logging::ParseLogLevel(raw, level, level_error)) {
      error = std::string(kEnvLogLevel) + ": " + level_error;
      return false;
    }
    layer.log_level = level;
  }

  if (const char* raw = LookupNonEmpty(lookup, kEnvLogFormat); raw != nullptr) {
    core::logging::LogFormat format = core::logging::LogFormat::kText;
    std::string format_error;
    if (!core::logging::ParseLogFormat(raw, format, format_error)) {
      error = std::string(kEnvLogFormat) + ": " + format_error;
      return false;
    }
    layer.log_format = format;
  }

  if (const char* raw = LookupNonEmpty(lookup, kEnvLogFile); raw != nullptr) {
    layer.log_file = std::string(raw);
  }

  if (const char* raw = LookupNonEmpty(lookup, kEnvMaxDepth); raw != nullptr) {
    std::size_t depth = 0;
    if (!ParseMaxDepth(raw, depth)) {
      error = std::string(kEnvMaxDepth) + ": " + MaxDepthRangeText() + ", got '" + raw + "'";
      return false;
    }
    layer.max_depth = depth;
  }

  return true;
}

std::optional<fs::path> FindDefaultSettingsFile(const EnvLookup& lookup) {
  std::error_code ec;
  const fs::path cwd = fs::current_path(ec);
  if (!ec) {
    const fs::path candidate = cwd / kDefaultSettingsFileName;
    if (IsUsableFile(candidate)) {
      return candidate;
    }
  }

  const char* home = LookupNonEmpty(lookup, "HOME");
  if (home == nullptr) {
    return std::nullopt;
  }

  const fs::path config_candidate = fs::path(home) / ".config" / "jsoncheck" / kDefaultSettingsFileName;
  if (IsUsableFile(config_candidate)) {
    return config_candidate;
  }

  const fs::path home_candidate = fs::path(home) / kDefaultSettingsFileName;
  if (IsUsableFile(home_candidate)) {
    return home_candidate;
  }

  return std::nullopt;
}

bool ResolveSettings(const std::optional<fs::path>& explicit_path, const SettingsLayer& command_line,
                     Settings& settings, std::optional<fs::path>& used_path, std::string& error,
                     const EnvLookup& lookup) {
  settings = Settings{};
  used_path.reset();

  std::optional<fs::path> settings_path = explicit_path;
  if (!settings_path.has_value()) {
    settings_path = FindDefaultSettingsFile(lookup);
  }

  if (settings_path.has_value()) {
    SettingsLayer file_layer;
    if (!LoadSettingsFile(*settings_path, file_layer, error)) {
      return false;
    }
    ApplyLayer(file_layer, settings);
    used_path = settings_path;
  }

  SettingsLayer env_layer;
  if (!LoadSettingsEnvironment(env_layer, error, lookup)) {
    return false;
  }
  ApplyLayer(env_layer, settings);

  ApplyLayer(command_line, settings);
  return true;
}

} // namespace jsoncheck::config
