#include "jsoncheck/cli/router.hpp"

#include "comparison/report.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace jsoncheck::cli {

namespace {

constexpr std::string_view kVersion = "jsoncheck 1.0.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitDocumentsDiffer = core::errors::ToInt(core::errors::ExitCode::kDocumentsDiffer);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitInputInvalid = core::errors::ToInt(core::errors::ExitCode::kInputInvalid);
constexpr int kExitIoFailed = core::errors::ToInt(core::errors::ExitCode::kIoFailed);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  jsoncheck compare --expected <file> --actual <file|-> "
         "[--report-format <text|json>] [--report-out <file>] [--stats] [common options]\n"
      << "  jsoncheck validate <file|-> [common options]\n"
      << "  jsoncheck version\n"
      << "\n"
      << "common options:\n"
      << "  --config <file>            settings file (default: jsoncheck.config.json search)\n"
      << "  --max-depth <n>            deepest allowed JSON nesting (1..4096, default 64)\n"
      << "  --log-level <debug|info|warn|error>   (alias --verbosity)\n"
      << "  --log-format <text|json>\n"
      << "  --log-file <file>\n"
      << "  --console-logging <true|false>\n"
      << "  --quiet, -q                disable logging\n";
}

enum class SharedFlag {
  kNotShared,
  kConsumed,
  kError,
};

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string_view& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = args[i + 1];
  ++i;
  return true;
}

// Flags accepted by every document-reading command. Advances `i` past any
// consumed value.
SharedFlag ParseSharedFlag(const std::vector<std::string_view>& args, std::size_t& i,
                           std::optional<fs::path>& config_path, config::SettingsLayer& layer,
                           std::string& error) {
  const std::string_view token = args[i];
  std::string_view value;

  if (token == "--config") {
    if (!TakeValue(args, i, token, value, error)) {
      return SharedFlag::kError;
    }
    config_path = fs::path(value);
    return SharedFlag::kConsumed;
  }
  if (token == "--max-depth") {
    if (!TakeValue(args, i, token, value, error)) {
      return SharedFlag::kError;
    }
    std::size_t depth = 0;
    if (!config::ParseMaxDepth(value, depth)) {
      error = "--max-depth " + config::MaxDepthRangeText() + ", got '" + std::string(value) +
              "'";
      return SharedFlag::kError;
    }
    layer.max_depth = depth;
    return SharedFlag::kConsumed;
  }
  if (token == "--log-level" || token == "--verbosity") {
    if (!TakeValue(args, i, token, value, error)) {
      return SharedFlag::kError;
    }
    core::logging::LogLevel level = core::logging::LogLevel::kInfo;
    if (!core::logging::ParseLogLevel(value, level, error)) {
      return SharedFlag::kError;
    }
    layer.log_level = level;
    return SharedFlag::kConsumed;
  }
  if (token == "--log-format") {
    if (!TakeValue(args, i, token, value, error)) {
      return SharedFlag::kError;
    }
    core::logging::LogFormat format = core::logging::LogFormat::kText;
    if (!core::logging::ParseLogFormat(value, format, error)) {
      return SharedFlag::kError;
    }
    layer.log_format = format;
    return SharedFlag::kConsumed;
  }
  if (token == "--log-file") {
    if (!TakeValue(args, i, token, value, error)) {
      return SharedFlag::kError;
    }
    layer.log_file = std::string(value);
    return SharedFlag::kConsumed;
  }
  if (token == "--console-logging") {
    if (!TakeValue(args, i, token, value, error)) {
      return SharedFlag::kError;
    }
    bool enabled = true;
    if (!config::ParseBoolText(value, enabled)) {
      error = "--console-logging expects true|false, got '" + std::string(value) + "'";
      return SharedFlag::kError;
    }
    layer.console_logging = enabled;
    return SharedFlag::kConsumed;
  }
  if (token == "--quiet" || token == "-q") {
    layer.quiet = true;
    return SharedFlag::kConsumed;
  }

  return SharedFlag::kNotShared;
}

// Parse `compare` args with an explicit contract:
// - required `--expected <file>` and `--actual <file|->`
// - optional report/stats flags plus the shared flags
// Positional arguments and unknown flags are usage errors.
bool ParseCompareOptions(const std::vector<std::string_view>& args, CompareCommandOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;

    if (token == "--expected" || token == "-e") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.expected_path = std::string(value);
      continue;
    }
    if (token == "--actual" || token == "-a") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.actual_path = std::string(value);
      continue;
    }
    if (token == "--report-format") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      comparison::ReportFormat format = comparison::ReportFormat::kText;
      if (!comparison::ParseReportFormat(value, format, error)) {
        return false;
      }
      options.overrides.report_format = format;
      continue;
    }
    if (token == "--report-out") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.report_out = std::string(value);
      continue;
    }
    if (token == "--stats" || token == "-s") {
      options.overrides.stats = true;
      continue;
    }

    const SharedFlag shared =
        ParseSharedFlag(args, i, options.config_path, options.overrides, error);
    if (shared == SharedFlag::kError) {
      return false;
    }
    if (shared == SharedFlag::kConsumed) {
      continue;
    }

    if (!token.empty() && token.front() == '-' && token != "-") {
      error = "unknown option: " + std::string(token);
      return false;
    }
    error = "unexpected argument: " + std::string(token);
    return false;
  }

  if (options.expected_path.empty()) {
    error = "compare requires --expected <file>";
    return false;
  }
  if (options.actual_path.empty()) {
    error = "compare requires --actual <file|->";
    return false;
  }
  if (options.expected_path == "-") {
    error = "--expected must name a file; only --actual may read stdin";
    return false;
  }

  return true;
}

const char* LookupProcessEnv(const char* name) {
  return std::getenv(name);
}

std::string MakeSessionId(std::chrono::system_clock::time_point now) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return "session-" + std::to_string(millis);
}

// Settings layering happens before any log line is written so the first line
// already honours --log-format and --quiet.
bool ConfigureLogger(const config::Settings& settings, std::string_view category,
                     core::logging::Logger& logger, std::string& error) {
  logger.SetMinLevel(settings.log_level);
  logger.SetFormat(settings.log_format);
  logger.SetCategory(std::string(category));
  logger.SetSessionId(MakeSessionId(std::chrono::system_clock::now()));

  if (settings.quiet) {
    logger.Disable();
    return true;
  }
  if (!settings.console_logging) {
    logger.SetConsole(nullptr);
  }
  if (!settings.log_file.empty()) {
    std::string parent_error;
    if (!core::EnsureParentDirectory(settings.log_file, parent_error)) {
      error = parent_error;
      return false;
    }
    if (!logger.OpenFile(settings.log_file, error)) {
      return false;
    }
  }
  return true;
}

bool LoadDocumentText(const std::string& path, std::string& contents, std::string& error) {
  if (path == "-") {
    return core::ReadStreamText(std::cin, contents, error);
  }
  return core::ReadTextFile(path, contents, error);
}

std::string LabelFor(const std::string& path) {
  if (path == "-") {
    return std::string(kStdinLabel);
  }
  return path;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << kVersion << '\n';
  return kExitSuccess;
}

int CommandCompare(const std::vector<std::string_view>& args) {
  CompareCommandOptions options;
  std::string error;
  if (!ParseCompareOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  config::Settings settings;
  std::optional<fs::path> settings_path;
  if (!config::ResolveSettings(options.config_path, options.overrides, settings, settings_path,
                               error, LookupProcessEnv)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  core::logging::Logger logger;
  if (!ConfigureLogger(settings, "jsoncheck.compare", logger, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitIoFailed;
  }

  const std::string expected_label = LabelFor(options.expected_path);
  const std::string actual_label = LabelFor(options.actual_path);
  logger.Info("comparison requested",
              {{"expected", expected_label},
               {"actual", actual_label},
               {"report_format", comparison::ToString(settings.report_format)}});
  if (settings_path.has_value()) {
    logger.Debug("settings file applied", {{"path", settings_path->string()}});
  }

  PipelineStats stats;
  core::StageTimer timer;

  std::string expected_text;
  if (!LoadDocumentText(options.expected_path, expected_text, error)) {
    logger.Error("failed to load expected document", {{"error", error}});
    std::cerr << "error: failed to load expected document: " << error << '\n';
    return kExitIoFailed;
  }
  std::string actual_text;
  if (!LoadDocumentText(options.actual_path, actual_text, error)) {
    logger.Error("failed to load actual document", {{"error", error}});
    std::cerr << "error: failed to load actual document: " << error << '\n';
    return kExitIoFailed;
  }
  stats.load_ms = timer.ElapsedMillis();

  timer.Restart();
  core::json::ParseOptions parse_options;
  parse_options.max_depth = settings.max_depth;
  comparison::CompareError compare_error;
  core::json::Document expected_doc;
  core::json::Document actual_doc;
  bool parsed = core::json::Parse(std::move(expected_text), expected_doc, compare_error.parse,
                                  parse_options);
  if (!parsed) {
    compare_error.role = comparison::DocumentRole::kExpected;
  } else {
    parsed = core::json::Parse(std::move(actual_text), actual_doc, compare_error.parse,
                               parse_options);
    if (!parsed) {
      compare_error.role = comparison::DocumentRole::kActual;
    }
  }
  if (!parsed) {
    const std::string detail = comparison::Describe(compare_error);
    logger.Error("invalid JSON input", {{"error", detail}});
    std::cerr << "error: invalid JSON in " << detail << '\n';
    return kExitInputInvalid;
  }
  stats.parse_ms = timer.ElapsedMillis();

  timer.Restart();
  comparison::ComparisonReport report;
  report.expected_label = expected_label;
  report.actual_label = actual_label;
  report.mismatches = comparison::CompareDocuments(expected_doc, actual_doc);
  stats.compare_ms = timer.ElapsedMillis();

  std::cout << comparison::Render(report, settings.report_format);
  std::cout.flush();

  if (options.report_out.has_value()) {
    if (!comparison::WriteReportJson(report, *options.report_out, error)) {
      logger.Error("failed to write report", {{"path", *options.report_out}, {"error", error}});
      std::cerr << "error: failed to write report: " << error << '\n';
      return kExitIoFailed;
    }
    logger.Debug("report written", {{"path", *options.report_out}});
  }

  if (settings.stats) {
    std::cerr << FormatPipelineStats(stats);
  }

  const std::string mismatch_count = std::to_string(report.mismatches.size());
  if (report.Passed()) {
    logger.Info("comparison passed");
    return kExitSuccess;
  }

  logger.Warn("comparison failed", {{"mismatch_count", mismatch_count}});
  return kExitDocumentsDiffer;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  std::string input_path;
  std::optional<fs::path> config_path;
  config::SettingsLayer overrides;
  std::string error;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    const SharedFlag shared = ParseSharedFlag(args, i, config_path, overrides, error);
    if (shared == SharedFlag::kError) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
    if (shared == SharedFlag::kConsumed) {
      continue;
    }
    if (!token.empty() && token.front() == '-' && token != "-") {
      std::cerr << "error: unknown option: " << token << '\n';
      return kExitUsage;
    }
    if (!input_path.empty()) {
      std::cerr << "error: validate accepts exactly 1 document path\n";
      return kExitUsage;
    }
    input_path = std::string(token);
  }
  if (input_path.empty()) {
    std::cerr << "error: validate requires exactly 1 argument: <file|->\n";
    return kExitUsage;
  }

  config::Settings settings;
  std::optional<fs::path> settings_path;
  if (!config::ResolveSettings(config_path, overrides, settings, settings_path, error,
                               LookupProcessEnv)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  core::logging::Logger logger;
  if (!ConfigureLogger(settings, "jsoncheck.validate", logger, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitIoFailed;
  }

  const std::string label = LabelFor(input_path);
  logger.Info("validation requested", {{"input", label}});

  std::string text;
  if (!LoadDocumentText(input_path, text, error)) {
    logger.Error("failed to load document", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitIoFailed;
  }

  core::json::ParseOptions parse_options;
  parse_options.max_depth = settings.max_depth;
  core::json::Document document;
  core::json::ParseError parse_error;
  if (!core::json::Parse(std::move(text), document, parse_error, parse_options)) {
    const std::string detail = core::json::Describe(parse_error);
    logger.Warn("document is not valid JSON", {{"input", label}, {"error", detail}});
    std::cerr << "invalid JSON: " << label << '\n' << "  - " << detail << '\n';
    return kExitInputInvalid;
  }

  logger.Info("document is valid JSON",
              {{"input", label}, {"root_kind", core::json::ToString(document.root.type)}});
  std::cout << "valid: " << label << '\n';
  return kExitSuccess;
}

} // namespace

std::string FormatPipelineStats(const PipelineStats& stats) {
  std::ostringstream out;
  out << "\n"
      << "Pipeline Statistics:\n"
      << "  ----------------------------\n"
      << "  Load:     " << core::FormatMillis(stats.load_ms) << '\n'
      << "  Parse:    " << core::FormatMillis(stats.parse_ms) << '\n'
      << "  Compare:  " << core::FormatMillis(stats.compare_ms) << '\n'
      << "  ----------------------------\n"
      << "  Total:    " << core::FormatMillis(stats.TotalMillis()) << '\n';
  return out.str();
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "compare") {
    return CommandCompare(args);
  }

  if (command == "validate") {
    return CommandValidate(args);
  }

  if (command == "version" || command == "--version") {
    return CommandVersion(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace jsoncheck::cli
