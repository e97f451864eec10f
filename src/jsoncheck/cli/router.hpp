#pragma once

#include "comparison/comparator.hpp"
#include "config/settings.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsoncheck::cli {

// Label used for a document read from standard input (`--actual -`).
inline constexpr std::string_view kStdinLabel = "<stdin>";

// Parsed `jsoncheck compare` invocation before settings layering.
struct CompareCommandOptions {
  std::string expected_path;
  std::string actual_path;
  std::optional<std::filesystem::path> config_path;
  std::optional<std::string> report_out;
  config::SettingsLayer overrides;
};

// Stage timings reported by `--stats`, in milliseconds.
struct PipelineStats {
  double load_ms = 0.0;
  double parse_ms = 0.0;
  double compare_ms = 0.0;

  double TotalMillis() const {
    return load_ms + parse_ms + compare_ms;
  }
};

std::string FormatPipelineStats(const PipelineStats& stats);

// Routes `jsoncheck` subcommands and returns the process exit code:
//   0  => documents equivalent / command succeeded
//   1  => documents differ
//   2  => usage error (unknown command / invalid args)
//   10 => malformed JSON input
//   20 => input unreadable or report unwritable
//   30 => invalid configuration
int Dispatch(int argc, char** argv);

} // namespace jsoncheck::cli
