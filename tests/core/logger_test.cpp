#include "core/logging/logger.hpp"

#include "../common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using jsoncheck::core::logging::LogFormat;
using jsoncheck::core::logging::Logger;
using jsoncheck::core::logging::LogLevel;

TEST_CASE("Text lines carry level category session and fields", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kInfo, &out);
  logger.SetCategory("jsoncheck.test");
  logger.SetSessionId("session-1");

  logger.Info("hello \"world\"", {{"path", "$.a"}});
  const std::string line = out.str();

  REQUIRE(line.rfind("ts_utc=", 0) == 0U);
  REQUIRE(line.find(" level=INFO category=jsoncheck.test session_id=\"session-1\"") !=
          std::string::npos);
  REQUIRE(line.find(" msg=\"hello \\\"world\\\"\" path=\"$.a\"\n") != std::string::npos);
}

TEST_CASE("JSON lines are single objects", "[core][logging][json]") {
  std::ostringstream out;
  Logger logger(LogLevel::kDebug, &out);
  logger.SetFormat(LogFormat::kJson);

  logger.Debug("parsed", {{"count", "2"}});
  const std::string line = out.str();

  REQUIRE(line.rfind("{\"ts_utc\":\"", 0) == 0U);
  REQUIRE(line.find("\"level\":\"DEBUG\",\"category\":\"jsoncheck\",\"session_id\":\"-\","
                    "\"msg\":\"parsed\",\"count\":\"2\"}\n") != std::string::npos);
}

TEST_CASE("Lines below the minimum level are dropped", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kWarn, &out);

  logger.Info("hidden");
  REQUIRE(out.str().empty());
  logger.Error("shown");
  REQUIRE(out.str().find("level=ERROR") != std::string::npos);
}

TEST_CASE("Disabled logger writes nothing", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kDebug, &out);
  logger.Disable();

  REQUIRE_FALSE(logger.ShouldLog(LogLevel::kError));
  logger.Error("hidden");
  REQUIRE(out.str().empty());
}

TEST_CASE("File sink appends without a console", "[core][logging][io]") {
  const auto temp_root = jsoncheck::tests::common::CreateUniqueTempDir("jsoncheck-logger-test");
  const auto log_path = temp_root / "run.log";

  {
    Logger logger(LogLevel::kInfo, nullptr);
    std::string error;
    REQUIRE(logger.OpenFile(log_path, error));
    logger.Info("first");
  }
  {
    Logger logger(LogLevel::kInfo, nullptr);
    std::string error;
    REQUIRE(logger.OpenFile(log_path, error));
    logger.Info("second");
  }

  const std::string contents = jsoncheck::tests::common::ReadFileToString(log_path);
  REQUIRE(contents.find("msg=\"first\"") != std::string::npos);
  REQUIRE(contents.find("msg=\"second\"") != std::string::npos);

  jsoncheck::tests::common::RemovePathBestEffort(temp_root);
}

TEST_CASE("Level and format names parse with aliases", "[core][logging]") {
  LogLevel level = LogLevel::kInfo;
  std::string error;
  REQUIRE(jsoncheck::core::logging::ParseLogLevel("Warning", level, error));
  REQUIRE(level == LogLevel::kWarn);
  REQUIRE(jsoncheck::core::logging::ParseLogLevel("trace", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE_FALSE(jsoncheck::core::logging::ParseLogLevel("", level, error));
  REQUIRE(error == "missing log level (expected debug|info|warn|error)");

  LogFormat format = LogFormat::kText;
  REQUIRE(jsoncheck::core::logging::ParseLogFormat("JSON", format, error));
  REQUIRE(format == LogFormat::kJson);
  REQUIRE_FALSE(jsoncheck::core::logging::ParseLogFormat("xml", format, error));
  REQUIRE(error == "invalid log format 'xml' (expected text|json)");
}
