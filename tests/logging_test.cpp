#include <health/logging.h>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  health::StructuredLogger logger(stream, {health::LogLevel::kInfo});

  logger.Log(health::LogLevel::kDebug, "metrics.package.complete", {});
  logger.Log(health::LogLevel::kInfo, "pipeline.complete", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("metrics.package.complete"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("pipeline.complete"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  health::StructuredLogger logger(stream, {health::LogLevel::kDebug});

  logger.Log(health::LogLevel::kWarn, "extract.directory.skipped",
             {{"directory", "legacy"}, {"reason", "parse \"error\""}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("level=warn"));
  EXPECT_NE(std::string::npos,
            output.find("message=\"extract.directory.skipped\""));
  EXPECT_NE(std::string::npos, output.find("fields={\"directory\": \"legacy\""));
  EXPECT_NE(std::string::npos,
            output.find("\"reason\": \"parse \\\"error\\\"\"}"));
}

TEST(LoggingTest, ConcurrentRecordsStayOnSeparateLines) {
  std::stringstream stream;
  health::StructuredLogger logger(stream, {health::LogLevel::kDebug});

  std::vector<std::thread> workers;
  for (int worker = 0; worker < 4; ++worker) {
    workers.emplace_back([&logger] {
      for (int i = 0; i < 25; ++i) {
        logger.Log(health::LogLevel::kDebug, "metrics.package.complete",
                   {{"package", "core"}});
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }

  std::string line;
  int lines = 0;
  while (std::getline(stream, line)) {
    EXPECT_EQ(line.front(), '[');
    EXPECT_NE(std::string::npos, line.find("fields={\"package\": \"core\"}"));
    ++lines;
  }
  EXPECT_EQ(lines, 100);
}

TEST(LoggingTest, ParsesLevelNamesCaseInsensitively) {
  EXPECT_EQ(health::ParseLogLevel("DEBUG"), health::LogLevel::kDebug);
  EXPECT_EQ(health::ParseLogLevel("warning"), health::LogLevel::kWarn);
  EXPECT_EQ(health::LevelName(health::LogLevel::kError), "error");
  EXPECT_THROW(health::ParseLogLevel("verbose"), std::invalid_argument);
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = health::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr, std::dynamic_pointer_cast<health::NullLogger>(provided));

  auto custom = health::MakeLogger(health::LoggingConfig{}, std::cout);
  EXPECT_EQ(custom, health::EnsureLogger(custom));
  EXPECT_FALSE(custom->IsEnabled(health::LogLevel::kWarn));
}

} // namespace
