#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <unistd.h>

#include "runlog/config/logging_config.h"
#include "runlog/logging/logging_error.h"
#include "../logging/test_log_helpers.h"

namespace runlog {
namespace config {
namespace test {

using logging::testing::TempDir;
using logging::testing::fixedClock;
using logging::testing::kFixedDate;
using logging::testing::kFixedRunId;

class LoggingConfigTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (!original_dir_.empty() && chdir(original_dir_.c_str()) != 0) {
      ADD_FAILURE() << "Cannot restore working directory " << original_dir_;
    }
    unsetenv(kConfigEnvVar);
    unsetenv("RUNLOG_TEST_DIR");
  }

  std::string writeFile(const std::string& name, const std::string& content) {
    std::string path = temp_.sub(name);
    std::ofstream file(path);
    file << content;
    return path;
  }

  // Returns the error raised by parsing text, or fails the test
  ConfigParseError parseError(const std::string& text) {
    try {
      parseLoggingConfig(YAML::Load(text), "inline.yaml");
    } catch (const ConfigParseError& e) {
      return e;
    }
    ADD_FAILURE() << "Expected ConfigParseError for:\n" << text;
    return ConfigParseError("not raised");
  }

  TempDir temp_;
  std::string original_dir_;
};

TEST_F(LoggingConfigTest, ParseFullDocument) {
  auto config = parseLoggingConfig(YAML::Load(R"(
base_directory: /var/log/app
run_name: nightly
loggers:
  - name: svc
    level: warning
    handlers:
      - name: console
        type: console
        level: error
        format: logger_name
        stream: stdout
      - name: main
        type: file
        format: "{level}|{message}"
  - name: worker
    base_directory: /tmp/worker
    join:
      - logger: svc
        handler: main
)"));

  ASSERT_TRUE(config.base_directory.has_value());
  EXPECT_EQ(*config.base_directory, "/var/log/app");
  ASSERT_TRUE(config.run_name.has_value());
  EXPECT_EQ(*config.run_name, "nightly");
  ASSERT_EQ(config.loggers.size(), 2u);

  const auto& svc = config.loggers[0];
  EXPECT_EQ(svc.name, "svc");
  ASSERT_TRUE(svc.level.has_value());
  EXPECT_EQ(*svc.level, logging::LogLevel::Warning);
  ASSERT_EQ(svc.handlers.size(), 2u);

  EXPECT_EQ(svc.handlers[0].name, "console");
  EXPECT_EQ(svc.handlers[0].type, HandlerConfig::Type::Console);
  EXPECT_EQ(svc.handlers[0].level, logging::LogLevel::Error);
  EXPECT_EQ(svc.handlers[0].format, logging::formats::kLoggerName);
  EXPECT_FALSE(svc.handlers[0].use_stderr);

  EXPECT_EQ(svc.handlers[1].type, HandlerConfig::Type::File);
  EXPECT_EQ(svc.handlers[1].level, logging::LogLevel::Info);
  EXPECT_EQ(svc.handlers[1].format, "{level}|{message}");

  const auto& worker = config.loggers[1];
  EXPECT_FALSE(worker.level.has_value());
  ASSERT_TRUE(worker.base_directory.has_value());
  EXPECT_EQ(*worker.base_directory, "/tmp/worker");
  ASSERT_EQ(worker.joins.size(), 1u);
  EXPECT_EQ(worker.joins[0].logger, "svc");
  EXPECT_EQ(worker.joins[0].handler, "main");
}

TEST_F(LoggingConfigTest, HandlerDefaults) {
  auto config = parseLoggingConfig(YAML::Load(R"(
loggers:
  - name: svc
    handlers:
      - name: console
)"));

  const auto& handler = config.loggers[0].handlers[0];
  EXPECT_EQ(handler.type, HandlerConfig::Type::Console);
  EXPECT_EQ(handler.level, logging::LogLevel::Info);
  EXPECT_EQ(handler.format, logging::formats::kBasic);
  EXPECT_TRUE(handler.use_stderr);
}

TEST_F(LoggingConfigTest, EmptyDocument) {
  auto config = parseLoggingConfig(YAML::Load(""));
  EXPECT_FALSE(config.base_directory.has_value());
  EXPECT_FALSE(config.run_name.has_value());
  EXPECT_TRUE(config.loggers.empty());
}

TEST_F(LoggingConfigTest, UnknownKeyReportsPath) {
  auto error = parseError(R"(
loggers:
  - name: svc
    handlers:
      - name: console
        colour: blue
)");
  EXPECT_EQ(error.field(), "loggers[0].handlers[0]");
  EXPECT_EQ(error.file(), "inline.yaml");
  EXPECT_NE(error.message().find("colour"), std::string::npos);
  EXPECT_GT(error.line(), 0);
}

TEST_F(LoggingConfigTest, BadValuesAreRejected) {
  EXPECT_EQ(parseError("loggers:\n  - name: svc\n    level: loud\n").field(),
            "loggers[0].level");
  EXPECT_EQ(parseError("loggers:\n  - name: svc\n    handlers:\n"
                       "      - name: h\n        type: syslog\n")
                .field(),
            "loggers[0].handlers[0].type");
  EXPECT_EQ(parseError("loggers:\n  - name: svc\n    handlers:\n"
                       "      - name: h\n        format: \"{asctime}\"\n")
                .field(),
            "loggers[0].handlers[0].format");
  EXPECT_EQ(parseError("loggers:\n  - name: svc\n    handlers:\n"
                       "      - name: h\n        type: file\n"
                       "        stream: stdout\n")
                .field(),
            "loggers[0].handlers[0].stream");
  EXPECT_EQ(parseError("loggers:\n  - level: info\n").field(), "loggers[0]");
  EXPECT_EQ(parseError("loggers: svc\n").field(), "loggers");
  EXPECT_EQ(parseError("- just\n- a list\n").field(), "");
}

TEST_F(LoggingConfigTest, DuplicateNamesAreRejected) {
  auto loggers = parseError("loggers:\n  - name: svc\n  - name: svc\n");
  EXPECT_NE(loggers.message().find("Duplicate logger name 'svc'"),
            std::string::npos);

  auto handlers = parseError(R"(
loggers:
  - name: svc
    handlers:
      - name: main
    join:
      - logger: other
        handler: main
)");
  EXPECT_EQ(handlers.field(), "loggers[0].join[0]");
  EXPECT_NE(handlers.message().find("Duplicate handler name 'main'"),
            std::string::npos);
}

TEST_F(LoggingConfigTest, ErrorMessageFormat) {
  ConfigParseError error("Unknown log level 'loud'", "loggers[0].level",
                         "app.yaml", 3);
  EXPECT_STREQ(error.what(),
               "Configuration parse error in app.yaml:3 at field "
               "'loggers[0].level': Unknown log level 'loud'");
}

TEST_F(LoggingConfigTest, LoadFileWithEnvironmentSubstitution) {
  setenv("RUNLOG_TEST_DIR", "/srv/logs", 1);
  std::string path = writeFile("app.yaml", R"(
base_directory: ${RUNLOG_TEST_DIR}
run_name: ${RUNLOG_TEST_RUN_NAME_UNSET:-fallback}
)");

  auto config = loadLoggingConfigFile(path);
  EXPECT_EQ(*config.base_directory, "/srv/logs");
  EXPECT_EQ(*config.run_name, "fallback");
}

TEST_F(LoggingConfigTest, UnsetVariableWithoutDefaultFails) {
  std::string path =
      writeFile("app.yaml", "base_directory: ${RUNLOG_TEST_DIR}\n");
  EXPECT_THROW(loadLoggingConfigFile(path), ConfigParseError);
}

TEST_F(LoggingConfigTest, LoadFileErrors) {
  EXPECT_THROW(loadLoggingConfigFile(temp_.sub("missing.yaml")),
               ConfigParseError);

  std::string path = writeFile("broken.yaml", "loggers: [\n");
  try {
    loadLoggingConfigFile(path);
    FAIL() << "Expected ConfigParseError";
  } catch (const ConfigParseError& e) {
    EXPECT_EQ(e.file(), path);
  }

  std::string big = writeFile("big.yaml", std::string(2 * 1024 * 1024, '#'));
  EXPECT_THROW(loadLoggingConfigFile(big), ConfigParseError);
}

TEST_F(LoggingConfigTest, SearchPrecedence) {
  std::string explicit_file = writeFile("explicit.yaml", "");
  std::string env_file = writeFile("env.yaml", "");
  writeFile(kDefaultConfigFile, "");

  char cwd[1024];
  ASSERT_NE(getcwd(cwd, sizeof(cwd)), nullptr);
  original_dir_ = cwd;
  ASSERT_EQ(chdir(temp_.path().c_str()), 0);

  EXPECT_EQ(findConfigFile(), kDefaultConfigFile);

  setenv(kConfigEnvVar, env_file.c_str(), 1);
  EXPECT_EQ(findConfigFile(), env_file);
  EXPECT_EQ(findConfigFile(explicit_file), explicit_file);

  // An explicit or environment path that does not exist is not replaced by
  // the fallback
  EXPECT_EQ(findConfigFile(temp_.sub("nope.yaml")), "");
  setenv(kConfigEnvVar, temp_.sub("nope.yaml").c_str(), 1);
  EXPECT_EQ(findConfigFile(), "");
}

TEST_F(LoggingConfigTest, ApplyCreatesLoggersHandlersAndJoins) {
  logging::LoggerRegistry registry(temp_.sub("default"), fixedClock());
  std::string svc_dir = temp_.sub("svc_logs");

  auto config = parseLoggingConfig(YAML::Load(R"(
run_name: nightly
loggers:
  - name: worker
    level: error
    join:
      - logger: svc
        handler: main
  - name: svc
    handlers:
      - name: console
      - name: main
        type: file
        level: debug
)"));
  config.loggers[1].base_directory = svc_dir;

  applyLoggingConfig(config, registry);

  const std::string run_id = std::string(kFixedRunId) + "_nightly";
  EXPECT_EQ(registry.getRunId(), run_id);

  auto svc = registry.getLogger("svc");
  auto worker = registry.getLogger("worker");
  EXPECT_EQ(svc->getBaseDirectory(), svc_dir);
  EXPECT_EQ(worker->getBaseDirectory(), temp_.sub("default"));
  EXPECT_EQ(worker->getLevel(), logging::LogLevel::Error);
  EXPECT_EQ(svc->getLevel(), logging::LogLevel::Debug);

  ASSERT_TRUE(svc->hasHandler("console"));
  EXPECT_EQ(svc->getHandler("console")->type(), logging::SinkType::Stdio);

  auto main_sink = std::dynamic_pointer_cast<logging::FileSink>(
      svc->getHandler("main"));
  ASSERT_NE(main_sink, nullptr);
  EXPECT_EQ(main_sink->filename(), svc_dir + "/" + kFixedDate + "/" + run_id +
                                  "/" + run_id + "_main.log");
  EXPECT_EQ(worker->getHandler("main"), svc->getHandler("main"));
}

TEST_F(LoggingConfigTest, ApplyWithUnknownJoinTargetChangesNothing) {
  logging::LoggerRegistry registry(temp_.path(), fixedClock());
  auto config = parseLoggingConfig(YAML::Load(R"(
run_name: nightly
loggers:
  - name: svc
    handlers:
      - name: main
        type: file
  - name: worker
    join:
      - logger: ghost
        handler: main
)"));

  EXPECT_THROW(applyLoggingConfig(config, registry), logging::NotFoundError);
  EXPECT_TRUE(registry.getLoggerNames().empty());
  EXPECT_EQ(registry.getRunId(), kFixedRunId);
  EXPECT_FALSE(std::filesystem::exists(
      std::filesystem::path(temp_.path()) / kFixedDate));
}

TEST_F(LoggingConfigTest, ApplyWithUndeclaredJoinHandlerThrows) {
  logging::LoggerRegistry registry(temp_.path(), fixedClock());
  auto config = parseLoggingConfig(YAML::Load(R"(
loggers:
  - name: svc
    handlers:
      - name: console
  - name: worker
    join:
      - logger: svc
        handler: main
)"));

  try {
    applyLoggingConfig(config, registry);
    FAIL() << "Expected NotFoundError";
  } catch (const logging::NotFoundError& e) {
    EXPECT_EQ(e.kind(), "Handler");
    EXPECT_EQ(e.name(), "main");
    EXPECT_EQ(e.owner(), "svc");
  }
  EXPECT_FALSE(registry.hasLogger("svc"));
}

TEST_F(LoggingConfigTest, ApplyJoinsHandlerOfRegisteredLogger) {
  logging::LoggerRegistry registry(temp_.path(), fixedClock());
  auto existing = registry.getOrCreateLogger("app");
  existing->addConsoleHandler("console");

  auto config = parseLoggingConfig(YAML::Load(R"(
loggers:
  - name: worker
    join:
      - logger: app
        handler: console
)"));
  applyLoggingConfig(config, registry);

  EXPECT_EQ(registry.getLogger("worker")->getHandler("console"),
            existing->getHandler("console"));
}

TEST_F(LoggingConfigTest, ErrorsCarryNodeLine) {
  auto error = parseError("loggers:\n  - name: svc\n    level: loud\n");
  EXPECT_EQ(error.line(), 3);
  EXPECT_TRUE(error.hasLocation());
  EXPECT_STREQ(error.what(),
               "Configuration parse error in inline.yaml:3 at field "
               "'loggers[0].level': Unknown log level 'loud'");
}

TEST_F(LoggingConfigTest, ParseContextPath) {
  ParseContext ctx("app.yaml");
  EXPECT_EQ(ctx.path(), "");
  {
    ParseContext::FieldScope loggers(ctx, "loggers");
    ParseContext::IndexScope item(ctx, 2);
    ParseContext::FieldScope handlers(ctx, "handlers");
    ParseContext::IndexScope handler(ctx, 0);
    EXPECT_EQ(ctx.path(), "loggers[2].handlers[0]");

    auto error = ctx.createError("bad");
    EXPECT_EQ(error.field(), "loggers[2].handlers[0]");
    EXPECT_EQ(error.file(), "app.yaml");
    EXPECT_FALSE(error.hasLocation());
  }
  EXPECT_EQ(ctx.path(), "");

  // Nodes without a position leave the line unknown
  EXPECT_EQ(ParseContext::lineOf(YAML::Node()), -1);
}

}  // namespace test
}  // namespace config
}  // namespace runlog
