/**
 * @file run_logging_demo.cc
 * @brief Walk through the registry, file handlers and handler sharing
 *
 * Usage: runlog_demo [config.yaml]
 *
 * Without an argument the demo looks for $RUNLOG_CONFIG or ./runlog.yaml and
 * falls back to a built-in setup with two loggers writing under ./data/logs.
 */

#include <fstream>
#include <iostream>

#include "runlog/config/logging_config.h"
#include "runlog/logging/log_macros.h"
#include "runlog/logging/logger_registry.h"
#include "runlog/logging/logging_error.h"

using namespace runlog;
using namespace runlog::logging;

namespace {

void printFile(const std::string& path) {
  std::ifstream in(path);
  std::cerr << "---- " << path << std::endl;
  std::cerr << in.rdbuf() << std::endl;
}

void runBuiltInDemo(LoggerRegistry& registry) {
  auto test_logger = registry.getOrCreateLogger("test");
  auto main_logger = registry.getOrCreateLogger("main");

  test_logger->addFileHandler("file_1", Logger::kDebug);
  main_logger->addFileHandler("file_1", Logger::kDebug,
                              formats::kLoggerNameBrackets);
  main_logger->addConsoleHandler("console", Logger::kInfo,
                                 formats::kModuleFuncName);

  std::string log_file_path = test_logger->getRunDirectory() + "/" +
                              test_logger->getRunId() + "_file_1.log";

  test_logger->debug("debug message");
  test_logger->info("info message");
  test_logger->warning("warning message");
  printFile(log_file_path);

  // Nothing reaches the file once the handler is gone
  test_logger->removeHandler("file_1");
  test_logger->debug("debug message");
  test_logger->info("info message");
  test_logger->warning("warning message");
  printFile(log_file_path);

  // Share main's file with a worker logger
  auto worker = registry.getOrCreateLogger("worker");
  worker->joinHandler("main", "file_1");
  RUNLOG_INFO(main_logger, "main writes {} line", 1);
  RUNLOG_INFO(worker, "worker writes to the same file");

  registry.deleteLogger("test");
  for (const auto& name : registry.getLoggerNames()) {
    main_logger->info("registered logger: {}", name);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  LoggerRegistry registry;

  try {
    std::string config_path = config::findConfigFile(argc > 1 ? argv[1] : "");
    if (argc > 1 && config_path.empty()) {
      std::cerr << "Configuration file not found: " << argv[1] << std::endl;
      return 1;
    }

    if (config_path.empty()) {
      runBuiltInDemo(registry);
      return 0;
    }

    config::applyLoggingConfig(config::loadLoggingConfigFile(config_path),
                               registry);
    for (const auto& name : registry.getLoggerNames()) {
      auto logger = registry.getLogger(name);
      RUNLOG_INFO(logger, "logger {} configured from {} (run {})", name,
                  config_path, logger->getRunId());
    }
  } catch (const config::ConfigParseError& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  } catch (const LoggingError& e) {
    std::cerr << "Logging setup failed: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
