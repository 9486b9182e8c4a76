// Logging configuration file support
//
// Search Order and Precedence:
// 1. Path passed by the application (e.g. from a --log-config argument)
// 2. RUNLOG_CONFIG environment variable
// 3. ./runlog.yaml
//
// Environment variables may be referenced as ${NAME} or ${NAME:-default}
// anywhere in the file; they are substituted before YAML parsing.

#include "runlog/config/logging_config.h"

#include <cstdlib>
#include <fstream>
#include <map>
#include <regex>
#include <set>
#include <sstream>
#include <sys/stat.h>

#include "runlog/logging/logging_error.h"

namespace runlog {
namespace config {

namespace {

// Constants for file handling limits
constexpr size_t MAX_FILE_SIZE_BYTES = 1024 * 1024;  // 1 MB

bool exists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

void checkKeys(const YAML::Node& node,
               const std::set<std::string>& allowed,
               ParseContext& ctx) {
  for (const auto& entry : node) {
    std::string key = entry.first.as<std::string>();
    if (allowed.count(key) == 0) {
      throw ctx.createError("Unknown key '" + key + "'", entry.first);
    }
  }
}

std::string getString(const YAML::Node& node,
                      const std::string& field,
                      ParseContext& ctx) {
  ParseContext::FieldScope scope(ctx, field);
  if (!node.IsScalar()) {
    throw ctx.createError("Expected a string", node);
  }
  return node.as<std::string>();
}

std::string getRequiredString(const YAML::Node& parent,
                              const std::string& field,
                              ParseContext& ctx) {
  if (!parent[field]) {
    throw ctx.createError("Required field '" + field + "' is missing",
                          parent);
  }
  std::string value = getString(parent[field], field, ctx);
  if (value.empty()) {
    ParseContext::FieldScope scope(ctx, field);
    throw ctx.createError("Must not be empty", parent[field]);
  }
  return value;
}

logging::LogLevel getLevel(const YAML::Node& node, ParseContext& ctx) {
  std::string text = getString(node, "level", ctx);
  logging::LogLevel level;
  if (!logging::tryParseLogLevel(text, level)) {
    ParseContext::FieldScope scope(ctx, "level");
    throw ctx.createError("Unknown log level '" + text + "'", node);
  }
  return level;
}

std::string getFormat(const YAML::Node& node, ParseContext& ctx) {
  std::string pattern =
      logging::formatForName(getString(node, "format", ctx));
  try {
    logging::PatternFormatter validate(pattern);
  } catch (const logging::LoggingError& e) {
    ParseContext::FieldScope scope(ctx, "format");
    throw ctx.createError(e.what(), node);
  }
  return pattern;
}

HandlerConfig parseHandler(const YAML::Node& node, ParseContext& ctx) {
  if (!node.IsMap()) {
    throw ctx.createError("Expected a mapping", node);
  }
  checkKeys(node, {"name", "type", "level", "format", "stream"}, ctx);

  HandlerConfig handler;
  handler.name = getRequiredString(node, "name", ctx);

  if (node["type"]) {
    std::string type = getString(node["type"], "type", ctx);
    if (type == "console") {
      handler.type = HandlerConfig::Type::Console;
    } else if (type == "file") {
      handler.type = HandlerConfig::Type::File;
    } else {
      ParseContext::FieldScope scope(ctx, "type");
      throw ctx.createError("Unknown handler type '" + type +
                                "' (expected console or file)",
                            node["type"]);
    }
  }

  if (node["level"]) {
    handler.level = getLevel(node["level"], ctx);
  }
  if (node["format"]) {
    handler.format = getFormat(node["format"], ctx);
  }

  if (node["stream"]) {
    std::string stream = getString(node["stream"], "stream", ctx);
    ParseContext::FieldScope scope(ctx, "stream");
    if (handler.type != HandlerConfig::Type::Console) {
      throw ctx.createError("Only console handlers have a stream",
                            node["stream"]);
    }
    if (stream == "stderr") {
      handler.use_stderr = true;
    } else if (stream == "stdout") {
      handler.use_stderr = false;
    } else {
      throw ctx.createError("Unknown stream '" + stream +
                                "' (expected stdout or stderr)",
                            node["stream"]);
    }
  }

  return handler;
}

JoinConfig parseJoin(const YAML::Node& node, ParseContext& ctx) {
  if (!node.IsMap()) {
    throw ctx.createError("Expected a mapping", node);
  }
  checkKeys(node, {"logger", "handler"}, ctx);

  JoinConfig join;
  join.logger = getRequiredString(node, "logger", ctx);
  join.handler = getRequiredString(node, "handler", ctx);
  return join;
}

LoggerConfig parseLogger(const YAML::Node& node, ParseContext& ctx) {
  if (!node.IsMap()) {
    throw ctx.createError("Expected a mapping", node);
  }
  checkKeys(node, {"name", "level", "base_directory", "handlers", "join"},
            ctx);

  LoggerConfig logger;
  logger.name = getRequiredString(node, "name", ctx);

  if (node["level"]) {
    logger.level = getLevel(node["level"], ctx);
  }
  if (node["base_directory"]) {
    logger.base_directory =
        getString(node["base_directory"], "base_directory", ctx);
  }

  std::set<std::string> handler_names;

  if (node["handlers"]) {
    ParseContext::FieldScope scope(ctx, "handlers");
    const YAML::Node& handlers = node["handlers"];
    if (!handlers.IsSequence()) {
      throw ctx.createError("Expected a list", handlers);
    }
    for (size_t i = 0; i < handlers.size(); ++i) {
      ParseContext::IndexScope item(ctx, i);
      HandlerConfig handler = parseHandler(handlers[i], ctx);
      if (!handler_names.insert(handler.name).second) {
        throw ctx.createError("Duplicate handler name '" + handler.name + "'",
                              handlers[i]);
      }
      logger.handlers.push_back(handler);
    }
  }

  if (node["join"]) {
    ParseContext::FieldScope scope(ctx, "join");
    const YAML::Node& joins = node["join"];
    if (!joins.IsSequence()) {
      throw ctx.createError("Expected a list", joins);
    }
    for (size_t i = 0; i < joins.size(); ++i) {
      ParseContext::IndexScope item(ctx, i);
      JoinConfig join = parseJoin(joins[i], ctx);
      if (!handler_names.insert(join.handler).second) {
        throw ctx.createError("Duplicate handler name '" + join.handler + "'",
                              joins[i]);
      }
      logger.joins.push_back(join);
    }
  }

  return logger;
}

std::string substituteEnvironmentVariables(const std::string& content,
                                           ParseContext& ctx) {
  std::regex env_regex(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)(:-([^}]*))?\})");

  std::string result;
  std::string::const_iterator search_start(content.cbegin());
  std::smatch match;

  while (std::regex_search(search_start, content.cend(), match, env_regex)) {
    result.append(search_start, match[0].first);

    std::string var_name = match[1].str();
    const char* env_value = std::getenv(var_name.c_str());
    if (env_value) {
      result += env_value;
    } else if (match[2].matched) {
      result += match[3].str();
    } else {
      throw ctx.createError("Environment variable '" + var_name +
                            "' is not set and has no default");
    }

    search_start = match[0].second;
  }
  result.append(search_start, content.cend());

  return result;
}

// A join may only name a handler declared in the handlers list of a logger in
// the document, or one already attached to a logger in the registry.
void checkJoinTargets(const LoggingConfig& config,
                      const logging::LoggerRegistry& registry) {
  std::map<std::string, std::set<std::string>> declared;
  for (const auto& logger : config.loggers) {
    for (const auto& handler : logger.handlers) {
      declared[logger.name].insert(handler.name);
    }
  }

  for (const auto& logger : config.loggers) {
    for (const auto& join : logger.joins) {
      auto it = declared.find(join.logger);
      if (it != declared.end() && it->second.count(join.handler) > 0) {
        continue;
      }
      if (!registry.hasLogger(join.logger)) {
        throw logging::NotFoundError("Logger", join.logger);
      }
      if (!registry.getLogger(join.logger)->hasHandler(join.handler)) {
        throw logging::NotFoundError("Handler", join.handler, join.logger);
      }
    }
  }
}

}  // namespace

LoggingConfig parseLoggingConfig(const YAML::Node& root,
                                 const std::string& source) {
  ParseContext ctx(source);

  LoggingConfig config;
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw ctx.createError("Top level must be a mapping", root);
  }
  checkKeys(root, {"base_directory", "run_name", "loggers"}, ctx);

  if (root["base_directory"]) {
    config.base_directory =
        getString(root["base_directory"], "base_directory", ctx);
  }
  if (root["run_name"]) {
    config.run_name = getString(root["run_name"], "run_name", ctx);
  }

  if (root["loggers"]) {
    ParseContext::FieldScope scope(ctx, "loggers");
    const YAML::Node& loggers = root["loggers"];
    if (!loggers.IsSequence()) {
      throw ctx.createError("Expected a list", loggers);
    }

    std::set<std::string> names;
    for (size_t i = 0; i < loggers.size(); ++i) {
      ParseContext::IndexScope item(ctx, i);
      LoggerConfig logger = parseLogger(loggers[i], ctx);
      if (!names.insert(logger.name).second) {
        throw ctx.createError("Duplicate logger name '" + logger.name + "'",
                              loggers[i]);
      }
      config.loggers.push_back(logger);
    }
  }

  return config;
}

LoggingConfig loadLoggingConfigFile(const std::string& path) {
  ParseContext ctx(path);

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw ctx.createError("Cannot open configuration file");
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  std::string content = buffer.str();
  if (content.size() > MAX_FILE_SIZE_BYTES) {
    throw ctx.createError("Configuration file exceeds " +
                          std::to_string(MAX_FILE_SIZE_BYTES) + " bytes");
  }

  content = substituteEnvironmentVariables(content, ctx);

  YAML::Node root;
  try {
    root = YAML::Load(content);
  } catch (const YAML::ParserException& e) {
    throw ConfigParseError(e.msg, "", path, e.mark.line + 1);
  }

  return parseLoggingConfig(root, path);
}

std::string findConfigFile(const std::string& explicit_path) {
  if (!explicit_path.empty()) {
    return exists(explicit_path) ? explicit_path : "";
  }

  const char* env_path = std::getenv(kConfigEnvVar);
  if (env_path && *env_path) {
    return exists(env_path) ? std::string(env_path) : "";
  }

  if (exists(kDefaultConfigFile)) {
    return kDefaultConfigFile;
  }
  return "";
}

void applyLoggingConfig(const LoggingConfig& config,
                        logging::LoggerRegistry& registry) {
  checkJoinTargets(config, registry);

  if (config.run_name) {
    registry.setRunName(*config.run_name);
  }

  std::vector<std::shared_ptr<logging::Logger>> created;
  created.reserve(config.loggers.size());

  for (const auto& logger_config : config.loggers) {
    std::string base_directory = registry.getBaseDirectory();
    if (logger_config.base_directory) {
      base_directory = *logger_config.base_directory;
    } else if (config.base_directory) {
      base_directory = *config.base_directory;
    }

    auto logger =
        registry.getOrCreateLogger(logger_config.name, base_directory);
    if (logger_config.level) {
      logger->setLevel(*logger_config.level);
    }

    for (const auto& handler : logger_config.handlers) {
      if (handler.type == HandlerConfig::Type::File) {
        logger->addFileHandler(handler.name, handler.level, handler.format);
      } else {
        logger->addConsoleHandler(
            handler.name, handler.level, handler.format,
            handler.use_stderr ? logging::StdioSink::Stderr
                               : logging::StdioSink::Stdout);
      }
    }
    created.push_back(logger);
  }

  for (size_t i = 0; i < config.loggers.size(); ++i) {
    for (const auto& join : config.loggers[i].joins) {
      created[i]->joinHandler(join.logger, join.handler);
    }
  }
}

}  // namespace config
}  // namespace runlog
