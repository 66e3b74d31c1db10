#define LANLINK_LOG_COMPONENT "config"

#include "lanlink/config/config_loader.h"

#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "lanlink/logging/log_macros.h"
#include "lanlink/logging/log_sink.h"

namespace lanlink {
namespace config {

namespace {

constexpr size_t MAX_FILE_SIZE_BYTES = 1024 * 1024;  // 1 MB

bool hasYamlExtension(const std::string& path) {
  auto endsWith = [&path](const std::string& suffix) {
    return path.size() >= suffix.size() &&
           path.compare(path.size() - suffix.size(), suffix.size(), suffix) ==
               0;
  };
  return endsWith(".yaml") || endsWith(".yml");
}

// Convert a YAML node into the equivalent JSON value
nlohmann::json yamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      return nullptr;

    case YAML::NodeType::Scalar: {
      // Quoted scalars stay strings
      if (node.Tag() == "!") {
        return node.Scalar();
      }
      bool b;
      if (YAML::convert<bool>::decode(node, b)) {
        return b;
      }
      int64_t i;
      if (YAML::convert<int64_t>::decode(node, i)) {
        return i;
      }
      double d;
      if (YAML::convert<double>::decode(node, d)) {
        return d;
      }
      return node.Scalar();
    }

    case YAML::NodeType::Sequence: {
      auto result = nlohmann::json::array();
      for (const auto& item : node) {
        result.push_back(yamlToJson(item));
      }
      return result;
    }

    case YAML::NodeType::Map: {
      auto result = nlohmann::json::object();
      for (const auto& pair : node) {
        result[pair.first.Scalar()] = yamlToJson(pair.second);
      }
      return result;
    }
  }

  return nullptr;
}

}  // namespace

nlohmann::json parseConfigDocument(const std::string& content, bool yaml) {
  if (!yaml) {
    auto doc = nlohmann::json::parse(content, nullptr, false);
    if (doc.is_discarded()) {
      throw ConfigLoadError("JSON parse error");
    }
    return doc;
  }

  YAML::Node root;
  try {
    root = YAML::Load(content);
  } catch (const YAML::ParserException& e) {
    std::ostringstream error;
    error << "YAML parse error at line " << e.mark.line + 1 << ", column "
          << e.mark.column + 1;
    throw ConfigLoadError(error.str());
  }

  auto doc = yamlToJson(root);
  if (doc.is_null()) {
    // An empty document means "all defaults"
    return nlohmann::json::object();
  }
  return doc;
}

LanlinkConfig loadConfigFile(const std::string& path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    throw ConfigLoadError("Cannot open configuration file: " + path);
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  std::string content = buffer.str();
  if (content.size() > MAX_FILE_SIZE_BYTES) {
    throw ConfigLoadError("Configuration file too large: " + path);
  }

  bool yaml = hasYamlExtension(path);
  LANLINK_LOG(Debug, "Loading {} configuration from {}",
              yaml ? "YAML" : "JSON", path);

  nlohmann::json doc;
  try {
    doc = parseConfigDocument(content, yaml);
  } catch (const ConfigLoadError& e) {
    throw ConfigLoadError(std::string(e.what()) + " in " + path);
  }

  return LanlinkConfig::fromJson(doc);
}

void applyLoggingConfig(const LoggingConfig& config) {
  config.validate();

  auto& registry = logging::LoggerRegistry::instance();

  std::shared_ptr<logging::LogSink> sink;
  if (config.file.empty()) {
    sink = logging::SinkFactory::createStderrSink();
  } else {
    sink = logging::SinkFactory::createFileSink(config.file);
  }
  if (config.format == "json") {
    sink->setFormatter(
        std::unique_ptr<logging::Formatter>(new logging::JsonFormatter()));
  }

  registry.setDefaultSink(sink);
  registry.setGlobalLevel(*logging::parseLogLevel(config.level));
  registry.clearPatterns();
  for (const auto& pattern : config.patterns) {
    registry.setPattern(pattern.first, *logging::parseLogLevel(pattern.second));
  }
}

}  // namespace config
}  // namespace lanlink
