/**
 * @file Config.cpp
 * @brief YAML configuration parsing and validation.
 */

#include "src/config/inc/Config.hpp"
#include "src/logging/inc/Logging.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace pfrelay {

namespace config {

namespace {

bool parseInterfaces(const YAML::Node& node, std::vector<std::string>& out, std::string& error) {
  if (!node || node.IsNull()) {
    error = "no interfaces found";
    return false;
  }
  if (!node.IsSequence()) {
    error = "interfaces must be a list of interface names";
    return false;
  }

  for (const YAML::Node& item : node) {
    if (!item.IsScalar() || item.Scalar().empty()) {
      error = "interfaces must be a list of interface names";
      return false;
    }
    out.push_back(item.Scalar());
  }

  if (out.empty()) {
    error = "no interfaces found";
    return false;
  }
  return true;
}

} // namespace

std::string Config::toString() const {
  std::string names;
  for (const std::string& name : interfaces) {
    if (!names.empty()) {
      names += ',';
    }
    names += name;
  }
  return fmt::format("interfaces=[{}] pollingInterval={}ms logLevel={}", names, pollingIntervalMs,
                     logLevel);
}

bool parseConfig(const std::string& text, Config& out, std::string& error) {
  Config parsed{};

  try {
    const YAML::Node ROOT = YAML::Load(text);
    if (!ROOT.IsMap()) {
      error = "configuration must be a mapping";
      return false;
    }

    if (!parseInterfaces(ROOT["interfaces"], parsed.interfaces, error)) {
      return false;
    }

    if (const YAML::Node INTERVAL = ROOT["pollingInterval"]) {
      parsed.pollingIntervalMs = INTERVAL.as<int>();
    }

    if (const YAML::Node LEVEL = ROOT["logLevel"]) {
      parsed.logLevel = LEVEL.as<std::string>();
    }
  } catch (const YAML::Exception& e) {
    error = fmt::format("failed to unmarshal config: {}", e.what());
    return false;
  }

  if (parsed.pollingIntervalMs <= 0) {
    error = "invalid polling interval";
    return false;
  }

  spdlog::level::level_enum level{};
  if (!logging::parseLevel(parsed.logLevel, level)) {
    error = fmt::format("invalid log level '{}'", parsed.logLevel);
    return false;
  }

  out = std::move(parsed);
  return true;
}

bool loadConfigFile(const std::string& path, Config& out, std::string& error) {
  std::ifstream file(path);
  if (!file) {
    error = fmt::format("failed to read config file {}: {}", path, std::strerror(errno));
    return false;
  }

  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    error = fmt::format("failed to read config file {}", path);
    return false;
  }

  return parseConfig(contents.str(), out, error);
}

} // namespace config

} // namespace pfrelay
