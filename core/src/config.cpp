#include "courtline/config.h"

#include "courtline/log.h"

#include <fstream>
#include <optional>

#include <nlohmann/json.hpp>

#if COURTLINE_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace courtline {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

struct ConfigFields {
  std::optional<int> backfill_min_seconds;
  std::optional<bool> suppress_resolution_warnings;
  std::optional<bool> log_diagnostics;
  std::optional<bool> strict;
  std::optional<bool> verbose;
  std::vector<std::string> on_court_action_types;
  bool has_action_types = false;
};

void apply_fields(TrackerConfig& cfg, const ConfigFields& fields) {
  if (fields.backfill_min_seconds.has_value()) {
    if (*fields.backfill_min_seconds >= 0) {
      cfg.backfill_min_seconds = *fields.backfill_min_seconds;
    } else {
      log::warn("config: backfill_min_seconds must not be negative; keeping default");
    }
  }
  if (fields.suppress_resolution_warnings.has_value()) {
    cfg.suppress_resolution_warnings = *fields.suppress_resolution_warnings;
  }
  if (fields.log_diagnostics.has_value()) {
    cfg.log_diagnostics = *fields.log_diagnostics;
  }
  if (fields.strict.has_value()) {
    cfg.strict = *fields.strict;
  }
  if (fields.verbose.has_value()) {
    cfg.verbose = *fields.verbose;
  }
  if (fields.has_action_types) {
    cfg.on_court_action_types = fields.on_court_action_types;
  }
}

ConfigFields read_json_fields(const nlohmann::json& root) {
  ConfigFields fields;
  if (root.contains("backfill_min_seconds")) {
    fields.backfill_min_seconds = root["backfill_min_seconds"].get<int>();
  }
  if (root.contains("suppress_resolution_warnings")) {
    fields.suppress_resolution_warnings = root["suppress_resolution_warnings"].get<bool>();
  }
  if (root.contains("log_diagnostics")) {
    fields.log_diagnostics = root["log_diagnostics"].get<bool>();
  }
  if (root.contains("strict")) {
    fields.strict = root["strict"].get<bool>();
  }
  if (root.contains("verbose")) {
    fields.verbose = root["verbose"].get<bool>();
  }
  if (root.contains("on_court_action_types") && root["on_court_action_types"].is_array()) {
    fields.has_action_types = true;
    for (const auto& v : root["on_court_action_types"]) {
      fields.on_court_action_types.push_back(v.get<std::string>());
    }
  }
  return fields;
}

#if COURTLINE_ENABLE_DATA_YAML
ConfigFields read_yaml_fields(const YAML::Node& root) {
  ConfigFields fields;
  if (root["backfill_min_seconds"]) {
    fields.backfill_min_seconds = root["backfill_min_seconds"].as<int>();
  }
  if (root["suppress_resolution_warnings"]) {
    fields.suppress_resolution_warnings = root["suppress_resolution_warnings"].as<bool>();
  }
  if (root["log_diagnostics"]) {
    fields.log_diagnostics = root["log_diagnostics"].as<bool>();
  }
  if (root["strict"]) {
    fields.strict = root["strict"].as<bool>();
  }
  if (root["verbose"]) {
    fields.verbose = root["verbose"].as<bool>();
  }
  if (root["on_court_action_types"] && root["on_court_action_types"].IsSequence()) {
    fields.has_action_types = true;
    for (const auto& v : root["on_court_action_types"]) {
      fields.on_court_action_types.push_back(v.as<std::string>());
    }
  }
  return fields;
}
#endif
} // namespace

TrackerConfig load_tracker_config(const std::filesystem::path& path) {
  TrackerConfig cfg;

  if (!file_exists(path)) {
    log::warn(std::string("config not found: ") + path.string());
    return cfg;
  }

  const auto ext = path.extension().string();
  if (ext == ".json") {
    try {
      std::ifstream in(path);
      nlohmann::json j;
      in >> j;
      const auto& root = j.contains("tracker") ? j["tracker"] : j;
      apply_fields(cfg, read_json_fields(root));
    } catch (const nlohmann::json::exception& e) {
      log::warn(std::string("config ") + path.string() + " unreadable, using defaults: " + e.what());
      return TrackerConfig{};
    }
    return cfg;
  }

  if (ext == ".yaml" || ext == ".yml") {
#if COURTLINE_ENABLE_DATA_YAML
    try {
      YAML::Node doc = YAML::LoadFile(path.string());
      YAML::Node root = doc["tracker"] ? doc["tracker"] : doc;
      apply_fields(cfg, read_yaml_fields(root));
    } catch (const YAML::Exception& e) {
      log::warn(std::string("config ") + path.string() + " unreadable, using defaults: " + e.what());
      return TrackerConfig{};
    }
#else
    log::warn("YAML config requested but YAML support is disabled.");
#endif
    return cfg;
  }

  log::warn("Unknown config extension; using defaults.");
  return cfg;
}

} // namespace courtline
