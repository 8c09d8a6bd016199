#include "app/config.hpp"
#include "util/logging.hpp"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace discofill {
namespace app {

using json = nlohmann::json;

namespace {

// Copies obj[key] into out when present; throws on a type mismatch
template <typename T>
void Read(const json &obj, const char *key, T &out) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return;
  }
  out = it->get<T>();
}

void ReadMillis(const json &obj, const char *key,
                std::chrono::milliseconds &out) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return;
  }
  const auto value = it->get<int64_t>();
  if (value < 0) {
    throw std::invalid_argument(std::string(key) + " must not be negative");
  }
  out = std::chrono::milliseconds(value);
}

const json *Section(const json &root, const char *key) {
  auto it = root.find(key);
  if (it == root.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw std::invalid_argument(std::string(key) + " must be an object");
  }
  return &*it;
}

void Apply(const json &root, AppConfig &config) {
  if (!root.is_object()) {
    throw std::invalid_argument("top level must be an object");
  }

  Read(root, "username", config.transfer.credentials.username);
  Read(root, "password", config.transfer.credentials.password);

  std::string download_dir;
  Read(root, "download_dir", download_dir);
  if (!download_dir.empty()) {
    config.transfer.download_dir = download_dir;
  }

  Read(root, "enable_fingerprinting", config.enable_fingerprinting);
  config.transfer.match.analysis_enabled = config.enable_fingerprinting;

  Read(root, "protocol_backend", config.protocol_backend);
  if (config.protocol_backend != "null" && config.protocol_backend != "simulated") {
    throw std::invalid_argument("unknown protocol_backend '" +
                                config.protocol_backend + "'");
  }

  if (const json *catalog = Section(root, "catalog")) {
    Read(*catalog, "host", config.catalog.host);
    Read(*catalog, "port", config.catalog.port);
    Read(*catalog, "use_tls", config.catalog.use_tls);
    Read(*catalog, "user_agent", config.catalog.user_agent);
    ReadMillis(*catalog, "timeout_ms", config.catalog.timeout);
    ReadMillis(*catalog, "min_request_interval_ms",
               config.discography.min_request_interval);
    Read(*catalog, "page_limit", config.discography.limit);
    Read(*catalog, "max_page_attempts", config.discography.max_page_attempts);
    Read(*catalog, "include_releases", config.discography.include_releases);
    Read(*catalog, "max_releases_per_group",
         config.discography.max_releases_per_group);
    if (config.discography.limit == 0 || config.discography.limit > 100) {
      throw std::invalid_argument("catalog.page_limit must be 1-100");
    }
  }

  if (const json *match = Section(root, "match")) {
    Read(*match, "max_attempts", config.transfer.match.max_attempts);
    ReadMillis(*match, "base_delay_ms", config.transfer.match.base_delay);
    ReadMillis(*match, "max_delay_ms", config.transfer.match.max_delay);
    if (config.transfer.match.max_attempts < 1) {
      throw std::invalid_argument("match.max_attempts must be at least 1");
    }
  }

  if (const json *registry = Section(root, "registry")) {
    Read(*registry, "max_entries", config.transfer.registry_max_entries);
  }

  if (const json *shutdown = Section(root, "shutdown")) {
    std::string policy;
    Read(*shutdown, "policy", policy);
    if (policy == "cancel") {
      config.transfer.shutdown_policy = transfer::ShutdownPolicy::Cancel;
    } else if (policy == "drain") {
      config.transfer.shutdown_policy = transfer::ShutdownPolicy::Drain;
    } else if (!policy.empty()) {
      throw std::invalid_argument("unknown shutdown.policy '" + policy + "'");
    }
    ReadMillis(*shutdown, "drain_timeout_ms", config.transfer.drain_timeout);
  }

  if (auto it = root.find("folder_extensions");
      it != root.end() && !it->is_null()) {
    config.transfer.folder_extensions = it->get<std::vector<std::string>>();
  }

  Read(root, "log_level", config.log_level);
  Read(root, "log_file", config.log_file);
}

} // namespace

AppConfig::AppConfig() {
  transfer.download_dir = DefaultDownloadDir().string();
}

std::filesystem::path DefaultDownloadDir() {
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return std::filesystem::path("downloads");
  }
  return std::filesystem::path(home) / "Downloads" / "Soulseek";
}

bool ParseConfig(const std::string &text, AppConfig &config, std::string *error) {
  AppConfig updated = config;
  try {
    Apply(json::parse(text), updated);
  } catch (const std::exception &e) {
    if (error) {
      *error = e.what();
    }
    return false;
  }
  config = std::move(updated);
  return true;
}

bool LoadConfigFile(const std::filesystem::path &path, AppConfig &config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_APP_WARN("Config file {} not found, using defaults", path.string());
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  std::string error;
  if (!ParseConfig(buffer.str(), config, &error)) {
    LOG_APP_ERROR("Ignoring malformed config file {}: {}", path.string(), error);
    return false;
  }

  LOG_APP_INFO("Loaded config from {}", path.string());
  return true;
}

} // namespace app
} // namespace discofill
