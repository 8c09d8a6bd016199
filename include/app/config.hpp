#ifndef DISCOFILL_APP_CONFIG_HPP
#define DISCOFILL_APP_CONFIG_HPP

#include "catalog/discography_paginator.hpp"
#include "catalog/http_catalog_client.hpp"
#include "transfer/transfer_orchestrator.hpp"
#include <filesystem>
#include <string>

namespace discofill {
namespace app {

/**
 * Application configuration
 *
 * Built from defaults, then a JSON config file (read only, never written),
 * then command line flags.
 */
struct AppConfig {
  // "null" (no P2P library) or "simulated"
  std::string protocol_backend = "null";
  bool enable_fingerprinting = false;

  transfer::TransferOrchestrator::Config transfer;
  catalog::HttpCatalogClient::Config catalog;
  catalog::DiscographyPaginator::Options discography;

  std::string log_level = "info";
  std::string log_file; // empty = console

  AppConfig();
};

// ~/Downloads/Soulseek, or ./downloads when HOME is unset
std::filesystem::path DefaultDownloadDir();

/**
 * Apply a JSON config document on top of config
 *
 * All-or-nothing: on any error config is left untouched, the reason is
 * stored in *error (if given) and false is returned. Unknown keys are
 * ignored.
 */
bool ParseConfig(const std::string &text, AppConfig &config,
                 std::string *error = nullptr);

// Read and apply a config file; missing or malformed files are logged and
// leave config untouched
bool LoadConfigFile(const std::filesystem::path &path, AppConfig &config);

} // namespace app
} // namespace discofill

#endif // DISCOFILL_APP_CONFIG_HPP
