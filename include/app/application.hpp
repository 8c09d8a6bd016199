#ifndef DISCOFILL_APP_APPLICATION_HPP
#define DISCOFILL_APP_APPLICATION_HPP

#include "app/config.hpp"
#include "catalog/catalog_client.hpp"
#include "catalog/discography_paginator.hpp"
#include "transfer/null_protocol_client.hpp"
#include "transfer/transfer_orchestrator.hpp"
#include "util/threadpool.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace discofill {
namespace app {

/**
 * Application - the single engine instance of a process
 *
 * Owns the transfer orchestrator, the catalog client and the worker pool
 * that runs discography fetches. Constructed once and handed by reference
 * to whatever drives it (CLI, host integration, tests).
 *
 * Shutdown follows transfer.shutdown_policy: Cancel aborts unfinished
 * transfers, Drain waits up to drain_timeout for them first. Queued
 * transfers are not persisted across runs.
 */
class Application {
public:
  /**
   * @param client   protocol backend; built from protocol_backend if null
   * @param catalog  catalog service; an HttpCatalogClient if null
   * @param sink     receives manual-search instructions from the null backend
   */
  explicit Application(const AppConfig &config,
                       transfer::ProtocolClientPtr client = nullptr,
                       std::shared_ptr<catalog::CatalogClient> catalog = nullptr,
                       transfer::NullProtocolClient::InstructionSink sink = nullptr);
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  bool is_running() const { return running_; }

  // Block until stop() or a SIGINT/SIGTERM
  void wait_for_shutdown();
  void request_shutdown() { shutdown_requested_ = true; }

  // Caller-facing API
  transfer::SessionId StartSearch(const std::string &query);
  transfer::TransferId RequestDownload(transfer::SessionId session,
                                       const transfer::SearchResult &result,
                                       transfer::DestinationPtr destination);
  transfer::GroupId RequestFolderDownload(transfer::SessionId session,
                                          const transfer::SearchResult &result,
                                          transfer::DestinationPtr destination);
  void Cancel(transfer::TransferId id);
  [[nodiscard]] transfer::SessionRouter::Subscription
  Subscribe(transfer::SessionId session, transfer::SessionCallback callback);
  std::vector<transfer::Transfer> ListTransfers() const;

  std::future<catalog::DiscographyResult>
  FetchDiscography(const std::string &artist_id);
  std::future<catalog::DiscographyResult>
  FetchDiscographyByName(const std::string &artist_name);

  transfer::TransferOrchestrator &orchestrator() { return *orchestrator_; }
  // Paces catalog requests across all discography fetches
  const catalog::RateLimiter &catalog_rate_limiter() const {
    return *catalog_rate_limiter_;
  }
  const AppConfig &config() const { return config_; }

  // Backend selected by config.protocol_backend
  static transfer::ProtocolClientPtr
  MakeProtocolClient(const AppConfig &config,
                     transfer::NullProtocolClient::InstructionSink sink);

  static Application *instance();

private:
  bool init_download_dir();
  void require_initialized() const;
  void setup_signal_handlers();
  static void signal_handler(int signal);

  AppConfig config_;
  transfer::ProtocolClientPtr client_;
  std::shared_ptr<catalog::CatalogClient> catalog_;
  transfer::NullProtocolClient::InstructionSink instruction_sink_;

  std::unique_ptr<transfer::TransferOrchestrator> orchestrator_;
  std::unique_ptr<util::ThreadPool> catalog_pool_;
  std::shared_ptr<catalog::RateLimiter> catalog_rate_limiter_;

  std::atomic<bool> initialized_{false};
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  static Application *instance_;
};

} // namespace app
} // namespace discofill

#endif // DISCOFILL_APP_APPLICATION_HPP
