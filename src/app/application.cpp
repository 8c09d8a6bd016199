#include "app/application.hpp"
#include "catalog/http_catalog_client.hpp"
#include "transfer/simulated_protocol_client.hpp"
#include "util/logging.hpp"
#include <chrono>
#include <csignal>
#include <iostream> // Keep for signal handler output
#include <thread>

namespace discofill {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config,
                         transfer::ProtocolClientPtr client,
                         std::shared_ptr<catalog::CatalogClient> catalog,
                         transfer::NullProtocolClient::InstructionSink sink)
    : config_(config), client_(std::move(client)), catalog_(std::move(catalog)),
      instruction_sink_(std::move(sink)) {
  config_.transfer.match.analysis_enabled = config_.enable_fingerprinting;
  instance_ = this;
}

Application::~Application() {
  stop();
  if (instance_ == this) {
    instance_ = nullptr;
  }
}

Application *Application::instance() { return instance_; }

transfer::ProtocolClientPtr Application::MakeProtocolClient(
    const AppConfig &config, transfer::NullProtocolClient::InstructionSink sink) {
  if (config.protocol_backend == "simulated") {
    auto simulated = std::make_shared<transfer::SimulatedProtocolClient>();
    simulated->SetMaterializeFiles(true);
    return simulated;
  }
  return std::make_shared<transfer::NullProtocolClient>(std::move(sink));
}

bool Application::initialize() {
  if (initialized_) {
    return true;
  }

  LOG_APP_INFO("Initializing discofill...");

  if (!init_download_dir()) {
    LOG_APP_ERROR("Failed to initialize download directory");
    return false;
  }

  if (!client_) {
    client_ = MakeProtocolClient(config_, instruction_sink_);
  }
  LOG_APP_INFO("Protocol backend: {}", client_->name());

  if (!catalog_) {
    catalog_ = std::make_shared<catalog::HttpCatalogClient>(config_.catalog);
  }

  orchestrator_ =
      std::make_unique<transfer::TransferOrchestrator>(client_, config_.transfer);
  catalog_pool_ = std::make_unique<util::ThreadPool>("catalog", 1);
  catalog_rate_limiter_ = std::make_shared<catalog::RateLimiter>(
      config_.discography.min_request_interval);

  initialized_ = true;
  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::init_download_dir() {
  const std::filesystem::path dir(config_.transfer.download_dir);
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    LOG_APP_ERROR("Cannot create download directory {}: {}", dir.string(),
                  ec.message());
    return false;
  }
  LOG_APP_INFO("Download directory: {}", dir.string());
  return true;
}

bool Application::start() {
  if (running_) {
    return true;
  }
  if (!initialized_ && !initialize()) {
    return false;
  }

  if (!orchestrator_->start()) {
    LOG_APP_ERROR("Failed to start transfer engine");
    return false;
  }

  running_ = true;
  LOG_APP_INFO("discofill started");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  LOG_APP_INFO("Shutting down...");

  orchestrator_->stop();
  if (catalog_pool_) {
    catalog_pool_->shutdown();
  }

  running_ = false;
  LOG_APP_INFO("Shutdown complete");
}

void Application::wait_for_shutdown() {
  setup_signal_handlers();
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  stop();
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  if (instance_) {
    std::cout << "\nReceived signal " << signal << std::endl;
    instance_->shutdown_requested_ = true;
  }
}

// ============================================================================
// Caller-facing API
// ============================================================================

void Application::require_initialized() const {
  if (!initialized_) {
    throw std::logic_error("Application::initialize() has not been called");
  }
}

transfer::SessionId Application::StartSearch(const std::string &query) {
  require_initialized();
  return orchestrator_->start_search(query);
}

transfer::TransferId
Application::RequestDownload(transfer::SessionId session,
                             const transfer::SearchResult &result,
                             transfer::DestinationPtr destination) {
  require_initialized();
  return orchestrator_->request_download(session, result.peer, result.file_path,
                                         std::move(destination));
}

transfer::GroupId
Application::RequestFolderDownload(transfer::SessionId session,
                                   const transfer::SearchResult &result,
                                   transfer::DestinationPtr destination) {
  require_initialized();
  return orchestrator_->request_folder_download_for(session, result,
                                                    std::move(destination));
}

void Application::Cancel(transfer::TransferId id) {
  require_initialized();
  orchestrator_->cancel(id);
}

transfer::SessionRouter::Subscription
Application::Subscribe(transfer::SessionId session,
                       transfer::SessionCallback callback) {
  require_initialized();
  return orchestrator_->subscribe(session, std::move(callback));
}

std::vector<transfer::Transfer> Application::ListTransfers() const {
  require_initialized();
  return orchestrator_->list_transfers();
}

std::future<catalog::DiscographyResult>
Application::FetchDiscography(const std::string &artist_id) {
  require_initialized();
  if (artist_id.empty()) {
    throw std::invalid_argument("artist id is empty");
  }
  auto catalog = catalog_;
  auto options = config_.discography;
  auto limiter = catalog_rate_limiter_;
  return catalog_pool_->enqueue([catalog, options, limiter, artist_id]() {
    catalog::DiscographyPaginator paginator(*catalog, options, nullptr, limiter);
    return paginator.FetchAll(artist_id);
  });
}

std::future<catalog::DiscographyResult>
Application::FetchDiscographyByName(const std::string &artist_name) {
  require_initialized();
  if (artist_name.empty()) {
    throw std::invalid_argument("artist name is empty");
  }
  auto catalog = catalog_;
  auto options = config_.discography;
  auto limiter = catalog_rate_limiter_;
  return catalog_pool_->enqueue([catalog, options, limiter, artist_name]() {
    catalog::DiscographyPaginator paginator(*catalog, options, nullptr, limiter);
    return paginator.FetchAllByName(artist_name);
  });
}

} // namespace app
} // namespace discofill
