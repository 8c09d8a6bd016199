#include "transfer/transfer_orchestrator.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <cctype>
#include <filesystem>
#include <future>

namespace discofill {
namespace transfer {

namespace {

std::string Trim(const std::string &s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::string LowercaseExtension(const std::string &path) {
  auto slash = path.find_last_of("/\\");
  auto dot = path.rfind('.');
  if (dot == std::string::npos ||
      (slash != std::string::npos && dot < slash)) {
    return "";
  }
  std::string ext = path.substr(dot);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

std::string ParentFolder(const std::string &path) {
  auto slash = path.find_last_of("/\\");
  return slash == std::string::npos ? std::string() : path.substr(0, slash);
}

std::string LastComponent(const std::string &path) {
  auto slash = path.find_last_of("/\\");
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

const char *ToString(ConnectionState state) {
  switch (state) {
  case ConnectionState::Disconnected:
    return "disconnected";
  case ConnectionState::Connecting:
    return "connecting";
  case ConnectionState::Connected:
    return "connected";
  case ConnectionState::Unavailable:
    return "unavailable";
  }
  return "unknown";
}

TransferOrchestrator::TransferOrchestrator(
    ProtocolClientPtr client, const Config &config,
    boost::asio::io_context *external_io_context)
    : config_(config), client_(std::move(client)),
      registry_(config.registry_max_entries),
      analysis_pool_("analysis", std::max<size_t>(1, config.analysis_threads)),
      owned_io_context_(external_io_context
                            ? nullptr
                            : std::make_unique<boost::asio::io_context>()),
      io_context_(external_io_context ? *external_io_context
                                      : *owned_io_context_),
      credentials_(config.credentials) {
  if (!client_) {
    throw std::invalid_argument("TransferOrchestrator requires a protocol client");
  }

  matcher_ = std::make_unique<AutoMatcher>(io_context_, registry_, router_,
                                           &analysis_pool_, config_.match);

  // Protocol callbacks may fire on any thread; hop onto ours
  client_->set_event_callback([this](const ProtocolEvent &event) {
    post([this, event]() { on_protocol_event(event); });
  });
  client_->set_connection_lost_callback([this](const std::string &reason) {
    post([this, reason]() { on_connection_lost(reason); });
  });

  LOG_XFER_TRACE("TransferOrchestrator initialized (backend: {}, external_io_context: {})",
                 client_->name(), external_io_context ? "yes" : "no");
}

TransferOrchestrator::~TransferOrchestrator() {
  // Prevent callbacks from firing into a destroyed orchestrator
  client_->set_event_callback({});
  client_->set_connection_lost_callback({});
  stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool TransferOrchestrator::start() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  running_.store(true, std::memory_order_release);

  if (owned_io_context_) {
    work_guard_ = std::make_unique<
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        boost::asio::make_work_guard(io_context_));
    io_thread_ = std::thread([this]() { io_context_.run(); });
  }

  post([this]() { do_connect(); });

  LOG_XFER_INFO("Transfer engine started (backend: {}, download dir: {})",
                client_->name(), config_.download_dir);
  return true;
}

void TransferOrchestrator::stop() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  if (config_.shutdown_policy == ShutdownPolicy::Drain) {
    if (owned_io_context_) {
      LOG_XFER_INFO("Draining {} active transfers (up to {} ms)",
                    registry_.ActiveIds().size(), config_.drain_timeout.count());
      const auto deadline = std::chrono::steady_clock::now() + config_.drain_timeout;
      while (!registry_.ActiveIds().empty() &&
             std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
    } else {
      LOG_XFER_DEBUG("External io_context: skipping drain, cancelling instead");
    }
  }

  run_on_context([this]() { shutdown_transfers(); });

  // No new work is accepted from here on
  running_.store(false, std::memory_order_release);

  if (owned_io_context_) {
    work_guard_.reset();
    io_context_.stop();
    if (io_thread_.joinable()) {
      io_thread_.join();
    }
    io_context_.restart();
  }

  analysis_pool_.shutdown();
  LOG_XFER_INFO("Transfer engine stopped");
}

void TransferOrchestrator::shutdown_transfers() {
  matcher_->CancelAll();
  pending_searches_.clear();

  size_t cancelled = 0;
  for (TransferId id : registry_.ActiveIds()) {
    auto it = active_.find(id);
    if (it != active_.end() && it->second.dispatched) {
      client_->cancel(id);
    }
    if (registry_.Transition(id, TransferState::Cancelled, [](Transfer &t) {
          t.error = "engine shut down";
        })) {
      ++cancelled;
      if (auto t = registry_.Get(id)) {
        router_.PublishTransfer(SessionEventType::TransferUpdate, *t);
      }
    }
  }
  active_.clear();
  pending_dispatch_.clear();

  if (client_->is_connected()) {
    client_->disconnect();
  }
  connection_state_ = ConnectionState::Disconnected;

  if (cancelled > 0) {
    LOG_XFER_INFO("Cancelled {} unfinished transfers at shutdown", cancelled);
  }
}

void TransferOrchestrator::post(std::function<void()> fn) {
  boost::asio::post(io_context_, std::move(fn));
}

void TransferOrchestrator::run_on_context(const std::function<void()> &fn) {
  if (!owned_io_context_ || !io_thread_.joinable() ||
      io_thread_.get_id() == std::this_thread::get_id()) {
    // External context: the owner is not running it concurrently with us
    fn();
    return;
  }

  std::promise<void> done;
  auto future = done.get_future();
  post([&fn, &done]() {
    fn();
    done.set_value();
  });
  future.wait();
}

void TransferOrchestrator::wait_idle() {
  if (!owned_io_context_ || !io_thread_.joinable()) {
    return;
  }
  run_on_context([]() {});
}

// ============================================================================
// Connection management
// ============================================================================

void TransferOrchestrator::connect(const Credentials &credentials) {
  post([this, credentials]() {
    credentials_ = credentials;
    reconnect_attempted_ = false;
    if (connection_state_ == ConnectionState::Unavailable) {
      connection_state_ = ConnectionState::Disconnected;
    }
    do_connect();
  });
}

void TransferOrchestrator::do_connect() {
  if (connection_state_ == ConnectionState::Connecting ||
      connection_state_ == ConnectionState::Connected) {
    return;
  }

  if (credentials_.empty()) {
    LOG_XFER_WARN("No P2P credentials configured; downloads stay queued "
                  "until connect() is called");
    broadcast_status("Please configure P2P credentials in the options.");
    connection_state_ = ConnectionState::Disconnected;
    return;
  }

  connection_state_ = ConnectionState::Connecting;
  LOG_XFER_INFO("Connecting to P2P network as {} ({})", credentials_.username,
                client_->name());

  client_->connect(credentials_, [this](bool success, const std::string &error) {
    post([this, success, error]() { on_connect_result(success, error); });
  });
}

void TransferOrchestrator::on_connect_result(bool success,
                                             const std::string &error) {
  if (!running_) {
    return;
  }

  if (success) {
    connection_state_ = ConnectionState::Connected;
    reconnect_attempted_ = false;
    LOG_XFER_INFO("Connected to P2P network as {}", credentials_.username);
    broadcast_status("Connected as " + credentials_.username);
    flush_pending();
    return;
  }

  connection_state_ = ConnectionState::Unavailable;
  LOG_XFER_ERROR("P2P connection failed: {}", error);
  broadcast_status("Connection error: " + error);

  // Nothing queued can be served now
  for (const auto &search : pending_searches_) {
    router_.PublishStatus(search.session,
                          "Not connected; search for '" + search.query +
                              "' was not sent");
  }
  pending_searches_.clear();

  std::deque<TransferId> waiting;
  waiting.swap(pending_dispatch_);
  for (TransferId id : waiting) {
    fail_transfer(id, "not connected: " + error);
  }
}

void TransferOrchestrator::on_connection_lost(const std::string &reason) {
  if (!running_) {
    return;
  }

  LOG_XFER_WARN("P2P connection lost: {}", reason);
  connection_state_ = ConnectionState::Disconnected;

  // Running downloads are gone with the session; queued ones can be resent
  // unless the user already asked to cancel them
  std::vector<TransferId> failed;
  std::vector<TransferId> cancelled;
  for (auto &[id, active] : active_) {
    auto t = registry_.Get(id);
    if (!t) {
      continue;
    }
    if (t->state == TransferState::InProgress) {
      failed.push_back(id);
    } else if (t->state == TransferState::Queued && active.dispatched) {
      if (active.cancel_requested) {
        cancelled.push_back(id);
        continue;
      }
      active.dispatched = false;
      pending_dispatch_.push_back(id);
    }
  }
  std::sort(failed.begin(), failed.end());
  for (TransferId id : failed) {
    fail_transfer(id, "connection lost: " + reason);
  }
  std::sort(cancelled.begin(), cancelled.end());
  for (TransferId id : cancelled) {
    finish_transfer(id, TransferState::Cancelled, "cancelled by user");
  }

  if (reconnect_attempted_) {
    connection_state_ = ConnectionState::Unavailable;
    broadcast_status("Connection lost: " + reason);
    std::deque<TransferId> waiting;
    waiting.swap(pending_dispatch_);
    for (TransferId id : waiting) {
      fail_transfer(id, "connection lost: " + reason);
    }
    return;
  }

  reconnect_attempted_ = true;
  broadcast_status("Connection lost (" + reason + "), reconnecting...");
  do_connect();
}

void TransferOrchestrator::flush_pending() {
  std::vector<PendingSearch> searches;
  searches.swap(pending_searches_);
  for (const auto &search : searches) {
    issue_search(search.session, search.generation, search.query);
  }

  std::deque<TransferId> waiting;
  waiting.swap(pending_dispatch_);
  for (TransferId id : waiting) {
    dispatch(id);
  }
}

void TransferOrchestrator::broadcast_status(const std::string &message) {
  std::vector<SessionId> ids;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    ids.reserve(sessions_.size());
    for (const auto &[id, session] : sessions_) {
      ids.push_back(id);
    }
  }
  for (SessionId id : ids) {
    router_.PublishStatus(id, message);
  }
}

// ============================================================================
// Sessions and search
// ============================================================================

SessionId TransferOrchestrator::open_session() {
  const SessionId id = next_session_id_++;
  auto session = std::make_shared<SearchSession>(id, "");
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_[id] = std::move(session);
  }
  LOG_SEARCH_TRACE("Opened session {}", id);
  return id;
}

std::shared_ptr<SearchSession>
TransferOrchestrator::find_session(SessionId session) const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto it = sessions_.find(session);
  return it == sessions_.end() ? nullptr : it->second;
}

bool TransferOrchestrator::has_session(SessionId session) const {
  return find_session(session) != nullptr;
}

void TransferOrchestrator::start_search(SessionId session,
                                        const std::string &query) {
  const std::string trimmed = Trim(query);
  if (trimmed.empty()) {
    throw std::invalid_argument("search query is empty");
  }

  auto search = find_session(session);
  if (!search) {
    throw std::invalid_argument("unknown session " + std::to_string(session));
  }
  if (!running_) {
    throw EngineUnavailableError("transfer engine is not running");
  }

  const uint64_t generation = search->Reset(trimmed);
  post([this, session, generation, trimmed]() {
    if (connection_state_ == ConnectionState::Connecting) {
      pending_searches_.push_back(PendingSearch{session, generation, trimmed});
      return;
    }
    issue_search(session, generation, trimmed);
  });
}

SessionId TransferOrchestrator::start_search(const std::string &query) {
  if (Trim(query).empty()) {
    throw std::invalid_argument("search query is empty");
  }
  const SessionId session = open_session();
  start_search(session, query);
  return session;
}

void TransferOrchestrator::issue_search(SessionId session,
                                        uint64_t generation,
                                        const std::string &query) {
  auto search = find_session(session);
  if (!search) {
    LOG_SEARCH_DEBUG("Session {} closed before its search was sent", session);
    return;
  }
  if (search->generation() != generation) {
    LOG_SEARCH_DEBUG("Session {}: '{}' superseded before it was sent", session,
                     query);
    return;
  }

  LOG_SEARCH_INFO("Session {}: searching for '{}'", session, query);
  router_.PublishStatus(session, "Searching for: " + query + "...");

  // The session id is captured here, not taken from the result, so a
  // misbehaving backend cannot leak results into another session. The
  // generation keeps late results of a replaced query out of the new one.
  const bool issued = client_->search(
      session, query,
      [this, session, generation](const SearchResult &result) {
        post([this, session, generation, result]() {
          on_search_result(session, generation, result);
        });
      });

  if (!issued) {
    LOG_SEARCH_WARN("Session {}: backend refused search (state: {})", session,
                    ToString(connection_state_.load()));
    router_.PublishStatus(session, "Not connected to the P2P network; "
                                   "search was not sent.");
  }
}

void TransferOrchestrator::on_search_result(SessionId session,
                                            uint64_t generation,
                                            SearchResult result) {
  auto search = find_session(session);
  if (!search) {
    LOG_SEARCH_TRACE("Dropping result for closed session {}", session);
    return;
  }

  auto stored = search->AppendIfCurrent(generation, std::move(result));
  if (!stored) {
    LOG_SEARCH_TRACE("Session {}: dropping result of a replaced query",
                     session);
    return;
  }

  SessionEvent event;
  event.type = SessionEventType::SearchResult;
  event.result = std::move(*stored);
  router_.Publish(session, event);
}

std::vector<SearchResult>
TransferOrchestrator::search_results(SessionId session,
                                     const SortOrder &order) const {
  auto search = find_session(session);
  if (!search) {
    return {};
  }
  return search->Sorted(order);
}

void TransferOrchestrator::close_session(SessionId session) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  if (sessions_.erase(session) > 0) {
    LOG_SEARCH_TRACE("Closed session {}", session);
  }
}

SessionRouter::Subscription
TransferOrchestrator::subscribe(SessionId session, SessionCallback callback) {
  return router_.Subscribe(session, std::move(callback));
}

SessionRouter::Subscription
TransferOrchestrator::subscribe_queue(SessionCallback callback) {
  return router_.SubscribeQueue(std::move(callback));
}

// ============================================================================
// Download requests (caller threads)
// ============================================================================

void TransferOrchestrator::ensure_accepting() const {
  if (!running_) {
    throw EngineUnavailableError("transfer engine is not running");
  }
  if (connection_state_ == ConnectionState::Unavailable) {
    throw EngineUnavailableError("P2P network unavailable");
  }
}

TransferId TransferOrchestrator::add_transfer(SessionId session, GroupId group,
                                              const std::string &peer,
                                              const FolderEntry &file,
                                              const DestinationPtr &destination) {
  Transfer transfer;
  transfer.session_id = session;
  transfer.group_id = group;
  transfer.peer = peer;
  transfer.remote_path = file.remote_path;
  transfer.size_bytes = file.size_bytes;
  transfer.destination = destination;
  return registry_.Add(std::move(transfer));
}

TransferId TransferOrchestrator::request_download(SessionId session,
                                                  const std::string &peer,
                                                  const std::string &remote_path,
                                                  DestinationPtr destination) {
  if (Trim(peer).empty()) {
    throw std::invalid_argument("peer is empty");
  }
  if (Trim(remote_path).empty()) {
    throw std::invalid_argument("remote path is empty");
  }
  if (!destination) {
    throw std::invalid_argument("destination is null");
  }
  ensure_accepting();

  const TransferId id =
      add_transfer(session, INVALID_ID, peer, FolderEntry{remote_path, 0},
                   destination);
  LOG_XFER_INFO("Transfer {} queued: {} from {} (session {})", id, remote_path,
                peer, session);

  post([this, id]() { on_download_requested(id); });
  return id;
}

std::vector<FolderEntry>
TransferOrchestrator::filter_folder(const FolderManifest &manifest) const {
  std::vector<FolderEntry> kept;
  for (const auto &file : manifest.files) {
    if (Trim(file.remote_path).empty()) {
      continue;
    }
    if (!config_.folder_extensions.empty()) {
      const std::string ext = LowercaseExtension(file.remote_path);
      if (std::find(config_.folder_extensions.begin(),
                    config_.folder_extensions.end(),
                    ext) == config_.folder_extensions.end()) {
        LOG_XFER_TRACE("Skipping {} (extension not wanted)", file.remote_path);
        continue;
      }
    }
    kept.push_back(file);
  }
  return kept;
}

GroupId TransferOrchestrator::request_folder_download(
    SessionId session, const std::string &peer, const FolderManifest &manifest,
    DestinationPtr destination) {
  if (Trim(peer).empty()) {
    throw std::invalid_argument("peer is empty");
  }
  if (!destination) {
    throw std::invalid_argument("destination is null");
  }
  auto files = filter_folder(manifest);
  if (files.empty()) {
    throw std::invalid_argument("folder '" + manifest.folder +
                                "' has no downloadable files");
  }
  ensure_accepting();

  const GroupId group = next_group_id_++;
  std::vector<TransferId> ids;
  ids.reserve(files.size());
  for (const auto &file : files) {
    ids.push_back(add_transfer(session, group, peer, file, destination));
  }

  LOG_XFER_INFO("Folder {} from {}: {} transfers in group {} (session {})",
                manifest.folder, peer, ids.size(), group, session);

  post([this, ids]() {
    for (TransferId id : ids) {
      on_download_requested(id);
    }
  });
  return group;
}

GroupId TransferOrchestrator::request_folder_download_for(
    SessionId session, const SearchResult &result, DestinationPtr destination) {
  if (Trim(result.peer).empty()) {
    throw std::invalid_argument("peer is empty");
  }
  const std::string folder = ParentFolder(result.file_path);
  if (Trim(folder).empty()) {
    throw std::invalid_argument("result '" + result.file_path +
                                "' has no parent folder");
  }
  if (!destination) {
    throw std::invalid_argument("destination is null");
  }
  ensure_accepting();

  const GroupId group = next_group_id_++;
  const std::string peer = result.peer;

  post([this, session, group, peer, folder, destination]() {
    router_.PublishStatus(session, "Browsing folder: " + folder + "...");
    const bool issued = client_->browse_folder(
        peer, folder,
        [this, session, group, peer, destination](
            bool success, const FolderManifest &manifest,
            const std::string &error) {
          post([this, session, group, peer, destination, success, manifest,
                error]() {
            on_folder_listing(session, group, peer, destination, success,
                              manifest, error);
          });
        });
    if (!issued) {
      router_.PublishStatus(session, "Could not browse " + folder +
                                         ": not connected");
    }
  });
  return group;
}

void TransferOrchestrator::on_folder_listing(
    SessionId session, GroupId group, const std::string &peer,
    DestinationPtr destination, bool success, const FolderManifest &manifest,
    const std::string &error) {
  if (!running_) {
    return;
  }
  if (!success) {
    LOG_XFER_WARN("Browsing {} on {} failed: {}", manifest.folder, peer, error);
    router_.PublishStatus(session, "Folder download error: " + error);
    return;
  }

  auto files = filter_folder(manifest);
  if (files.empty()) {
    router_.PublishStatus(session,
                          "Folder is empty or could not be retrieved.");
    return;
  }

  router_.PublishStatus(session, "Downloading " + std::to_string(files.size()) +
                                     " files from folder...");
  for (const auto &file : files) {
    on_download_requested(add_transfer(session, group, peer, file, destination));
  }
}

void TransferOrchestrator::cancel(TransferId id) {
  auto transfer = registry_.Get(id);
  if (!transfer || IsTerminal(transfer->state)) {
    LOG_XFER_TRACE("cancel({}): nothing to do", id);
    return;
  }
  post([this, id]() { on_cancel_requested(id); });
}

// ============================================================================
// io_context thread
// ============================================================================

void TransferOrchestrator::on_download_requested(TransferId id) {
  auto transfer = registry_.Get(id);
  if (!transfer || IsTerminal(transfer->state)) {
    return;
  }

  active_[id] = ActiveTransfer{};
  router_.PublishTransfer(SessionEventType::TransferUpdate, *transfer);

  switch (connection_state_.load()) {
  case ConnectionState::Connected:
    dispatch(id);
    break;
  case ConnectionState::Connecting:
  case ConnectionState::Disconnected:
    pending_dispatch_.push_back(id);
    break;
  case ConnectionState::Unavailable:
    fail_transfer(id, "P2P network unavailable");
    break;
  }
}

void TransferOrchestrator::dispatch(TransferId id) {
  auto it = active_.find(id);
  auto transfer = registry_.Get(id);
  if (it == active_.end() || !transfer || IsTerminal(transfer->state)) {
    return;
  }

  // Folder downloads keep their folder name under the download directory
  std::string download_dir = config_.download_dir;
  if (transfer->group_id != INVALID_ID) {
    const std::string folder = LastComponent(ParentFolder(transfer->remote_path));
    if (!folder.empty()) {
      download_dir = (std::filesystem::path(download_dir) / folder).string();
    }
  }

  if (!client_->request_download(id, transfer->peer, transfer->remote_path,
                                 download_dir)) {
    fail_transfer(id, "rejected by protocol client");
    return;
  }
  it->second.dispatched = true;
  LOG_XFER_DEBUG("Transfer {} handed to {} backend", id, client_->name());
}

void TransferOrchestrator::on_cancel_requested(TransferId id) {
  auto transfer = registry_.Get(id);
  if (!transfer || IsTerminal(transfer->state)) {
    return;
  }

  auto it = active_.find(id);
  if (it == active_.end() || !it->second.dispatched) {
    // Protocol has nothing in flight for it yet
    pending_dispatch_.erase(
        std::remove(pending_dispatch_.begin(), pending_dispatch_.end(), id),
        pending_dispatch_.end());
    finish_transfer(id, TransferState::Cancelled, "cancelled by user");
    return;
  }

  if (it->second.cancel_requested) {
    return;
  }
  it->second.cancel_requested = true;
  LOG_XFER_DEBUG("Transfer {}: cancel forwarded to protocol", id);
  client_->cancel(id);
}

void TransferOrchestrator::on_protocol_event(const ProtocolEvent &event) {
  const TransferId id = event.transfer_id;
  auto transfer = registry_.Get(id);
  if (!transfer) {
    LOG_XFER_WARN("Protocol {} event for unknown transfer {}",
                  ToString(event.type), id);
    return;
  }
  if (IsTerminal(transfer->state)) {
    // Lost a race with another terminal event; first one stands
    LOG_XFER_TRACE("Ignoring {} event for {} transfer {}", ToString(event.type),
                   ToString(transfer->state), id);
    return;
  }

  auto update_sizes = [&event](Transfer &t) {
    if (event.total_bytes > 0) {
      t.size_bytes = event.total_bytes;
    }
    t.bytes_transferred = std::max(t.bytes_transferred, event.bytes_transferred);
  };

  switch (event.type) {
  case ProtocolEventType::Progress: {
    if (transfer->state == TransferState::Queued) {
      registry_.Transition(id, TransferState::InProgress, update_sizes);
      LOG_XFER_DEBUG("Transfer {} started", id);
    } else {
      registry_.Update(id, update_sizes);
    }
    if (auto t = registry_.Get(id)) {
      router_.PublishTransfer(SessionEventType::TransferUpdate, *t);
    }
    break;
  }

  case ProtocolEventType::Completed: {
    if (transfer->state == TransferState::Queued) {
      registry_.Transition(id, TransferState::InProgress, update_sizes);
      if (auto t = registry_.Get(id)) {
        router_.PublishTransfer(SessionEventType::TransferUpdate, *t);
      }
    }
    registry_.Transition(id, TransferState::Completed, [&event](Transfer &t) {
      t.local_path = event.local_path;
      if (event.total_bytes > 0) {
        t.size_bytes = event.total_bytes;
      }
      t.bytes_transferred = t.size_bytes;
    });
    active_.erase(id);

    auto done = registry_.Get(id);
    if (!done) {
      LOG_XFER_WARN("Transfer {} left the registry on completion", id);
      break;
    }
    LOG_XFER_INFO("Transfer {} completed: {}", id, done->local_path);
    router_.PublishTransfer(SessionEventType::TransferUpdate, *done);
    router_.PublishStatus(done->session_id, "Finished: " + done->local_path);

    matcher_->Start(id);
    break;
  }

  case ProtocolEventType::Failed:
    fail_transfer(id, event.error.empty() ? "transfer failed" : event.error);
    break;

  case ProtocolEventType::Cancelled:
    finish_transfer(id, TransferState::Cancelled, "cancelled");
    break;
  }
}

void TransferOrchestrator::fail_transfer(TransferId id,
                                         const std::string &reason) {
  finish_transfer(id, TransferState::Failed, reason);
}

void TransferOrchestrator::finish_transfer(TransferId id, TransferState state,
                                           const std::string &reason) {
  active_.erase(id);
  if (!registry_.Transition(id, state,
                            [&reason](Transfer &t) { t.error = reason; })) {
    return;
  }

  if (state == TransferState::Failed) {
    LOG_XFER_WARN("Transfer {} failed: {}", id, reason);
  } else {
    LOG_XFER_INFO("Transfer {} {}: {}", id, ToString(state), reason);
  }
  if (auto transfer = registry_.Get(id)) {
    router_.PublishTransfer(SessionEventType::TransferUpdate, *transfer);
  }
}

} // namespace transfer
} // namespace discofill
