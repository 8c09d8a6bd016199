#pragma once

#include "transfer/auto_matcher.hpp"
#include "transfer/protocol_client.hpp"
#include "transfer/search_session.hpp"
#include "transfer/session_router.hpp"
#include "transfer/transfer_registry.hpp"
#include "transfer/types.hpp"
#include "util/threadpool.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace discofill {
namespace transfer {

// Thrown by request_* once the connection is gone for good (reconnect failed)
class EngineUnavailableError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class ConnectionState {
  Disconnected, // never connected, or no credentials configured
  Connecting,
  Connected,
  Unavailable, // connect or reconnect failed; requests are rejected
};

const char *ToString(ConnectionState state);

enum class ShutdownPolicy {
  Cancel, // cancel every non-terminal transfer
  Drain,  // wait up to drain_timeout for them, then cancel the rest
};

// TransferOrchestrator - single owner of the P2P connection
//
// One io_context thread owns the ProtocolClient: every call into it and
// every event coming out of it is handled there, in arrival order. Caller
// operations (search, download, cancel) validate their input synchronously,
// then post the work and return without waiting for the network.
//
// Callers are isolated by SessionId: search results, transfer updates and
// status messages are published through the SessionRouter under the session
// that caused them. The TransferRegistry is global and outlives sessions and
// subscriptions, feeding the queue view.
//
// When an external io_context is supplied no thread is started; the owner
// runs the context (tests drive it with run()/poll()).
class TransferOrchestrator {
public:
  struct Config {
    Credentials credentials;
    std::string download_dir;
    AutoMatcher::Config match;
    size_t registry_max_entries;
    // Folder downloads only fetch these (lowercase, with dot); empty = all
    std::vector<std::string> folder_extensions;
    ShutdownPolicy shutdown_policy;
    std::chrono::milliseconds drain_timeout;
    size_t analysis_threads;

    Config()
        : download_dir("downloads"),
          registry_max_entries(TransferRegistry::DEFAULT_MAX_ENTRIES),
          folder_extensions({".mp3", ".flac", ".wav", ".aiff", ".ogg", ".m4a",
                             ".jpg", ".png", ".nfo"}),
          shutdown_policy(ShutdownPolicy::Cancel),
          drain_timeout(std::chrono::seconds(30)), analysis_threads(1) {}
  };

  explicit TransferOrchestrator(ProtocolClientPtr client,
                                const Config &config = Config{},
                                boost::asio::io_context *external_io_context = nullptr);
  ~TransferOrchestrator();

  TransferOrchestrator(const TransferOrchestrator &) = delete;
  TransferOrchestrator &operator=(const TransferOrchestrator &) = delete;

  // Lifecycle
  bool start();
  void stop();
  bool is_running() const { return running_; }

  // (Re)connect with new credentials; also clears the Unavailable state
  void connect(const Credentials &credentials);
  ConnectionState connection_state() const { return connection_state_; }

  // Sessions and search
  SessionId open_session();
  void start_search(SessionId session, const std::string &query);
  SessionId start_search(const std::string &query);
  std::vector<SearchResult> search_results(SessionId session,
                                           const SortOrder &order = {}) const;
  bool has_session(SessionId session) const;
  void close_session(SessionId session);

  // Downloads. Throw std::invalid_argument on bad input (nothing is
  // created) and EngineUnavailableError when the network is gone.
  TransferId request_download(SessionId session, const std::string &peer,
                              const std::string &remote_path,
                              DestinationPtr destination);
  GroupId request_folder_download(SessionId session, const std::string &peer,
                                  const FolderManifest &manifest,
                                  DestinationPtr destination);
  // Browse the folder containing `result` on its peer, then download it
  GroupId request_folder_download_for(SessionId session,
                                      const SearchResult &result,
                                      DestinationPtr destination);

  // Idempotent; no-op for unknown or terminal transfers
  void cancel(TransferId id);

  // Queue view (session independent)
  std::vector<Transfer> list_transfers() const { return registry_.ListAll(); }
  std::vector<Transfer> list_session_transfers(SessionId session) const {
    return registry_.ListBySession(session);
  }
  std::vector<Transfer> list_group_transfers(GroupId group) const {
    return registry_.ListByGroup(group);
  }
  std::optional<Transfer> get_transfer(TransferId id) const {
    return registry_.Get(id);
  }

  [[nodiscard]] SessionRouter::Subscription subscribe(SessionId session,
                                                      SessionCallback callback);
  [[nodiscard]] SessionRouter::Subscription
  subscribe_queue(SessionCallback callback);

  TransferRegistry &registry() { return registry_; }
  SessionRouter &router() { return router_; }

  // Block until everything posted so far has been handled (owned thread
  // only; with an external io_context this is a no-op)
  void wait_idle();

  // Filters a manifest down to the configured folder extensions
  std::vector<FolderEntry> filter_folder(const FolderManifest &manifest) const;

private:
  struct ActiveTransfer {
    bool dispatched{false};
    bool cancel_requested{false};
  };

  struct PendingSearch {
    SessionId session;
    uint64_t generation;
    std::string query;
  };

  // Caller-side helpers
  void ensure_accepting() const;
  std::shared_ptr<SearchSession> find_session(SessionId session) const;
  TransferId add_transfer(SessionId session, GroupId group,
                          const std::string &peer, const FolderEntry &file,
                          const DestinationPtr &destination);
  void post(std::function<void()> fn);
  void run_on_context(const std::function<void()> &fn);

  // io_context thread only
  void do_connect();
  void on_connect_result(bool success, const std::string &error);
  void on_connection_lost(const std::string &reason);
  void issue_search(SessionId session, uint64_t generation,
                    const std::string &query);
  void on_search_result(SessionId session, uint64_t generation,
                        SearchResult result);
  void on_download_requested(TransferId id);
  void dispatch(TransferId id);
  void flush_pending();
  void on_cancel_requested(TransferId id);
  void on_protocol_event(const ProtocolEvent &event);
  void on_folder_listing(SessionId session, GroupId group,
                         const std::string &peer, DestinationPtr destination,
                         bool success, const FolderManifest &manifest,
                         const std::string &error);
  void fail_transfer(TransferId id, const std::string &reason);
  void finish_transfer(TransferId id, TransferState state,
                       const std::string &reason);
  void broadcast_status(const std::string &message);
  void shutdown_transfers();

  Config config_;
  ProtocolClientPtr client_;

  std::atomic<bool> running_{false};
  std::atomic<ConnectionState> connection_state_{ConnectionState::Disconnected};
  mutable std::mutex start_stop_mutex_;

  TransferRegistry registry_;
  SessionRouter router_;
  util::ThreadPool analysis_pool_;

  // IO context (may be external or owned locally)
  std::unique_ptr<boost::asio::io_context> owned_io_context_;
  boost::asio::io_context &io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread io_thread_;

  std::unique_ptr<AutoMatcher> matcher_;

  // Sessions are read by callers and written by the io thread
  mutable std::mutex sessions_mutex_;
  std::unordered_map<SessionId, std::shared_ptr<SearchSession>> sessions_;
  std::atomic<SessionId> next_session_id_{1};
  std::atomic<GroupId> next_group_id_{1};

  // io_context thread only
  Credentials credentials_;
  bool reconnect_attempted_{false};
  std::unordered_map<TransferId, ActiveTransfer> active_;
  std::deque<TransferId> pending_dispatch_;
  std::vector<PendingSearch> pending_searches_;
};

} // namespace transfer
} // namespace discofill
