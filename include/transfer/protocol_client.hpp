#ifndef DISCOFILL_TRANSFER_PROTOCOL_CLIENT_HPP
#define DISCOFILL_TRANSFER_PROTOCOL_CLIENT_HPP

#include "transfer/types.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace discofill {
namespace transfer {

/**
 * Abstract P2P protocol capability
 *
 * The engine does not speak the file-sharing wire protocol itself; it drives
 * an implementation of this interface:
 * - NullProtocolClient: library absent, turns searches into manual instructions
 * - SimulatedProtocolClient: in-memory peer network for testing
 * - a real network binding, provided by the host
 *
 * Threading contract: every method is called from the orchestrator thread
 * only. Callbacks may be invoked from any thread, including synchronously
 * from inside the call that triggered them; the orchestrator re-posts them
 * onto its own context before acting.
 */

struct Credentials {
  std::string username;
  std::string password;

  bool empty() const { return username.empty() || password.empty(); }
};

enum class ProtocolEventType {
  Progress,
  Completed,
  Failed,
  Cancelled,
};

const char *ToString(ProtocolEventType type);

struct ProtocolEvent {
  ProtocolEventType type{ProtocolEventType::Progress};
  TransferId transfer_id{INVALID_ID}; // token handed to request_download()
  uint64_t bytes_transferred{0};
  uint64_t total_bytes{0};
  std::string local_path; // Completed only
  std::string error;      // Failed only
};

using ConnectCallback =
    std::function<void(bool success, const std::string &error)>;
using SearchResultCallback = std::function<void(const SearchResult &result)>;
using BrowseCallback = std::function<void(
    bool success, const FolderManifest &manifest, const std::string &error)>;
using ProtocolEventCallback = std::function<void(const ProtocolEvent &event)>;
using ConnectionLostCallback = std::function<void(const std::string &reason)>;

class ProtocolClient {
public:
  virtual ~ProtocolClient() = default;

  /**
   * Log in to the network
   * The callback reports the outcome exactly once
   */
  virtual void connect(const Credentials &credentials,
                       ConnectCallback callback) = 0;

  virtual void disconnect() = 0;

  virtual bool is_connected() const = 0;

  /**
   * Issue a search; every result must carry session_id == session
   * @return false if the search could not be issued
   */
  virtual bool search(SessionId session, const std::string &query,
                      SearchResultCallback callback) = 0;

  /**
   * Start downloading one file into download_dir
   * Progress and terminal events for it are tagged with transfer_id
   * @return false if the request was rejected outright
   */
  virtual bool request_download(TransferId transfer_id, const std::string &peer,
                                const std::string &remote_path,
                                const std::string &download_dir) = 0;

  /**
   * List the files of a folder shared by a peer
   */
  virtual bool browse_folder(const std::string &peer, const std::string &folder,
                             BrowseCallback callback) = 0;

  /**
   * Ask the protocol to abort a download
   * Acknowledged by a Cancelled event, unless a terminal event won the race
   */
  virtual void cancel(TransferId transfer_id) = 0;

  virtual void set_event_callback(ProtocolEventCallback callback) = 0;
  virtual void set_connection_lost_callback(ConnectionLostCallback callback) = 0;

  /**
   * Backend name for logs ("null", "simulated", ...)
   */
  virtual std::string name() const = 0;
};

using ProtocolClientPtr = std::shared_ptr<ProtocolClient>;

} // namespace transfer
} // namespace discofill

#endif // DISCOFILL_TRANSFER_PROTOCOL_CLIENT_HPP
