#ifndef DISCOFILL_TRANSFER_SIMULATED_PROTOCOL_CLIENT_HPP
#define DISCOFILL_TRANSFER_SIMULATED_PROTOCOL_CLIENT_HPP

#include "transfer/protocol_client.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace discofill {
namespace transfer {

/**
 * SimulatedProtocolClient - in-memory peer network for testing
 *
 * Peers share files registered with AddFile(). Searches match files whose
 * path contains every query word (case-insensitive). Everything happens
 * synchronously inside the calling thread.
 *
 * Two download modes:
 * - auto-complete (default): request_download() immediately reports a
 *   progress event followed by Completed, or Failed for paths added with
 *   FailFile()
 * - manual: nothing happens until the test calls Emit*()
 */
class SimulatedProtocolClient : public ProtocolClient {
public:
  struct SharedFile {
    std::string peer;
    std::string path;
    uint64_t size_bytes{0};
    std::optional<uint32_t> bitrate_kbps;
    bool lossless{false};
    uint32_t queue_length{0};
    uint64_t upload_speed{0};
  };

  struct DownloadRequest {
    TransferId transfer_id{INVALID_ID};
    std::string peer;
    std::string remote_path;
    std::string download_dir;
  };

  SimulatedProtocolClient();
  ~SimulatedProtocolClient() override = default;

  // ProtocolClient interface
  void connect(const Credentials &credentials,
               ConnectCallback callback) override;
  void disconnect() override;
  bool is_connected() const override;
  bool search(SessionId session, const std::string &query,
              SearchResultCallback callback) override;
  bool request_download(TransferId transfer_id, const std::string &peer,
                        const std::string &remote_path,
                        const std::string &download_dir) override;
  bool browse_folder(const std::string &peer, const std::string &folder,
                     BrowseCallback callback) override;
  void cancel(TransferId transfer_id) override;
  void set_event_callback(ProtocolEventCallback callback) override;
  void set_connection_lost_callback(ConnectionLostCallback callback) override;
  std::string name() const override { return "simulated"; }

  // Network setup
  void AddFile(const SharedFile &file);
  void AddFile(const std::string &peer, const std::string &path,
               uint64_t size_bytes,
               std::optional<uint32_t> bitrate_kbps = std::nullopt,
               bool lossless = false);
  void FailFile(const std::string &remote_path);
  void SetAutoComplete(bool enabled);
  void SetConnectOutcome(bool success, const std::string &error = "");
  // Answer cancel() with a Cancelled event (default true)
  void SetAckCancels(bool enabled);
  // Create the downloaded files on disk when they complete
  void SetMaterializeFiles(bool enabled);

  // Manual mode controls
  void EmitProgress(TransferId id, uint64_t bytes_transferred);
  void EmitComplete(TransferId id);
  void EmitFailure(TransferId id, const std::string &error);
  void EmitCancelled(TransferId id);
  void DropConnection(const std::string &reason);

  // Introspection
  int connect_attempts() const;
  int cancel_requests(TransferId id) const;
  std::vector<std::string> search_queries() const;
  std::vector<DownloadRequest> downloads() const;
  std::optional<DownloadRequest> download(TransferId id) const;
  size_t in_flight() const;

  static std::string LocalPathFor(const std::string &download_dir,
                                  const std::string &remote_path);

private:
  void emit(const ProtocolEvent &event);
  ProtocolEvent completion_event(TransferId id);

  mutable std::mutex mutex_;
  bool connected_{false};
  bool auto_complete_{true};
  bool ack_cancels_{true};
  bool materialize_files_{false};
  bool connect_succeeds_{true};
  std::string connect_error_;
  int connect_attempts_{0};

  std::vector<SharedFile> files_;
  std::set<std::string> failing_paths_;
  std::vector<std::string> search_queries_;
  std::map<TransferId, DownloadRequest> downloads_;
  std::set<TransferId> in_flight_;
  std::map<TransferId, int> cancel_requests_;

  std::mutex callback_mutex_;
  ProtocolEventCallback event_callback_;
  ConnectionLostCallback connection_lost_callback_;
};

} // namespace transfer
} // namespace discofill

#endif // DISCOFILL_TRANSFER_SIMULATED_PROTOCOL_CLIENT_HPP
