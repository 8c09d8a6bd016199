#ifndef DISCOFILL_TRANSFER_NULL_PROTOCOL_CLIENT_HPP
#define DISCOFILL_TRANSFER_NULL_PROTOCOL_CLIENT_HPP

#include "transfer/protocol_client.hpp"
#include <functional>
#include <mutex>
#include <string>

namespace discofill {
namespace transfer {

/**
 * NullProtocolClient - stand-in when no P2P library is available
 *
 * Never connects. A search is answered with a human readable instruction
 * (how to run the same search by hand in a standalone client) delivered to
 * the instruction sink; downloads fail immediately.
 */
class NullProtocolClient : public ProtocolClient {
public:
  using InstructionSink = std::function<void(const std::string &message)>;

  explicit NullProtocolClient(InstructionSink sink = nullptr);
  ~NullProtocolClient() override = default;

  void connect(const Credentials &credentials,
               ConnectCallback callback) override;
  void disconnect() override {}
  bool is_connected() const override { return false; }
  bool search(SessionId session, const std::string &query,
              SearchResultCallback callback) override;
  bool request_download(TransferId transfer_id, const std::string &peer,
                        const std::string &remote_path,
                        const std::string &download_dir) override;
  bool browse_folder(const std::string &peer, const std::string &folder,
                     BrowseCallback callback) override;
  void cancel(TransferId transfer_id) override;
  void set_event_callback(ProtocolEventCallback callback) override;
  void set_connection_lost_callback(ConnectionLostCallback) override {}
  std::string name() const override { return "null"; }

  static constexpr const char *UNAVAILABLE_REASON =
      "P2P protocol library not available";

  // Text shown for a search that cannot be run here
  static std::string ManualSearchInstruction(const std::string &query);

private:
  void emit(const ProtocolEvent &event);

  InstructionSink sink_;
  std::mutex callback_mutex_;
  ProtocolEventCallback event_callback_;
};

} // namespace transfer
} // namespace discofill

#endif // DISCOFILL_TRANSFER_NULL_PROTOCOL_CLIENT_HPP
