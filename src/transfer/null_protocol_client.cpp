#include "transfer/null_protocol_client.hpp"
#include "util/logging.hpp"

namespace discofill {
namespace transfer {

NullProtocolClient::NullProtocolClient(InstructionSink sink)
    : sink_(std::move(sink)) {}

std::string NullProtocolClient::ManualSearchInstruction(const std::string &query) {
  return "P2P library not available. Search manually in your P2P client for: " +
         query;
}

void NullProtocolClient::connect(const Credentials &credentials,
                                 ConnectCallback callback) {
  LOG_XFER_DEBUG("Null backend: refusing login for {}", credentials.username);
  if (callback) {
    callback(false, UNAVAILABLE_REASON);
  }
}

bool NullProtocolClient::search(SessionId session, const std::string &query,
                                SearchResultCallback) {
  const std::string instruction = ManualSearchInstruction(query);
  LOG_SEARCH_INFO("Session {}: {}", session, instruction);
  if (sink_) {
    sink_(instruction);
  }
  // Accepted, but no results will ever arrive
  return true;
}

bool NullProtocolClient::request_download(TransferId transfer_id,
                                          const std::string &peer,
                                          const std::string &remote_path,
                                          const std::string &) {
  LOG_XFER_DEBUG("Null backend: cannot download {} from {}", remote_path, peer);
  ProtocolEvent event;
  event.type = ProtocolEventType::Failed;
  event.transfer_id = transfer_id;
  event.error = UNAVAILABLE_REASON;
  emit(event);
  return true;
}

bool NullProtocolClient::browse_folder(const std::string &,
                                       const std::string &folder,
                                       BrowseCallback callback) {
  if (callback) {
    FolderManifest manifest;
    manifest.folder = folder;
    callback(false, manifest, UNAVAILABLE_REASON);
  }
  return true;
}

void NullProtocolClient::cancel(TransferId transfer_id) {
  ProtocolEvent event;
  event.type = ProtocolEventType::Cancelled;
  event.transfer_id = transfer_id;
  emit(event);
}

void NullProtocolClient::set_event_callback(ProtocolEventCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  event_callback_ = std::move(callback);
}

void NullProtocolClient::emit(const ProtocolEvent &event) {
  ProtocolEventCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = event_callback_;
  }
  if (callback) {
    callback(event);
  }
}

} // namespace transfer
} // namespace discofill
