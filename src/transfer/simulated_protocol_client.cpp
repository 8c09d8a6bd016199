#include "transfer/simulated_protocol_client.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace discofill {
namespace transfer {

namespace {

std::string Lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool MatchesAllWords(const std::string &path, const std::string &query) {
  const std::string haystack = Lowercase(path);
  std::istringstream words(Lowercase(query));
  std::string word;
  bool any = false;
  while (words >> word) {
    any = true;
    if (haystack.find(word) == std::string::npos) {
      return false;
    }
  }
  return any;
}

std::string ParentOf(const std::string &path) {
  auto slash = path.find_last_of("/\\");
  return slash == std::string::npos ? std::string() : path.substr(0, slash);
}

} // namespace

SimulatedProtocolClient::SimulatedProtocolClient() = default;

std::string SimulatedProtocolClient::LocalPathFor(const std::string &download_dir,
                                                  const std::string &remote_path) {
  auto slash = remote_path.find_last_of("/\\");
  const std::string base =
      slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
  return (std::filesystem::path(download_dir) / base).string();
}

// ----------------------------------------------------------------------------
// ProtocolClient interface
// ----------------------------------------------------------------------------

void SimulatedProtocolClient::connect(const Credentials &credentials,
                                      ConnectCallback callback) {
  bool success;
  std::string error;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++connect_attempts_;
    success = connect_succeeds_;
    error = connect_error_.empty() ? "login rejected" : connect_error_;
    connected_ = success;
  }
  LOG_XFER_DEBUG("Simulated login as {}: {}", credentials.username,
                 success ? "ok" : error);
  if (callback) {
    callback(success, success ? std::string() : error);
  }
}

void SimulatedProtocolClient::disconnect() {
  std::lock_guard<std::mutex> lock(mutex_);
  connected_ = false;
  in_flight_.clear();
}

bool SimulatedProtocolClient::is_connected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_;
}

bool SimulatedProtocolClient::search(SessionId session, const std::string &query,
                                     SearchResultCallback callback) {
  std::vector<SearchResult> results;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
      return false;
    }
    search_queries_.push_back(query);
    for (const auto &file : files_) {
      if (!MatchesAllWords(file.path, query)) {
        continue;
      }
      SearchResult result;
      result.session_id = session;
      result.peer = file.peer;
      result.file_path = file.path;
      result.size_bytes = file.size_bytes;
      result.bitrate_kbps = file.bitrate_kbps;
      result.lossless = file.lossless;
      result.queue_length = file.queue_length;
      result.upload_speed = file.upload_speed;
      results.push_back(std::move(result));
    }
  }

  if (callback) {
    for (const auto &result : results) {
      callback(result);
    }
  }
  return true;
}

bool SimulatedProtocolClient::request_download(TransferId transfer_id,
                                               const std::string &peer,
                                               const std::string &remote_path,
                                               const std::string &download_dir) {
  bool auto_complete;
  bool fails;
  uint64_t size = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
      return false;
    }
    downloads_[transfer_id] =
        DownloadRequest{transfer_id, peer, remote_path, download_dir};
    in_flight_.insert(transfer_id);
    auto_complete = auto_complete_;
    fails = failing_paths_.count(remote_path) > 0;
    for (const auto &file : files_) {
      if (file.peer == peer && file.path == remote_path) {
        size = file.size_bytes;
        break;
      }
    }
  }

  if (!auto_complete) {
    return true;
  }

  ProtocolEvent progress;
  progress.type = ProtocolEventType::Progress;
  progress.transfer_id = transfer_id;
  progress.bytes_transferred = size / 2;
  progress.total_bytes = size;
  emit(progress);

  if (fails) {
    EmitFailure(transfer_id, "peer closed the transfer");
  } else {
    EmitComplete(transfer_id);
  }
  return true;
}

bool SimulatedProtocolClient::browse_folder(const std::string &peer,
                                            const std::string &folder,
                                            BrowseCallback callback) {
  FolderManifest manifest;
  manifest.folder = folder;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
      return false;
    }
    for (const auto &file : files_) {
      if (file.peer == peer && ParentOf(file.path) == folder) {
        manifest.files.push_back(FolderEntry{file.path, file.size_bytes});
      }
    }
  }

  if (callback) {
    if (manifest.files.empty()) {
      callback(false, manifest, "folder not shared by " + peer);
    } else {
      callback(true, manifest, "");
    }
  }
  return true;
}

void SimulatedProtocolClient::cancel(TransferId transfer_id) {
  bool ack;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++cancel_requests_[transfer_id];
    ack = ack_cancels_ && in_flight_.count(transfer_id) > 0;
  }
  if (ack) {
    EmitCancelled(transfer_id);
  }
}

void SimulatedProtocolClient::set_event_callback(ProtocolEventCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  event_callback_ = std::move(callback);
}

void SimulatedProtocolClient::set_connection_lost_callback(
    ConnectionLostCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  connection_lost_callback_ = std::move(callback);
}

// ----------------------------------------------------------------------------
// Setup
// ----------------------------------------------------------------------------

void SimulatedProtocolClient::AddFile(const SharedFile &file) {
  std::lock_guard<std::mutex> lock(mutex_);
  files_.push_back(file);
}

void SimulatedProtocolClient::AddFile(const std::string &peer,
                                      const std::string &path,
                                      uint64_t size_bytes,
                                      std::optional<uint32_t> bitrate_kbps,
                                      bool lossless) {
  SharedFile file;
  file.peer = peer;
  file.path = path;
  file.size_bytes = size_bytes;
  file.bitrate_kbps = bitrate_kbps;
  file.lossless = lossless;
  AddFile(file);
}

void SimulatedProtocolClient::FailFile(const std::string &remote_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  failing_paths_.insert(remote_path);
}

void SimulatedProtocolClient::SetAutoComplete(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto_complete_ = enabled;
}

void SimulatedProtocolClient::SetConnectOutcome(bool success,
                                                const std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  connect_succeeds_ = success;
  connect_error_ = error;
}

void SimulatedProtocolClient::SetAckCancels(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  ack_cancels_ = enabled;
}

void SimulatedProtocolClient::SetMaterializeFiles(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  materialize_files_ = enabled;
}

// ----------------------------------------------------------------------------
// Manual mode
// ----------------------------------------------------------------------------

void SimulatedProtocolClient::EmitProgress(TransferId id,
                                           uint64_t bytes_transferred) {
  ProtocolEvent event;
  event.type = ProtocolEventType::Progress;
  event.transfer_id = id;
  event.bytes_transferred = bytes_transferred;
  emit(event);
}

ProtocolEvent SimulatedProtocolClient::completion_event(TransferId id) {
  ProtocolEvent event;
  event.type = ProtocolEventType::Completed;
  event.transfer_id = id;

  std::lock_guard<std::mutex> lock(mutex_);
  in_flight_.erase(id);
  auto it = downloads_.find(id);
  if (it == downloads_.end()) {
    return event;
  }
  event.local_path = LocalPathFor(it->second.download_dir, it->second.remote_path);
  for (const auto &file : files_) {
    if (file.peer == it->second.peer && file.path == it->second.remote_path) {
      event.total_bytes = file.size_bytes;
      event.bytes_transferred = file.size_bytes;
      break;
    }
  }

  if (materialize_files_) {
    std::error_code ec;
    std::filesystem::create_directories(it->second.download_dir, ec);
    std::ofstream out(event.local_path, std::ios::binary | std::ios::trunc);
    if (!ec && out) {
      out << "simulated " << it->second.remote_path << " from "
          << it->second.peer << "\n";
    } else {
      LOG_XFER_WARN("Simulated backend could not write {}", event.local_path);
    }
  }
  return event;
}

void SimulatedProtocolClient::EmitComplete(TransferId id) {
  emit(completion_event(id));
}

void SimulatedProtocolClient::EmitFailure(TransferId id,
                                          const std::string &error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(id);
  }
  ProtocolEvent event;
  event.type = ProtocolEventType::Failed;
  event.transfer_id = id;
  event.error = error;
  emit(event);
}

void SimulatedProtocolClient::EmitCancelled(TransferId id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(id);
  }
  ProtocolEvent event;
  event.type = ProtocolEventType::Cancelled;
  event.transfer_id = id;
  emit(event);
}

void SimulatedProtocolClient::DropConnection(const std::string &reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
    in_flight_.clear();
  }
  ConnectionLostCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = connection_lost_callback_;
  }
  if (callback) {
    callback(reason);
  }
}

void SimulatedProtocolClient::emit(const ProtocolEvent &event) {
  ProtocolEventCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = event_callback_;
  }
  if (callback) {
    callback(event);
  }
}

// ----------------------------------------------------------------------------
// Introspection
// ----------------------------------------------------------------------------

int SimulatedProtocolClient::connect_attempts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connect_attempts_;
}

int SimulatedProtocolClient::cancel_requests(TransferId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cancel_requests_.find(id);
  return it == cancel_requests_.end() ? 0 : it->second;
}

std::vector<std::string> SimulatedProtocolClient::search_queries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return search_queries_;
}

std::vector<SimulatedProtocolClient::DownloadRequest>
SimulatedProtocolClient::downloads() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DownloadRequest> out;
  out.reserve(downloads_.size());
  for (const auto &[id, request] : downloads_) {
    out.push_back(request);
  }
  return out;
}

std::optional<SimulatedProtocolClient::DownloadRequest>
SimulatedProtocolClient::download(TransferId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = downloads_.find(id);
  if (it == downloads_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t SimulatedProtocolClient::in_flight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_.size();
}

} // namespace transfer
} // namespace discofill
