// Copyright (c) 2024 Discofill
// Distributed under the MIT software license

#ifndef DISCOFILL_TRANSFER_TYPES_HPP
#define DISCOFILL_TRANSFER_TYPES_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace discofill {
namespace transfer {

using TransferId = uint64_t;
using SessionId = uint64_t;
using GroupId = uint64_t;

// 0 is never allocated for any of the id types
constexpr uint64_t INVALID_ID = 0;

enum class TransferState {
  Queued,
  InProgress,
  Completed,
  Failed,
  Cancelled,
};

// Attachment of a completed file to its destination, tracked apart from the
// download itself: a Completed transfer may still have a Failed match.
enum class MatchStatus {
  NotAttempted,
  Pending,
  Success,
  Failed,
};

enum class AttachResult {
  Success,
  Retryable, // destination not ready yet (e.g. album still loading)
  Fatal,     // destination gone for good
};

enum class QualityTier {
  High,
  Medium,
  Low,
};

const char *ToString(TransferState state);
const char *ToString(MatchStatus status);
const char *ToString(AttachResult result);
const char *ToString(QualityTier tier);

inline bool IsTerminal(TransferState state) {
  return state == TransferState::Completed || state == TransferState::Failed ||
         state == TransferState::Cancelled;
}

// Queued -> InProgress -> {Completed | Failed | Cancelled}; Queued may also
// end directly in Failed or Cancelled. Nothing leaves a terminal state.
bool IsValidTransition(TransferState from, TransferState to);

/**
 * Destination - where a completed download should land
 *
 * Implemented by the host (e.g. "track slot of this album, which may still be
 * loading"). The engine never looks inside; it only calls these two methods,
 * always from its own threads.
 */
class Destination {
public:
  virtual ~Destination() = default;

  virtual AttachResult AttachFile(const std::string &local_path) = 0;

  // Fire-and-forget follow-up after a successful attach (fingerprinting)
  virtual void TriggerAnalysis(const std::string &local_path) = 0;

  // For logs and the queue view
  virtual std::string Describe() const { return "<destination>"; }
};

using DestinationPtr = std::shared_ptr<Destination>;

struct Transfer {
  TransferId id{INVALID_ID};
  SessionId session_id{INVALID_ID};
  GroupId group_id{INVALID_ID}; // INVALID_ID for single-file downloads
  std::string peer;
  std::string remote_path;
  std::string local_path; // known once the protocol reports completion
  uint64_t size_bytes{0};
  uint64_t bytes_transferred{0};
  TransferState state{TransferState::Queued};
  MatchStatus match_status{MatchStatus::NotAttempted};
  int match_attempts{0};
  std::string error;
  DestinationPtr destination;
  int64_t created_at{0};               // ms since epoch
  std::optional<int64_t> completed_at; // set when a terminal state is reached
};

struct SearchResult {
  SessionId session_id{INVALID_ID};
  std::string peer;
  std::string file_path;
  uint64_t size_bytes{0};
  std::optional<uint32_t> bitrate_kbps;
  bool lossless{false};
  uint32_t queue_length{0};
  uint64_t upload_speed{0}; // bytes per second
  uint64_t sequence{0};     // arrival index inside its session
};

struct FolderEntry {
  std::string remote_path;
  uint64_t size_bytes{0};
};

struct FolderManifest {
  std::string folder; // remote folder, for logging
  std::vector<FolderEntry> files;
};

} // namespace transfer
} // namespace discofill

#endif // DISCOFILL_TRANSFER_TYPES_HPP
