// Copyright (c) 2024 Discofill
// Distributed under the MIT software license

#include "transfer/types.hpp"

namespace discofill {
namespace transfer {

const char *ToString(TransferState state) {
  switch (state) {
  case TransferState::Queued:
    return "queued";
  case TransferState::InProgress:
    return "in-progress";
  case TransferState::Completed:
    return "completed";
  case TransferState::Failed:
    return "failed";
  case TransferState::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

const char *ToString(MatchStatus status) {
  switch (status) {
  case MatchStatus::NotAttempted:
    return "not-attempted";
  case MatchStatus::Pending:
    return "pending";
  case MatchStatus::Success:
    return "success";
  case MatchStatus::Failed:
    return "failed";
  }
  return "unknown";
}

const char *ToString(AttachResult result) {
  switch (result) {
  case AttachResult::Success:
    return "success";
  case AttachResult::Retryable:
    return "retryable";
  case AttachResult::Fatal:
    return "fatal";
  }
  return "unknown";
}

const char *ToString(QualityTier tier) {
  switch (tier) {
  case QualityTier::High:
    return "high";
  case QualityTier::Medium:
    return "medium";
  case QualityTier::Low:
    return "low";
  }
  return "unknown";
}

bool IsValidTransition(TransferState from, TransferState to) {
  if (IsTerminal(from)) {
    return false;
  }

  switch (to) {
  case TransferState::Queued:
    return false;
  case TransferState::InProgress:
    return from == TransferState::Queued;
  case TransferState::Completed:
    // A completion always passes through InProgress first
    return from == TransferState::InProgress;
  case TransferState::Failed:
  case TransferState::Cancelled:
    return true;
  }
  return false;
}

} // namespace transfer
} // namespace discofill
