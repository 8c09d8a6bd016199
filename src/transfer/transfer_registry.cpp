// Copyright (c) 2024 Discofill
// Distributed under the MIT software license

#include "transfer/transfer_registry.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace discofill {
namespace transfer {

namespace {

// A Completed transfer stays until auto-matching has reached an outcome
bool Evictable(const Transfer &t) {
  if (!IsTerminal(t.state)) {
    return false;
  }
  return !(t.state == TransferState::Completed &&
           (t.match_status == MatchStatus::NotAttempted ||
            t.match_status == MatchStatus::Pending));
}

} // namespace

TransferRegistry::TransferRegistry(size_t max_entries)
    : max_entries_(max_entries == 0 ? DEFAULT_MAX_ENTRIES : max_entries),
      current_(std::make_shared<const Snapshot>()) {}

std::shared_ptr<const TransferRegistry::Snapshot>
TransferRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return current_;
}

void TransferRegistry::publish(std::shared_ptr<const Snapshot> next) {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  current_ = std::move(next);
}

TransferId TransferRegistry::Add(Transfer transfer) {
  std::lock_guard<std::mutex> lock(write_mutex_);

  transfer.id = next_id_++;
  transfer.state = TransferState::Queued;
  transfer.match_status = MatchStatus::NotAttempted;
  transfer.match_attempts = 0;
  transfer.created_at = util::GetTimeMillis();
  transfer.completed_at.reset();

  auto next = std::make_shared<Snapshot>(*snapshot());
  const TransferId id = transfer.id;
  (*next)[id] = std::make_shared<const Transfer>(std::move(transfer));
  evict_if_needed(*next, id);
  publish(std::move(next));

  return id;
}

bool TransferRegistry::Update(TransferId id,
                              const std::function<void(Transfer &)> &mutator) {
  std::lock_guard<std::mutex> lock(write_mutex_);

  auto current = snapshot();
  auto it = current->find(id);
  if (it == current->end()) {
    return false;
  }

  Transfer updated = *it->second;
  mutator(updated);
  // id and state are owned by Add/Transition
  updated.id = it->second->id;
  updated.state = it->second->state;

  auto next = std::make_shared<Snapshot>(*current);
  (*next)[id] = std::make_shared<const Transfer>(std::move(updated));
  publish(std::move(next));
  return true;
}

bool TransferRegistry::Transition(
    TransferId id, TransferState to,
    const std::function<void(Transfer &)> &mutator) {
  std::lock_guard<std::mutex> lock(write_mutex_);

  auto current = snapshot();
  auto it = current->find(id);
  if (it == current->end()) {
    return false;
  }

  const TransferState from = it->second->state;
  if (!IsValidTransition(from, to)) {
    LOG_XFER_TRACE("Registry: rejected transition {} -> {} for transfer {}",
                   ToString(from), ToString(to), id);
    return false;
  }

  Transfer updated = *it->second;
  if (mutator) {
    mutator(updated);
  }
  updated.id = id;
  updated.state = to;
  if (IsTerminal(to)) {
    updated.completed_at = util::GetTimeMillis();
  }

  auto next = std::make_shared<Snapshot>(*current);
  (*next)[id] = std::make_shared<const Transfer>(std::move(updated));
  if (IsTerminal(to)) {
    evict_if_needed(*next, id);
  }
  publish(std::move(next));
  return true;
}

void TransferRegistry::evict_if_needed(Snapshot &snap, TransferId keep) const {
  if (snap.size() <= max_entries_) {
    return;
  }

  size_t evicted = 0;
  for (auto it = snap.begin(); it != snap.end() && snap.size() > max_entries_;) {
    if (it->first != keep && Evictable(*it->second)) {
      it = snap.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }

  if (evicted > 0) {
    LOG_XFER_DEBUG("Registry: evicted {} terminal transfers (bound {})",
                   evicted, max_entries_);
  }
}

std::optional<Transfer> TransferRegistry::Get(TransferId id) const {
  auto snap = snapshot();
  auto it = snap->find(id);
  if (it == snap->end()) {
    return std::nullopt;
  }
  return *it->second;
}

template <typename Pred>
std::vector<Transfer> TransferRegistry::collect(Pred pred) const {
  auto snap = snapshot();
  std::vector<Transfer> out;
  out.reserve(snap->size());
  for (const auto &[id, entry] : *snap) {
    if (pred(*entry)) {
      out.push_back(*entry);
    }
  }
  return out;
}

std::vector<Transfer> TransferRegistry::ListAll() const {
  return collect([](const Transfer &) { return true; });
}

std::vector<Transfer> TransferRegistry::ListBySession(SessionId session) const {
  return collect(
      [session](const Transfer &t) { return t.session_id == session; });
}

std::vector<Transfer> TransferRegistry::ListByGroup(GroupId group) const {
  if (group == INVALID_ID) {
    return {};
  }
  return collect([group](const Transfer &t) { return t.group_id == group; });
}

std::vector<TransferId> TransferRegistry::ActiveIds() const {
  auto snap = snapshot();
  std::vector<TransferId> ids;
  for (const auto &[id, entry] : *snap) {
    if (!IsTerminal(entry->state)) {
      ids.push_back(id);
    }
  }
  return ids;
}

size_t TransferRegistry::Size() const { return snapshot()->size(); }

} // namespace transfer
} // namespace discofill
