// Copyright (c) 2024 Discofill
// Distributed under the MIT software license

#include "transfer/session_router.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace discofill {
namespace transfer {

const char *ToString(SessionEventType type) {
  switch (type) {
  case SessionEventType::SearchResult:
    return "search-result";
  case SessionEventType::TransferUpdate:
    return "transfer-update";
  case SessionEventType::MatchUpdate:
    return "match-update";
  case SessionEventType::Status:
    return "status";
  }
  return "unknown";
}

// ============================================================================
// Internal state
// ============================================================================

struct SessionRouter::Entry {
  SubscriptionId id{0};
  SessionId session{INVALID_ID}; // INVALID_ID for queue subscribers
  SessionCallback callback;

  // Held while the callback runs; recursive so a callback can unsubscribe
  // itself from inside the call
  std::recursive_mutex call_mutex;
  bool active{true};
};

struct SessionRouter::State {
  mutable std::mutex mutex;
  SubscriptionId next_id{1};
  std::unordered_map<SessionId, std::vector<std::shared_ptr<Entry>>> sessions;
  std::vector<std::shared_ptr<Entry>> queue;
};

// ============================================================================
// SessionRouter::Subscription
// ============================================================================

SessionRouter::Subscription::Subscription(std::weak_ptr<State> state,
                                          SubscriptionId id)
    : state_(std::move(state)), id_(id) {}

SessionRouter::Subscription::~Subscription() { Unsubscribe(); }

SessionRouter::Subscription::Subscription(Subscription &&other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
  other.id_ = 0;
}

SessionRouter::Subscription &
SessionRouter::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    state_ = std::move(other.state_);
    id_ = other.id_;
    other.id_ = 0;
  }
  return *this;
}

void SessionRouter::Subscription::Unsubscribe() {
  if (id_ == 0) {
    return;
  }
  if (auto state = state_.lock()) {
    SessionRouter::Unsubscribe(state, id_);
  }
  state_.reset();
  id_ = 0;
}

// ============================================================================
// SessionRouter
// ============================================================================

SessionRouter::SessionRouter() : state_(std::make_shared<State>()) {}

SessionRouter::~SessionRouter() = default;

SessionRouter::Subscription SessionRouter::Subscribe(SessionId session,
                                                     SessionCallback callback) {
  auto entry = std::make_shared<Entry>();
  entry->session = session;
  entry->callback = std::move(callback);

  std::lock_guard<std::mutex> lock(state_->mutex);
  entry->id = state_->next_id++;
  state_->sessions[session].push_back(entry);

  LOG_XFER_TRACE("SessionRouter: subscription {} for session {}", entry->id,
                 session);
  return Subscription(state_, entry->id);
}

SessionRouter::Subscription
SessionRouter::SubscribeQueue(SessionCallback callback) {
  auto entry = std::make_shared<Entry>();
  entry->callback = std::move(callback);

  std::lock_guard<std::mutex> lock(state_->mutex);
  entry->id = state_->next_id++;
  state_->queue.push_back(entry);
  return Subscription(state_, entry->id);
}

void SessionRouter::Unsubscribe(const std::shared_ptr<State> &state,
                                SubscriptionId id) {
  std::shared_ptr<Entry> removed;
  {
    std::lock_guard<std::mutex> lock(state->mutex);

    auto match = [id](const std::shared_ptr<Entry> &e) { return e->id == id; };

    auto qit = std::find_if(state->queue.begin(), state->queue.end(), match);
    if (qit != state->queue.end()) {
      removed = *qit;
      state->queue.erase(qit);
    } else {
      for (auto it = state->sessions.begin(); it != state->sessions.end();
           ++it) {
        auto &entries = it->second;
        auto eit = std::find_if(entries.begin(), entries.end(), match);
        if (eit != entries.end()) {
          removed = *eit;
          entries.erase(eit);
          if (entries.empty()) {
            state->sessions.erase(it);
          }
          break;
        }
      }
    }
  }

  if (!removed) {
    return; // already gone
  }

  // Wait out an in-flight delivery on another thread
  std::lock_guard<std::recursive_mutex> call_lock(removed->call_mutex);
  removed->active = false;
}

void SessionRouter::Deliver(const std::vector<std::shared_ptr<Entry>> &entries,
                            const SessionEvent &event) {
  for (const auto &entry : entries) {
    std::lock_guard<std::recursive_mutex> call_lock(entry->call_mutex);
    if (!entry->active || !entry->callback) {
      continue;
    }
    try {
      entry->callback(event);
    } catch (const std::exception &e) {
      LOG_XFER_ERROR("SessionRouter: subscriber {} threw on {} event: {}",
                     entry->id, ToString(event.type), e.what());
    }
  }
}

void SessionRouter::Publish(SessionId session, const SessionEvent &event) {
  std::vector<std::shared_ptr<Entry>> targets;
  std::vector<std::shared_ptr<Entry>> queue_targets;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->sessions.find(session);
    if (it != state_->sessions.end()) {
      targets = it->second;
    }
    if (event.type == SessionEventType::TransferUpdate) {
      queue_targets = state_->queue;
    }
  }

  if (targets.empty() && queue_targets.empty()) {
    LOG_XFER_TRACE("SessionRouter: no subscribers for session {} ({})",
                   session, ToString(event.type));
    return;
  }

  SessionEvent tagged = event;
  tagged.session_id = session;
  Deliver(targets, tagged);
  Deliver(queue_targets, tagged);
}

void SessionRouter::PublishStatus(SessionId session,
                                  const std::string &message) {
  SessionEvent event;
  event.type = SessionEventType::Status;
  event.message = message;
  Publish(session, event);
}

void SessionRouter::PublishTransfer(SessionEventType type,
                                    const Transfer &transfer) {
  SessionEvent event;
  event.type = type;
  event.transfer = transfer;
  Publish(transfer.session_id, event);
}

size_t SessionRouter::SubscriberCount(SessionId session) const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  auto it = state_->sessions.find(session);
  return it == state_->sessions.end() ? 0 : it->second.size();
}

} // namespace transfer
} // namespace discofill
