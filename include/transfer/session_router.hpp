#pragma once

#include "transfer/types.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace discofill {
namespace transfer {

enum class SessionEventType {
  SearchResult,   // one result for the session's search
  TransferUpdate, // state/progress change of one of the session's transfers
  MatchUpdate,    // auto-matching progress or outcome
  Status,         // human-readable status line
};

const char *ToString(SessionEventType type);

struct SessionEvent {
  SessionEventType type{SessionEventType::Status};
  SessionId session_id{INVALID_ID};
  std::optional<SearchResult> result;
  std::optional<Transfer> transfer; // registry entry after the change
  std::string message;
};

using SessionCallback = std::function<void(const SessionEvent &event)>;

/**
 * SessionRouter - demultiplexes engine events to the sessions that own them
 *
 * Every event is tagged with a session id and delivered only to callbacks
 * subscribed to exactly that id. Publishing to a session nobody listens to is
 * a no-op: a dialog may close while its search or download still finishes.
 *
 * Queue subscribers (SubscribeQueue) are session independent and receive
 * TransferUpdate events of every session; they never see search results or
 * status messages.
 *
 * Thread-safety: all methods may be called from any thread. Callbacks run on
 * the publishing thread, outside the router lock, so a callback may itself
 * subscribe or unsubscribe. Once Unsubscribe() returns, the callback will not
 * be invoked again (a callback unsubscribing itself returns immediately).
 */
class SessionRouter {
private:
  struct Entry;
  struct State;

public:
  using SubscriptionId = uint64_t;

  /**
   * RAII subscription handle; unsubscribes on destruction
   * Safe to outlive the router.
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    // Idempotent
    void Unsubscribe();

    bool active() const { return id_ != 0; }
    SubscriptionId id() const { return id_; }

  private:
    friend class SessionRouter;
    Subscription(std::weak_ptr<State> state, SubscriptionId id);

    std::weak_ptr<State> state_;
    SubscriptionId id_{0};
  };

  SessionRouter();
  ~SessionRouter();

  SessionRouter(const SessionRouter &) = delete;
  SessionRouter &operator=(const SessionRouter &) = delete;

  [[nodiscard]] Subscription Subscribe(SessionId session,
                                       SessionCallback callback);
  [[nodiscard]] Subscription SubscribeQueue(SessionCallback callback);

  void Publish(SessionId session, const SessionEvent &event);

  // Convenience wrappers around Publish
  void PublishStatus(SessionId session, const std::string &message);
  void PublishTransfer(SessionEventType type, const Transfer &transfer);

  size_t SubscriberCount(SessionId session) const;

private:
  static void Unsubscribe(const std::shared_ptr<State> &state,
                          SubscriptionId id);
  static void Deliver(const std::vector<std::shared_ptr<Entry>> &entries,
                      const SessionEvent &event);

  std::shared_ptr<State> state_;
};

} // namespace transfer
} // namespace discofill
