#pragma once

/*
 TransferRegistry: process-wide record of every transfer the engine started

 Purpose
 - Source of truth for the global queue view (session independent)
 - Lookup by id, by session, by folder group

 Storage
 - Copy-on-write: the current contents are an immutable Snapshot held by
   shared_ptr. Readers copy the pointer under snapshot_mutex_ (O(1)) and then
   work on a structure nobody mutates, so a reader always sees a consistent
   state and never waits for a writer's copy/update work.
 - Writers are serialized by write_mutex_, build the next Snapshot from the
   current one and publish it with a pointer swap.
 - Entries are themselves immutable (shared_ptr<const Transfer>); an update
   replaces the entry.

 Retention
 - Entries live for the process lifetime, except that once Size() exceeds
   max_entries the oldest terminal transfers are evicted. Never evicted:
   non-terminal transfers, Completed transfers whose match has no outcome yet
   (NotAttempted or Pending), and the entry the evicting write just touched.
   The bound is soft while many transfers are active.

 State machine
 - Transition() enforces IsValidTransition(); a rejected transition leaves the
   entry untouched and returns false. This is what makes racing terminal
   events (cancel vs completion) resolve to whichever arrived first.
*/

#include "transfer/types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace discofill {
namespace transfer {

class TransferRegistry {
public:
  static constexpr size_t DEFAULT_MAX_ENTRIES = 5000;

  explicit TransferRegistry(size_t max_entries = DEFAULT_MAX_ENTRIES);

  /**
   * Insert a new transfer in Queued state
   * Assigns id and created_at; any id/state in `transfer` is overwritten.
   * Safe to call from any thread.
   */
  TransferId Add(Transfer transfer);

  /**
   * Apply `mutator` to a copy of the entry and publish the result
   * The mutator must not change id or state (use Transition for state).
   * Returns false if the id is unknown.
   */
  bool Update(TransferId id, const std::function<void(Transfer &)> &mutator);

  /**
   * Move an entry to `to`, applying `mutator` in the same publish step
   * Returns false (and changes nothing) for unknown ids or invalid transitions.
   * Reaching a terminal state stamps completed_at.
   */
  bool Transition(TransferId id, TransferState to,
                  const std::function<void(Transfer &)> &mutator = nullptr);

  std::optional<Transfer> Get(TransferId id) const;

  // Ordered by creation (oldest first)
  std::vector<Transfer> ListAll() const;
  std::vector<Transfer> ListBySession(SessionId session) const;
  std::vector<Transfer> ListByGroup(GroupId group) const;

  // Ids of transfers that are not terminal yet, oldest first
  std::vector<TransferId> ActiveIds() const;

  size_t Size() const;
  size_t max_entries() const { return max_entries_; }

private:
  // Ids are allocated in creation order, so a map keyed by id is also
  // ordered by created_at.
  using Snapshot = std::map<TransferId, std::shared_ptr<const Transfer>>;

  std::shared_ptr<const Snapshot> snapshot() const;
  void publish(std::shared_ptr<const Snapshot> next);
  // `keep` is the entry written by the current call
  void evict_if_needed(Snapshot &snap, TransferId keep) const;

  template <typename Pred>
  std::vector<Transfer> collect(Pred pred) const;

  const size_t max_entries_;

  std::mutex write_mutex_;
  TransferId next_id_{1};

  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const Snapshot> current_;
};

} // namespace transfer
} // namespace discofill
