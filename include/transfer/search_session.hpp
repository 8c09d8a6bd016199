// Copyright (c) 2024 Discofill
// Distributed under the MIT software license

#ifndef DISCOFILL_TRANSFER_SEARCH_SESSION_HPP
#define DISCOFILL_TRANSFER_SEARCH_SESSION_HPP

#include "transfer/types.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace discofill {
namespace transfer {

/**
 * Quality tier of a search result, for presentation (ordering, colouring)
 * only; never used to pick what gets downloaded.
 *
 *   lossless or >= 320 kbps  -> High
 *   192 .. 319 kbps          -> Medium
 *   < 192 kbps               -> Low
 *
 * Without a reported bitrate: a lossless extension or "320" in the file name
 * counts as High, anything else as Medium.
 */
QualityTier ClassifyQuality(const SearchResult &result);

bool HasLosslessExtension(const std::string &path);

enum class SortKey {
  Arrival,
  Size,
  Speed,
  Quality,
  QueueLength,
};

struct SortOrder {
  SortKey key{SortKey::Arrival};
  bool descending{false};
};

/**
 * Stable view of `results` under `order`; ties keep arrival order.
 * Pure: the input is not modified.
 */
std::vector<SearchResult> SortResults(const std::vector<SearchResult> &results,
                                      const SortOrder &order);

/**
 * SearchSession - one user-initiated search and its accumulated results
 *
 * Results are appended by the orchestrator thread and read by callers, so
 * the buffer is mutex protected. Sorting never reorders the buffer itself.
 */
class SearchSession {
public:
  SearchSession(SessionId id, std::string query);

  SessionId id() const { return id_; }
  std::string query() const;

  /**
   * Append a result, stamping its arrival sequence
   * Returns the stored copy.
   */
  SearchResult Append(SearchResult result);

  /**
   * Append only while `generation` is still current
   * Results from a query that has since been replaced return nullopt.
   */
  std::optional<SearchResult> AppendIfCurrent(uint64_t generation,
                                              SearchResult result);

  // Arrival order
  std::vector<SearchResult> Results() const;
  std::vector<SearchResult> Sorted(const SortOrder &order) const;

  size_t ResultCount() const;

  // Drop accumulated results before re-running the search; returns the
  // generation the new query's results must carry
  uint64_t Reset(std::string query);

  uint64_t generation() const;

private:
  const SessionId id_;

  mutable std::mutex mutex_;
  std::string query_;
  std::vector<SearchResult> results_;
  uint64_t next_sequence_{0};
  uint64_t generation_{0};
};

} // namespace transfer
} // namespace discofill

#endif // DISCOFILL_TRANSFER_SEARCH_SESSION_HPP
