#pragma once

#include "catalog/catalog_client.hpp"
#include "catalog/catalog_node.hpp"
#include "catalog/rate_limiter.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace discofill {
namespace catalog {

/**
 * Best-effort discography of one artist
 *
 * nodes: release groups and (optionally) releases, unique by id, in the
 *        order they were first seen
 * truncated: some page could not be fetched; nodes holds everything that was
 * errors: one message per abandoned branch
 */
struct DiscographyResult {
  std::string artist_id;
  std::vector<CatalogNode> nodes;
  bool truncated{false};
  std::vector<std::string> errors;
  size_t release_group_requests{0};
  size_t release_requests{0};

  size_t total_requests() const {
    return release_group_requests + release_requests;
  }
};

/**
 * DiscographyPaginator - walks the catalog's artist -> release group ->
 * release tree with offset/limit paging
 *
 * A listing ends at the first page shorter than the limit, at an explicit
 * end marker, or once offset + count reaches the reported total. Every
 * request passes through the rate limiter. A page failing with a transient
 * CatalogError is retried with exponential backoff up to max_page_attempts;
 * a permanent error or exhausted retries abandons only that listing (the
 * artist's release groups, or one group's releases) and marks the result
 * truncated.
 *
 * Passing a shared RateLimiter spaces requests across every paginator that
 * holds it; without one the paginator paces only its own requests.
 *
 * Blocking; run it on a worker thread.
 */
class DiscographyPaginator {
public:
  struct Options {
    uint32_t limit;
    bool include_releases;
    uint32_t max_releases_per_group; // 0 = no cap
    int max_page_attempts;
    std::chrono::milliseconds base_backoff;
    std::chrono::milliseconds max_backoff;
    std::chrono::milliseconds min_request_interval;

    Options()
        : limit(100), include_releases(true), max_releases_per_group(0),
          max_page_attempts(3), base_backoff(std::chrono::milliseconds(1000)),
          max_backoff(std::chrono::milliseconds(8000)),
          min_request_interval(std::chrono::milliseconds(1000)) {}
  };

  DiscographyPaginator(CatalogClient &client, const Options &options = Options{},
                       RateLimiter::Sleeper sleeper = nullptr,
                       std::shared_ptr<RateLimiter> rate_limiter = nullptr);

  DiscographyResult FetchAll(const std::string &artist_id);

  // Resolve the name with the catalog's artist search, then FetchAll() the
  // best match. Throws CatalogError if the search fails or finds nothing.
  DiscographyResult FetchAllByName(const std::string &artist_name);

  const Options &options() const { return options_; }

private:
  enum class Listing { ReleaseGroups, Releases };

  // Pages one listing into result; returns false if it was abandoned
  bool walk(Listing listing, const std::string &parent_id, uint32_t cap,
            DiscographyResult &result, std::unordered_set<std::string> &seen,
            std::vector<std::string> *new_group_ids);
  bool fetch_page(Listing listing, const std::string &parent_id,
                  uint32_t offset, uint32_t limit, DiscographyResult &result,
                  Page &page);

  CatalogClient &client_;
  Options options_;
  RateLimiter::Sleeper sleeper_;
  std::shared_ptr<RateLimiter> rate_limiter_;
};

} // namespace catalog
} // namespace discofill
