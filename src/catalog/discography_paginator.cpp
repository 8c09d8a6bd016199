#include "catalog/discography_paginator.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <thread>

namespace discofill {
namespace catalog {

const char *ToString(NodeType type) {
  switch (type) {
  case NodeType::ReleaseGroup:
    return "release-group";
  case NodeType::Release:
    return "release";
  }
  return "unknown";
}

DiscographyPaginator::DiscographyPaginator(CatalogClient &client,
                                           const Options &options,
                                           RateLimiter::Sleeper sleeper,
                                           std::shared_ptr<RateLimiter> rate_limiter)
    : client_(client), options_(options), sleeper_(std::move(sleeper)),
      rate_limiter_(std::move(rate_limiter)) {
  if (!rate_limiter_) {
    rate_limiter_ =
        std::make_shared<RateLimiter>(options_.min_request_interval, sleeper_);
  }
  if (options_.limit == 0) {
    options_.limit = 1;
  }
  if (options_.max_page_attempts < 1) {
    options_.max_page_attempts = 1;
  }
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

DiscographyResult DiscographyPaginator::FetchAll(const std::string &artist_id) {
  DiscographyResult result;
  result.artist_id = artist_id;
  std::unordered_set<std::string> seen;

  LOG_CATALOG_INFO("Loading discography for artist {}", artist_id);

  std::vector<std::string> groups;
  walk(Listing::ReleaseGroups, artist_id, 0, result, seen, &groups);

  if (options_.include_releases) {
    for (const auto &group_id : groups) {
      walk(Listing::Releases, group_id, options_.max_releases_per_group, result,
           seen, nullptr);
    }
  }

  LOG_CATALOG_INFO("Artist {}: {} nodes from {} requests{}", artist_id,
                   result.nodes.size(), result.total_requests(),
                   result.truncated ? " (truncated)" : "");
  return result;
}

DiscographyResult
DiscographyPaginator::FetchAllByName(const std::string &artist_name) {
  rate_limiter_->Acquire();
  auto matches = client_.SearchArtist(artist_name);
  if (matches.empty()) {
    throw CatalogError("no artist found for '" + artist_name + "'", 0, false);
  }
  const auto &best = matches.front();
  LOG_CATALOG_INFO("Artist '{}' resolved to {} ({}, score {})", artist_name,
                   best.id, best.name, best.score);
  return FetchAll(best.id);
}

bool DiscographyPaginator::walk(Listing listing, const std::string &parent_id,
                                uint32_t cap, DiscographyResult &result,
                                std::unordered_set<std::string> &seen,
                                std::vector<std::string> *new_group_ids) {
  uint32_t offset = 0;
  uint32_t taken = 0;

  while (true) {
    uint32_t limit = options_.limit;
    if (cap > 0) {
      limit = std::min(limit, cap - taken);
    }

    Page page;
    if (!fetch_page(listing, parent_id, offset, limit, result, page)) {
      return false;
    }

    // Entries skipped by the parser still occupy their offsets
    const auto count =
        static_cast<uint32_t>(std::max(page.raw_count, page.items.size()));
    for (auto &node : page.items) {
      if (!seen.insert(node.id).second) {
        LOG_CATALOG_DEBUG("Duplicate {} {} at offset {}", ToString(node.type),
                          node.id, offset);
        continue;
      }
      if (listing == Listing::Releases && !node.parent_id) {
        node.parent_id = parent_id;
      }
      if (new_group_ids) {
        new_group_ids->push_back(node.id);
      }
      result.nodes.push_back(std::move(node));
    }
    taken += count;

    if (count < limit || page.end_of_results ||
        (page.total && offset + count >= *page.total) ||
        (cap > 0 && taken >= cap)) {
      return true;
    }
    offset += count;
  }
}

bool DiscographyPaginator::fetch_page(Listing listing,
                                      const std::string &parent_id,
                                      uint32_t offset, uint32_t limit,
                                      DiscographyResult &result, Page &page) {
  const char *what =
      listing == Listing::ReleaseGroups ? "release groups" : "releases";

  for (int attempt = 1; attempt <= options_.max_page_attempts; ++attempt) {
    rate_limiter_->Acquire();
    if (listing == Listing::ReleaseGroups) {
      ++result.release_group_requests;
    } else {
      ++result.release_requests;
    }

    try {
      page = listing == Listing::ReleaseGroups
                 ? client_.FetchReleaseGroups(parent_id, offset, limit)
                 : client_.FetchReleases(parent_id, offset, limit);
      return true;
    } catch (const CatalogError &e) {
      const bool retry = e.transient() && attempt < options_.max_page_attempts;
      LOG_CATALOG_WARN("Fetching {} of {} at offset {} failed (attempt {}/{}, "
                       "HTTP {}): {}",
                       what, parent_id, offset, attempt,
                       options_.max_page_attempts, e.http_status(), e.what());
      if (!retry) {
        result.truncated = true;
        result.errors.push_back(std::string(what) + " of " + parent_id +
                                " at offset " + std::to_string(offset) + ": " +
                                e.what());
        return false;
      }

      const std::chrono::milliseconds delay =
          options_.base_backoff * (1LL << std::min(attempt - 1, 20));
      sleeper_(std::min(delay, options_.max_backoff));
    }
  }
  return false;
}

} // namespace catalog
} // namespace discofill
