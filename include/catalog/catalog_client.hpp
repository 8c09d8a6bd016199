#ifndef DISCOFILL_CATALOG_CATALOG_CLIENT_HPP
#define DISCOFILL_CATALOG_CATALOG_CLIENT_HPP

#include "catalog/catalog_node.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace discofill {
namespace catalog {

/**
 * Error from the catalog service
 *
 * transient() is true for failures worth retrying (HTTP 429, 5xx, network
 * errors); permanent failures (other 4xx, unparseable bodies) are not.
 */
class CatalogError : public std::runtime_error {
public:
  CatalogError(const std::string &what, int http_status, bool transient)
      : std::runtime_error(what), http_status_(http_status),
        transient_(transient) {}

  int http_status() const { return http_status_; } // 0 if no HTTP response
  bool transient() const { return transient_; }

private:
  int http_status_;
  bool transient_;
};

// One offset/limit page of results
struct Page {
  std::vector<CatalogNode> items;
  std::optional<uint64_t> total; // total result count, when the service says
  bool end_of_results{false};    // explicit end marker
  // Entries the service returned, including ones the parser had to skip.
  // Paging advances by this, so 0 means "same as items.size()".
  size_t raw_count{0};
};

/**
 * Read-only paged catalog service
 *
 * Calls are blocking and throw CatalogError on failure.
 */
class CatalogClient {
public:
  virtual ~CatalogClient() = default;

  virtual Page FetchReleaseGroups(const std::string &artist_id, uint32_t offset,
                                  uint32_t limit) = 0;
  virtual Page FetchReleases(const std::string &release_group_id,
                             uint32_t offset, uint32_t limit) = 0;
  // Best matches first
  virtual std::vector<ArtistMatch> SearchArtist(const std::string &name) = 0;
};

} // namespace catalog
} // namespace discofill

#endif // DISCOFILL_CATALOG_CATALOG_CLIENT_HPP
