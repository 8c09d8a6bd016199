#ifndef DISCOFILL_CATALOG_HTTP_CATALOG_CLIENT_HPP
#define DISCOFILL_CATALOG_HTTP_CATALOG_CLIENT_HPP

#include "catalog/catalog_client.hpp"
#include <boost/asio/io_context.hpp>
#include "version.hpp"
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace discofill {
namespace catalog {

/**
 * HttpCatalogClient - MusicBrainz web service (ws/2, JSON) over Boost.Beast
 *
 * Blocking HTTP/1.1 GET per call, one connection per request, HTTPS when
 * use_tls is set. Response bodies are handed to the static Parse* functions,
 * which are usable on their own.
 *
 * Each stage of a request (connect, TLS handshake, write, read) must finish
 * within Config::timeout.
 *
 * Error mapping: network errors, timeouts, HTTP 429 and 5xx are transient;
 * other non-200 statuses and malformed JSON are permanent.
 */
class HttpCatalogClient : public CatalogClient {
public:
  struct Config {
    std::string host;
    uint16_t port;
    bool use_tls;
    std::string user_agent;
    std::chrono::milliseconds timeout;

    Config()
        : host("musicbrainz.org"), port(443), use_tls(true),
          user_agent(GetUserAgent()), timeout(std::chrono::seconds(30)) {}
  };

  explicit HttpCatalogClient(const Config &config = Config{});
  ~HttpCatalogClient() override;

  Page FetchReleaseGroups(const std::string &artist_id, uint32_t offset,
                          uint32_t limit) override;
  Page FetchReleases(const std::string &release_group_id, uint32_t offset,
                     uint32_t limit) override;
  std::vector<ArtistMatch> SearchArtist(const std::string &name) override;

  // Response parsers (throw CatalogError on malformed input)
  static Page ParseReleaseGroupPage(const std::string &body, uint32_t offset);
  static Page ParseReleasePage(const std::string &body,
                               const std::string &release_group_id,
                               uint32_t offset);
  static std::vector<ArtistMatch> ParseArtistSearch(const std::string &body);

  // Percent-encodes everything but RFC 3986 unreserved characters
  static std::string UrlEncode(const std::string &value);

  const Config &config() const { return config_; }

private:
  // Returns the body of a 200 response
  std::string get(const std::string &target);

  Config config_;
  std::mutex mutex_;
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ssl::context> ssl_context_;
};

} // namespace catalog
} // namespace discofill

#endif // DISCOFILL_CATALOG_HTTP_CATALOG_CLIENT_HPP
