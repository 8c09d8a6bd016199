#include "catalog/http_catalog_client.hpp"
#include "util/logging.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <algorithm>
#include <cstdio>
#include <nlohmann/json.hpp>

namespace discofill {
namespace catalog {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

std::optional<std::string> OptString(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return std::nullopt;
  }
  auto value = it->get<std::string>();
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint64_t> OptCount(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number_integer()) {
    return std::nullopt;
  }
  return it->get<uint64_t>();
}

json ParseBody(const std::string &body) {
  try {
    auto doc = json::parse(body);
    if (!doc.is_object()) {
      throw CatalogError("catalog response is not a JSON object", 200, false);
    }
    return doc;
  } catch (const json::parse_error &e) {
    throw CatalogError(std::string("malformed catalog response: ") + e.what(),
                       200, false);
  }
}

const json &RequireArray(const json &doc, const char *key) {
  auto it = doc.find(key);
  if (it == doc.end() || !it->is_array()) {
    throw CatalogError(std::string("catalog response lacks '") + key + "'", 200,
                       false);
  }
  return *it;
}

void FinishPage(Page &page, uint32_t offset) {
  if (page.total && offset + page.raw_count >= *page.total) {
    page.end_of_results = true;
  }
}

// Starts one async operation and runs the client's io_context until it
// completes. The stream's expiry turns a stalled peer into
// beast::error::timeout.
template <typename Initiate>
beast::error_code Await(net::io_context &io, Initiate &&initiate) {
  beast::error_code result = net::error::would_block;
  initiate([&result](beast::error_code ec, auto &&...) { result = ec; });
  io.restart();
  io.run();
  return result;
}

void ThrowIf(const beast::error_code &ec) {
  if (ec) {
    throw beast::system_error(ec);
  }
}

template <typename Stream>
http::response<http::string_body>
Exchange(net::io_context &io, Stream &stream,
         const http::request<http::string_body> &req,
         std::chrono::milliseconds timeout) {
  beast::get_lowest_layer(stream).expires_after(timeout);
  ThrowIf(Await(io, [&](auto handler) {
    http::async_write(stream, req, std::move(handler));
  }));

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  beast::get_lowest_layer(stream).expires_after(timeout);
  ThrowIf(Await(io, [&](auto handler) {
    http::async_read(stream, buffer, res, std::move(handler));
  }));
  return res;
}

} // namespace

HttpCatalogClient::HttpCatalogClient(const Config &config) : config_(config) {
  if (config_.use_tls) {
    ssl_context_ =
        std::make_unique<net::ssl::context>(net::ssl::context::tls_client);
    ssl_context_->set_default_verify_paths();
    ssl_context_->set_verify_mode(net::ssl::verify_peer);
  }
  LOG_CATALOG_DEBUG("Catalog client for {}://{}:{}",
                    config_.use_tls ? "https" : "http", config_.host,
                    config_.port);
}

HttpCatalogClient::~HttpCatalogClient() = default;

std::string HttpCatalogClient::UrlEncode(const std::string &value) {
  std::string out;
  out.reserve(value.size() * 3);
  for (unsigned char c : value) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
        (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
        c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out.append(buf);
    }
  }
  return out;
}

Page HttpCatalogClient::FetchReleaseGroups(const std::string &artist_id,
                                           uint32_t offset, uint32_t limit) {
  const std::string target = "/ws/2/release-group?artist=" + UrlEncode(artist_id) +
                             "&limit=" + std::to_string(limit) +
                             "&offset=" + std::to_string(offset) + "&fmt=json";
  return ParseReleaseGroupPage(get(target), offset);
}

Page HttpCatalogClient::FetchReleases(const std::string &release_group_id,
                                      uint32_t offset, uint32_t limit) {
  const std::string target =
      "/ws/2/release?release-group=" + UrlEncode(release_group_id) +
      "&limit=" + std::to_string(limit) + "&offset=" + std::to_string(offset) +
      "&fmt=json";
  return ParseReleasePage(get(target), release_group_id, offset);
}

std::vector<ArtistMatch> HttpCatalogClient::SearchArtist(const std::string &name) {
  const std::string target = "/ws/2/artist?query=" +
                             UrlEncode("artist:\"" + name + "\"") +
                             "&limit=5&fmt=json";
  return ParseArtistSearch(get(target));
}

std::string HttpCatalogClient::get(const std::string &target) {
  std::lock_guard<std::mutex> lock(mutex_);

  http::request<http::string_body> req{http::verb::get, target, 11};
  req.set(http::field::host, config_.host);
  req.set(http::field::user_agent, config_.user_agent);
  req.set(http::field::accept, "application/json");

  LOG_CATALOG_TRACE("GET {}", target);

  http::response<http::string_body> res;
  try {
    tcp::resolver resolver(io_context_);
    auto const results =
        resolver.resolve(config_.host, std::to_string(config_.port));

    if (config_.use_tls) {
      beast::ssl_stream<beast::tcp_stream> stream(io_context_, *ssl_context_);
      if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                    config_.host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()),
                              net::error::get_ssl_category()));
      }
      stream.set_verify_callback(net::ssl::host_name_verification(config_.host));

      auto &socket = beast::get_lowest_layer(stream);
      socket.expires_after(config_.timeout);
      ThrowIf(Await(io_context_, [&](auto handler) {
        socket.async_connect(results, std::move(handler));
      }));
      socket.expires_after(config_.timeout);
      ThrowIf(Await(io_context_, [&](auto handler) {
        stream.async_handshake(net::ssl::stream_base::client,
                               std::move(handler));
      }));
      res = Exchange(io_context_, stream, req, config_.timeout);

      socket.expires_after(config_.timeout);
      auto ec = Await(io_context_, [&](auto handler) {
        stream.async_shutdown(std::move(handler));
      });
      if (ec && ec != net::ssl::error::stream_truncated) {
        LOG_CATALOG_TRACE("TLS shutdown: {}", ec.message());
      }
    } else {
      beast::tcp_stream stream(io_context_);
      stream.expires_after(config_.timeout);
      ThrowIf(Await(io_context_, [&](auto handler) {
        stream.async_connect(results, std::move(handler));
      }));
      res = Exchange(io_context_, stream, req, config_.timeout);

      beast::error_code ec;
      stream.socket().shutdown(tcp::socket::shutdown_both, ec);
      if (ec && ec != beast::errc::not_connected) {
        LOG_CATALOG_TRACE("Socket shutdown: {}", ec.message());
      }
    }
  } catch (const beast::system_error &e) {
    throw CatalogError(config_.host + ": " + e.code().message(), 0, true);
  }

  const int status = static_cast<int>(res.result_int());
  if (status == 200) {
    return std::move(res.body());
  }

  const bool transient = status == 429 || status >= 500;
  throw CatalogError(config_.host + " answered HTTP " + std::to_string(status) +
                         " for " + target,
                     status, transient);
}

// ----------------------------------------------------------------------------
// Parsers
// ----------------------------------------------------------------------------

Page HttpCatalogClient::ParseReleaseGroupPage(const std::string &body,
                                              uint32_t offset) {
  const json doc = ParseBody(body);
  Page page;
  page.total = OptCount(doc, "release-group-count");

  const json &items = RequireArray(doc, "release-groups");
  page.raw_count = items.size();
  for (const auto &item : items) {
    auto id = OptString(item, "id");
    if (!id) {
      LOG_CATALOG_DEBUG("Skipping release group without id");
      continue;
    }
    CatalogNode node;
    node.id = *id;
    node.type = NodeType::ReleaseGroup;
    node.title = OptString(item, "title").value_or("");
    node.primary_type = OptString(item, "primary-type");
    node.date = OptString(item, "first-release-date");
    page.items.push_back(std::move(node));
  }

  FinishPage(page, offset);
  return page;
}

Page HttpCatalogClient::ParseReleasePage(const std::string &body,
                                         const std::string &release_group_id,
                                         uint32_t offset) {
  const json doc = ParseBody(body);
  Page page;
  page.total = OptCount(doc, "release-count");

  const json &items = RequireArray(doc, "releases");
  page.raw_count = items.size();
  for (const auto &item : items) {
    auto id = OptString(item, "id");
    if (!id) {
      LOG_CATALOG_DEBUG("Skipping release without id in group {}",
                        release_group_id);
      continue;
    }
    CatalogNode node;
    node.id = *id;
    node.type = NodeType::Release;
    node.title = OptString(item, "title").value_or("");
    node.parent_id = release_group_id;
    node.date = OptString(item, "date");
    page.items.push_back(std::move(node));
  }

  FinishPage(page, offset);
  return page;
}

std::vector<ArtistMatch> HttpCatalogClient::ParseArtistSearch(const std::string &body) {
  const json doc = ParseBody(body);
  std::vector<ArtistMatch> matches;

  for (const auto &item : RequireArray(doc, "artists")) {
    auto id = OptString(item, "id");
    if (!id) {
      continue;
    }
    ArtistMatch match;
    match.id = *id;
    match.name = OptString(item, "name").value_or("");
    auto score = item.find("score");
    if (score != item.end() && score->is_number_integer()) {
      match.score = score->get<int>();
    }
    matches.push_back(std::move(match));
  }

  std::stable_sort(matches.begin(), matches.end(),
                   [](const ArtistMatch &a, const ArtistMatch &b) {
                     return a.score > b.score;
                   });
  return matches;
}

} // namespace catalog
} // namespace discofill
