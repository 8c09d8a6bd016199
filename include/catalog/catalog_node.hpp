#ifndef DISCOFILL_CATALOG_CATALOG_NODE_HPP
#define DISCOFILL_CATALOG_CATALOG_NODE_HPP

#include <optional>
#include <string>

namespace discofill {
namespace catalog {

enum class NodeType {
  ReleaseGroup,
  Release,
};

const char *ToString(NodeType type);

// One entry of an artist's catalog tree. Identified (and deduplicated) by id.
struct CatalogNode {
  std::string id;
  NodeType type{NodeType::ReleaseGroup};
  std::string title;
  std::optional<std::string> parent_id; // release group of a Release
  std::optional<std::string> primary_type; // "Album", "Single", ...
  std::optional<std::string> date;
};

struct ArtistMatch {
  std::string id;
  std::string name;
  int score{0}; // catalog relevance, 0-100
};

} // namespace catalog
} // namespace discofill

#endif // DISCOFILL_CATALOG_CATALOG_NODE_HPP
