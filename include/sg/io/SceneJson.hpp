#pragma once
#include "sg/scene/Node.hpp"

#include <memory>
#include <string>

namespace sg {

struct SerializeOptions {
  // Omit the "children" array of groups (the group's own fields are kept).
  bool excludeChildren{false};
};

struct LoadResult {
  bool ok{true};
  std::string error;          // human text, empty on success
  std::unique_ptr<Node> node; // root of the loaded tree
};

// Node tree -> JSON object text.
std::string toJSON(const Node& node, const SerializeOptions& options = SerializeOptions{});

// JSON object text -> node tree. Unknown members are ignored; a malformed
// node fails the whole load.
LoadResult fromJSON(const std::string& json);

// Convenience wrappers around a file on disk.
bool saveSceneFile(const std::string& path, const Node& node,
                   const SerializeOptions& options = SerializeOptions{});
LoadResult loadSceneFile(const std::string& path);

} // namespace sg
