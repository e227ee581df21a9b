#ifndef INCLUDE_AGENTFS_OBJECTKEY_
#define INCLUDE_AGENTFS_OBJECTKEY_

#include <optional>
#include <string>

#include "metadata.hpp"

namespace agentfs {

constexpr char KEY_PREFIX[] = "agent_fs";
constexpr char FALLBACK_BASENAME[] = "file";

// Blob key a new upload of `node` would be stored under:
// agent_fs/<filespace>/<node>/<sanitized basename>. Only the last segment
// depends on the name, so the key survives renames and moves.
std::string object_key(const Node& node,
                       const std::optional<std::string>& filename = std::nullopt);

// Key of the stored blob if there is one, else object_key(node).
std::string current_key(const Node& node);

}

#endif
