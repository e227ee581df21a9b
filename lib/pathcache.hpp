#ifndef INCLUDE_AGENTFS_PATHCACHE_
#define INCLUDE_AGENTFS_PATHCACHE_

#include <set>
#include <string>

#include "database.hpp"

namespace agentfs {

// Path of `node` as it would be with its current name and parent, built by
// walking the stored ancestor chain.
std::string compute_path(const Database& db, const Node& node);

// Ids of every node, live or deleted, whose parent chain passes through
// `dir`, gathered through the (filespace, parent) index. Cached paths are
// not consulted: a deleted subtree and a newer live one may share a prefix.
std::set<std::string> subtree_ids(const Database& db, const Node& dir);

// `dir` has just moved from `old_dir` to its current path. Rewrites the
// cached path of every node in its subtree to match, in one pass over the
// filespace, and returns the number of rows rewritten.
size_t rewrite_descendant_paths(Database& db, Transaction& tx,
                                const Node& dir, const std::string& old_dir);

}

#endif
