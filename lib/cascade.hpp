#ifndef INCLUDE_AGENTFS_CASCADE_
#define INCLUDE_AGENTFS_CASCADE_

#include "database.hpp"

namespace agentfs {

// Marks `node` deleted at `at` and, for a directory, every live node of its
// subtree with the same timestamp. An already deleted node keeps
// its timestamp, which is then used for any descendant still live.
// Returns the number of rows changed.
size_t trash_subtree(Database& db, Transaction& tx, const Node& node, Timestamp at);

// Clears the deleted state of `node` and, for a directory, of every deleted
// node of its subtree. Returns the number of rows changed, or NAME_CONFLICT (and
// changes nothing) if that would leave two live nodes with one name at the
// same level.
int restore_subtree(Database& db, Transaction& tx, const Node& node);

}

#endif
