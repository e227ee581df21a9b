#ifndef INCLUDE_AGENTFS_UNIQUENESS_
#define INCLUDE_AGENTFS_UNIQUENESS_

#include <optional>
#include <string>

#include "database.hpp"

namespace agentfs {

// Both checks consider live nodes only and ignore the node `self`, so a
// node never conflicts with its own current name. They return 0 or
// NAME_CONFLICT.
int check_sibling_name(const Database& db, const std::string& space,
                       const std::string& parent, const std::string& name,
                       const std::string& self = "");
int check_root_name(const Database& db, const std::string& space,
                    const std::string& name, const std::string& self = "");

// Dispatches to the directory- or root-scoped check matching `parent`.
int check_unique_name(const Database& db, const std::string& space,
                      const std::optional<std::string>& parent,
                      const std::string& name, const std::string& self = "");

}

#endif
