#ifndef INCLUDE_AGENTFS_REGISTRY_
#define INCLUDE_AGENTFS_REGISTRY_

#include <string>
#include <vector>

#include "database.hpp"
#include "metadata.hpp"

namespace agentfs {

constexpr size_t SPACE_NAME_MAX_BYTES = 128;

// Filespaces by owner. Callers are trusted to have been authorized already.
class Registry {
  public:
    Registry(Database& db, bool debug = false);

    int create(const std::string& name, const std::string& owner,
               FileSpace& out, const std::string& description = "");
    int rename(const std::string& id, const std::string& name, FileSpace& out);

    // Called by the agent-creation workflow: the owner's "<agent> Files"
    // filespace, created on first use.
    int provision_default(const std::string& agent_name, const std::string& owner,
                          FileSpace& out);

    int get(const std::string& id, FileSpace& out) const;
    int find(const std::string& owner, const std::string& name, FileSpace& out) const;
    std::vector<FileSpace> list(const std::string& owner) const;

  private:
    const FileSpace *lookup(const std::string& owner, const std::string& name) const;
    int insert(Transaction& tx, const std::string& name, const std::string& owner,
               const std::string& description, FileSpace& out);

    Database& db_;
    bool debug_;
};

}

#endif
