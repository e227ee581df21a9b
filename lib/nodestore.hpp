#ifndef INCLUDE_AGENTFS_NODESTORE_
#define INCLUDE_AGENTFS_NODESTORE_

#include <optional>
#include <string>
#include <vector>

#include "blobstore.hpp"
#include "database.hpp"
#include "metadata.hpp"

namespace agentfs {

// Bytes to store as a file node's content.
struct Upload {
    std::string filename; // original name; feeds the key's last segment
    std::string data;
    std::string mime_type;
};

struct NewNode {
    std::string space;
    std::optional<std::string> parent;
    Kind kind = Kind::File;
    std::string name;
    std::optional<std::string> created_by;
    const Upload *content = nullptr; // ignored for directories
};

// One structural mutation: any combination of a new parent, a new name and
// moving the node to the trash.
struct NodeChange {
    std::string id;
    bool reparent = false;
    std::optional<std::string> parent; // target when reparent is set
    std::optional<std::string> name;
    bool trash = false;
};

class NodeStore {
  public:
    // `blobs` may be null when no content is ever attached.
    NodeStore(Database& db, BlobStore *blobs = nullptr, bool debug = false);

    int create(const NewNode& req, Node& out);
    int create(const std::string& space, const std::optional<std::string>& parent,
               Kind kind, const std::string& name, Node& out,
               const Upload *content = nullptr);

    // `parent` unset moves the node to the filespace root.
    int move(const std::string& id, const std::optional<std::string>& parent,
             const std::optional<std::string>& name, Node& out);
    int rename(const std::string& id, const std::string& name, Node& out);
    int update(const NodeChange& change, Node& out);

    // Both return the number of rows changed, or a negative error.
    int trash(const std::string& id);
    int restore(const std::string& id);

    int attach(const std::string& id, const Upload& upload, Node& out);

    int get(const std::string& id, Node& out) const;
    int lookup(const std::string& space, const char *path, Node& out) const;
    int list_children(const std::string& space, const std::optional<std::string>& parent,
                      std::vector<Node>& out, bool include_deleted = false) const;
    int descendants(const std::string& id, std::vector<Node>& out,
                    bool include_deleted = false) const;

  private:
    int check_parent(const std::string& space, const std::optional<std::string>& parent) const;
    int check_cycle(const std::string& id, const std::optional<std::string>& parent) const;
    int store_content(Node& node, const Upload& upload);

    Database& db_;
    BlobStore *blobs_;
    bool debug_;
};

}

#endif
