#include "pathcache.hpp"

#include <vector>

#include "path.hpp"

using namespace std;

namespace agentfs {

string compute_path(const Database& db, const Node& node)
{
    vector<const string *> names {&node.name};
    auto parent = node.parent;
    // Bounded by the row count in case of a corrupt parent chain.
    for (size_t depth = 0; parent && depth <= db.size(); ++depth) {
        const Node *p = db.node(*parent);
        if (p == nullptr) {
            break;
        }
        names.push_back(&p->name);
        parent = p->parent;
    }

    string path;
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        path = join_path(path, **it);
    }
    return path;
}

set<string> subtree_ids(const Database& db, const Node& dir)
{
    set<string> ids;
    vector<string> pending {dir.id};
    while (!pending.empty()) {
        auto id = pending.back();
        pending.pop_back();
        for (auto child : db.children(dir.filespace, id)) {
            // a corrupt parent chain could loop back
            if (child->id != dir.id && ids.insert(child->id).second) {
                pending.push_back(child->id);
            }
        }
    }
    return ids;
}

size_t rewrite_descendant_paths(Database& db, Transaction& tx,
                                const Node& dir, const string& old_dir)
{
    if (old_dir == dir.path) {
        return 0;
    }
    auto ids = subtree_ids(db, dir);
    auto stamp = now();
    return db.update_where(tx, dir.filespace,
        [&](const Node& n) { return ids.count(n.id) && is_below(n.path, old_dir); },
        [&](Node& n) {
            n.path = rebase(n.path, old_dir, dir.path);
            n.updated_at = stamp;
        });
}

}
