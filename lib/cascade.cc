#include "cascade.hpp"

#include <set>
#include <utility>
#include <vector>

#include "error.hpp"
#include "pathcache.hpp"
#include "uniqueness.hpp"

using namespace std;

namespace agentfs {

size_t trash_subtree(Database& db, Transaction& tx, const Node& node, Timestamp at)
{
    size_t count = 0;
    Node self = node;
    if (auto prev = self.deleted_at()) {
        at = *prev;
    } else {
        self.state = Deleted{at};
        self.updated_at = at;
        db.put(tx, self);
        ++count;
    }

    if (self.is_dir()) {
        auto ids = subtree_ids(db, self);
        count += db.update_where(tx, self.filespace,
            [&](const Node& n) { return !n.is_deleted() && ids.count(n.id); },
            [&](Node& n) {
                n.state = Deleted{at};
                n.updated_at = at;
            });
    }
    return count;
}

int restore_subtree(Database& db, Transaction& tx, const Node& node)
{
    vector<const Node *> revived;
    if (node.is_deleted()) {
        revived.push_back(&node);
    }
    set<string> ids;
    if (node.is_dir()) {
        ids = subtree_ids(db, node);
        auto below = db.select(node.filespace, [&](const Node& n) {
            return n.is_deleted() && ids.count(n.id);
        });
        revived.insert(revived.end(), below.begin(), below.end());
    }

    set<pair<string, string>> seen;
    for (auto n : revived) {
        if (!seen.insert(make_pair(n->parent.value_or(""), n->name)).second) {
            return NAME_CONFLICT;
        }
        int err = check_unique_name(db, n->filespace, n->parent, n->name, n->id);
        if (err) {
            return err;
        }
    }

    auto stamp = now();
    int count = 0;
    if (node.is_deleted()) {
        Node self = node;
        self.state = Live{};
        self.updated_at = stamp;
        db.put(tx, self);
        ++count;
    }
    if (node.is_dir()) {
        count += static_cast<int>(db.update_where(tx, node.filespace,
            [&](const Node& n) { return n.is_deleted() && ids.count(n.id); },
            [&](Node& n) {
                n.state = Live{};
                n.updated_at = stamp;
            }));
    }
    return count;
}

}
