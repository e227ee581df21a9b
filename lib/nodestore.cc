#include "nodestore.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "cascade.hpp"
#include "digest.hpp"
#include "error.hpp"
#include "objectkey.hpp"
#include "path.hpp"
#include "pathcache.hpp"
#include "uniqueness.hpp"

using namespace std;

namespace agentfs {

NodeStore::NodeStore(Database& db, BlobStore *blobs, bool debug)
    : db_(db), blobs_(blobs), debug_(debug) {}

int NodeStore::create(const string& space, const optional<string>& parent,
                      Kind kind, const string& name, Node& out, const Upload *content)
{
    NewNode req;
    req.space = space;
    req.parent = parent;
    req.kind = kind;
    req.name = name;
    req.content = content;
    return create(req, out);
}

int NodeStore::create(const NewNode& req, Node& out)
{
    if (debug_)
        cerr << "DEBUG: " << __func__ << "(): space=" << req.space
             << ", parent=" << req.parent.value_or("/")
             << ", kind=" << kind_name(req.kind) << ", name=" << req.name << endl;

    if (!valid_name(req.name)) {
        return INVALID_NAME;
    }

    Transaction tx(db_);
    if (db_.space(req.space) == nullptr) {
        return NOT_FOUND;
    }
    int err = check_parent(req.space, req.parent);
    if (err) {
        return err;
    }
    err = check_unique_name(db_, req.space, req.parent, req.name);
    if (err) {
        return err;
    }

    Node n;
    try {
        n.id = new_uuid();
    } catch (const runtime_error& e) {
        cerr << "ERROR: " << __func__ << "(): " << e.what() << endl;
        return STORAGE_ERROR;
    }
    n.filespace = req.space;
    n.parent = req.parent;
    n.kind = req.kind;
    n.name = req.name;
    n.created_by = req.created_by;
    n.state = Live{};
    n.created_at = n.updated_at = now();
    n.path = compute_path(db_, n);

    if (n.is_file() && req.content != nullptr) {
        err = store_content(n, *req.content);
        if (err) {
            return err;
        }
    }

    db_.put(tx, n);
    tx.commit();
    out = n;
    return 0;
}

int NodeStore::move(const string& id, const optional<string>& parent,
                    const optional<string>& name, Node& out)
{
    NodeChange change;
    change.id = id;
    change.reparent = true;
    change.parent = parent;
    change.name = name;
    int ret = update(change, out);
    return ret < 0 ? ret : 0;
}

int NodeStore::rename(const string& id, const string& name, Node& out)
{
    NodeChange change;
    change.id = id;
    change.name = name;
    int ret = update(change, out);
    return ret < 0 ? ret : 0;
}

int NodeStore::update(const NodeChange& change, Node& out)
{
    if (debug_)
        cerr << "DEBUG: " << __func__ << "(): id=" << change.id
             << ", reparent=" << change.reparent
             << ", parent=" << change.parent.value_or("/")
             << ", name=" << change.name.value_or("")
             << ", trash=" << change.trash << endl;

    if (change.name && !valid_name(*change.name)) {
        return INVALID_NAME;
    }

    Transaction tx(db_);
    const Node *cur = db_.node(change.id);
    if (cur == nullptr) {
        return NOT_FOUND;
    }
    Node n = *cur;
    auto parent = change.reparent ? change.parent : n.parent;
    auto name = change.name.value_or(n.name);

    int err = 0;
    if (change.reparent) {
        err = check_parent(n.filespace, parent);
        if (err == 0) {
            err = check_cycle(n.id, parent);
        }
        if (err) {
            return err;
        }
    }
    bool relocated = parent != n.parent || name != n.name;
    if (relocated && !n.is_deleted()) {
        err = check_unique_name(db_, n.filespace, parent, name, n.id);
        if (err) {
            return err;
        }
    }

    // Structure first, then the node's own path, then the descendants'
    // paths. The cascade below finds descendants by path, so it must run
    // against the rewritten ones.
    int count = 0;
    if (relocated) {
        string old_path = n.path;
        n.parent = parent;
        n.name = name;
        n.path = compute_path(db_, n);
        n.updated_at = now();
        db_.put(tx, n);
        if (n.is_dir() && n.path != old_path) {
            auto rewritten = rewrite_descendant_paths(db_, tx, n, old_path);
            if (debug_)
                cerr << "DEBUG: " << __func__ << "(): " << old_path << " -> " << n.path
                     << ", rewrote " << rewritten << " descendant path(s)" << endl;
        }
    }
    if (change.trash) {
        count = static_cast<int>(trash_subtree(db_, tx, n, now()));
    }

    tx.commit();
    out = *db_.node(n.id);
    return count;
}

int NodeStore::trash(const string& id)
{
    NodeChange change;
    change.id = id;
    change.trash = true;
    Node n;
    return update(change, n);
}

int NodeStore::restore(const string& id)
{
    if (debug_)
        cerr << "DEBUG: " << __func__ << "(): id=" << id << endl;

    Transaction tx(db_);
    const Node *cur = db_.node(id);
    if (cur == nullptr) {
        return NOT_FOUND;
    }
    Node n = *cur;
    int count = restore_subtree(db_, tx, n);
    if (count < 0) {
        return count;
    }
    tx.commit();
    return count;
}

int NodeStore::attach(const string& id, const Upload& upload, Node& out)
{
    if (debug_)
        cerr << "DEBUG: " << __func__ << "(): id=" << id
             << ", filename=" << upload.filename
             << ", size=" << upload.data.size() << endl;

    string stale;
    {
        Transaction tx(db_);
        const Node *cur = db_.node(id);
        if (cur == nullptr || cur->is_deleted()) {
            return NOT_FOUND;
        }
        if (cur->is_dir()) {
            return IS_DIRECTORY;
        }
        Node n = *cur;
        if (n.content) {
            stale = n.content->key;
        }
        int err = store_content(n, upload);
        if (err) {
            return err;
        }
        n.updated_at = now();
        db_.put(tx, n);
        tx.commit();
        out = n;
    }

    // The metadata already points at the new blob; a leftover old blob is
    // only wasted space.
    if (!stale.empty() && stale != out.content->key && blobs_->remove(stale) != 0) {
        cerr << "WARNING: attach(): stale blob " << stale << " was not removed" << endl;
    }
    return 0;
}

int NodeStore::get(const string& id, Node& out) const
{
    lock_guard<mutex> lock(db_.mutex());
    const Node *n = db_.node(id);
    if (n == nullptr) {
        return NOT_FOUND;
    }
    out = *n;
    return 0;
}

int NodeStore::lookup(const string& space, const char *path, Node& out) const
{
    if (debug_)
        cerr << "DEBUG: " << __func__ << "(): space=" << space
             << ", path=" << (path ? path : "") << endl;

    lock_guard<mutex> lock(db_.mutex());
    if (db_.space(space) == nullptr) {
        return NOT_FOUND;
    }

    optional<string> parent;
    const Node *found = nullptr;
    while (path != nullptr && *path) {
        if (found != nullptr && !found->is_dir()) {
            return INVALID_PARENT;
        }
        auto step = pathsep(path);
        if (step.empty()) {
            break;
        }
        found = nullptr;
        for (auto n : db_.children(space, parent)) {
            if (!n->is_deleted() && n->name == step) {
                found = n;
                break;
            }
        }
        if (found == nullptr) {
            return NOT_FOUND;
        }
        parent = found->id;
    }
    if (found == nullptr) {
        return NOT_FOUND;
    }
    out = *found;
    return 0;
}

int NodeStore::list_children(const string& space, const optional<string>& parent,
                             vector<Node>& out, bool include_deleted) const
{
    if (debug_)
        cerr << "DEBUG: " << __func__ << "(): space=" << space
             << ", parent=" << parent.value_or("/") << endl;

    lock_guard<mutex> lock(db_.mutex());
    if (db_.space(space) == nullptr) {
        return NOT_FOUND;
    }
    if (parent) {
        const Node *p = db_.node(*parent);
        if (p == nullptr || p->filespace != space) {
            return NOT_FOUND;
        }
        if (!p->is_dir()) {
            return INVALID_PARENT;
        }
    }

    out.clear();
    for (auto n : db_.children(space, parent)) {
        if (include_deleted || !n->is_deleted()) {
            out.push_back(*n);
        }
    }
    sort(out.begin(), out.end(), [](const Node& a, const Node& b) {
        if (a.kind != b.kind) {
            return a.is_dir();
        }
        return a.name < b.name;
    });
    return 0;
}

int NodeStore::descendants(const string& id, vector<Node>& out, bool include_deleted) const
{
    lock_guard<mutex> lock(db_.mutex());
    const Node *dir = db_.node(id);
    if (dir == nullptr) {
        return NOT_FOUND;
    }
    out.clear();
    if (!dir->is_dir()) {
        return 0;
    }
    auto ids = subtree_ids(db_, *dir);
    auto below = db_.select(dir->filespace, [&](const Node& n) {
        return ids.count(n.id) && (include_deleted || !n.is_deleted());
    });
    for (auto n : below) {
        out.push_back(*n);
    }
    sort(out.begin(), out.end(), [](const Node& a, const Node& b) {
        return a.path < b.path;
    });
    return 0;
}

int NodeStore::check_parent(const string& space, const optional<string>& parent) const
{
    if (!parent) {
        return 0;
    }
    const Node *p = db_.node(*parent);
    if (p == nullptr) {
        return NOT_FOUND;
    }
    if (p->filespace != space || !p->is_dir() || p->is_deleted()) {
        return INVALID_PARENT;
    }
    return 0;
}

int NodeStore::check_cycle(const string& id, const optional<string>& parent) const
{
    auto cur = parent;
    for (size_t depth = 0; cur && depth <= db_.size(); ++depth) {
        if (*cur == id) {
            return CYCLE_DETECTED;
        }
        const Node *p = db_.node(*cur);
        if (p == nullptr) {
            break;
        }
        cur = p->parent;
    }
    return 0;
}

int NodeStore::store_content(Node& node, const Upload& upload)
{
    if (blobs_ == nullptr) {
        cerr << "ERROR: " << __func__ << "(): no blob store configured" << endl;
        return STORAGE_ERROR;
    }

    Content c;
    c.key = object_key(node, upload.filename);
    c.size = upload.data.size();
    c.mime_type = upload.mime_type;
    try {
        c.checksum = sha256_hex(upload.data);
    } catch (const runtime_error& e) {
        cerr << "ERROR: " << __func__ << "(): " << e.what() << endl;
        return STORAGE_ERROR;
    }

    int err = blobs_->put(c.key, upload.data);
    if (err) {
        return err;
    }
    node.content = c;
    return 0;
}

}
