#include "registry.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "digest.hpp"
#include "error.hpp"

using namespace std;

namespace agentfs {

static bool valid_space_name(const string& name)
{
    return !name.empty() && name.size() <= SPACE_NAME_MAX_BYTES;
}

Registry::Registry(Database& db, bool debug) : db_(db), debug_(debug) {}

int Registry::create(const string& name, const string& owner, FileSpace& out,
                     const string& description)
{
    if (debug_)
        cerr << "DEBUG: " << __func__ << "(): owner=" << owner
             << ", name=" << name << endl;

    Transaction tx(db_);
    int err = insert(tx, name, owner, description, out);
    if (err) {
        return err;
    }
    tx.commit();
    return 0;
}

int Registry::rename(const string& id, const string& name, FileSpace& out)
{
    if (debug_)
        cerr << "DEBUG: " << __func__ << "(): id=" << id << ", name=" << name << endl;

    if (!valid_space_name(name)) {
        return INVALID_NAME;
    }
    Transaction tx(db_);
    const FileSpace *cur = db_.space(id);
    if (cur == nullptr) {
        return NOT_FOUND;
    }
    const FileSpace *other = lookup(cur->owner, name);
    if (other != nullptr && other->id != id) {
        return DUPLICATE_NAME;
    }
    FileSpace fs = *cur;
    fs.name = name;
    fs.updated_at = now();
    db_.put_space(tx, fs);
    tx.commit();
    out = fs;
    return 0;
}

int Registry::provision_default(const string& agent_name, const string& owner,
                                FileSpace& out)
{
    string name = agent_name + " Files";
    Transaction tx(db_);
    if (auto fs = lookup(owner, name)) {
        out = *fs;
        return 0;
    }
    int err = insert(tx, name, owner, "", out);
    if (err) {
        return err;
    }
    tx.commit();
    if (debug_)
        cerr << "DEBUG: " << __func__ << "(): provisioned " << out.id
             << " for agent " << agent_name << endl;
    return 0;
}

int Registry::get(const string& id, FileSpace& out) const
{
    lock_guard<mutex> lock(db_.mutex());
    const FileSpace *fs = db_.space(id);
    if (fs == nullptr) {
        return NOT_FOUND;
    }
    out = *fs;
    return 0;
}

int Registry::find(const string& owner, const string& name, FileSpace& out) const
{
    lock_guard<mutex> lock(db_.mutex());
    const FileSpace *fs = lookup(owner, name);
    if (fs == nullptr) {
        return NOT_FOUND;
    }
    out = *fs;
    return 0;
}

vector<FileSpace> Registry::list(const string& owner) const
{
    vector<FileSpace> out;
    {
        lock_guard<mutex> lock(db_.mutex());
        for (auto fs : db_.spaces()) {
            if (fs->owner == owner) {
                out.push_back(*fs);
            }
        }
    }
    // Newest first.
    sort(out.begin(), out.end(), [](const FileSpace& a, const FileSpace& b) {
        return a.created_at > b.created_at;
    });
    return out;
}

const FileSpace *Registry::lookup(const string& owner, const string& name) const
{
    for (auto fs : db_.spaces()) {
        if (fs->owner == owner && fs->name == name) {
            return fs;
        }
    }
    return nullptr;
}

int Registry::insert(Transaction& tx, const string& name, const string& owner,
                     const string& description, FileSpace& out)
{
    if (!valid_space_name(name) || owner.empty()) {
        return INVALID_NAME;
    }
    if (lookup(owner, name) != nullptr) {
        return DUPLICATE_NAME;
    }
    FileSpace fs;
    try {
        fs.id = new_uuid();
    } catch (const runtime_error& e) {
        cerr << "ERROR: " << __func__ << "(): " << e.what() << endl;
        return STORAGE_ERROR;
    }
    fs.name = name;
    fs.owner = owner;
    fs.description = description;
    fs.created_at = fs.updated_at = now();
    db_.put_space(tx, fs);
    out = fs;
    return 0;
}

}
