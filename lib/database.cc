#include "database.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace std;
using nlohmann::json;

namespace agentfs {

Database::Database() {}

const FileSpace *Database::space(const string& id) const
{
    auto it = spaces_.find(id);
    return it == spaces_.end() ? nullptr : &it->second;
}

vector<const FileSpace *> Database::spaces() const
{
    vector<const FileSpace *> out;
    for (const auto& kv : spaces_) {
        out.push_back(&kv.second);
    }
    return out;
}

void Database::put_space(Transaction& tx, const FileSpace& fs)
{
    if (tx.spaces_.find(fs.id) == tx.spaces_.end()) {
        tx.spaces_[fs.id] = space(fs.id) ? optional<FileSpace>(*space(fs.id)) : nullopt;
    }
    store_space(fs);
}

const Node *Database::node(const string& id) const
{
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

void Database::put(Transaction& tx, const Node& node)
{
    remember(tx, node.id);
    store(node);
}

vector<const Node *> Database::children(const string& space,
                                        const optional<string>& parent) const
{
    vector<const Node *> out;
    auto it = by_parent_.find(ParentKey(space, parent.value_or("")));
    if (it == by_parent_.end()) {
        return out;
    }
    for (const auto& id : it->second) {
        out.push_back(&nodes_.at(id));
    }
    return out;
}

size_t Database::size() const
{
    return nodes_.size();
}

std::mutex& Database::mutex()
{
    return mutex_;
}

Database::ParentKey Database::parent_key(const Node& n)
{
    return ParentKey(n.filespace, n.parent.value_or(""));
}

void Database::remember(Transaction& tx, const string& id)
{
    if (tx.nodes_.find(id) != tx.nodes_.end()) {
        return;
    }
    auto it = nodes_.find(id);
    tx.nodes_[id] = it == nodes_.end() ? nullopt : optional<Node>(it->second);
}

void Database::store(const Node& node)
{
    auto it = nodes_.find(node.id);
    if (it != nodes_.end()) {
        by_parent_[parent_key(it->second)].erase(node.id);
        it->second = node;
    } else {
        nodes_.emplace(node.id, node);
    }
    by_space_[node.filespace].insert(node.id);
    by_parent_[parent_key(node)].insert(node.id);
}

void Database::erase(const string& id)
{
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return;
    }
    by_space_[it->second.filespace].erase(id);
    by_parent_[parent_key(it->second)].erase(id);
    nodes_.erase(it);
}

void Database::store_space(const FileSpace& fs)
{
    spaces_[fs.id] = fs;
}

void Database::erase_space(const string& id)
{
    spaces_.erase(id);
}

void Database::load(const string& path)
{
    ifstream i {path};
    if (!i) {
        return;
    }
    json j;
    i >> j;
    lock_guard<std::mutex> lock(mutex_);
    j.get_to(*this);
}

void Database::save(const string& path) const
{
    json j;
    {
        lock_guard<std::mutex> lock(mutex_);
        to_json(j, *this);
    }
    string tmp = path + ".tmp";
    {
        ofstream o {tmp, ios::trunc};
        o << j.dump(2) << endl;
        if (!o) {
            throw runtime_error("cannot write " + tmp);
        }
    }
    if (rename(tmp.c_str(), path.c_str()) != 0) {
        throw runtime_error("cannot replace " + path);
    }
}

void to_json(json& j, const Database& db)
{
    json spaces = json::array();
    for (const auto& kv : db.spaces_) {
        spaces.push_back(kv.second);
    }
    // Rows are emitted per filespace in id order so that dumps are stable.
    json nodes = json::array();
    for (const auto& kv : db.spaces_) {
        auto it = db.by_space_.find(kv.first);
        if (it == db.by_space_.end()) {
            continue;
        }
        for (const auto& id : it->second) {
            nodes.push_back(db.nodes_.at(id));
        }
    }
    j = json{{"filespaces", spaces}, {"nodes", nodes}};
}

void from_json(const json& j, Database& db)
{
    db.spaces_.clear();
    db.nodes_.clear();
    db.by_space_.clear();
    db.by_parent_.clear();
    for (const auto& s : j.at("filespaces")) {
        db.store_space(s.get<FileSpace>());
    }
    for (const auto& n : j.at("nodes")) {
        db.store(n.get<Node>());
    }
}

Transaction::Transaction(Database& db) : db_(db), lock_(db.mutex_) {}

Transaction::~Transaction()
{
    if (!done_) {
        if (!nodes_.empty() || !spaces_.empty()) {
            cerr << "WARNING: rolling back " << nodes_.size()
                 << " node(s) and " << spaces_.size() << " filespace(s)" << endl;
        }
        rollback();
    }
}

void Transaction::commit()
{
    nodes_.clear();
    spaces_.clear();
    done_ = true;
}

void Transaction::rollback()
{
    for (auto& kv : nodes_) {
        if (kv.second) {
            db_.store(*kv.second);
        } else {
            db_.erase(kv.first);
        }
    }
    for (auto& kv : spaces_) {
        if (kv.second) {
            db_.store_space(*kv.second);
        } else {
            db_.erase_space(kv.first);
        }
    }
    nodes_.clear();
    spaces_.clear();
    done_ = true;
}

}
