#ifndef INCLUDE_AGENTFS_DATABASE_
#define INCLUDE_AGENTFS_DATABASE_

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "metadata.hpp"

namespace agentfs {

class Transaction;

// In-memory table of filespaces and nodes. Rows are addressed by id and
// indexed by filespace and by (filespace, parent). Writes go through a
// Transaction, which holds the database lock and an undo log.
class Database {
  public:
    Database();
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    const FileSpace *space(const std::string& id) const;
    std::vector<const FileSpace *> spaces() const;
    void put_space(Transaction& tx, const FileSpace& fs);

    const Node *node(const std::string& id) const;
    void put(Transaction& tx, const Node& node);

    // Live and deleted rows whose parent is `parent` (unset = root level).
    std::vector<const Node *> children(const std::string& space,
                                       const std::optional<std::string>& parent) const;

    template <class Pred>
    std::vector<const Node *> select(const std::string& space, Pred pred) const
    {
        std::vector<const Node *> out;
        auto it = by_space_.find(space);
        if (it == by_space_.end()) {
            return out;
        }
        for (const auto& id : it->second) {
            const Node& n = nodes_.at(id);
            if (pred(n)) {
                out.push_back(&n);
            }
        }
        return out;
    }

    // Applies `fn` to every row of `space` matching `pred` in one pass and
    // returns the number of rows touched.
    template <class Pred, class Fn>
    size_t update_where(Transaction& tx, const std::string& space, Pred pred, Fn fn);

    size_t size() const;
    std::mutex& mutex();

    // Missing files load as an empty database.
    void load(const std::string& path);
    void save(const std::string& path) const;

  private:
    typedef std::pair<std::string, std::string> ParentKey;

    static ParentKey parent_key(const Node& n);
    void remember(Transaction& tx, const std::string& id);
    void store(const Node& node);
    void erase(const std::string& id);
    void store_space(const FileSpace& fs);
    void erase_space(const std::string& id);

    std::map<std::string, FileSpace> spaces_;
    std::unordered_map<std::string, Node> nodes_;
    std::unordered_map<std::string, std::set<std::string>> by_space_;
    std::map<ParentKey, std::set<std::string>> by_parent_;
    mutable std::mutex mutex_;

    friend Transaction;
    friend void to_json(nlohmann::json& j, const Database& db);
    friend void from_json(const nlohmann::json& j, Database& db);
};

// Scope of one structural mutation. Holds the database lock for its
// lifetime; unless commit() is called, every row it touched is restored
// when it goes out of scope.
class Transaction {
  public:
    explicit Transaction(Database& db);
    ~Transaction();
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();
    void rollback();

  private:
    Database& db_;
    std::unique_lock<std::mutex> lock_;
    std::unordered_map<std::string, std::optional<Node>> nodes_;
    std::unordered_map<std::string, std::optional<FileSpace>> spaces_;
    bool done_ = false;

    friend Database;
};

template <class Pred, class Fn>
size_t Database::update_where(Transaction& tx, const std::string& space, Pred pred, Fn fn)
{
    size_t count = 0;
    auto it = by_space_.find(space);
    if (it == by_space_.end()) {
        return 0;
    }
    // Indexes are keyed by id and parent, neither of which `fn` may change,
    // so the rows can be rewritten in place.
    for (const auto& id : it->second) {
        Node& n = nodes_.at(id);
        if (!pred(n)) {
            continue;
        }
        remember(tx, id);
        fn(n);
        ++count;
    }
    return count;
}

void to_json(nlohmann::json& j, const Database& db);
void from_json(const nlohmann::json& j, Database& db);

}

#endif
