#include "uniqueness.hpp"

#include "error.hpp"

using namespace std;

namespace agentfs {

static bool taken(const vector<const Node *>& level, const string& name,
                  const string& self)
{
    for (auto n : level) {
        if (n->id != self && !n->is_deleted() && n->name == name) {
            return true;
        }
    }
    return false;
}

int check_sibling_name(const Database& db, const string& space,
                       const string& parent, const string& name, const string& self)
{
    return taken(db.children(space, parent), name, self) ? NAME_CONFLICT : 0;
}

int check_root_name(const Database& db, const string& space,
                    const string& name, const string& self)
{
    auto roots = db.select(space, [](const Node& n) { return !n.parent; });
    return taken(roots, name, self) ? NAME_CONFLICT : 0;
}

int check_unique_name(const Database& db, const string& space,
                      const optional<string>& parent, const string& name,
                      const string& self)
{
    if (parent) {
        return check_sibling_name(db, space, *parent, name, self);
    }
    return check_root_name(db, space, name, self);
}

}
