#include "objectkey.hpp"

#include "path.hpp"

using namespace std;

namespace agentfs {

static string safe_basename(const Node& node, const optional<string>& filename)
{
    string base = filename && !filename->empty() ? *filename : node.name;
    string s = sanitize_filename(basename(base));
    if (s.empty() && base != node.name) {
        s = sanitize_filename(node.name);
    }
    return s.empty() ? FALLBACK_BASENAME : s;
}

string object_key(const Node& node, const optional<string>& filename)
{
    return string(KEY_PREFIX) + SEP + node.filespace + SEP + node.id + SEP +
           safe_basename(node, filename);
}

string current_key(const Node& node)
{
    if (node.content && !node.content->key.empty()) {
        return node.content->key;
    }
    return object_key(node);
}

}
