#include "metadata.hpp"

#include <stdexcept>

using namespace std;
using nlohmann::json;

namespace agentfs {

Timestamp now()
{
    return chrono::system_clock::now();
}

const char *kind_name(Kind kind)
{
    return kind == Kind::Directory ? "dir" : "file";
}

bool Node::is_dir() const
{
    return kind == Kind::Directory;
}

bool Node::is_file() const
{
    return kind == Kind::File;
}

bool Node::is_deleted() const
{
    return holds_alternative<Deleted>(state);
}

optional<Timestamp> Node::deleted_at() const
{
    if (auto d = get_if<Deleted>(&state)) {
        return d->at;
    }
    return nullopt;
}

// Timestamps are stored as microseconds since the epoch.
static int64_t to_micros(Timestamp ts)
{
    return chrono::duration_cast<chrono::microseconds>(ts.time_since_epoch()).count();
}

static Timestamp from_micros(int64_t us)
{
    return Timestamp(chrono::duration_cast<Timestamp::duration>(chrono::microseconds(us)));
}

static Kind kind_from(const string& s)
{
    if (s == "dir") {
        return Kind::Directory;
    } else if (s == "file") {
        return Kind::File;
    }
    throw invalid_argument("unknown node kind: " + s);
}

void to_json(json& j, const Content& c)
{
    j = json{{"key", c.key}, {"size", c.size},
             {"mime_type", c.mime_type}, {"checksum", c.checksum}};
}

void from_json(const json& j, Content& c)
{
    j.at("key").get_to(c.key);
    j.at("size").get_to(c.size);
    j.at("mime_type").get_to(c.mime_type);
    j.at("checksum").get_to(c.checksum);
}

void to_json(json& j, const FileSpace& fs)
{
    j = json{{"id", fs.id}, {"name", fs.name}, {"owner", fs.owner},
             {"description", fs.description},
             {"created_at", to_micros(fs.created_at)},
             {"updated_at", to_micros(fs.updated_at)}};
}

void from_json(const json& j, FileSpace& fs)
{
    j.at("id").get_to(fs.id);
    j.at("name").get_to(fs.name);
    j.at("owner").get_to(fs.owner);
    fs.description = j.value("description", "");
    fs.created_at = from_micros(j.at("created_at").get<int64_t>());
    fs.updated_at = from_micros(j.at("updated_at").get<int64_t>());
}

void to_json(json& j, const Node& n)
{
    j = json{{"id", n.id}, {"filespace", n.filespace},
             {"kind", kind_name(n.kind)}, {"name", n.name}, {"path", n.path},
             {"is_deleted", n.is_deleted()},
             {"created_at", to_micros(n.created_at)},
             {"updated_at", to_micros(n.updated_at)}};
    j["parent"] = n.parent ? json(*n.parent) : json(nullptr);
    j["content"] = n.content ? json(*n.content) : json(nullptr);
    j["created_by"] = n.created_by ? json(*n.created_by) : json(nullptr);
    auto at = n.deleted_at();
    j["deleted_at"] = at ? json(to_micros(*at)) : json(nullptr);
}

void from_json(const json& j, Node& n)
{
    j.at("id").get_to(n.id);
    j.at("filespace").get_to(n.filespace);
    n.kind = kind_from(j.at("kind").get<string>());
    j.at("name").get_to(n.name);
    j.at("path").get_to(n.path);
    n.created_at = from_micros(j.at("created_at").get<int64_t>());
    n.updated_at = from_micros(j.at("updated_at").get<int64_t>());

    n.parent.reset();
    if (j.contains("parent") && !j["parent"].is_null()) {
        n.parent = j["parent"].get<string>();
    }
    n.content.reset();
    if (n.is_file() && j.contains("content") && !j["content"].is_null()) {
        n.content = j["content"].get<Content>();
    }
    n.created_by.reset();
    if (j.contains("created_by") && !j["created_by"].is_null()) {
        n.created_by = j["created_by"].get<string>();
    }

    // A row flagged deleted without a timestamp takes its last update time.
    const auto& at = j.contains("deleted_at") ? j["deleted_at"] : json(nullptr);
    if (!at.is_null()) {
        n.state = Deleted{from_micros(at.get<int64_t>())};
    } else if (j.value("is_deleted", false)) {
        n.state = Deleted{n.updated_at};
    } else {
        n.state = Live{};
    }
}

}
