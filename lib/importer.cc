#include "importer.hpp"

#include <ctime>
#include <iostream>
#include <set>

#include "error.hpp"
#include "path.hpp"

using namespace std;

namespace agentfs {

string utc_date(Timestamp ts)
{
    time_t t = chrono::system_clock::to_time_t(ts);
    struct tm parts {};
    gmtime_r(&t, &parts);
    char buf[16];
    strftime(buf, sizeof(buf), "%Y-%m-%d", &parts);
    return buf;
}

Importer::Importer(NodeStore& store, bool debug) : store_(store), debug_(debug) {}

int Importer::ensure_dir(const string& space, const optional<string>& parent,
                         const string& name, Node& out)
{
    vector<Node> children;
    int err = store_.list_children(space, parent, children);
    if (err) {
        return err;
    }
    for (const auto& n : children) {
        if (n.is_dir() && n.name == name) {
            out = n;
            return 0;
        }
    }
    return store_.create(space, parent, Kind::Directory, name, out);
}

int Importer::dedupe_name(const string& space, const optional<string>& parent,
                          const string& base, string& out)
{
    vector<Node> children;
    int err = store_.list_children(space, parent, children);
    if (err) {
        return err;
    }
    set<string> taken;
    for (const auto& n : children) {
        taken.insert(n.name);
    }
    if (taken.count(base) == 0) {
        out = base;
        return 0;
    }

    auto dot = base.rfind('.');
    string stem = dot == string::npos ? base : base.substr(0, dot);
    string ext = dot == string::npos ? "" : base.substr(dot);
    for (int i = 2;; ++i) {
        string candidate = stem + " (" + to_string(i) + ")" + ext;
        if (taken.count(candidate) == 0) {
            out = candidate;
            return 0;
        }
    }
}

int Importer::import(const string& space, const Attachment& att, Timestamp received,
                     ImportedNode& out, const optional<string>& agent)
{
    if (debug_)
        cerr << "DEBUG: " << __func__ << "(): space=" << space
             << ", filename=" << att.filename << ", size=" << att.data.size() << endl;

    Node inbox, day;
    int err = ensure_dir(space, nullopt, INBOX_DIR, inbox);
    if (err == 0) {
        err = ensure_dir(space, inbox.id, utc_date(received), day);
    }
    if (err) {
        return err;
    }

    string base = basename(att.filename);
    if (!valid_name(base)) {
        base = FALLBACK_ATTACHMENT;
    }
    string name;
    err = dedupe_name(space, day.id, base, name);
    if (err) {
        return err;
    }

    Upload upload;
    upload.filename = att.filename.empty() ? name : att.filename;
    upload.data = att.data;
    upload.mime_type = att.mime_type;

    NewNode req;
    req.space = space;
    req.parent = day.id;
    req.kind = Kind::File;
    req.name = name;
    req.created_by = agent;
    req.content = &upload;

    Node node;
    err = store_.create(req, node);
    if (err) {
        return err;
    }
    out.node_id = node.id;
    out.path = node.path;
    out.filename = name;
    return 0;
}

vector<ImportedNode> Importer::import_all(const string& space, const vector<Attachment>& atts,
                                          Timestamp received, const optional<string>& agent)
{
    vector<ImportedNode> created;
    for (const auto& att : atts) {
        ImportedNode info;
        int err = import(space, att, received, info, agent);
        if (err) {
            cerr << "ERROR: import_all(): " << att.filename << ": "
                 << describe(err) << endl;
            continue;
        }
        created.push_back(info);
    }
    return created;
}

}
