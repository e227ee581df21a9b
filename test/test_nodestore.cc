#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "../lib/database.hpp"
#include "../lib/error.hpp"
#include "../lib/nodestore.hpp"
#include "../lib/registry.hpp"
#include "fakes.hpp"

#define OPENSSL_SUPPRESS_DEPRECATED
#include <openssl/rand.h>

using namespace std;
using namespace agentfs;

struct Fixture {
    MemoryBlobStore blobs;
    Database db;
    Registry registry {db};
    NodeStore store {db, &blobs};
    FileSpace fs;

    Fixture()
    {
        int err = registry.create("Work", "u1", fs);
        assert(err == 0);
        (void)err;
    }

    Node mkdir(const optional<string>& parent, const string& name)
    {
        Node n;
        int err = store.create(fs.id, parent, Kind::Directory, name, n);
        assert(err == 0);
        (void)err;
        return n;
    }

    Node touch(const optional<string>& parent, const string& name)
    {
        Node n;
        int err = store.create(fs.id, parent, Kind::File, name, n);
        assert(err == 0);
        (void)err;
        return n;
    }

    Node fetch(const string& id)
    {
        Node n;
        int err = store.get(id, n);
        assert(err == 0);
        (void)err;
        return n;
    }
};

void test_create_paths()
{
    Fixture f;
    auto a = f.mkdir(nullopt, "a");
    auto b = f.mkdir(a.id, "b");
    auto c = f.touch(b.id, "c.txt");

    assert(a.path == "/a");
    assert(b.path == "/a/b");
    assert(c.path == "/a/b/c.txt");
    assert(c.parent == b.id);
    assert(!a.parent);
    assert(!c.is_deleted());

    Node found;
    assert(f.store.lookup(f.fs.id, "/a/b/c.txt", found) == 0);
    assert(found.id == c.id);
    assert(f.store.lookup(f.fs.id, "a//b", found) == 0);
    assert(found.id == b.id);
    assert(f.store.lookup(f.fs.id, "/a/missing", found) == NOT_FOUND);
    assert(f.store.lookup(f.fs.id, "/a/b/c.txt/x", found) == INVALID_PARENT);
    assert(f.store.lookup(f.fs.id, "/", found) == NOT_FOUND);
}

void test_create_validation()
{
    Fixture f;
    auto dir = f.mkdir(nullopt, "dir");
    auto file = f.touch(nullopt, "file");
    Node n;

    assert(f.store.create(f.fs.id, nullopt, Kind::File, "", n) == INVALID_NAME);
    assert(f.store.create(f.fs.id, nullopt, Kind::File, "a/b", n) == INVALID_NAME);
    assert(f.store.create(f.fs.id, nullopt, Kind::File, string("a\0b", 3), n) == INVALID_NAME);
    assert(f.store.create(f.fs.id, file.id, Kind::File, "x", n) == INVALID_PARENT);
    assert(f.store.create(f.fs.id, string("nope"), Kind::File, "x", n) == NOT_FOUND);
    assert(f.store.create("no-such-space", nullopt, Kind::File, "x", n) == NOT_FOUND);

    FileSpace other;
    assert(f.registry.create("Other", "u1", other) == 0);
    assert(f.store.create(other.id, dir.id, Kind::File, "x", n) == INVALID_PARENT);

    assert(f.store.trash(dir.id) == 1);
    assert(f.store.create(f.fs.id, dir.id, Kind::File, "x", n) == INVALID_PARENT);
}

void test_directory_never_has_content()
{
    Fixture f;
    Upload up {"x.bin", "bytes", "application/octet-stream"};
    Node d;
    assert(f.store.create(f.fs.id, nullopt, Kind::Directory, "d", d, &up) == 0);
    assert(!d.content);
    assert(f.blobs.blobs.empty());
    assert(f.store.attach(d.id, up, d) == IS_DIRECTORY);
}

void test_sibling_uniqueness()
{
    Fixture f;
    auto dir = f.mkdir(nullopt, "dir");
    auto first = f.touch(dir.id, "notes.md");
    Node n;

    assert(f.store.create(f.fs.id, dir.id, Kind::File, "notes.md", n) == NAME_CONFLICT);
    assert(f.store.create(f.fs.id, dir.id, Kind::Directory, "notes.md", n) == NAME_CONFLICT);
    // case-sensitive
    assert(f.store.create(f.fs.id, dir.id, Kind::File, "Notes.md", n) == 0);

    assert(f.store.trash(first.id) == 1);
    assert(f.store.create(f.fs.id, dir.id, Kind::File, "notes.md", n) == 0);
}

void test_root_uniqueness()
{
    Fixture f;
    auto top = f.touch(nullopt, "readme");
    Node n;
    assert(f.store.create(f.fs.id, nullopt, Kind::Directory, "readme", n) == NAME_CONFLICT);

    // same name one level down is fine
    auto dir = f.mkdir(nullopt, "dir");
    assert(f.store.create(f.fs.id, dir.id, Kind::File, "readme", n) == 0);

    FileSpace other;
    assert(f.registry.create("Other", "u1", other) == 0);
    assert(f.store.create(other.id, nullopt, Kind::File, "readme", n) == 0);

    assert(f.store.trash(top.id) == 1);
    assert(f.store.create(f.fs.id, nullopt, Kind::File, "readme", n) == 0);
}

void test_listing_order()
{
    Fixture f;
    f.touch(nullopt, "b.txt");
    f.mkdir(nullopt, "zeta");
    f.touch(nullopt, "a.txt");
    f.mkdir(nullopt, "alpha");
    auto gone = f.touch(nullopt, "gone");
    assert(f.store.trash(gone.id) == 1);

    vector<Node> out;
    assert(f.store.list_children(f.fs.id, nullopt, out) == 0);
    vector<string> names;
    for (const auto& n : out) {
        names.push_back(n.name);
    }
    assert((names == vector<string>{"alpha", "zeta", "a.txt", "b.txt"}));

    assert(f.store.list_children(f.fs.id, nullopt, out, true) == 0);
    assert(out.size() == 5);

    auto file = f.touch(nullopt, "plain");
    assert(f.store.list_children(f.fs.id, file.id, out) == INVALID_PARENT);
}

void test_rename_rewrites_descendants()
{
    Fixture f;
    auto a = f.mkdir(nullopt, "a");
    auto b = f.mkdir(a.id, "b");
    auto c = f.touch(b.id, "c.txt");
    auto d = f.mkdir(b.id, "d");
    auto e = f.touch(d.id, "e");
    auto other = f.touch(nullopt, "ab");

    Node out;
    assert(f.store.rename(a.id, "z", out) == 0);
    assert(out.path == "/z");
    assert(f.fetch(b.id).path == "/z/b");
    assert(f.fetch(c.id).path == "/z/b/c.txt");
    assert(f.fetch(d.id).path == "/z/b/d");
    assert(f.fetch(e.id).path == "/z/b/d/e");
    assert(f.fetch(other.id).path == "/ab");

    // move b to the root under a new name
    assert(f.store.move(b.id, nullopt, string("top"), out) == 0);
    assert(!out.parent);
    assert(out.path == "/top");
    assert(f.fetch(e.id).path == "/top/d/e");

    // and back below z keeping its name
    assert(f.store.move(b.id, a.id, nullopt, out) == 0);
    assert(out.path == "/z/top");
    assert(f.fetch(c.id).path == "/z/top/c.txt");

    // a file rename touches nobody else
    assert(f.store.rename(c.id, "c2.txt", out) == 0);
    assert(out.path == "/z/top/c2.txt");
    assert(f.fetch(e.id).path == "/z/top/d/e");
}

void test_move_validation()
{
    Fixture f;
    auto a = f.mkdir(nullopt, "a");
    auto b = f.mkdir(a.id, "b");
    auto x = f.touch(nullopt, "x");
    f.touch(b.id, "x");
    Node out;

    assert(f.store.rename(a.id, "", out) == INVALID_NAME);
    assert(f.store.rename(a.id, "x", out) == NAME_CONFLICT);
    assert(f.store.move(x.id, b.id, nullopt, out) == NAME_CONFLICT);
    assert(f.store.move(x.id, x.id, nullopt, out) == INVALID_PARENT);
    assert(f.store.rename("missing", "y", out) == NOT_FOUND);
    assert(f.fetch(x.id).path == "/x");

    // renaming to the current name is not a conflict with itself
    assert(f.store.rename(a.id, "a", out) == 0);
    assert(out.path == "/a");
}

void test_cycle_detection()
{
    Fixture f;
    auto a = f.mkdir(nullopt, "a");
    auto b = f.mkdir(a.id, "b");
    auto c = f.mkdir(b.id, "c");
    Node out;

    assert(f.store.move(a.id, c.id, nullopt, out) == CYCLE_DETECTED);
    assert(f.store.move(a.id, b.id, nullopt, out) == CYCLE_DETECTED);
    assert(f.store.move(a.id, a.id, nullopt, out) == CYCLE_DETECTED);

    auto stored = f.fetch(a.id);
    assert(!stored.parent);
    assert(stored.path == "/a");
    assert(f.fetch(c.id).path == "/a/b/c");

    // moving down a sibling branch is fine
    auto s = f.mkdir(nullopt, "s");
    assert(f.store.move(s.id, c.id, nullopt, out) == 0);
    assert(out.path == "/a/b/c/s");
}

void test_content()
{
    Fixture f;
    auto dir = f.mkdir(nullopt, "docs");
    Upload up {"Quarterly Report.pdf", "%PDF-1.4", "application/pdf"};
    Node n;
    assert(f.store.create(f.fs.id, dir.id, Kind::File, "report.pdf", n, &up) == 0);
    assert(n.content);
    assert(n.content->size == 8);
    assert(n.content->mime_type == "application/pdf");
    assert(n.content->checksum.size() == 64);
    assert(n.content->key == "agent_fs/" + f.fs.id + "/" + n.id + "/Quarterly_Report.pdf");
    assert(f.blobs.blobs.at(n.content->key) == "%PDF-1.4");

    // checksum of "abc"
    Upload abc {"abc.txt", "abc", "text/plain"};
    assert(f.store.attach(n.id, abc, n) == 0);
    assert(n.content->checksum ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(n.content->size == 3);
    assert(f.blobs.blobs.size() == 1);
    assert(f.blobs.blobs.count(n.content->key) == 1);

    // key is tied to the node, not its path
    string key = n.content->key;
    Node renamed;
    assert(f.store.rename(dir.id, "papers", renamed) == 0);
    assert(f.fetch(n.id).path == "/papers/report.pdf");
    assert(f.fetch(n.id).content->key == key);
}

void test_storage_failure()
{
    Fixture f;
    f.blobs.fail = true;
    Upload up {"a.txt", "data", "text/plain"};
    Node n;
    assert(f.store.create(f.fs.id, nullopt, Kind::File, "a.txt", n, &up) == STORAGE_ERROR);
    vector<Node> out;
    assert(f.store.list_children(f.fs.id, nullopt, out) == 0);
    assert(out.empty());

    f.blobs.fail = false;
    assert(f.store.create(f.fs.id, nullopt, Kind::File, "a.txt", n, &up) == 0);
    auto before = n.content->checksum;
    f.blobs.fail = true;
    Upload other {"b.txt", "other", "text/plain"};
    assert(f.store.attach(n.id, other, n) == STORAGE_ERROR);
    assert(f.fetch(n.id).content->checksum == before);

    NodeStore bare(f.db);
    assert(bare.create(f.fs.id, nullopt, Kind::File, "c.txt", n, &up) == STORAGE_ERROR);
}

void test_descendants()
{
    Fixture f;
    auto a = f.mkdir(nullopt, "a");
    auto b = f.mkdir(a.id, "b");
    auto c = f.touch(b.id, "c");
    auto d = f.touch(a.id, "d");
    f.touch(nullopt, "outside");
    assert(f.store.trash(d.id) == 1);

    vector<Node> out;
    assert(f.store.descendants(a.id, out) == 0);
    assert(out.size() == 2);
    assert(out[0].id == b.id && out[1].id == c.id);
    assert(f.store.descendants(a.id, out, true) == 0);
    assert(out.size() == 3);
    assert(f.store.descendants(c.id, out) == 0);
    assert(out.empty());
}

static int no_random(unsigned char *, int) { return 0; }
static int not_seeded() { return 0; }

// With the random source down, no id can be drawn; creation reports a
// storage error and writes nothing.
void test_id_failure()
{
    Fixture f;
    size_t rows = f.db.size();
    size_t spaces = f.db.spaces().size();

    RAND_METHOD broken {};
    broken.bytes = no_random;
    broken.pseudorand = no_random;
    broken.status = not_seeded;
    RAND_set_rand_method(&broken);
    Node n;
    int node_err = f.store.create(f.fs.id, nullopt, Kind::Directory, "d", n);
    FileSpace other;
    int space_err = f.registry.create("Other", "u1", other);
    RAND_set_rand_method(RAND_OpenSSL());

    assert(node_err == STORAGE_ERROR);
    assert(space_err == STORAGE_ERROR);
    assert(f.db.size() == rows);
    assert(f.db.spaces().size() == spaces);

    auto d = f.mkdir(nullopt, "d");
    assert(d.id.size() == 36 && d.id[14] == '4');
}

int main()
{
    test_create_paths();
    test_create_validation();
    test_directory_never_has_content();
    test_sibling_uniqueness();
    test_root_uniqueness();
    test_listing_order();
    test_rename_rewrites_descendants();
    test_move_validation();
    test_cycle_detection();
    test_content();
    test_storage_failure();
    test_descendants();
    test_id_failure();
    cout << "test_nodestore: ok" << endl;
    return 0;
}
