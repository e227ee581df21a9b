/*
  agentfs: command-line access to agent filespaces

  Every command loads the metadata database named by the configuration,
  performs one operation, and writes the database back if it changed.
*/

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include "lib/blobstore.hpp"
#include "lib/config.hpp"
#include "lib/database.hpp"
#include "lib/error.hpp"
#include "lib/importer.hpp"
#include "lib/nodestore.hpp"
#include "lib/objectkey.hpp"
#include "lib/path.hpp"
#include "lib/registry.hpp"
#include "protos/remote.hpp"

using namespace std;
using namespace agentfs;

struct Cli {
    Database db;
    unique_ptr<BlobStore> blobs;
    bool debug = false;
    bool all = false;
    string mime;
    optional<string> agent;
};
static Cli cli{};


static void print_usage(char *prog_name) {
    cout << "Usage: " << prog_name << " --help\n"
         << "       " << prog_name << " [options] <command> [args...]\n"
         << "\ncommands:\n"
         << "  mkspace <owner> <name> [description]\n"
         << "  provision <owner> <agent-name>\n"
         << "  spaces <owner>\n"
         << "  mkdir <space> <path>\n"
         << "  put <space> <path> <local-file>\n"
         << "  mv <space> <path> <new-path>\n"
         << "  rm <space> <path>\n"
         << "  restore <space> <node-id>\n"
         << "  ls <space> [path]\n"
         << "  key <space> <path> [filename]\n"
         << "  import <space> <local-file>...\n";
}


static void print_node(const Node& n) {
    cout << (n.is_dir() ? "d " : "- ") << n.path << "\t" << n.id;
    if (n.content) {
        cout << "\t" << n.content->size << "\t" << n.content->mime_type;
    }
    if (n.is_deleted()) {
        cout << "\t(deleted)";
    }
    cout << "\n";
}


static void print_space(const FileSpace& fs) {
    cout << fs.id << "\t" << fs.owner << "\t" << fs.name << "\n";
}


static int fail(const string& cmd, int err) {
    cerr << "ERROR: " << cmd << "(): " << describe(err) << endl;
    return 1;
}


static bool read_file(const string& path, string& out) {
    ifstream i {path, ios::binary};
    if (!i) {
        return false;
    }
    out.assign(istreambuf_iterator<char>(i), istreambuf_iterator<char>());
    return true;
}


// Splits `path` into its parent directory (unset at the root) and last name.
static int resolve_parent(NodeStore& store, const string& space, const string& path,
                          optional<string>& parent, string& name) {
    auto pos = path.rfind(SEP);
    name = pos == string::npos ? path : path.substr(pos + 1);
    string dir = pos == string::npos ? "" : path.substr(0, pos);
    parent.reset();
    if (dir.find_first_not_of(SEP) == string::npos) {
        return 0;
    }
    Node p;
    int err = store.lookup(space, dir.c_str(), p);
    if (err) {
        return err;
    }
    if (!p.is_dir()) {
        return INVALID_PARENT;
    }
    parent = p.id;
    return 0;
}


static int run(const string& cmd, const vector<string>& args, bool& dirty) {
    Registry registry(cli.db, cli.debug);
    NodeStore store(cli.db, cli.blobs.get(), cli.debug);
    auto want = [&](size_t lo, size_t hi) {
        if (args.size() < lo || args.size() > hi) {
            cerr << "ERROR: " << cmd << ": invalid number of arguments" << endl;
            return false;
        }
        return true;
    };

    if (cmd == "mkspace") {
        if (!want(2, 3))
            return 2;
        FileSpace fs;
        int err = registry.create(args[1], args[0], fs, args.size() > 2 ? args[2] : "");
        if (err)
            return fail(cmd, err);
        print_space(fs);
        dirty = true;

    } else if (cmd == "provision") {
        if (!want(2, 2))
            return 2;
        FileSpace fs;
        int err = registry.provision_default(args[1], args[0], fs);
        if (err)
            return fail(cmd, err);
        print_space(fs);
        dirty = true;

    } else if (cmd == "spaces") {
        if (!want(1, 1))
            return 2;
        for (const auto& fs : registry.list(args[0]))
            print_space(fs);

    } else if (cmd == "mkdir" || cmd == "put") {
        if (!want(2, cmd == "put" ? 3 : 2))
            return 2;
        optional<string> parent;
        string name;
        int err = resolve_parent(store, args[0], args[1], parent, name);
        if (err)
            return fail(cmd, err);
        Node n;
        if (cmd == "mkdir") {
            err = store.create(args[0], parent, Kind::Directory, name, n);
        } else {
            Upload upload;
            if (!read_file(args[2], upload.data)) {
                cerr << "ERROR: put(): cannot read " << args[2] << endl;
                return 1;
            }
            upload.filename = basename(args[2]);
            upload.mime_type = cli.mime;
            NewNode req;
            req.space = args[0];
            req.parent = parent;
            req.name = name;
            req.created_by = cli.agent;
            req.content = &upload;
            err = store.create(req, n);
        }
        if (err)
            return fail(cmd, err);
        print_node(n);
        dirty = true;

    } else if (cmd == "mv") {
        if (!want(3, 3))
            return 2;
        Node n;
        int err = store.lookup(args[0], args[1].c_str(), n);
        optional<string> parent;
        string name;
        if (err == 0)
            err = resolve_parent(store, args[0], args[2], parent, name);
        if (err == 0)
            err = store.move(n.id, parent, name, n);
        if (err)
            return fail(cmd, err);
        print_node(n);
        dirty = true;

    } else if (cmd == "rm") {
        if (!want(2, 2))
            return 2;
        Node n;
        int ret = store.lookup(args[0], args[1].c_str(), n);
        if (ret == 0)
            ret = store.trash(n.id);
        if (ret < 0)
            return fail(cmd, ret);
        cout << ret << " node(s) moved to trash\n";
        dirty = true;

    } else if (cmd == "restore") {
        if (!want(2, 2))
            return 2;
        Node n;
        int ret = store.get(args[1], n);
        if (ret == 0 && n.filespace != args[0])
            ret = NOT_FOUND;
        if (ret == 0)
            ret = store.restore(n.id);
        if (ret < 0)
            return fail(cmd, ret);
        cout << ret << " node(s) restored\n";
        dirty = true;

    } else if (cmd == "ls") {
        if (!want(1, 2))
            return 2;
        optional<string> parent;
        if (args.size() > 1 && args[1].find_first_not_of(SEP) != string::npos) {
            Node p;
            int err = store.lookup(args[0], args[1].c_str(), p);
            if (err)
                return fail(cmd, err);
            parent = p.id;
        }
        vector<Node> children;
        int err = store.list_children(args[0], parent, children, cli.all);
        if (err)
            return fail(cmd, err);
        for (const auto& n : children)
            print_node(n);

    } else if (cmd == "key") {
        if (!want(2, 3))
            return 2;
        Node n;
        int err = store.lookup(args[0], args[1].c_str(), n);
        if (err)
            return fail(cmd, err);
        cout << (args.size() > 2 ? object_key(n, args[2]) : current_key(n)) << "\n";

    } else if (cmd == "import") {
        if (!want(2, SIZE_MAX))
            return 2;
        vector<Attachment> atts;
        for (size_t i = 1; i < args.size(); ++i) {
            Attachment att;
            if (!read_file(args[i], att.data)) {
                cerr << "ERROR: import(): cannot read " << args[i] << endl;
                continue;
            }
            att.filename = basename(args[i]);
            att.mime_type = cli.mime;
            atts.push_back(att);
        }
        Importer importer(store, cli.debug);
        auto created = importer.import_all(args[0], atts, now(), cli.agent);
        for (const auto& info : created)
            cout << info.path << "\t" << info.node_id << "\n";
        dirty = !created.empty();
        if (created.size() != args.size() - 1)
            return 1;

    } else {
        cerr << "ERROR: unknown command " << cmd << endl;
        return 2;
    }
    return 0;
}


static cxxopts::ParseResult parse_wrapper(cxxopts::Options& parser, int& argc, char**& argv) {
    try {
        return parser.parse(argc, argv);
    } catch (cxxopts::OptionException& exc) {
        std::cout << argv[0] << ": " << exc.what() << std::endl;
        print_usage(argv[0]);
        exit(2);
    }
}


static cxxopts::ParseResult parse_options(int argc, char **argv) {
    cxxopts::Options opt_parser(argv[0]);
    opt_parser.add_options()
        ("config", "Configuration file", cxxopts::value<std::string>()
            ->default_value("/etc/agentfs/config.json"))
        ("debug", "Enable debug messages")
        ("help", "Print help")
        ("all", "Include deleted nodes in listings")
        ("mime", "MIME type of stored content", cxxopts::value<std::string>()
            ->default_value("application/octet-stream"))
        ("agent", "Agent recorded as creator of new nodes", cxxopts::value<std::string>())
        ("command", "Command", cxxopts::value<std::string>())
        ("args", "Command arguments", cxxopts::value<std::vector<std::string>>());
    opt_parser.parse_positional({"command", "args"});

    auto options = parse_wrapper(opt_parser, argc, argv);

    if (options.count("help")) {
        print_usage(argv[0]);
        auto help = opt_parser.help();
        std::cout << std::endl << "options:"
                  << help.substr(help.find("\n\n") + 1, string::npos);
        exit(0);

    } else if (!options.count("command")) {
        std::cout << argv[0] << ": missing command\n";
        print_usage(argv[0]);
        exit(2);
    }

    return options;
}


int main(int argc, char *argv[]) {

    auto options {parse_options(argc, argv)};
    auto cmd = options["command"].as<std::string>();
    auto args = options.count("args")
        ? options["args"].as<std::vector<std::string>>()
        : std::vector<std::string>();

    try {
        Config cfg(options["config"].as<std::string>());
        cli.debug = cfg.debug() || options.count("debug") != 0;
        cli.all = options.count("all") != 0;
        cli.mime = options["mime"].as<std::string>();
        if (options.count("agent"))
            cli.agent = options["agent"].as<std::string>();

        if (cfg.remote().empty())
            cli.blobs.reset(new PoolBlobStore(cfg.pool(), cli.debug));
        else
            cli.blobs.reset(new RemoteBlobStore(cfg.remote(), cli.debug));

        cli.db.load(cfg.metadata());

        bool dirty = false;
        int ret = run(cmd, args, dirty);
        if (dirty)
            cli.db.save(cfg.metadata());
        return ret;

    } catch (std::exception& exc) {
        cerr << "ERROR: " << exc.what() << endl;
    }
    return 1;
}
