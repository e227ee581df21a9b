#include "blobstore.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

#include "error.hpp"
#include "path.hpp"

using namespace std;
namespace fs = std::filesystem;

namespace agentfs {

PoolBlobStore::PoolBlobStore(const string& pool, bool debug)
    : pool_(pool), debug_(debug) {}

string PoolBlobStore::path_of(const string& key) const
{
    return pool_ + SEP + key;
}

int PoolBlobStore::put(const string& key, const string& bytes)
{
    if (debug_)
        cerr << "DEBUG: " << __func__ << "(): key=" << key
             << ", size=" << bytes.size() << endl;

    fs::path p = path_of(key);
    error_code ec;
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
        cerr << "ERROR: put(): " << p.parent_path() << ": " << ec.message() << endl;
        return STORAGE_ERROR;
    }

    string tmp = p.string() + ".part";
    {
        ofstream o {tmp, ios::binary | ios::trunc};
        o.write(bytes.data(), static_cast<streamsize>(bytes.size()));
        if (!o) {
            cerr << "ERROR: put(): cannot write " << tmp << endl;
            fs::remove(tmp, ec);
            return STORAGE_ERROR;
        }
    }
    fs::rename(tmp, p, ec);
    if (ec) {
        cerr << "ERROR: put(): " << p << ": " << ec.message() << endl;
        return STORAGE_ERROR;
    }
    return 0;
}

int PoolBlobStore::remove(const string& key)
{
    if (debug_)
        cerr << "DEBUG: " << __func__ << "(): key=" << key << endl;

    error_code ec;
    fs::remove(path_of(key), ec);
    if (ec) {
        cerr << "ERROR: remove(): " << key << ": " << ec.message() << endl;
        return STORAGE_ERROR;
    }
    return 0;
}

}
