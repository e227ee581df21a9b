#include "config.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

using namespace std;

namespace agentfs {

constexpr char DEFAULT_CONFIG[] = "/etc/agentfs/config.json";

Config::Config() : Config::Config(DEFAULT_CONFIG) {}

Config::Config(const string& path) {
    ifstream i(path);
    nlohmann::json j;
    i >> j;
    metadata_ = j.at("metadata");
    pool_ = j.at("pool");
    remote_ = j.value("remote", "");
    debug_ = j.value("debug", false);
}

Config::~Config() {}

const string& Config::metadata() const { return metadata_; }
const string& Config::pool() const { return pool_; }
const string& Config::remote() const { return remote_; }
bool Config::debug() const { return debug_; }

}
