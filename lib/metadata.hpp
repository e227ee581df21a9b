#ifndef INCLUDE_AGENTFS_METADATA_
#define INCLUDE_AGENTFS_METADATA_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace agentfs {

typedef std::chrono::system_clock::time_point Timestamp;

Timestamp now();

enum class Kind { Directory, File };

const char *kind_name(Kind kind);

struct Live {};

struct Deleted {
    Timestamp at;
};

// A node is either live or deleted at some instant, never both.
typedef std::variant<Live, Deleted> Liveness;

struct Content {
    std::string key;
    uint64_t size = 0;
    std::string mime_type;
    std::string checksum;
};

struct FileSpace {
    std::string id;
    std::string name;
    std::string owner;
    std::string description;
    Timestamp created_at;
    Timestamp updated_at;
};

struct Node {
    std::string id;
    std::string filespace;
    std::optional<std::string> parent; // unset at the filespace root
    Kind kind = Kind::File;
    std::string name;
    std::string path;
    std::optional<Content> content; // files only
    std::optional<std::string> created_by;
    Liveness state;
    Timestamp created_at;
    Timestamp updated_at;

    bool is_dir() const;
    bool is_file() const;
    bool is_deleted() const;
    std::optional<Timestamp> deleted_at() const;
};

void to_json(nlohmann::json& j, const Content& c);
void from_json(const nlohmann::json& j, Content& c);
void to_json(nlohmann::json& j, const FileSpace& fs);
void from_json(const nlohmann::json& j, FileSpace& fs);
void to_json(nlohmann::json& j, const Node& n);
void from_json(const nlohmann::json& j, Node& n);

}

#endif
