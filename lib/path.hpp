#ifndef INCLUDE_AGENTFS_PATH_
#define INCLUDE_AGENTFS_PATH_

#include <string>

namespace agentfs {

constexpr char SEP = '/';
constexpr size_t NAME_MAX_BYTES = 255;

// Returns the next component of `path` and advances it past the separators
// that follow; `path` becomes nullptr after the last component.
std::string pathsep(const char *&path);

bool valid_name(const std::string& name);
std::string join_path(const std::string& parent_path, const std::string& name);

// True if `path` lies strictly below `dir`.
bool is_below(const std::string& path, const std::string& dir);
std::string rebase(const std::string& path, const std::string& old_dir,
                   const std::string& new_dir);

std::string basename(const std::string& path);
std::string sanitize_filename(const std::string& name);

}

#endif
