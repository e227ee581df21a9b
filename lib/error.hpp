#ifndef INCLUDE_AGENTFS_ERROR_
#define INCLUDE_AGENTFS_ERROR_

#include <cerrno>

namespace agentfs {

// Operations return 0 (or a non-negative count) on success and one of these
// negated errno values on failure.
constexpr int INVALID_NAME = -EINVAL;
constexpr int INVALID_PARENT = -ENOTDIR;
constexpr int CYCLE_DETECTED = -ELOOP;
constexpr int NAME_CONFLICT = -EEXIST;
constexpr int DUPLICATE_NAME = -EEXIST;
constexpr int NOT_FOUND = -ENOENT;
constexpr int STORAGE_ERROR = -EIO;
constexpr int IS_DIRECTORY = -EISDIR;
constexpr int CONCURRENCY_CONFLICT = -EBUSY;

const char *describe(int err);

}

#endif
