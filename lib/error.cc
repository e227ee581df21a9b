#include "error.hpp"

#include <cstring>

namespace agentfs {

const char *describe(int err)
{
    switch (err) {
    case 0:
        return "success";
    case INVALID_NAME:
        return "invalid name";
    case INVALID_PARENT:
        return "parent is not a live directory of this filespace";
    case CYCLE_DETECTED:
        return "node cannot become its own descendant";
    case NAME_CONFLICT:
        return "name already in use";
    case NOT_FOUND:
        return "no such filespace or node";
    case STORAGE_ERROR:
        return "blob store failure";
    case IS_DIRECTORY:
        return "directories cannot carry content";
    case CONCURRENCY_CONFLICT:
        return "concurrent modification";
    }
    return strerror(err < 0 ? -err : err);
}

}
