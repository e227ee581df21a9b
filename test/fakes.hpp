#ifndef INCLUDE_AGENTFS_TEST_FAKES_
#define INCLUDE_AGENTFS_TEST_FAKES_

#include <map>
#include <string>

#include "../lib/blobstore.hpp"
#include "../lib/error.hpp"

// Blob store kept in memory; `fail` makes every call report STORAGE_ERROR.
class MemoryBlobStore : public agentfs::BlobStore {
  public:
    int put(const std::string& key, const std::string& bytes) override
    {
        if (fail) {
            return agentfs::STORAGE_ERROR;
        }
        blobs[key] = bytes;
        return 0;
    }

    int remove(const std::string& key) override
    {
        if (fail) {
            return agentfs::STORAGE_ERROR;
        }
        blobs.erase(key);
        return 0;
    }

    std::map<std::string, std::string> blobs;
    bool fail = false;
};

#endif
