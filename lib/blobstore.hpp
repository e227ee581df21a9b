#ifndef INCLUDE_AGENTFS_BLOBSTORE_
#define INCLUDE_AGENTFS_BLOBSTORE_

#include <string>

namespace agentfs {

// Byte storage for file content. Both calls return 0 or STORAGE_ERROR.
class BlobStore {
  public:
    virtual ~BlobStore() {}
    virtual int put(const std::string& key, const std::string& bytes) = 0;
    virtual int remove(const std::string& key) = 0;
};

// Blobs kept as plain files at <pool>/<key>.
class PoolBlobStore : public BlobStore {
  public:
    PoolBlobStore(const std::string& pool, bool debug = false);
    int put(const std::string& key, const std::string& bytes) override;
    int remove(const std::string& key) override;
    std::string path_of(const std::string& key) const;

  private:
    std::string pool_;
    bool debug_;
};

}

#endif
