#ifndef INCLUDE_AGENTFS_REMOTE_
#define INCLUDE_AGENTFS_REMOTE_

#include <memory>
#include <string>

#include "blob.grpc.pb.h"
#include "../lib/blobstore.hpp"

namespace agentfs {

// Blob store backed by a BlobService reachable at `url`.
class RemoteBlobStore : public BlobStore {
  public:
    RemoteBlobStore(const std::string& url, bool debug = false);
    int put(const std::string& key, const std::string& bytes) override;
    int remove(const std::string& key) override;

  private:
    std::unique_ptr<blob::BlobService::Stub> stub_;
    bool debug_;
};

}

#endif
