#include "remote.hpp"

#include <iostream>

#include <grpcpp/grpcpp.h>

#include "../lib/error.hpp"

using blob::BlobService;
using blob::DeleteReply;
using blob::DeleteRequest;
using blob::PutReply;
using blob::PutRequest;
using namespace grpc;
using namespace std;

namespace agentfs {

RemoteBlobStore::RemoteBlobStore(const string& url, bool debug) : debug_(debug)
{
    const auto& channel = CreateChannel(url, InsecureChannelCredentials());
    stub_ = BlobService::NewStub(channel);
}

int RemoteBlobStore::put(const string& key, const string& bytes)
{
    if (debug_)
        cerr << "DEBUG: " << __func__ << "(): key=" << key
             << ", size=" << bytes.size() << endl;

    PutRequest request;
    request.set_key(key);
    request.set_data(bytes);

    PutReply reply;
    ClientContext context;
    Status status = stub_->Put(&context, request, &reply);
    if (!status.ok()) {
        cerr << "ERROR: put(): " << status.error_code() << ": "
             << status.error_message() << endl;
        return STORAGE_ERROR;
    }
    return reply.ok() ? 0 : STORAGE_ERROR;
}

int RemoteBlobStore::remove(const string& key)
{
    if (debug_)
        cerr << "DEBUG: " << __func__ << "(): key=" << key << endl;

    DeleteRequest request;
    request.set_key(key);

    DeleteReply reply;
    ClientContext context;
    Status status = stub_->Delete(&context, request, &reply);
    if (!status.ok()) {
        cerr << "ERROR: remove(): " << status.error_code() << ": "
             << status.error_message() << endl;
        return STORAGE_ERROR;
    }
    return reply.ok() ? 0 : STORAGE_ERROR;
}

}
