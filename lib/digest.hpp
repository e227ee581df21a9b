#ifndef INCLUDE_AGENTFS_DIGEST_
#define INCLUDE_AGENTFS_DIGEST_

#include <string>

namespace agentfs {

// Lowercase hex SHA-256 of `data`. Throws std::runtime_error if OpenSSL fails.
std::string sha256_hex(const std::string& data);

// Random (version 4) UUID in canonical 8-4-4-4-12 form.
std::string new_uuid();

}

#endif
