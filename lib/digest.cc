#include "digest.hpp"

#include <array>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/rand.h>

using namespace std;

namespace agentfs {

static string to_hex(const unsigned char *p, size_t n)
{
    ostringstream oss;
    oss << hex << setfill('0');
    for (size_t i = 0; i < n; ++i) {
        oss << setw(2) << static_cast<int>(p[i]);
    }
    return oss.str();
}

string sha256_hex(const string& data)
{
    array<unsigned char, EVP_MAX_MD_SIZE> md {};
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), md.data(), &len,
                   EVP_sha256(), nullptr) != 1) {
        throw runtime_error("EVP_Digest(EVP_sha256) failed");
    }
    return to_hex(md.data(), len);
}

string new_uuid()
{
    array<unsigned char, 16> b {};
    if (RAND_bytes(b.data(), static_cast<int>(b.size())) != 1) {
        throw runtime_error("RAND_bytes failed");
    }
    b[6] = (b[6] & 0x0f) | 0x40;
    b[8] = (b[8] & 0x3f) | 0x80;

    string s = to_hex(b.data(), b.size());
    return s.substr(0, 8) + '-' + s.substr(8, 4) + '-' + s.substr(12, 4) +
           '-' + s.substr(16, 4) + '-' + s.substr(20);
}

}
