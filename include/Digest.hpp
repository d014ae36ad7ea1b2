#ifndef DIGEST_HPP
#define DIGEST_HPP

#include <array>
#include <cstdint>
#include <string_view>
#include <openssl/evp.h>

class Digest
{
public:
    static constexpr size_t MD5_SIZE = 16;

    static std::array<uint8_t, MD5_SIZE> md5(std::string_view data);

    // First 8 bytes of the MD5 digest read as a big endian integer.
    // Keys and virtual nodes share this space on the hash ring.
    static uint64_t ringPosition(std::string_view data);

private:
    static EVP_MD_CTX *getDigestContext();
};

#endif
