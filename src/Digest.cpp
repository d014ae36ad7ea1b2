#include "Digest.hpp"
#include <stdexcept>

EVP_MD_CTX *Digest::getDigestContext()
{
    static thread_local EVP_MD_CTX *digest_ctx = nullptr;

    if (!digest_ctx)
    {
        digest_ctx = EVP_MD_CTX_new();
        if (!digest_ctx)
        {
            throw std::runtime_error("Failed to create thread-local digest context");
        }
    }
    return digest_ctx;
}

std::array<uint8_t, Digest::MD5_SIZE> Digest::md5(std::string_view data)
{
    EVP_MD_CTX *ctx = getDigestContext();

    if (EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) != 1)
    {
        throw std::runtime_error("Failed to initialize MD5 digest");
    }

    if (EVP_DigestUpdate(ctx, data.data(), data.size()) != 1)
    {
        throw std::runtime_error("Failed to update MD5 digest");
    }

    std::array<uint8_t, MD5_SIZE> out{};
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx, out.data(), &outLen) != 1 || outLen != MD5_SIZE)
    {
        throw std::runtime_error("Failed to finalize MD5 digest");
    }

    return out;
}

uint64_t Digest::ringPosition(std::string_view data)
{
    auto digest = md5(data);
    uint64_t position = 0;
    for (size_t i = 0; i < sizeof(uint64_t); ++i)
    {
        position = (position << 8) | digest[i];
    }
    return position;
}
