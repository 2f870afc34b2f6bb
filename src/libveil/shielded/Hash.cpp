#include <libveil/shielded/Hash.h>

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <array>
#include <cstring>
#include <memory>
#include <new>
#include <stdexcept>

namespace veil {

namespace {

struct MdDeleter
{
    void
    operator()(EVP_MD* md) const
    {
        EVP_MD_free(md);
    }
};

struct MdCtxDeleter
{
    void
    operator()(EVP_MD_CTX* ctx) const
    {
        EVP_MD_CTX_free(ctx);
    }
};

// Fetched once; EVP_MD objects are safe to share between threads
EVP_MD const*
keccak256()
{
    static std::unique_ptr<EVP_MD, MdDeleter> const md(
        EVP_MD_fetch(nullptr, "KECCAK-256", nullptr));
    if (!md)
        throw std::runtime_error("OpenSSL provider has no KECCAK-256 digest");
    return md.get();
}

uint256
keccak(void const* data, std::size_t size)
{
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx)
        throw std::bad_alloc();

    uint256 result;
    unsigned int length = 0;
    if (EVP_DigestInit_ex(ctx.get(), keccak256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), result.data(), &length) != 1 ||
        length != uint256::size())
        throw std::runtime_error("Keccak-256 digest failed");

    return result;
}

}  // namespace

uint256
hashPair(uint256 const& left, uint256 const& right)
{
    std::array<unsigned char, 64> input;
    std::memcpy(input.data(), left.data(), 32);
    std::memcpy(input.data() + 32, right.data(), 32);
    return keccak(input.data(), input.size());
}

uint256
keccak256Digest(ripple::Slice const& data)
{
    return keccak(data.data(), data.size());
}

uint256
sha256Digest(ripple::Slice const& data)
{
    uint256 result;
    SHA256(data.data(), data.size(), result.data());
    return result;
}

}  // namespace veil
