#include "crypto/SslHelper.h"
#include <cassert>
#include <cstring>
#if OPENSSL_VERSION_MAJOR >= 3
#include <openssl/core_names.h>
#include <openssl/params.h>
#endif
#include <openssl/kdf.h>
#include <vector>

namespace crypto
{
std::string toHexString(const void* srcData, uint16_t len)
{
    auto src = reinterpret_cast<const uint8_t*>(srcData);
    const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::string s;
    s.reserve(len * 2);
    for (int i = 0; i < len; ++i)
    {
        s += hexmap[src[i] >> 4];
        s += hexmap[src[i] & 0x0F];
    }
    return s;
}

Sha256::Sha256() : _ctx(EVP_MD_CTX_new())
{
    assert(_ctx);
    reset();
}

Sha256::~Sha256()
{
    EVP_MD_CTX_free(_ctx);
}

void Sha256::add(const void* data, size_t length)
{
    if (length > 0)
    {
        EVP_DigestUpdate(_ctx, data, length);
    }
}

bool Sha256::compute(uint8_t digest[DIGEST_SIZE]) const
{
    unsigned int outLength = 0;
    const auto success = EVP_DigestFinal_ex(_ctx, digest, &outLength);
    return success == 1 && outLength == DIGEST_SIZE;
}

Sha256::Digest Sha256::compute() const
{
    Digest digest = {};
    compute(digest.data());
    return digest;
}

bool Sha256::reset()
{
    return EVP_DigestInit_ex(_ctx, EVP_sha256(), nullptr) == 1;
}

Sha256::Digest Sha256::hash(const void* data, size_t length)
{
    Sha256 sha;
    sha.add(data, length);
    return sha.compute();
}

#if OPENSSL_VERSION_MAJOR >= 3
bool hkdfSha256(const uint8_t* keyMaterial,
    size_t keyMaterialLength,
    const uint8_t* salt,
    size_t saltLength,
    const std::string& info,
    uint8_t* output,
    size_t outputLength)
{
    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
    if (!kdf)
    {
        return false;
    }
    EVP_KDF_CTX* ctx = EVP_KDF_CTX_new(kdf);
    EVP_KDF_free(kdf);
    if (!ctx)
    {
        return false;
    }

    char digestName[] = "SHA256";
    std::vector<uint8_t> ikm(keyMaterial, keyMaterial + keyMaterialLength);
    std::vector<uint8_t> saltCopy(salt, salt + saltLength);
    std::vector<char> infoCopy(info.begin(), info.end());

    std::vector<OSSL_PARAM> params;
    params.push_back(OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digestName, 0));
    params.push_back(OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_KEY, ikm.data(), ikm.size()));
    if (!saltCopy.empty())
    {
        params.push_back(OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()));
    }
    if (!infoCopy.empty())
    {
        params.push_back(OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_INFO, infoCopy.data(), infoCopy.size()));
    }
    params.push_back(OSSL_PARAM_construct_end());

    const auto success = EVP_KDF_derive(ctx, output, outputLength, params.data());
    EVP_KDF_CTX_free(ctx);
    return success == 1;
}
#else
bool hkdfSha256(const uint8_t* keyMaterial,
    size_t keyMaterialLength,
    const uint8_t* salt,
    size_t saltLength,
    const std::string& info,
    uint8_t* output,
    size_t outputLength)
{
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!ctx)
    {
        return false;
    }

    bool success = EVP_PKEY_derive_init(ctx) > 0 && EVP_PKEY_CTX_set_hkdf_md(ctx, EVP_sha256()) > 0 &&
        EVP_PKEY_CTX_set1_hkdf_key(ctx, keyMaterial, static_cast<int>(keyMaterialLength)) > 0;
    if (success && saltLength > 0)
    {
        success = EVP_PKEY_CTX_set1_hkdf_salt(ctx, salt, static_cast<int>(saltLength)) > 0;
    }
    if (success && !info.empty())
    {
        success = EVP_PKEY_CTX_add1_hkdf_info(ctx,
                      reinterpret_cast<const unsigned char*>(info.data()),
                      static_cast<int>(info.size())) > 0;
    }

    size_t derivedLength = outputLength;
    success = success && EVP_PKEY_derive(ctx, output, &derivedLength) > 0 && derivedLength == outputLength;
    EVP_PKEY_CTX_free(ctx);
    return success;
}
#endif

} // namespace crypto
