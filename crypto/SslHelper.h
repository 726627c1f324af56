#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <openssl/evp.h>
#include <openssl/opensslv.h>
#include <string>

namespace crypto
{

class Sha256
{
public:
    static constexpr size_t DIGEST_SIZE = 32;
    using Digest = std::array<uint8_t, DIGEST_SIZE>;

    Sha256();
    Sha256(const Sha256&) = delete;
    ~Sha256();

    Sha256& operator=(const Sha256&) = delete;

    void add(const void* data, size_t length);
    void add(const std::string& text) { add(text.data(), text.size()); }

    template <typename IntType>
    void add(const IntType& data)
    {
        add(&data, sizeof(IntType));
    }

    // Finalizes the digest. Call reset before adding more data.
    bool compute(uint8_t digest[DIGEST_SIZE]) const;
    Digest compute() const;
    bool reset();

    static Digest hash(const void* data, size_t length);

private:
    struct evp_md_ctx_st* _ctx;
};

/**
 * HKDF-SHA256 (RFC 5869). An empty salt is treated as HashLen zero bytes.
 * Returns false if OpenSSL rejects the parameters, e.g. output longer than 255 * 32 bytes.
 */
bool hkdfSha256(const uint8_t* keyMaterial,
    size_t keyMaterialLength,
    const uint8_t* salt,
    size_t saltLength,
    const std::string& info,
    uint8_t* output,
    size_t outputLength);

std::string toHexString(const void* src, uint16_t len);
} // namespace crypto
