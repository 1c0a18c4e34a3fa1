/*
 * Sha1.h - SHA-1 digest over the OpenSSL EVP interface
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAFKIT_CORE_SHA1_H
#define TAFKIT_CORE_SHA1_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace TafKit {
namespace Core {

using Sha1Digest = std::array<uint8_t, 20>;

/**
 * @brief Incremental SHA-1 computation.
 *
 * Owns an EVP_MD_CTX for its whole lifetime. A failing EVP call is an
 * environment problem rather than a data problem and throws std::runtime_error.
 */
class Sha1 {
public:
    Sha1();
    ~Sha1();

    Sha1(const Sha1&) = delete;
    Sha1& operator=(const Sha1&) = delete;

    void update(const uint8_t* data, size_t size);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

    /**
     * @brief Finish the digest. The object can be reused after reset().
     */
    Sha1Digest finalize();
    void reset();

    static Sha1Digest digest(const uint8_t* data, size_t size);
    static std::string toHex(const Sha1Digest& digest);

private:
    EVP_MD_CTX* m_ctx;
    bool m_finalized;
};

} // namespace Core
} // namespace TafKit

#endif // TAFKIT_CORE_SHA1_H
