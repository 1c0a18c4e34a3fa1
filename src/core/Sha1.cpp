/*
 * Sha1.cpp - SHA-1 digest over the OpenSSL EVP interface
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"
#include "core/Sha1.h"

namespace TafKit {
namespace Core {

Sha1::Sha1()
    : m_ctx(nullptr)
    , m_finalized(false)
{
    reset();
}

Sha1::~Sha1()
{
    if (m_ctx) {
        EVP_MD_CTX_free(m_ctx);
        m_ctx = nullptr;
    }
}

void Sha1::reset()
{
    if (m_ctx) {
        EVP_MD_CTX_free(m_ctx);
        m_ctx = nullptr;
    }

    m_ctx = EVP_MD_CTX_new();
    if (!m_ctx) {
        Debug::log("taf", "Failed to create SHA-1 context");
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    if (!EVP_DigestInit_ex(m_ctx, EVP_sha1(), nullptr)) {
        Debug::log("taf", "Failed to initialize SHA-1 digest");
        EVP_MD_CTX_free(m_ctx);
        m_ctx = nullptr;
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }

    m_finalized = false;
}

void Sha1::update(const uint8_t* data, size_t size)
{
    if (m_finalized) {
        throw std::logic_error("Sha1::update after finalize");
    }
    if (size == 0) {
        return;
    }
    if (!EVP_DigestUpdate(m_ctx, data, size)) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

Sha1Digest Sha1::finalize()
{
    if (m_finalized) {
        throw std::logic_error("Sha1::finalize called twice");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (!EVP_DigestFinal_ex(m_ctx, hash, &hash_len) || hash_len != 20) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    m_finalized = true;

    Sha1Digest result{};
    std::memcpy(result.data(), hash, result.size());
    return result;
}

Sha1Digest Sha1::digest(const uint8_t* data, size_t size)
{
    Sha1 sha;
    sha.update(data, size);
    return sha.finalize();
}

std::string Sha1::toHex(const Sha1Digest& digest)
{
    static constexpr char hex_chars[] = "0123456789abcdef";

    std::string result;
    result.reserve(digest.size() * 2);
    for (uint8_t byte : digest) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

} // namespace Core
} // namespace TafKit
