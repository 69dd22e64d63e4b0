/*
 * DigestValidator.cpp - Streaming SHA-1 and MD5 over decoded media
 * This file is part of chdread.
 * Copyright © 2025-2026 Kirn Gill <segin2005@gmail.com>
 *
 * chdread is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#include "chdread.h"

namespace ChdRead {
namespace Core {

DigestValidator::DigestValidator(Algorithm algorithm)
    : m_algorithm(algorithm)
    , m_ctx(nullptr)
    , m_finalized(false)
{
}

DigestValidator::~DigestValidator()
{
    if (m_ctx) {
        EVP_MD_CTX_free(m_ctx);
        m_ctx = nullptr;
    }
}

const char* DigestValidator::algorithmName(Algorithm algorithm)
{
    switch (algorithm) {
        case Algorithm::SHA1: return "SHA-1";
        case Algorithm::MD5:  return "MD5";
    }
    return "unknown";
}

size_t DigestValidator::digestSize() const
{
    return m_algorithm == Algorithm::SHA1 ? 20 : 16;
}

bool DigestValidator::reset()
{
    if (m_ctx) {
        EVP_MD_CTX_free(m_ctx);
        m_ctx = nullptr;
    }

    m_ctx = EVP_MD_CTX_new();
    if (!m_ctx) {
        Debug::log("chd", "DigestValidator: failed to create ", algorithmName(m_algorithm), " context");
        return false;
    }

    const EVP_MD* md = (m_algorithm == Algorithm::SHA1) ? EVP_sha1() : EVP_md5();
    if (!EVP_DigestInit_ex(m_ctx, md, nullptr)) {
        Debug::log("chd", "DigestValidator: failed to initialize ", algorithmName(m_algorithm));
        EVP_MD_CTX_free(m_ctx);
        m_ctx = nullptr;
        return false;
    }

    m_finalized = false;
    m_digest.clear();
    return true;
}

bool DigestValidator::update(const uint8_t* data, size_t length)
{
    if (!m_ctx || m_finalized) {
        Debug::log("chd", "DigestValidator: update without an active computation");
        return false;
    }
    if (length == 0) {
        return true;
    }
    if (!EVP_DigestUpdate(m_ctx, data, length)) {
        Debug::log("chd", "DigestValidator: ", algorithmName(m_algorithm), " update failed");
        return false;
    }
    return true;
}

bool DigestValidator::finalize(std::vector<uint8_t>& digest_out)
{
    if (m_finalized) {
        digest_out = m_digest;
        return true;
    }
    if (!m_ctx) {
        Debug::log("chd", "DigestValidator: finalize without an active computation");
        return false;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (!EVP_DigestFinal_ex(m_ctx, hash, &hash_len)) {
        Debug::log("chd", "DigestValidator: ", algorithmName(m_algorithm), " finalize failed");
        return false;
    }

    m_digest.assign(hash, hash + hash_len);
    m_finalized = true;
    digest_out = m_digest;
    return true;
}

} // namespace Core
} // namespace ChdRead
