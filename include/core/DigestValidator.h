/*
 * DigestValidator.h - Streaming SHA-1 and MD5 over decoded media
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

#ifndef CHDREAD_CORE_DIGESTVALIDATOR_H
#define CHDREAD_CORE_DIGESTVALIDATOR_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Core {

/**
 * @brief Incremental message digest backed by OpenSSL EVP
 *
 * Used to check whole-medium digests stored in container headers
 * (raw SHA-1 for v4/v5, SHA-1 and MD5 for v3).
 *
 * USAGE:
 * ======
 * DigestValidator sha1(DigestValidator::Algorithm::SHA1);
 * sha1.reset();
 * sha1.update(data, size);   // any number of times
 * std::vector<uint8_t> digest;
 * sha1.finalize(digest);
 */
class DigestValidator {
public:
    enum class Algorithm {
        SHA1,
        MD5
    };

    explicit DigestValidator(Algorithm algorithm);
    ~DigestValidator();

    DigestValidator(const DigestValidator&) = delete;
    DigestValidator& operator=(const DigestValidator&) = delete;

    /**
     * @brief Start a new computation
     * @return false if OpenSSL could not set up the context
     */
    bool reset();

    bool update(const uint8_t* data, size_t length);

    /**
     * @brief Finish and return the digest; repeated calls return the same value
     */
    bool finalize(std::vector<uint8_t>& digest_out);

    Algorithm algorithm() const { return m_algorithm; }
    size_t digestSize() const;

    static const char* algorithmName(Algorithm algorithm);

private:
    Algorithm m_algorithm;
    EVP_MD_CTX* m_ctx;
    bool m_finalized;
    std::vector<uint8_t> m_digest;
};

} // namespace Core
} // namespace ChdRead

#endif // CHDREAD_CORE_DIGESTVALIDATOR_H
