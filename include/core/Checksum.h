/*
 * Checksum.h - Hunk and map digest algorithms
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

#ifndef CHDREAD_CORE_CHECKSUM_H
#define CHDREAD_CORE_CHECKSUM_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Core {

/**
 * @brief Digest algorithms used by the supported container versions
 *
 * v5 containers protect each hunk and the compressed map with CRC-16
 * (CCITT polynomial 0x1021, initial value 0xFFFF). v3 and v4 containers
 * protect each hunk with the zlib CRC-32.
 */
enum class DigestKind : uint8_t {
    NONE = 0,
    CRC16,
    CRC32
};

class Checksum {
public:
    /**
     * @brief CRC-16/CCITT over a buffer
     * @param crc Running value, 0xFFFF for a fresh computation
     */
    static uint16_t crc16(const uint8_t* data, size_t length, uint16_t crc = 0xFFFF);

    /**
     * @brief zlib CRC-32 over a buffer
     */
    static uint32_t crc32(const uint8_t* data, size_t length);

    /**
     * @brief Compute a digest of the given kind; NONE yields zero
     */
    static uint32_t compute(DigestKind kind, const uint8_t* data, size_t length);
};

const char* digestKindName(DigestKind kind);

} // namespace Core
} // namespace ChdRead

#endif // CHDREAD_CORE_CHECKSUM_H
