/*
 * BitstreamReader.h - MSB-first bit cursor over a hunk buffer
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

#ifndef CHDREAD_CODECS_BITSTREAMREADER_H
#define CHDREAD_CODECS_BITSTREAMREADER_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Codec {

/**
 * BitstreamReader - bit-level reading from a byte buffer
 *
 * Provides bit-level access to compressed hunk payloads with support for:
 * - Variable-length bit field reading (1 to 32 bits)
 * - Unary-coded values and Rice codes
 * - UTF-8 coded numbers (FLAC frame headers)
 * - Byte alignment and byte-aligned runs
 *
 * Bits are consumed most-significant first. The reader does not own the
 * buffer; it must outlive the reader. Hunk payload lengths are known in
 * advance, so running out of bits is corruption: the bool-returning
 * methods report it with false and the value-returning methods throw
 * ChdException(OUT_OF_DATA).
 */
class BitstreamReader {
public:
    BitstreamReader(const uint8_t* data, size_t size);
    ~BitstreamReader() = default;

    // Basic bit reading
    bool readBits(uint32_t& value, uint32_t bit_count);
    bool readBitsSigned(int32_t& value, uint32_t bit_count);
    bool peekBits(uint32_t& value, uint32_t bit_count);

    // Throwing forms
    uint32_t readBits(uint32_t bit_count);
    uint32_t peekBits(uint32_t bit_count);

    // Special encoding readers
    bool readUnary(uint32_t& value);
    bool readUTF8(uint64_t& value);
    bool readRiceCode(int32_t& value, uint32_t rice_param);

    // Alignment
    bool alignToByte();
    bool isAligned() const;
    bool skipBits(uint32_t bit_count);

    /**
     * @brief Align to the next byte, then copy @p count whole bytes
     */
    bool readByteAligned(uint8_t* dest, size_t count);

    // Position tracking
    uint64_t getBitPosition() const;
    uint64_t getBytePosition() const;

    /**
     * @brief Byte offset of the first byte not yet touched, after
     * discarding any partial byte
     */
    size_t flush();

    // State queries
    size_t getAvailableBits() const;
    bool canRead(uint32_t bit_count) const;
    size_t size() const { return m_size; }
    const uint8_t* data() const { return m_data; }

private:
    const uint8_t* m_data;
    size_t m_size;
    size_t m_byte_position;      // Next byte to load into the cache

    // Bit cache for efficient reading (big-endian)
    uint64_t m_bit_cache;
    uint32_t m_cache_bits;

    // Total bits consumed (for position tracking)
    uint64_t m_total_bits_read;

    void refillCache();
    bool ensureBits(uint32_t bit_count);
    uint32_t peekCached(uint32_t bit_count) const;
    void consumeBits(uint32_t bit_count);
    void resync();

    static int32_t unfoldSigned(uint32_t folded);
};

} // namespace Codec
} // namespace ChdRead

#endif // CHDREAD_CODECS_BITSTREAMREADER_H
