/*
 * BitstreamReader.cpp - MSB-first bit cursor over a hunk buffer
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
namespace Codec {

BitstreamReader::BitstreamReader(const uint8_t* data, size_t size)
    : m_data(data)
    , m_size(data ? size : 0)
    , m_byte_position(0)
    , m_bit_cache(0)
    , m_cache_bits(0)
    , m_total_bits_read(0)
{
}

size_t BitstreamReader::getAvailableBits() const
{
    return (m_size - m_byte_position) * 8 + m_cache_bits;
}

bool BitstreamReader::canRead(uint32_t bit_count) const
{
    return getAvailableBits() >= bit_count;
}

void BitstreamReader::refillCache()
{
    // Fill cache with bytes from buffer (big-endian)
    while (m_cache_bits <= 56 && m_byte_position < m_size) {
        uint64_t byte = m_data[m_byte_position++];
        m_bit_cache = (m_bit_cache << 8) | byte;
        m_cache_bits += 8;
    }
}

bool BitstreamReader::ensureBits(uint32_t bit_count)
{
    if (bit_count > 32) {
        return false;
    }
    if (m_cache_bits < bit_count) {
        refillCache();
    }
    return m_cache_bits >= bit_count;
}

uint32_t BitstreamReader::peekCached(uint32_t bit_count) const
{
    // Extract bits from cache (big-endian: MSB first)
    uint32_t shift = m_cache_bits - bit_count;
    uint64_t mask = (1ULL << bit_count) - 1;
    return static_cast<uint32_t>((m_bit_cache >> shift) & mask);
}

void BitstreamReader::consumeBits(uint32_t bit_count)
{
    m_cache_bits -= bit_count;
    m_total_bits_read += bit_count;
    if (m_cache_bits < 64) {
        m_bit_cache &= (1ULL << m_cache_bits) - 1;
    }
}

void BitstreamReader::resync()
{
    // Only valid on a byte boundary: drop the cache and reload from the
    // true byte position
    m_byte_position = static_cast<size_t>(m_total_bits_read / 8);
    m_bit_cache = 0;
    m_cache_bits = 0;
}

bool BitstreamReader::readBits(uint32_t& value, uint32_t bit_count)
{
    if (bit_count == 0) {
        value = 0;
        return true;
    }
    if (!ensureBits(bit_count)) {
        return false;
    }
    value = peekCached(bit_count);
    consumeBits(bit_count);
    return true;
}

bool BitstreamReader::peekBits(uint32_t& value, uint32_t bit_count)
{
    if (bit_count == 0) {
        value = 0;
        return true;
    }
    if (!ensureBits(bit_count)) {
        return false;
    }
    value = peekCached(bit_count);
    return true;
}

uint32_t BitstreamReader::readBits(uint32_t bit_count)
{
    uint32_t value;
    if (!readBits(value, bit_count)) {
        std::ostringstream oss;
        oss << "bitstream exhausted reading " << bit_count << " bits at bit "
            << m_total_bits_read << " of " << (m_size * 8);
        throw ChdException(ChdError::OUT_OF_DATA, oss.str());
    }
    return value;
}

uint32_t BitstreamReader::peekBits(uint32_t bit_count)
{
    uint32_t value;
    if (!peekBits(value, bit_count)) {
        std::ostringstream oss;
        oss << "bitstream exhausted peeking " << bit_count << " bits at bit "
            << m_total_bits_read << " of " << (m_size * 8);
        throw ChdException(ChdError::OUT_OF_DATA, oss.str());
    }
    return value;
}

bool BitstreamReader::readBitsSigned(int32_t& value, uint32_t bit_count)
{
    if (bit_count == 0) {
        value = 0;
        return true;
    }
    uint32_t unsigned_value;
    if (!readBits(unsigned_value, bit_count)) {
        return false;
    }
    // Apply sign extension if MSB is set
    if (bit_count < 32 && (unsigned_value & (1U << (bit_count - 1)))) {
        unsigned_value |= ~((1U << bit_count) - 1);
    }
    value = static_cast<int32_t>(unsigned_value);
    return true;
}

bool BitstreamReader::alignToByte()
{
    uint32_t bits_to_skip = static_cast<uint32_t>((8 - (m_total_bits_read % 8)) % 8);
    if (bits_to_skip > 0) {
        if (!ensureBits(bits_to_skip)) {
            return false;
        }
        consumeBits(bits_to_skip);
    }
    return true;
}

bool BitstreamReader::isAligned() const
{
    return (m_total_bits_read % 8) == 0;
}

bool BitstreamReader::skipBits(uint32_t bit_count)
{
    while (bit_count > 0) {
        uint32_t chunk = std::min<uint32_t>(bit_count, 32);
        if (!ensureBits(chunk)) {
            return false;
        }
        consumeBits(chunk);
        bit_count -= chunk;
    }
    return true;
}

bool BitstreamReader::readByteAligned(uint8_t* dest, size_t count)
{
    if (!alignToByte()) {
        return false;
    }
    resync();
    if (count > m_size - m_byte_position) {
        return false;
    }
    if (count > 0) {
        std::memcpy(dest, m_data + m_byte_position, count);
    }
    m_byte_position += count;
    m_total_bits_read += static_cast<uint64_t>(count) * 8;
    return true;
}

uint64_t BitstreamReader::getBitPosition() const
{
    return m_total_bits_read;
}

uint64_t BitstreamReader::getBytePosition() const
{
    return m_total_bits_read / 8;
}

size_t BitstreamReader::flush()
{
    // A partially consumed byte counts as consumed
    uint64_t bytes = (m_total_bits_read + 7) / 8;
    m_total_bits_read = std::min<uint64_t>(bytes, m_size) * 8;
    resync();
    return m_byte_position;
}

int32_t BitstreamReader::unfoldSigned(uint32_t folded)
{
    // Zigzag decoding: 0 -> 0, 1 -> -1, 2 -> 1, 3 -> -2, ...
    if (folded & 1) {
        return -static_cast<int32_t>((folded >> 1)) - 1;
    }
    return static_cast<int32_t>(folded >> 1);
}

// Unary decoding: count zero bits until a 1 bit
bool BitstreamReader::readUnary(uint32_t& value)
{
    value = 0;
    while (true) {
        if (!ensureBits(1)) {
            return false;
        }
        uint32_t bit = peekCached(1);
        consumeBits(1);
        if (bit == 1) {
            break;
        }
        value++;
        // Corrupt data can describe an arbitrarily long run of zeros
        if (value > (1u << 20)) {
            Debug::log("flac_codec", "Unary value exceeds maximum: ", value);
            return false;
        }
    }
    return true;
}

// UTF-8 style coded number, up to 36 bits in 7 bytes
bool BitstreamReader::readUTF8(uint64_t& value)
{
    uint32_t first_byte;
    if (!readBits(first_byte, 8)) {
        return false;
    }

    uint32_t extra_bytes;
    if ((first_byte & 0x80) == 0) {
        value = first_byte;
        return true;
    } else if ((first_byte & 0xE0) == 0xC0) {
        extra_bytes = 1;
        value = first_byte & 0x1F;
    } else if ((first_byte & 0xF0) == 0xE0) {
        extra_bytes = 2;
        value = first_byte & 0x0F;
    } else if ((first_byte & 0xF8) == 0xF0) {
        extra_bytes = 3;
        value = first_byte & 0x07;
    } else if ((first_byte & 0xFC) == 0xF8) {
        extra_bytes = 4;
        value = first_byte & 0x03;
    } else if ((first_byte & 0xFE) == 0xFC) {
        extra_bytes = 5;
        value = first_byte & 0x01;
    } else if (first_byte == 0xFE) {
        extra_bytes = 6;
        value = 0;
    } else {
        return false;
    }

    for (uint32_t i = 0; i < extra_bytes; i++) {
        uint32_t byte;
        if (!readBits(byte, 8)) {
            return false;
        }
        if ((byte & 0xC0) != 0x80) {
            return false;
        }
        value = (value << 6) | (byte & 0x3F);
    }
    return true;
}

bool BitstreamReader::readRiceCode(int32_t& value, uint32_t rice_param)
{
    uint32_t quotient;
    if (!readUnary(quotient)) {
        return false;
    }
    uint32_t remainder = 0;
    if (rice_param > 0 && !readBits(remainder, rice_param)) {
        return false;
    }
    uint64_t folded = (static_cast<uint64_t>(quotient) << rice_param) | remainder;
    if (folded > 0xFFFFFFFFull) {
        return false;
    }
    value = unfoldSigned(static_cast<uint32_t>(folded));
    return true;
}

} // namespace Codec
} // namespace ChdRead
