/*
 * Checksum.cpp - Hunk and map digest algorithms
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

namespace {

constexpr std::array<uint16_t, 256> makeCRC16Table()
{
    std::array<uint16_t, 256> table{};
    for (uint32_t i = 0; i < 256; i++) {
        uint32_t crc = i << 8;
        for (int bit = 0; bit < 8; bit++) {
            crc = (crc & 0x8000) ? ((crc << 1) ^ 0x1021) : (crc << 1);
        }
        table[i] = static_cast<uint16_t>(crc & 0xFFFF);
    }
    return table;
}

constexpr std::array<uint16_t, 256> CRC16_TABLE = makeCRC16Table();

} // anonymous namespace

uint16_t Checksum::crc16(const uint8_t* data, size_t length, uint16_t crc)
{
    for (size_t i = 0; i < length; i++) {
        crc = static_cast<uint16_t>((crc << 8) ^ CRC16_TABLE[((crc >> 8) ^ data[i]) & 0xFF]);
    }
    return crc;
}

uint32_t Checksum::crc32(const uint8_t* data, size_t length)
{
    uLong crc = ::crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed large buffers in pieces
    while (length > 0) {
        uInt chunk = static_cast<uInt>(std::min<size_t>(length, 1u << 30));
        crc = ::crc32(crc, data, chunk);
        data += chunk;
        length -= chunk;
    }
    return static_cast<uint32_t>(crc);
}

uint32_t Checksum::compute(DigestKind kind, const uint8_t* data, size_t length)
{
    switch (kind) {
        case DigestKind::CRC16:
            return crc16(data, length);
        case DigestKind::CRC32:
            return crc32(data, length);
        case DigestKind::NONE:
        default:
            return 0;
    }
}

const char* digestKindName(DigestKind kind)
{
    switch (kind) {
        case DigestKind::CRC16: return "crc16";
        case DigestKind::CRC32: return "crc32";
        case DigestKind::NONE:
        default:                return "none";
    }
}

std::string tagToString(uint32_t tag)
{
    if (tag == 0) {
        return "none";
    }
    std::string result;
    for (int shift = 24; shift >= 0; shift -= 8) {
        char c = static_cast<char>((tag >> shift) & 0xFF);
        result += (c >= 0x20 && c < 0x7F) ? c : '?';
    }
    return result;
}

} // namespace Core
} // namespace ChdRead
