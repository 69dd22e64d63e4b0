/*
 * CRCValidator.cpp - CRC-8 and CRC-16 checks for FLAC frames
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
namespace FLAC {

namespace {

constexpr std::array<uint8_t, 256> makeCRC8Table()
{
    std::array<uint8_t, 256> table{};
    for (uint32_t i = 0; i < 256; i++) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; bit++) {
            crc = (crc & 0x80) ? ((crc << 1) ^ 0x07) : (crc << 1);
        }
        table[i] = static_cast<uint8_t>(crc & 0xFF);
    }
    return table;
}

constexpr std::array<uint16_t, 256> makeCRC16Table()
{
    std::array<uint16_t, 256> table{};
    for (uint32_t i = 0; i < 256; i++) {
        uint32_t crc = i << 8;
        for (int bit = 0; bit < 8; bit++) {
            crc = (crc & 0x8000) ? ((crc << 1) ^ 0x8005) : (crc << 1);
        }
        table[i] = static_cast<uint16_t>(crc & 0xFFFF);
    }
    return table;
}

constexpr std::array<uint8_t, 256> CRC8_TABLE = makeCRC8Table();
constexpr std::array<uint16_t, 256> CRC16_TABLE = makeCRC16Table();

} // anonymous namespace

uint8_t CRCValidator::updateCRC8(uint8_t crc, uint8_t byte)
{
    return CRC8_TABLE[crc ^ byte];
}

uint16_t CRCValidator::updateCRC16(uint16_t crc, uint8_t byte)
{
    return static_cast<uint16_t>((crc << 8) ^ CRC16_TABLE[((crc >> 8) ^ byte) & 0xFF]);
}

uint8_t CRCValidator::computeCRC8(const uint8_t* data, size_t length)
{
    uint8_t crc = 0;
    for (size_t i = 0; i < length; i++) {
        crc = updateCRC8(crc, data[i]);
    }
    return crc;
}

uint16_t CRCValidator::computeCRC16(const uint8_t* data, size_t length)
{
    uint16_t crc = 0;
    for (size_t i = 0; i < length; i++) {
        crc = updateCRC16(crc, data[i]);
    }
    return crc;
}

} // namespace FLAC
} // namespace Codec
} // namespace ChdRead
