/*
 * ByteOrder.h - Big-endian field access for container structures
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

#ifndef CHDREAD_CORE_BYTEORDER_H
#define CHDREAD_CORE_BYTEORDER_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Core {

// All CHD header, map and metadata fields are stored big-endian.

inline uint16_t readBE16(const uint8_t* p)
{
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

inline uint32_t readBE24(const uint8_t* p)
{
    return (static_cast<uint32_t>(p[0]) << 16) | (static_cast<uint32_t>(p[1]) << 8) | p[2];
}

inline uint32_t readBE32(const uint8_t* p)
{
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | p[3];
}

inline uint64_t readBE48(const uint8_t* p)
{
    return (static_cast<uint64_t>(readBE16(p)) << 32) | readBE32(p + 2);
}

inline uint64_t readBE64(const uint8_t* p)
{
    return (static_cast<uint64_t>(readBE32(p)) << 32) | readBE32(p + 4);
}

inline void writeBE16(uint8_t* p, uint16_t value)
{
    p[0] = static_cast<uint8_t>(value >> 8);
    p[1] = static_cast<uint8_t>(value);
}

inline void writeBE24(uint8_t* p, uint32_t value)
{
    p[0] = static_cast<uint8_t>(value >> 16);
    p[1] = static_cast<uint8_t>(value >> 8);
    p[2] = static_cast<uint8_t>(value);
}

inline void writeBE32(uint8_t* p, uint32_t value)
{
    p[0] = static_cast<uint8_t>(value >> 24);
    p[1] = static_cast<uint8_t>(value >> 16);
    p[2] = static_cast<uint8_t>(value >> 8);
    p[3] = static_cast<uint8_t>(value);
}

inline void writeBE48(uint8_t* p, uint64_t value)
{
    writeBE16(p, static_cast<uint16_t>(value >> 32));
    writeBE32(p + 2, static_cast<uint32_t>(value));
}

inline void writeBE64(uint8_t* p, uint64_t value)
{
    writeBE32(p, static_cast<uint32_t>(value >> 32));
    writeBE32(p + 4, static_cast<uint32_t>(value));
}

/**
 * @brief Build a four character code tag such as 'zlib'
 */
constexpr uint32_t makeTag(char a, char b, char c, char d)
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8) |
           static_cast<uint32_t>(static_cast<uint8_t>(d));
}

/**
 * @brief Printable form of a four character code; zero prints as "none"
 */
std::string tagToString(uint32_t tag);

} // namespace Core
} // namespace ChdRead

#endif // CHDREAD_CORE_BYTEORDER_H
