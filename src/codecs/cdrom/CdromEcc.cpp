/*
 * CdromEcc.cpp - CD-ROM sector layout and ECC regeneration
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
namespace Cdrom {

const std::array<uint8_t, 12> SYNC_HEADER = {
    0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x00
};

namespace {

constexpr int P_BLOCKS = 86;
constexpr int P_COMPONENTS = 24;
constexpr int Q_BLOCKS = 52;
constexpr int Q_COMPONENTS = 43;

// GF(2^8) multiply-by-alpha table, polynomial 0x11D
struct EccLowTable {
    uint8_t values[256];
    constexpr EccLowTable() : values{} {
        for (int i = 0; i < 256; i++) {
            values[i] = static_cast<uint8_t>(((i << 1) ^ ((i & 0x80) ? 0x11D : 0)) & 0xFF);
        }
    }
};

// Inverse of (alpha + 1)
struct EccHighTable {
    uint8_t values[256];
    constexpr EccHighTable() : values{} {
        EccLowTable low;
        for (int i = 0; i < 256; i++) {
            values[low.values[i] ^ i] = static_cast<uint8_t>(i);
        }
    }
};

struct PQOffsets {
    uint16_t p[P_BLOCKS][P_COMPONENTS];
    uint16_t q[Q_BLOCKS][Q_COMPONENTS];
    constexpr PQOffsets() : p{}, q{} {
        for (int b = 0; b < P_BLOCKS; b++) {
            for (int c = 0; c < P_COMPONENTS; c++) {
                p[b][c] = static_cast<uint16_t>(b + P_BLOCKS * c);
            }
        }
        for (int b = 0; b < Q_BLOCKS; b++) {
            for (int c = 0; c < Q_COMPONENTS; c++) {
                q[b][c] = static_cast<uint16_t>(2 * ((43 * (b / 2) + 44 * c) % 1118) + (b & 1));
            }
        }
    }
};

constexpr EccLowTable s_ecclow;
constexpr EccHighTable s_ecchigh;
constexpr PQOffsets s_offsets;

// Mode 2 sectors compute parity as if the address were zero
inline uint8_t eccSourceByte(const uint8_t* sector, uint32_t offset)
{
    return (sector[0x0F] == 2 && offset < 4) ? 0x00 : sector[0x0C + offset];
}

} // anonymous namespace

void Ecc::computeBytes(const uint8_t* sector, const uint16_t* offsets, int count,
                       uint8_t& val1, uint8_t& val2)
{
    val1 = 0;
    val2 = 0;
    for (int component = 0; component < count; component++) {
        uint8_t byte = eccSourceByte(sector, offsets[component]);
        val1 ^= byte;
        val2 ^= byte;
        val1 = s_ecclow.values[val1];
    }
    val1 = s_ecchigh.values[s_ecclow.values[val1] ^ val2];
    val2 ^= val1;
}

void Ecc::generate(uint8_t* sector)
{
    for (int b = 0; b < P_BLOCKS; b++) {
        computeBytes(sector, s_offsets.p[b], P_COMPONENTS,
                     sector[ECC_P_OFFSET + b], sector[ECC_P_OFFSET + P_BLOCKS + b]);
    }
    // Q covers the freshly written P parity
    for (int b = 0; b < Q_BLOCKS; b++) {
        computeBytes(sector, s_offsets.q[b], Q_COMPONENTS,
                     sector[ECC_Q_OFFSET + b], sector[ECC_Q_OFFSET + Q_BLOCKS + b]);
    }
}

bool Ecc::verify(const uint8_t* sector)
{
    uint8_t val1, val2;
    for (int b = 0; b < P_BLOCKS; b++) {
        computeBytes(sector, s_offsets.p[b], P_COMPONENTS, val1, val2);
        if (sector[ECC_P_OFFSET + b] != val1 || sector[ECC_P_OFFSET + P_BLOCKS + b] != val2) {
            return false;
        }
    }
    for (int b = 0; b < Q_BLOCKS; b++) {
        computeBytes(sector, s_offsets.q[b], Q_COMPONENTS, val1, val2);
        if (sector[ECC_Q_OFFSET + b] != val1 || sector[ECC_Q_OFFSET + Q_BLOCKS + b] != val2) {
            return false;
        }
    }
    return true;
}

bool Ecc::hasSyncHeader(const uint8_t* sector)
{
    return std::memcmp(sector, SYNC_HEADER.data(), SYNC_HEADER.size()) == 0;
}

} // namespace Cdrom
} // namespace Codec
} // namespace ChdRead
