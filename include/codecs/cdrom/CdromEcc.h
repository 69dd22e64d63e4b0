/*
 * CdromEcc.h - CD-ROM sector layout and ECC regeneration
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

#ifndef CHDREAD_CODECS_CDROM_CDROMECC_H
#define CHDREAD_CODECS_CDROM_CDROMECC_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Codec {
namespace Cdrom {

// Raw sector plus subcode, as stored in one CD hunk frame
constexpr uint32_t FRAME_SIZE = 2448;
constexpr uint32_t MAX_SECTOR_DATA = 2352;
constexpr uint32_t MAX_SUBCODE_DATA = 96;

// Mode 1/2 sync pattern at the start of every data sector
extern const std::array<uint8_t, 12> SYNC_HEADER;

// Offset of the P and Q parity blocks inside a raw sector
constexpr uint32_t ECC_P_OFFSET = 0x81C;
constexpr uint32_t ECC_Q_OFFSET = 0x8C8;

/**
 * @brief Reed-Solomon product code (P then Q parity) of a raw data sector
 *
 * The CD codecs strip the sync header and parity from sectors whose
 * parity was reproducible at compression time; these helpers put them
 * back.
 */
class Ecc {
public:
    /**
     * @brief Recompute both parity blocks in place
     * @param sector MAX_SECTOR_DATA bytes, header and user data filled in
     */
    static void generate(uint8_t* sector);

    /**
     * @brief True if the stored parity matches the sector contents
     */
    static bool verify(const uint8_t* sector);

    /**
     * @brief Whether the sector begins with the sync pattern
     */
    static bool hasSyncHeader(const uint8_t* sector);

private:
    static void computeBytes(const uint8_t* sector, const uint16_t* offsets, int count,
                             uint8_t& val1, uint8_t& val2);
};

} // namespace Cdrom
} // namespace Codec
} // namespace ChdRead

#endif // CHDREAD_CODECS_CDROM_CDROMECC_H
