/*
 * CRCValidator.h - CRC-8 and CRC-16 checks for FLAC frames
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

#ifndef CHDREAD_CODECS_FLAC_CRCVALIDATOR_H
#define CHDREAD_CODECS_FLAC_CRCVALIDATOR_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Codec {
namespace FLAC {

/**
 * CRCValidator provides the two FLAC frame checksums.
 *
 * CRC-8 (polynomial 0x07) covers the frame header from the sync code
 * through the last header byte before the CRC-8 itself.
 * CRC-16 (polynomial 0x8005) covers the whole frame up to the footer.
 * Both start from zero.
 */
class CRCValidator {
public:
    static uint8_t computeCRC8(const uint8_t* data, size_t length);
    static uint16_t computeCRC16(const uint8_t* data, size_t length);

    static uint8_t updateCRC8(uint8_t crc, uint8_t byte);
    static uint16_t updateCRC16(uint16_t crc, uint8_t byte);
};

} // namespace FLAC
} // namespace Codec
} // namespace ChdRead

#endif // CHDREAD_CODECS_FLAC_CRCVALIDATOR_H
