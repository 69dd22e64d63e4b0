/*
 * FrameParser.h - FLAC frame header and footer parsing
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

#ifndef CHDREAD_CODECS_FLAC_FRAMEPARSER_H
#define CHDREAD_CODECS_FLAC_FRAMEPARSER_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Codec {
namespace FLAC {

/**
 * FrameParser - Parses FLAC frame headers and footers
 *
 * CHD audio hunks are a plain concatenation of frames, so the parser
 * expects a sync code exactly where the previous frame ended rather than
 * searching for one.
 */
class FrameParser {
public:
    explicit FrameParser(BitstreamReader* reader);
    ~FrameParser() = default;

    /**
     * Parse a frame header at the current (byte aligned) position.
     * Fields coded as "from STREAMINFO" take their value from @p defaults.
     * The header CRC-8 is verified.
     * @return true if header parsed successfully, false on error
     */
    bool parseFrameHeader(FrameHeader& header, const StreamDefaults& defaults);

    /**
     * Align to the next byte, read the CRC-16 footer and check it against
     * every byte since the start of the frame.
     */
    bool parseFrameFooter();

    /**
     * Byte offset of the frame currently being parsed
     */
    size_t frameStart() const { return m_frame_start; }

private:
    BitstreamReader* m_reader;
    size_t m_frame_start;

    bool parseUncommonBlockSize(FrameHeader& header, uint32_t bits);
    bool parseUncommonSampleRate(FrameHeader& header, uint32_t sample_rate_bits);
};

} // namespace FLAC
} // namespace Codec
} // namespace ChdRead

#endif // CHDREAD_CODECS_FLAC_FRAMEPARSER_H
