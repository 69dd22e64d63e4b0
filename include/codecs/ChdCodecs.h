/*
 * ChdCodecs.h - Hunk codecs layered on the generic decompressors
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

#ifndef CHDREAD_CODECS_CHDCODECS_H
#define CHDREAD_CODECS_CHDCODECS_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Codec {

/*
 * Every codec here exposes the same shape,
 *   void decompress(const uint8_t* src, size_t src_len, uint8_t* dest, size_t dest_len)
 * and throws ChdException on failure. CodecDispatcher holds them in a
 * closed variant, so there is no common base class.
 */

/**
 * @brief 'huff': bytes coded with one Huffman table per hunk
 *
 * The table (256 symbols, at most 16 bits) is itself Huffman coded at
 * the start of the hunk.
 */
class HuffmanCodec {
public:
    HuffmanCodec();

    void decompress(const uint8_t* src, size_t src_len, uint8_t* dest, size_t dest_len);

private:
    HuffmanDecoder m_decoder;
};

/**
 * @brief 'flac': raw 16-bit stereo audio
 *
 * A leading 'L' or 'B' selects little or big endian sample output; the
 * rest is a run of FLAC frames.
 */
class FlacCodec {
public:
    FlacCodec();

    void decompress(const uint8_t* src, size_t src_len, uint8_t* dest, size_t dest_len);

private:
    FLAC::FlacDecoder m_decoder;
};

/**
 * @brief 'cdzl' and 'cdlz': CD frames split into sector and subcode streams
 *
 * Layout of one hunk of N frames:
 *   ECC bitmap        ceil(N/8) bytes, bit set = regenerate sync and parity
 *   base length       2 bytes (3 if the hunk is 64 KiB or larger)
 *   base stream       N * 2352 sector bytes through BaseCodec
 *   subcode stream    N * 96 subcode bytes through deflate
 */
template<typename BaseCodec>
class CdCodec {
public:
    /**
     * @param hunk_bytes Hunk size, must be a multiple of the frame size
     * @param base_args Forwarded to the BaseCodec constructor
     */
    template<typename... Args>
    explicit CdCodec(uint32_t hunk_bytes, Args&&... base_args)
        : m_base(std::forward<Args>(base_args)...)
        , m_buffer(hunk_bytes)
    {
        validateHunkBytes(hunk_bytes);
    }

    void decompress(const uint8_t* src, size_t src_len, uint8_t* dest, size_t dest_len);

private:
    static void validateHunkBytes(uint32_t hunk_bytes);

    BaseCodec m_base;
    ZlibDecompressor m_subcode;
    std::vector<uint8_t> m_buffer;
};

using CdZlibCodec = CdCodec<ZlibDecompressor>;
using CdLzmaCodec = CdCodec<LzmaDecompressor>;

/**
 * @brief 'cdfl': CD audio frames
 *
 * Sector data is FLAC coded as big endian stereo samples; the deflated
 * subcode stream follows the last FLAC frame. No ECC regeneration.
 */
class CdFlacCodec {
public:
    explicit CdFlacCodec(uint32_t hunk_bytes);

    void decompress(const uint8_t* src, size_t src_len, uint8_t* dest, size_t dest_len);

private:
    FLAC::FlacDecoder m_decoder;
    ZlibDecompressor m_subcode;
    std::vector<uint8_t> m_buffer;
};

/**
 * @brief Reassemble N 2448-byte frames from separate sector and subcode areas
 */
void interleaveCdFrames(const uint8_t* sectors, const uint8_t* subcode, uint32_t frames, uint8_t* dest);

} // namespace Codec
} // namespace ChdRead

#endif // CHDREAD_CODECS_CHDCODECS_H
