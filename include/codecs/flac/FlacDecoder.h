/*
 * FlacDecoder.h - Predictive audio decoder for CD audio hunks
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

#ifndef CHDREAD_CODECS_FLAC_FLACDECODER_H
#define CHDREAD_CODECS_FLAC_FLACDECODER_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Codec {
namespace FLAC {

/**
 * FlacDecoder - decodes a run of bare FLAC frames into PCM
 *
 * CHD audio hunks hold FLAC frames without the stream marker or any
 * metadata blocks; header fields that defer to STREAMINFO take their
 * values from StreamDefaults (44.1 kHz, 2 channels, 16 bits).
 *
 * Each frame is parsed, every channel's subframe decoded (constant,
 * verbatim, fixed or LPC prediction plus Rice residuals), stereo
 * decorrelation undone, and the frame CRC-16 checked. Samples are
 * returned interleaved in channel order (left, right for CD audio).
 */
class FlacDecoder {
public:
    explicit FlacDecoder(const StreamDefaults& defaults = StreamDefaults());
    ~FlacDecoder() = default;

    /**
     * @brief Decode exactly @p sample_frames interleaved sample frames
     *
     * @param src Compressed frames
     * @param src_len Bytes available at @p src
     * @param sample_frames Number of samples per channel wanted
     * @param interleaved Receives sample_frames * channels samples
     * @return Bytes of @p src consumed, through the footer of the last frame
     * @throws ChdException DECODE_FAILURE, INVALID_PREDICTION or OUT_OF_DATA
     */
    size_t decode(const uint8_t* src, size_t src_len, uint32_t sample_frames,
                  std::vector<int32_t>& interleaved);

    /**
     * @brief Decode to 16-bit PCM bytes in the requested byte order
     *
     * @p dest receives sample_frames * channels * 2 bytes.
     * @return Bytes of @p src consumed
     */
    size_t decodeInterleaved16(const uint8_t* src, size_t src_len, uint8_t* dest,
                               uint32_t sample_frames, bool big_endian);

    const StreamDefaults& defaults() const { return m_defaults; }

    uint64_t framesDecoded() const { return m_frames_decoded; }

    /**
     * @brief Block size a CHD encoder picks for a payload of @p bytes
     *
     * Quarter of the byte count (16-bit stereo), halved down to 2048.
     */
    static uint32_t blockSizeFor(uint32_t bytes);

    /**
     * @brief Block size a CHD encoder picks for the audio half of a CD hunk
     *
     * Same quartering, halved down to one sector (2352) instead.
     */
    static uint32_t cdBlockSizeFor(uint32_t bytes);

private:
    StreamDefaults m_defaults;
    std::vector<std::vector<int32_t>> m_channel_buffers;
    uint64_t m_frames_decoded;
};

} // namespace FLAC
} // namespace Codec
} // namespace ChdRead

#endif // CHDREAD_CODECS_FLAC_FLACDECODER_H
