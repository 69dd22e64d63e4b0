/*
 * FlacDecoder.cpp - Predictive audio decoder for CD audio hunks
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

FlacDecoder::FlacDecoder(const StreamDefaults& defaults)
    : m_defaults(defaults)
    , m_frames_decoded(0)
{
}

uint32_t FlacDecoder::blockSizeFor(uint32_t bytes)
{
    uint32_t block_size = bytes / 4;
    while (block_size > 2048) {
        block_size /= 2;
    }
    return block_size;
}

uint32_t FlacDecoder::cdBlockSizeFor(uint32_t bytes)
{
    uint32_t block_size = bytes / 4;
    while (block_size > Cdrom::MAX_SECTOR_DATA) {
        block_size /= 2;
    }
    return block_size;
}

size_t FlacDecoder::decode(const uint8_t* src, size_t src_len, uint32_t sample_frames,
                           std::vector<int32_t>& interleaved)
{
    const uint32_t channels = m_defaults.channels;
    interleaved.assign(static_cast<size_t>(sample_frames) * channels, 0);

    BitstreamReader reader(src, src_len);
    FrameParser parser(&reader);
    ResidualDecoder residual(&reader);
    SubframeDecoder subframe(&reader, &residual);

    m_channel_buffers.resize(channels);
    std::vector<int32_t*> channel_ptrs(channels);

    uint32_t produced = 0;
    while (produced < sample_frames) {
        FrameHeader header;
        if (!parser.parseFrameHeader(header, m_defaults)) {
            std::ostringstream oss;
            oss << "invalid FLAC frame header at byte " << parser.frameStart()
                << " after " << produced << " of " << sample_frames << " samples";
            throw ChdException(reader.canRead(1) ? ChdError::DECODE_FAILURE : ChdError::OUT_OF_DATA, oss.str());
        }
        if (header.channels != channels) {
            std::ostringstream oss;
            oss << "FLAC frame has " << header.channels << " channels, expected " << channels;
            throw ChdException(ChdError::DECODE_FAILURE, oss.str());
        }

        for (uint32_t ch = 0; ch < channels; ch++) {
            m_channel_buffers[ch].resize(header.block_size);
            channel_ptrs[ch] = m_channel_buffers[ch].data();
            bool side = ChannelDecorrelator::isSideChannel(header.channel_assignment, ch);
            if (!subframe.decodeSubframe(channel_ptrs[ch], header.block_size, header.bit_depth, side)) {
                ChdError error = subframe.lastError();
                if (error == ChdError::NONE) {
                    error = ChdError::DECODE_FAILURE;
                }
                std::ostringstream oss;
                oss << "FLAC subframe for channel " << ch << " of frame " << header.coded_number
                    << " failed (" << getErrorName(error) << ")";
                throw ChdException(error, oss.str());
            }
        }

        if (!ChannelDecorrelator::decorrelate(channel_ptrs.data(), header.block_size, channels,
                                              header.channel_assignment)) {
            throw ChdException(ChdError::DECODE_FAILURE, "FLAC channel decorrelation failed");
        }

        if (!parser.parseFrameFooter()) {
            std::ostringstream oss;
            oss << "FLAC frame " << header.coded_number << " failed its CRC-16 check";
            throw ChdException(ChdError::DECODE_FAILURE, oss.str());
        }

        uint32_t to_copy = std::min(header.block_size, sample_frames - produced);
        for (uint32_t i = 0; i < to_copy; i++) {
            for (uint32_t ch = 0; ch < channels; ch++) {
                interleaved[static_cast<size_t>(produced + i) * channels + ch] = m_channel_buffers[ch][i];
            }
        }
        produced += to_copy;
        m_frames_decoded++;
    }

    return static_cast<size_t>(reader.getBytePosition());
}

size_t FlacDecoder::decodeInterleaved16(const uint8_t* src, size_t src_len, uint8_t* dest,
                                        uint32_t sample_frames, bool big_endian)
{
    std::vector<int32_t> samples;
    size_t consumed = decode(src, src_len, sample_frames, samples);

    for (size_t i = 0; i < samples.size(); i++) {
        uint16_t value = static_cast<uint16_t>(static_cast<int16_t>(samples[i]));
        if (big_endian) {
            dest[i * 2] = static_cast<uint8_t>(value >> 8);
            dest[i * 2 + 1] = static_cast<uint8_t>(value);
        } else {
            dest[i * 2] = static_cast<uint8_t>(value);
            dest[i * 2 + 1] = static_cast<uint8_t>(value >> 8);
        }
    }
    return consumed;
}

} // namespace FLAC
} // namespace Codec
} // namespace ChdRead
