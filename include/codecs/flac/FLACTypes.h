/*
 * FLACTypes.h - Frame and subframe structures for the CD audio decoder
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

#ifndef CHDREAD_CODECS_FLAC_FLACTYPES_H
#define CHDREAD_CODECS_FLAC_FLACTYPES_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Codec {
namespace FLAC {

/**
 * Stereo decorrelation mode declared in the frame header
 */
enum class ChannelAssignment : uint8_t {
    INDEPENDENT = 0,
    LEFT_SIDE,
    RIGHT_SIDE,
    MID_SIDE
};

const char* channelAssignmentName(ChannelAssignment assignment);

/**
 * Values a frame header may defer to. CHD hunks carry bare frames with
 * no STREAMINFO block, so the reader supplies them.
 */
struct StreamDefaults {
    uint32_t sample_rate = 44100;
    uint32_t channels = 2;
    uint32_t bit_depth = 16;
};

/**
 * FLAC frame header
 */
struct FrameHeader {
    bool is_variable_block_size;
    uint32_t block_size;
    uint32_t sample_rate;
    uint32_t channels;
    ChannelAssignment channel_assignment;
    uint32_t bit_depth;
    uint64_t coded_number;  // frame number if fixed, sample number if variable
    uint8_t crc8;
    size_t header_bytes;    // bytes from sync code through CRC-8

    FrameHeader()
        : is_variable_block_size(false)
        , block_size(0)
        , sample_rate(0)
        , channels(0)
        , channel_assignment(ChannelAssignment::INDEPENDENT)
        , bit_depth(0)
        , coded_number(0)
        , crc8(0)
        , header_bytes(0)
    {}
};

enum class SubframeType : uint8_t {
    CONSTANT,
    VERBATIM,
    FIXED,
    LPC,
    RESERVED
};

struct SubframeHeader {
    SubframeType type = SubframeType::RESERVED;
    uint32_t predictor_order = 0;
    uint32_t wasted_bits = 0;
    uint32_t bit_depth = 0;   // effective depth after wasted bits and side bit
};

enum class CodingMethod : uint8_t {
    RICE_4BIT = 0,
    RICE_5BIT = 1
};

struct PartitionInfo {
    uint32_t sample_count = 0;
    uint32_t rice_parameter = 0;
    bool is_escaped = false;
    uint32_t escape_bits = 0;
};

// Largest predictor orders the format can express
static constexpr uint32_t MAX_FIXED_ORDER = 4;
static constexpr uint32_t MAX_LPC_ORDER = 32;

} // namespace FLAC
} // namespace Codec
} // namespace ChdRead

#endif // CHDREAD_CODECS_FLAC_FLACTYPES_H
