/*
 * ChannelDecorrelator.cpp - FLAC stereo decorrelation
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

bool ChannelDecorrelator::isSideChannel(ChannelAssignment assignment, uint32_t channel)
{
    switch (assignment) {
        case ChannelAssignment::LEFT_SIDE:
        case ChannelAssignment::MID_SIDE:
            return channel == 1;
        case ChannelAssignment::RIGHT_SIDE:
            return channel == 0;
        case ChannelAssignment::INDEPENDENT:
        default:
            return false;
    }
}

bool ChannelDecorrelator::decorrelate(int32_t** channels, uint32_t block_size,
                                      uint32_t channel_count, ChannelAssignment assignment)
{
    if (!channels || block_size == 0) {
        Debug::log("flac_codec", "ChannelDecorrelator: nothing to decorrelate");
        return false;
    }

    if (assignment == ChannelAssignment::INDEPENDENT) {
        return true;
    }

    if (channel_count != 2) {
        Debug::log("flac_codec", "ChannelDecorrelator: ", channelAssignmentName(assignment),
                   " requires 2 channels, got ", channel_count);
        return false;
    }

    switch (assignment) {
        case ChannelAssignment::LEFT_SIDE:
            decorrelateLeftSide(channels[0], channels[1], block_size);
            return true;
        case ChannelAssignment::RIGHT_SIDE:
            decorrelateRightSide(channels[0], channels[1], block_size);
            return true;
        case ChannelAssignment::MID_SIDE:
            decorrelateMidSide(channels[0], channels[1], block_size);
            return true;
        default:
            return false;
    }
}

void ChannelDecorrelator::decorrelateLeftSide(int32_t* left, int32_t* side, uint32_t count)
{
    // Right = Left - Side; side buffer becomes right
    for (uint32_t i = 0; i < count; ++i) {
        side[i] = left[i] - side[i];
    }
}

void ChannelDecorrelator::decorrelateRightSide(int32_t* side, int32_t* right, uint32_t count)
{
    // Left = Right + Side; side buffer becomes left
    for (uint32_t i = 0; i < count; ++i) {
        side[i] = right[i] + side[i];
    }
}

void ChannelDecorrelator::decorrelateMidSide(int32_t* mid, int32_t* side, uint32_t count)
{
    // The encoder dropped the low bit of mid; it equals the low bit of side
    for (uint32_t i = 0; i < count; ++i) {
        int64_t m = (static_cast<int64_t>(mid[i]) * 2) | (side[i] & 1);
        int64_t s = side[i];
        mid[i] = static_cast<int32_t>((m + s) >> 1);
        side[i] = static_cast<int32_t>((m - s) >> 1);
    }
}

} // namespace FLAC
} // namespace Codec
} // namespace ChdRead
