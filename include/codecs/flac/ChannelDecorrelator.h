/*
 * ChannelDecorrelator.h - FLAC stereo decorrelation
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

#ifndef CHDREAD_CODECS_FLAC_CHANNELDECORRELATOR_H
#define CHDREAD_CODECS_FLAC_CHANNELDECORRELATOR_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Codec {
namespace FLAC {

/**
 * ChannelDecorrelator - turns side-coded stereo back into left/right
 *
 * Works in place on the two channel buffers; afterwards channels[0] holds
 * left and channels[1] holds right whatever the assignment was.
 */
class ChannelDecorrelator {
public:
    static bool decorrelate(int32_t** channels, uint32_t block_size,
                            uint32_t channel_count, ChannelAssignment assignment);

    /**
     * Which channel of a frame carries the side signal (one extra bit)
     */
    static bool isSideChannel(ChannelAssignment assignment, uint32_t channel);

private:
    static void decorrelateLeftSide(int32_t* left, int32_t* side, uint32_t count);
    static void decorrelateRightSide(int32_t* side, int32_t* right, uint32_t count);
    static void decorrelateMidSide(int32_t* mid, int32_t* side, uint32_t count);
};

} // namespace FLAC
} // namespace Codec
} // namespace ChdRead

#endif // CHDREAD_CODECS_FLAC_CHANNELDECORRELATOR_H
