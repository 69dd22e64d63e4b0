/*
 * SubframeDecoder.h - FLAC subframe and residual decoding
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

#ifndef CHDREAD_CODECS_FLAC_SUBFRAMEDECODER_H
#define CHDREAD_CODECS_FLAC_SUBFRAMEDECODER_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Codec {
namespace FLAC {

/**
 * ResidualDecoder - Rice coded prediction residuals
 *
 * Residuals are split into 2^partition_order partitions, each with its own
 * Rice parameter or an escape to fixed-width samples. The first partition
 * is shortened by the predictor order.
 */
class ResidualDecoder {
public:
    explicit ResidualDecoder(BitstreamReader* reader);

    /**
     * Decode block_size - predictor_order residuals into @p output
     * @return true on success; on failure lastError() tells why
     */
    bool decodeResidual(int32_t* output, uint32_t block_size, uint32_t predictor_order);

    ChdError lastError() const { return m_last_error; }
    const char* lastMessage() const { return m_last_message; }

private:
    BitstreamReader* m_reader;
    ChdError m_last_error;
    const char* m_last_message;

    bool fail(ChdError error, const char* message);
    bool parseResidualHeader(CodingMethod& method, uint32_t& partition_order);
    bool decodePartition(int32_t* output, const PartitionInfo& info);
};

/**
 * SubframeDecoder - Decodes one channel of one FLAC frame
 *
 * Handles CONSTANT, VERBATIM, FIXED (orders 0-4) and LPC (orders 1-32)
 * subframes, then restores wasted low bits.
 */
class SubframeDecoder {
public:
    SubframeDecoder(BitstreamReader* reader, ResidualDecoder* residual);
    ~SubframeDecoder() = default;

    /**
     * Decode a subframe
     * @param output Output buffer with room for block_size samples
     * @param block_size Number of samples in this block
     * @param bit_depth Frame bit depth
     * @param is_side_channel True for the side channel (one extra bit)
     * @return true on success; on failure lastError() tells why
     */
    bool decodeSubframe(int32_t* output, uint32_t block_size,
                        uint32_t bit_depth, bool is_side_channel);

    ChdError lastError() const { return m_last_error; }

    // Predictors are exposed for the property tests
    static void applyFixedPredictor(int32_t* samples, const int32_t* residuals,
                                    uint32_t count, uint32_t order);
    static void applyLPCPredictor(int32_t* samples, const int32_t* residuals,
                                  const int32_t* coeffs, uint32_t count,
                                  uint32_t order, int32_t shift);

private:
    BitstreamReader* m_reader;
    ResidualDecoder* m_residual;
    ChdError m_last_error;

    bool fail(ChdError error);
    bool parseSubframeHeader(SubframeHeader& header, uint32_t frame_bit_depth,
                             bool is_side_channel);
    bool decodeConstant(int32_t* output, uint32_t block_size, const SubframeHeader& header);
    bool decodeVerbatim(int32_t* output, uint32_t block_size, const SubframeHeader& header);
    bool decodeFixed(int32_t* output, uint32_t block_size, const SubframeHeader& header);
    bool decodeLPC(int32_t* output, uint32_t block_size, const SubframeHeader& header);
    bool decodeResiduals(uint32_t block_size, uint32_t order,
                         std::vector<int32_t>& residuals);
};

} // namespace FLAC
} // namespace Codec
} // namespace ChdRead

#endif // CHDREAD_CODECS_FLAC_SUBFRAMEDECODER_H
