/*
 * ResidualDecoder.cpp - Rice coded prediction residuals
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

ResidualDecoder::ResidualDecoder(BitstreamReader* reader)
    : m_reader(reader)
    , m_last_error(ChdError::NONE)
    , m_last_message("")
{
}

bool ResidualDecoder::fail(ChdError error, const char* message)
{
    m_last_error = error;
    m_last_message = message;
    Debug::log("flac_codec", "ResidualDecoder: ", message);
    return false;
}

bool ResidualDecoder::decodeResidual(int32_t* output, uint32_t block_size, uint32_t predictor_order)
{
    m_last_error = ChdError::NONE;
    m_last_message = "";

    CodingMethod method;
    uint32_t partition_order;
    if (!parseResidualHeader(method, partition_order)) {
        return false;
    }

    // block_size must split evenly into 2^partition_order partitions and
    // the first partition must hold at least the warm-up samples
    uint32_t partition_count = 1u << partition_order;
    if (block_size % partition_count != 0) {
        return fail(ChdError::INVALID_PREDICTION, "Block size not divisible by partition count");
    }
    uint32_t samples_per_partition = block_size / partition_count;
    if (samples_per_partition < predictor_order) {
        return fail(ChdError::INVALID_PREDICTION, "First partition shorter than predictor order");
    }

    uint32_t param_bits = (method == CodingMethod::RICE_4BIT) ? 4 : 5;
    uint32_t escape_code = (1u << param_bits) - 1;

    uint32_t output_offset = 0;
    for (uint32_t p = 0; p < partition_count; ++p) {
        PartitionInfo info;
        info.sample_count = (p == 0) ? samples_per_partition - predictor_order : samples_per_partition;

        uint32_t rice_param;
        if (!m_reader->readBits(rice_param, param_bits)) {
            return fail(ChdError::OUT_OF_DATA, "Failed to read Rice parameter");
        }

        if (rice_param == escape_code) {
            // Escaped partition: samples stored at a fixed width, 0 means all zero
            info.is_escaped = true;
            if (!m_reader->readBits(info.escape_bits, 5)) {
                return fail(ChdError::OUT_OF_DATA, "Failed to read escape bit width");
            }
        } else {
            info.rice_parameter = rice_param;
        }

        if (!decodePartition(output + output_offset, info)) {
            return false;
        }
        output_offset += info.sample_count;
    }

    return true;
}

bool ResidualDecoder::parseResidualHeader(CodingMethod& method, uint32_t& partition_order)
{
    // 00 = 4-bit Rice parameters, 01 = 5-bit, 1x reserved
    uint32_t method_bits;
    if (!m_reader->readBits(method_bits, 2)) {
        return fail(ChdError::OUT_OF_DATA, "Failed to read coding method");
    }
    if (method_bits > 1) {
        return fail(ChdError::INVALID_PREDICTION, "Reserved residual coding method");
    }
    method = static_cast<CodingMethod>(method_bits);

    if (!m_reader->readBits(partition_order, 4)) {
        return fail(ChdError::OUT_OF_DATA, "Failed to read partition order");
    }
    return true;
}

bool ResidualDecoder::decodePartition(int32_t* output, const PartitionInfo& info)
{
    if (info.is_escaped) {
        for (uint32_t i = 0; i < info.sample_count; ++i) {
            if (!m_reader->readBitsSigned(output[i], info.escape_bits)) {
                return fail(ChdError::OUT_OF_DATA, "Failed to read escaped sample");
            }
        }
        return true;
    }

    for (uint32_t i = 0; i < info.sample_count; ++i) {
        if (!m_reader->readRiceCode(output[i], info.rice_parameter)) {
            Debug::log("flac_codec", "Rice decode failed at sample ", i, " of ", info.sample_count);
            return fail(m_reader->canRead(1) ? ChdError::DECODE_FAILURE : ChdError::OUT_OF_DATA,
                        "Failed to read Rice code");
        }
    }
    return true;
}

} // namespace FLAC
} // namespace Codec
} // namespace ChdRead
