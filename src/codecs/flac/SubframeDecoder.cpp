/*
 * SubframeDecoder.cpp - FLAC subframe decoding implementation
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

SubframeDecoder::SubframeDecoder(BitstreamReader *reader,
                                 ResidualDecoder *residual)
    : m_reader(reader), m_residual(residual), m_last_error(ChdError::NONE) {}

bool SubframeDecoder::fail(ChdError error) {
  m_last_error = error;
  return false;
}

bool SubframeDecoder::decodeSubframe(int32_t *output, uint32_t block_size,
                                     uint32_t bit_depth, bool is_side_channel) {
  m_last_error = ChdError::NONE;
  if (!output || block_size == 0) {
    Debug::log("flac_codec", "Invalid subframe parameters: block_size=",
               block_size);
    return fail(ChdError::DECODE_FAILURE);
  }

  SubframeHeader header;
  if (!parseSubframeHeader(header, bit_depth, is_side_channel)) {
    return false;
  }

  bool success = false;
  switch (header.type) {
  case SubframeType::CONSTANT:
    success = decodeConstant(output, block_size, header);
    break;
  case SubframeType::VERBATIM:
    success = decodeVerbatim(output, block_size, header);
    break;
  case SubframeType::FIXED:
    success = decodeFixed(output, block_size, header);
    break;
  case SubframeType::LPC:
    success = decodeLPC(output, block_size, header);
    break;
  case SubframeType::RESERVED:
  default:
    return fail(ChdError::INVALID_PREDICTION);
  }

  if (!success) {
    Debug::log("flac_codec", "Failed to decode subframe");
    return false;
  }

  if (header.wasted_bits > 0) {
    for (uint32_t i = 0; i < block_size; i++) {
      output[i] = static_cast<int32_t>(static_cast<uint32_t>(output[i])
                                       << header.wasted_bits);
    }
  }

  return true;
}

bool SubframeDecoder::parseSubframeHeader(SubframeHeader &header,
                                          uint32_t frame_bit_depth,
                                          bool is_side_channel) {
  uint32_t zero_bit;
  uint32_t type_bits;
  if (!m_reader->readBits(zero_bit, 1) || !m_reader->readBits(type_bits, 6)) {
    Debug::log("flac_codec", "Subframe header truncated");
    return fail(ChdError::OUT_OF_DATA);
  }
  if (zero_bit != 0) {
    Debug::log("flac_codec", "Subframe padding bit is not zero");
    return fail(ChdError::DECODE_FAILURE);
  }

  if (type_bits == 0) {
    header.type = SubframeType::CONSTANT;
    header.predictor_order = 0;
  } else if (type_bits == 1) {
    header.type = SubframeType::VERBATIM;
    header.predictor_order = 0;
  } else if ((type_bits & 0x38) == 0x08) {
    // 0b001xxx, order xxx
    header.type = SubframeType::FIXED;
    header.predictor_order = type_bits & 0x07;
    if (header.predictor_order > MAX_FIXED_ORDER) {
      Debug::log("flac_codec", "Invalid FIXED predictor order: ",
                 header.predictor_order);
      return fail(ChdError::INVALID_PREDICTION);
    }
  } else if ((type_bits & 0x20) == 0x20) {
    // 0b1xxxxx, order xxxxx + 1
    header.type = SubframeType::LPC;
    header.predictor_order = (type_bits & 0x1F) + 1;
  } else {
    Debug::log("flac_codec", "Reserved subframe type: 0x", std::hex, type_bits,
               std::dec);
    header.type = SubframeType::RESERVED;
    return fail(ChdError::INVALID_PREDICTION);
  }

  uint32_t wasted_bits_flag;
  if (!m_reader->readBits(wasted_bits_flag, 1)) {
    return fail(ChdError::OUT_OF_DATA);
  }
  header.wasted_bits = 0;
  if (wasted_bits_flag) {
    // Unary coded k, k+1 wasted bits
    if (!m_reader->readUnary(header.wasted_bits)) {
      return fail(ChdError::OUT_OF_DATA);
    }
    header.wasted_bits++;
  }

  header.bit_depth = frame_bit_depth;
  if (header.wasted_bits >= header.bit_depth) {
    Debug::log("flac_codec", "Wasted bits (", header.wasted_bits,
               ") >= bit depth (", header.bit_depth, ")");
    return fail(ChdError::INVALID_PREDICTION);
  }
  header.bit_depth -= header.wasted_bits;
  if (is_side_channel) {
    header.bit_depth++;
  }
  if (header.bit_depth == 0 || header.bit_depth > 32) {
    Debug::log("flac_codec", "Unsupported subframe bit depth: ",
               header.bit_depth);
    return fail(ChdError::INVALID_PREDICTION);
  }

  return true;
}

bool SubframeDecoder::decodeConstant(int32_t *output, uint32_t block_size,
                                     const SubframeHeader &header) {
  int32_t constant_value;
  if (!m_reader->readBitsSigned(constant_value, header.bit_depth)) {
    return fail(ChdError::OUT_OF_DATA);
  }
  for (uint32_t i = 0; i < block_size; i++) {
    output[i] = constant_value;
  }
  return true;
}

bool SubframeDecoder::decodeVerbatim(int32_t *output, uint32_t block_size,
                                     const SubframeHeader &header) {
  for (uint32_t i = 0; i < block_size; i++) {
    if (!m_reader->readBitsSigned(output[i], header.bit_depth)) {
      Debug::log("flac_codec", "Failed to read verbatim sample ", i);
      return fail(ChdError::OUT_OF_DATA);
    }
  }
  return true;
}

bool SubframeDecoder::decodeResiduals(uint32_t block_size, uint32_t order,
                                      std::vector<int32_t> &residuals) {
  residuals.assign(block_size - order, 0);
  if (!m_residual->decodeResidual(residuals.data(), block_size, order)) {
    Debug::log("flac_codec", "Failed to decode residuals: ",
               m_residual->lastMessage());
    return fail(m_residual->lastError());
  }
  return true;
}

bool SubframeDecoder::decodeFixed(int32_t *output, uint32_t block_size,
                                  const SubframeHeader &header) {
  uint32_t order = header.predictor_order;
  if (order > block_size) {
    Debug::log("flac_codec", "Predictor order (", order,
               ") exceeds block size (", block_size, ")");
    return fail(ChdError::INVALID_PREDICTION);
  }

  // Warm-up samples are stored verbatim
  for (uint32_t i = 0; i < order; i++) {
    if (!m_reader->readBitsSigned(output[i], header.bit_depth)) {
      return fail(ChdError::OUT_OF_DATA);
    }
  }

  std::vector<int32_t> residuals;
  if (!decodeResiduals(block_size, order, residuals)) {
    return false;
  }
  applyFixedPredictor(output, residuals.data(),
                      static_cast<uint32_t>(residuals.size()), order);
  return true;
}

bool SubframeDecoder::decodeLPC(int32_t *output, uint32_t block_size,
                                const SubframeHeader &header) {
  uint32_t order = header.predictor_order;
  if (order > block_size) {
    Debug::log("flac_codec", "Predictor order (", order,
               ") exceeds block size (", block_size, ")");
    return fail(ChdError::INVALID_PREDICTION);
  }

  for (uint32_t i = 0; i < order; i++) {
    if (!m_reader->readBitsSigned(output[i], header.bit_depth)) {
      return fail(ChdError::OUT_OF_DATA);
    }
  }

  // 4-bit (precision - 1); 0b1111 is forbidden
  uint32_t precision_bits;
  if (!m_reader->readBits(precision_bits, 4)) {
    return fail(ChdError::OUT_OF_DATA);
  }
  if (precision_bits == 0x0F) {
    Debug::log("flac_codec", "Forbidden coefficient precision: 0x0F");
    return fail(ChdError::INVALID_PREDICTION);
  }
  uint32_t coeff_precision = precision_bits + 1;

  int32_t shift;
  if (!m_reader->readBitsSigned(shift, 5)) {
    return fail(ChdError::OUT_OF_DATA);
  }
  if (shift < 0) {
    Debug::log("flac_codec", "Forbidden negative prediction shift: ", std::to_string(shift));
    return fail(ChdError::INVALID_PREDICTION);
  }

  std::vector<int32_t> coeffs(order);
  for (uint32_t i = 0; i < order; i++) {
    if (!m_reader->readBitsSigned(coeffs[i], coeff_precision)) {
      return fail(ChdError::OUT_OF_DATA);
    }
  }

  std::vector<int32_t> residuals;
  if (!decodeResiduals(block_size, order, residuals)) {
    return false;
  }
  applyLPCPredictor(output, residuals.data(), coeffs.data(),
                    static_cast<uint32_t>(residuals.size()), order, shift);
  return true;
}

void SubframeDecoder::applyFixedPredictor(int32_t *samples,
                                          const int32_t *residuals,
                                          uint32_t count, uint32_t order) {
  // samples[0..order-1] already hold the warm-up samples
  int32_t *out = samples + order;
  for (uint32_t i = 0; i < count; i++) {
    int64_t prediction = 0;
    const int32_t *history = out + i;
    switch (order) {
    case 0:
      prediction = 0;
      break;
    case 1:
      prediction = history[-1];
      break;
    case 2:
      prediction = 2LL * history[-1] - history[-2];
      break;
    case 3:
      prediction = 3LL * history[-1] - 3LL * history[-2] + history[-3];
      break;
    case 4:
      prediction = 4LL * history[-1] - 6LL * history[-2] +
                   4LL * history[-3] - history[-4];
      break;
    default:
      break;
    }
    out[i] = static_cast<int32_t>(prediction + residuals[i]);
  }
}

void SubframeDecoder::applyLPCPredictor(int32_t *samples,
                                        const int32_t *residuals,
                                        const int32_t *coeffs, uint32_t count,
                                        uint32_t order, int32_t shift) {
  // coeffs[0] weights the most recent sample
  int32_t *out = samples + order;
  for (uint32_t i = 0; i < count; i++) {
    const int32_t *history = out + i;
    int64_t sum = 0;
    for (uint32_t j = 0; j < order; j++) {
      sum += static_cast<int64_t>(coeffs[j]) * history[-1 - static_cast<int32_t>(j)];
    }
    out[i] = static_cast<int32_t>((sum >> shift) + residuals[i]);
  }
}

} // namespace FLAC
} // namespace Codec
} // namespace ChdRead
