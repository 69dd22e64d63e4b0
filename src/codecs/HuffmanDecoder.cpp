/*
 * HuffmanDecoder.cpp - Canonical Huffman decoder for CHD payloads
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

HuffmanDecoder::HuffmanDecoder(uint32_t num_codes, uint8_t max_bits)
    : m_num_codes(num_codes)
    , m_max_bits(std::min<uint8_t>(max_bits, 32))
    , m_built(false)
    , m_lengths(num_codes, 0)
    , m_codes(num_codes, 0)
{
    m_tier_first.fill(0);
    m_tier_count.fill(0);
    m_tier_offset.fill(0);
}

void HuffmanDecoder::importTreeRle(BitstreamReader& reader)
{
    // Bits per length entry depend on the largest representable length
    uint32_t numbits;
    if (m_max_bits >= 16) {
        numbits = 5;
    } else if (m_max_bits >= 8) {
        numbits = 4;
    } else {
        numbits = 3;
    }

    std::vector<uint8_t> lengths(m_num_codes, 0);
    uint32_t curnode = 0;
    while (curnode < m_num_codes) {
        uint32_t nodebits = reader.readBits(numbits);
        if (nodebits != 1) {
            lengths[curnode++] = static_cast<uint8_t>(nodebits);
            continue;
        }

        // 1 is the escape: a second 1 is a literal length of 1, anything
        // else is a length followed by a repeat count
        nodebits = reader.readBits(numbits);
        if (nodebits == 1) {
            lengths[curnode++] = 1;
            continue;
        }

        uint32_t repcount = reader.readBits(numbits) + 3;
        if (repcount > m_num_codes - curnode) {
            std::ostringstream oss;
            oss << "RLE repeat of " << repcount << " at code " << curnode
                << " overruns " << m_num_codes << " codes";
            throw ChdException(ChdError::INVALID_TABLE, oss.str());
        }
        while (repcount--) {
            lengths[curnode++] = static_cast<uint8_t>(nodebits);
        }
    }

    setCodeLengths(lengths);
}

void HuffmanDecoder::importTreeHuffman(BitstreamReader& reader)
{
    // First a small 24 entry tree describing how the lengths are coded
    HuffmanDecoder small_tree(24, 6);
    std::vector<uint8_t> small_lengths(24, 0);
    small_lengths[0] = static_cast<uint8_t>(reader.readBits(3));
    uint32_t start = reader.readBits(3) + 1;
    uint32_t count = 0;
    for (uint32_t index = 1; index < 24; index++) {
        if (index < start || count == 7) {
            small_lengths[index] = 0;
        } else {
            count = reader.readBits(3);
            small_lengths[index] = static_cast<uint8_t>((count == 7) ? 0 : count);
        }
    }
    small_tree.setCodeLengths(small_lengths);

    // Width of an extended RLE count
    uint32_t rlefullbits = 0;
    for (uint32_t temp = (m_num_codes > 9) ? m_num_codes - 9 : 0; temp != 0; temp >>= 1) {
        rlefullbits++;
    }

    std::vector<uint8_t> lengths(m_num_codes, 0);
    uint8_t last = 0;
    uint32_t curcode = 0;
    while (curcode < m_num_codes) {
        uint32_t value = small_tree.decodeOne(reader);
        if (value != 0) {
            last = static_cast<uint8_t>(value - 1);
            lengths[curcode++] = last;
        } else {
            uint32_t repeat = reader.readBits(3) + 2;
            if (repeat == 7 + 2) {
                repeat += reader.readBits(rlefullbits);
            }
            for (; repeat != 0 && curcode < m_num_codes; repeat--) {
                lengths[curcode++] = last;
            }
        }
    }

    setCodeLengths(lengths);
}

void HuffmanDecoder::setCodeLengths(const std::vector<uint8_t>& lengths)
{
    if (lengths.size() != m_num_codes) {
        std::ostringstream oss;
        oss << "expected " << m_num_codes << " code lengths, got " << lengths.size();
        throw ChdException(ChdError::INVALID_TABLE, oss.str());
    }
    m_built = false;
    m_lengths = lengths;
    assignCanonicalCodes();
    buildTiers();
    m_built = true;
}

void HuffmanDecoder::assignCanonicalCodes()
{
    std::array<uint32_t, 33> histogram{};
    for (uint32_t symbol = 0; symbol < m_num_codes; symbol++) {
        uint8_t length = m_lengths[symbol];
        if (length > m_max_bits) {
            std::ostringstream oss;
            oss << "code length " << static_cast<int>(length) << " for symbol " << symbol
                << " exceeds maximum of " << static_cast<int>(m_max_bits);
            throw ChdException(ChdError::INVALID_TABLE, oss.str());
        }
        histogram[length]++;
    }
    const uint32_t used = m_num_codes - histogram[0];

    // Longest codes take the lowest values. At each length the codes used
    // so far plus the new ones must pair up exactly into the next shorter
    // length, otherwise the tree has a hole or is oversubscribed.
    uint32_t curstart = 0;
    for (int length = 32; length > 0; length--) {
        uint32_t total = curstart + histogram[length];
        uint32_t nextstart = total >> 1;
        if (length != 1 && nextstart * 2 != total) {
            std::ostringstream oss;
            oss << "code lengths do not form a prefix code at length " << length;
            throw ChdException(ChdError::INVALID_TABLE, oss.str());
        }
        if (length == 1 && total > 2) {
            throw ChdException(ChdError::INVALID_TABLE, "code lengths oversubscribe the tree");
        }
        // A table with one used symbol is written as a lone 1-bit code
        if (length == 1 && total != 2 && !(total == 1 && used == 1)) {
            std::ostringstream oss;
            oss << "code lengths leave part of the tree unused (" << used << " symbols)";
            throw ChdException(ChdError::INVALID_TABLE, oss.str());
        }
        histogram[length] = curstart;
        curstart = nextstart;
    }

    for (uint32_t symbol = 0; symbol < m_num_codes; symbol++) {
        uint8_t length = m_lengths[symbol];
        m_codes[symbol] = (length > 0) ? histogram[length]++ : 0;
    }
}

void HuffmanDecoder::buildTiers()
{
    m_tier_first.fill(0);
    m_tier_count.fill(0);
    m_tier_offset.fill(0);
    m_sorted_symbols.clear();
    m_sorted_symbols.reserve(m_num_codes);

    // Symbols of one length carry consecutive codes in symbol order
    for (uint32_t length = 1; length <= 32; length++) {
        m_tier_offset[length] = static_cast<uint32_t>(m_sorted_symbols.size());
        for (uint32_t symbol = 0; symbol < m_num_codes; symbol++) {
            if (m_lengths[symbol] != length) {
                continue;
            }
            if (m_tier_count[length] == 0) {
                m_tier_first[length] = m_codes[symbol];
            }
            m_tier_count[length]++;
            m_sorted_symbols.push_back(symbol);
        }
    }
}

uint32_t HuffmanDecoder::decodeOne(BitstreamReader& reader) const
{
    if (!m_built) {
        throw ChdException(ChdError::INVALID_TABLE, "Huffman table used before it was built");
    }

    uint32_t code = 0;
    for (uint32_t length = 1; length <= m_max_bits; length++) {
        code = (code << 1) | reader.readBits(1);
        uint32_t count = m_tier_count[length];
        if (count > 0 && code >= m_tier_first[length] && code - m_tier_first[length] < count) {
            return m_sorted_symbols[m_tier_offset[length] + (code - m_tier_first[length])];
        }
    }

    std::ostringstream oss;
    oss << "no Huffman code matches 0x" << std::hex << code << std::dec
        << " within " << static_cast<int>(m_max_bits) << " bits";
    throw ChdException(ChdError::DECODE_FAILURE, oss.str());
}

uint8_t HuffmanDecoder::codeLength(uint32_t symbol) const
{
    return symbol < m_num_codes ? m_lengths[symbol] : 0;
}

uint32_t HuffmanDecoder::code(uint32_t symbol) const
{
    return symbol < m_num_codes ? m_codes[symbol] : 0;
}

} // namespace Codec
} // namespace ChdRead
