/*
 * HuffmanDecoder.h - Canonical Huffman decoder for CHD payloads
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

#ifndef CHDREAD_CODECS_HUFFMANDECODER_H
#define CHDREAD_CODECS_HUFFMANDECODER_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Codec {

/**
 * HuffmanDecoder - canonical prefix-code decoder
 *
 * The code table is rebuilt from code lengths alone. Two compact table
 * descriptions are understood:
 * - importTreeRle(): lengths written with a small fixed width and a
 *   run-length escape (compressed hunk maps)
 * - importTreeHuffman(): lengths themselves Huffman coded with a 24 entry
 *   table (the 'huff' codec)
 *
 * Codes are assigned longest length first. Within one length, codes are
 * consecutive in increasing symbol order, so every length tier occupies a
 * contiguous range and decoding can walk one bit at a time comparing the
 * accumulated code with that range.
 */
class HuffmanDecoder {
public:
    /**
     * @param num_codes Alphabet size
     * @param max_bits Longest permitted code length (at most 32)
     */
    HuffmanDecoder(uint32_t num_codes, uint8_t max_bits);
    ~HuffmanDecoder() = default;

    /**
     * @brief Read an RLE table description and build the code table
     * @throws ChdException INVALID_TABLE or OUT_OF_DATA
     */
    void importTreeRle(BitstreamReader& reader);

    /**
     * @brief Read a Huffman-coded table description and build the code table
     * @throws ChdException INVALID_TABLE or OUT_OF_DATA
     */
    void importTreeHuffman(BitstreamReader& reader);

    /**
     * @brief Build the code table directly from per-symbol lengths
     *
     * A length of zero means the symbol is unused. The lengths must fill
     * the code space exactly; the one exception is a single used symbol
     * with a 1-bit code.
     * @throws ChdException INVALID_TABLE if the lengths oversubscribe the
     * tree or leave part of it unused
     */
    void setCodeLengths(const std::vector<uint8_t>& lengths);

    /**
     * @brief Decode one symbol
     * @throws ChdException DECODE_FAILURE if no code matches within
     * max_bits bits, OUT_OF_DATA if the stream ends first
     */
    uint32_t decodeOne(BitstreamReader& reader) const;

    uint32_t numCodes() const { return m_num_codes; }
    uint8_t maxBits() const { return m_max_bits; }
    bool isBuilt() const { return m_built; }

    // Assigned code and its length for a symbol (length 0 if unused)
    uint8_t codeLength(uint32_t symbol) const;
    uint32_t code(uint32_t symbol) const;

private:
    void assignCanonicalCodes();
    void buildTiers();

    uint32_t m_num_codes;
    uint8_t m_max_bits;
    bool m_built;

    std::vector<uint8_t> m_lengths;
    std::vector<uint32_t> m_codes;

    // Per length: first code value, number of codes, index into m_sorted_symbols
    std::array<uint32_t, 33> m_tier_first;
    std::array<uint32_t, 33> m_tier_count;
    std::array<uint32_t, 33> m_tier_offset;
    std::vector<uint32_t> m_sorted_symbols;
};

} // namespace Codec
} // namespace ChdRead

#endif // CHDREAD_CODECS_HUFFMANDECODER_H
