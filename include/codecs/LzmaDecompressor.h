/*
 * LzmaDecompressor.h - Raw LZMA adapter over liblzma
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

#ifndef CHDREAD_CODECS_LZMADECOMPRESSOR_H
#define CHDREAD_CODECS_LZMADECOMPRESSOR_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Codec {

/**
 * @brief Decodes headerless LZMA streams
 *
 * CHD stores no LZMA properties. They are implied: lc=3, lp=0, pb=2 and
 * the level 9 dictionary shrunk to the smallest 2^n or 3*2^n size that
 * still covers one hunk. Streams carry no end marker, so the expected
 * output size is handed to the decoder.
 */
class LzmaDecompressor {
public:
    /**
     * @param hunk_bytes Largest output the stream can describe, used to
     * size the dictionary the encoder would have chosen
     */
    explicit LzmaDecompressor(uint32_t hunk_bytes);
    ~LzmaDecompressor();

    LzmaDecompressor(const LzmaDecompressor&) = delete;
    LzmaDecompressor& operator=(const LzmaDecompressor&) = delete;

    /**
     * @brief Decode @p src into exactly @p dest_len bytes at @p dest
     * @throws ChdException DECODE_FAILURE
     */
    void decompress(const uint8_t* src, size_t src_len, uint8_t* dest, size_t dest_len);

    uint32_t dictionarySize() const { return m_dict_size; }

    /**
     * @brief Dictionary size for a given hunk size
     */
    static uint32_t dictionarySizeFor(uint32_t hunk_bytes);

private:
    lzma_stream m_stream;
    uint32_t m_dict_size;
};

} // namespace Codec
} // namespace ChdRead

#endif // CHDREAD_CODECS_LZMADECOMPRESSOR_H
