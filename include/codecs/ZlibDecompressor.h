/*
 * ZlibDecompressor.h - Raw deflate adapter over zlib
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

#ifndef CHDREAD_CODECS_ZLIBDECOMPRESSOR_H
#define CHDREAD_CODECS_ZLIBDECOMPRESSOR_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Codec {

/**
 * @brief Inflates raw deflate streams (no zlib or gzip wrapper)
 *
 * The inflate state is allocated once and reset for every hunk.
 */
class ZlibDecompressor {
public:
    ZlibDecompressor();
    ~ZlibDecompressor();

    ZlibDecompressor(const ZlibDecompressor&) = delete;
    ZlibDecompressor& operator=(const ZlibDecompressor&) = delete;

    /**
     * @brief Inflate @p src into exactly @p dest_len bytes at @p dest
     * @throws ChdException DECODE_FAILURE if the stream is corrupt or
     * yields a different number of bytes
     */
    void decompress(const uint8_t* src, size_t src_len, uint8_t* dest, size_t dest_len);

private:
    z_stream m_stream;
    bool m_initialized;
};

} // namespace Codec
} // namespace ChdRead

#endif // CHDREAD_CODECS_ZLIBDECOMPRESSOR_H
