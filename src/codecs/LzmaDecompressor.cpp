/*
 * LzmaDecompressor.cpp - Raw LZMA adapter over liblzma
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

uint32_t LzmaDecompressor::dictionarySizeFor(uint32_t hunk_bytes)
{
    // Level 9 default, reduced the same way the encoder reduces it
    uint32_t dict_size = 1u << 26;
    if (dict_size > hunk_bytes) {
        for (uint32_t i = 11; i <= 30; i++) {
            if (hunk_bytes <= (2u << i)) {
                dict_size = 2u << i;
                break;
            }
            if (hunk_bytes <= (3u << i)) {
                dict_size = 3u << i;
                break;
            }
        }
    }
    return dict_size;
}

LzmaDecompressor::LzmaDecompressor(uint32_t hunk_bytes)
    : m_stream(LZMA_STREAM_INIT)
    , m_dict_size(dictionarySizeFor(hunk_bytes))
{
    Debug::log("chd_codec", "LzmaDecompressor: hunk_bytes=", hunk_bytes, ", dictionary=", m_dict_size);
}

LzmaDecompressor::~LzmaDecompressor()
{
    lzma_end(&m_stream);
}

void LzmaDecompressor::decompress(const uint8_t* src, size_t src_len, uint8_t* dest, size_t dest_len)
{
    lzma_options_lzma options{};
    if (lzma_lzma_preset(&options, 9) != 0) {
        throw ChdException(ChdError::DECODE_FAILURE, "liblzma rejected preset 9");
    }
    options.dict_size = m_dict_size;
    options.lc = 3;
    options.lp = 0;
    options.pb = 2;
    options.ext_flags = LZMA_LZMA1EXT_ALLOW_EOPM;
    options.ext_size_low = static_cast<uint32_t>(static_cast<uint64_t>(dest_len) & 0xFFFFFFFFu);
    options.ext_size_high = static_cast<uint32_t>(static_cast<uint64_t>(dest_len) >> 32);

    lzma_filter filters[2];
    filters[0].id = LZMA_FILTER_LZMA1EXT;
    filters[0].options = &options;
    filters[1].id = LZMA_VLI_UNKNOWN;
    filters[1].options = nullptr;

    // Re-initializing an existing stream reuses its allocations
    lzma_ret ret = lzma_raw_decoder(&m_stream, filters);
    if (ret != LZMA_OK) {
        std::ostringstream oss;
        oss << "lzma_raw_decoder initialization failed: " << static_cast<int>(ret);
        throw ChdException(ChdError::DECODE_FAILURE, oss.str());
    }

    m_stream.next_in = src;
    m_stream.avail_in = src_len;
    m_stream.next_out = dest;
    m_stream.avail_out = dest_len;

    ret = lzma_code(&m_stream, LZMA_FINISH);
    size_t produced = dest_len - m_stream.avail_out;
    if ((ret != LZMA_STREAM_END && ret != LZMA_OK) || produced != dest_len) {
        std::ostringstream oss;
        oss << "lzma_code failed: status " << static_cast<int>(ret) << ", produced " << produced
            << " of " << dest_len << " bytes";
        Debug::log("chd_codec", "LzmaDecompressor: ", oss.str());
        throw ChdException(ChdError::DECODE_FAILURE, oss.str());
    }
}

} // namespace Codec
} // namespace ChdRead
