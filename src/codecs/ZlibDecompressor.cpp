/*
 * ZlibDecompressor.cpp - Raw deflate adapter over zlib
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

ZlibDecompressor::ZlibDecompressor()
    : m_stream{}
    , m_initialized(false)
{
    m_stream.zalloc = Z_NULL;
    m_stream.zfree = Z_NULL;
    m_stream.opaque = Z_NULL;
    // Negative window bits: raw deflate, no header or trailer
    int result = inflateInit2(&m_stream, -15);
    if (result != Z_OK) {
        std::string message = "unable to initialize inflate: ";
        message += m_stream.msg ? m_stream.msg : zError(result);
        throw ChdException(ChdError::DECODE_FAILURE, message);
    }
    m_initialized = true;
}

ZlibDecompressor::~ZlibDecompressor()
{
    if (m_initialized) {
        inflateEnd(&m_stream);
    }
}

void ZlibDecompressor::decompress(const uint8_t* src, size_t src_len, uint8_t* dest, size_t dest_len)
{
    if (src_len > std::numeric_limits<uInt>::max() || dest_len > std::numeric_limits<uInt>::max()) {
        throw ChdException(ChdError::DECODE_FAILURE, "deflate block too large");
    }

    int status = inflateReset(&m_stream);
    if (status != Z_OK) {
        throw ChdException(ChdError::DECODE_FAILURE, std::string("inflateReset: ") + zError(status));
    }

    m_stream.next_in = const_cast<Bytef*>(src);
    m_stream.avail_in = static_cast<uInt>(src_len);
    m_stream.next_out = dest;
    m_stream.avail_out = static_cast<uInt>(dest_len);

    status = inflate(&m_stream, Z_FINISH);
    if (status == Z_DATA_ERROR || status == Z_NEED_DICT || status == Z_MEM_ERROR || status == Z_STREAM_ERROR) {
        std::ostringstream oss;
        oss << "inflate: " << (m_stream.msg ? m_stream.msg : "error") << " [" << status << "]";
        Debug::log("chd_codec", "ZlibDecompressor: ", oss.str());
        throw ChdException(ChdError::DECODE_FAILURE, oss.str());
    }

    // A full output buffer is success even if the end-of-block marker was
    // not reached
    if (m_stream.total_out != dest_len) {
        std::ostringstream oss;
        oss << "inflate produced " << m_stream.total_out << " bytes, expected " << dest_len;
        Debug::log("chd_codec", "ZlibDecompressor: ", oss.str());
        throw ChdException(ChdError::DECODE_FAILURE, oss.str());
    }
}

} // namespace Codec
} // namespace ChdRead
