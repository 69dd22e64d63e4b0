/*
 * CodecTypes.h - Codec identifiers declared in CHD headers
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

#ifndef CHDREAD_CODECS_CODECTYPES_H
#define CHDREAD_CODECS_CODECTYPES_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Codec {

// Four character codes stored in the v5 compressor list
constexpr uint32_t CODEC_NONE = 0;
constexpr uint32_t CODEC_ZLIB = Core::makeTag('z', 'l', 'i', 'b');
constexpr uint32_t CODEC_ZSTD = Core::makeTag('z', 's', 't', 'd');
constexpr uint32_t CODEC_LZMA = Core::makeTag('l', 'z', 'm', 'a');
constexpr uint32_t CODEC_HUFFMAN = Core::makeTag('h', 'u', 'f', 'f');
constexpr uint32_t CODEC_FLAC = Core::makeTag('f', 'l', 'a', 'c');
constexpr uint32_t CODEC_CD_ZLIB = Core::makeTag('c', 'd', 'z', 'l');
constexpr uint32_t CODEC_CD_ZSTD = Core::makeTag('c', 'd', 'z', 's');
constexpr uint32_t CODEC_CD_LZMA = Core::makeTag('c', 'd', 'l', 'z');
constexpr uint32_t CODEC_CD_FLAC = Core::makeTag('c', 'd', 'f', 'l');
constexpr uint32_t CODEC_AVHUFF = Core::makeTag('a', 'v', 'h', 'u');

/**
 * Closed set of codecs this reader decodes
 */
enum class CodecKind : uint8_t {
    UNSUPPORTED = 0,
    ZLIB,
    LZMA,
    HUFFMAN,
    FLAC,
    CD_ZLIB,
    CD_LZMA,
    CD_FLAC
};

/**
 * @brief Map a header tag to a codec kind
 * @return CodecKind::UNSUPPORTED for unknown or unimplemented tags
 */
CodecKind codecKindForTag(uint32_t tag);

const char* codecKindName(CodecKind kind);

/**
 * @brief Human readable codec name, e.g. "cdlz (CD LZMA)"
 */
std::string describeCodec(uint32_t tag);

} // namespace Codec
} // namespace ChdRead

#endif // CHDREAD_CODECS_CODECTYPES_H
