/*
 * CodecTypes.cpp - Codec identifiers declared in CHD headers
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

CodecKind codecKindForTag(uint32_t tag)
{
    switch (tag) {
        case CODEC_ZLIB:    return CodecKind::ZLIB;
        case CODEC_LZMA:    return CodecKind::LZMA;
        case CODEC_HUFFMAN: return CodecKind::HUFFMAN;
        case CODEC_FLAC:    return CodecKind::FLAC;
        case CODEC_CD_ZLIB: return CodecKind::CD_ZLIB;
        case CODEC_CD_LZMA: return CodecKind::CD_LZMA;
        case CODEC_CD_FLAC: return CodecKind::CD_FLAC;
        default:            return CodecKind::UNSUPPORTED;
    }
}

const char* codecKindName(CodecKind kind)
{
    switch (kind) {
        case CodecKind::UNSUPPORTED: return "unsupported";
        case CodecKind::ZLIB:        return "Deflate";
        case CodecKind::LZMA:        return "LZMA";
        case CodecKind::HUFFMAN:     return "Huffman";
        case CodecKind::FLAC:        return "FLAC";
        case CodecKind::CD_ZLIB:     return "CD Deflate";
        case CodecKind::CD_LZMA:     return "CD LZMA";
        case CodecKind::CD_FLAC:     return "CD FLAC";
    }
    return "unknown";
}

std::string describeCodec(uint32_t tag)
{
    if (tag == CODEC_NONE) {
        return "none";
    }
    std::string name = Core::tagToString(tag);
    CodecKind kind = codecKindForTag(tag);
    if (kind == CodecKind::UNSUPPORTED) {
        return name + " (unsupported)";
    }
    return name + " (" + codecKindName(kind) + ")";
}

} // namespace Codec
} // namespace ChdRead
