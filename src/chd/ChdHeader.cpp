/*
 * ChdHeader.cpp - CHD container header (versions 3, 4 and 5)
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
namespace Chd {

using Core::readBE32;
using Core::readBE48;
using Core::readBE64;

uint32_t ChdHeader::headerSizeFor(uint32_t version)
{
    switch (version) {
        case 3: return V3_HEADER_SIZE;
        case 4: return V4_HEADER_SIZE;
        case 5: return V5_HEADER_SIZE;
        default: return 0;
    }
}

ChdHeader ChdHeader::parse(const uint8_t* data, size_t size)
{
    if (size < 16) {
        throw ChdException(ChdError::OPEN_ERROR, "file too short for a CHD header");
    }
    if (std::memcmp(data, CHD_MAGIC, sizeof(CHD_MAGIC)) != 0) {
        throw ChdException(ChdError::OPEN_ERROR, "bad magic, not a CHD file");
    }

    ChdHeader header;
    header.length = readBE32(data + 8);
    header.version = readBE32(data + 12);

    uint32_t expected = headerSizeFor(header.version);
    if (expected == 0) {
        std::ostringstream oss;
        oss << "unsupported CHD version " << header.version;
        throw ChdException(ChdError::OPEN_ERROR, oss.str());
    }
    if (size < expected) {
        std::ostringstream oss;
        oss << "truncated v" << header.version << " header: " << size << " of " << expected << " bytes";
        throw ChdException(ChdError::OPEN_ERROR, oss.str());
    }
    if (header.length != expected) {
        std::ostringstream oss;
        oss << "v" << header.version << " header declares length " << header.length
            << ", expected " << expected;
        throw ChdException(ChdError::MALFORMED_HEADER, oss.str());
    }

    switch (header.version) {
        case 3: header.parseV3(data); break;
        case 4: header.parseV4(data); break;
        case 5: header.parseV5(data); break;
    }

    header.validate();

    Debug::log("chd_map", "ChdHeader: v", header.version, " logical=", header.logical_bytes,
               " hunk_bytes=", header.hunk_bytes, " unit_bytes=", header.unit_bytes,
               " hunks=", header.hunk_count, " map@", header.map_offset,
               " codec0=", Core::tagToString(header.compressors[0]));
    return header;
}

static uint32_t v34CompressionTag(uint32_t compression)
{
    switch (compression) {
        case V34_COMPRESSION_NONE:      return Codec::CODEC_NONE;
        case V34_COMPRESSION_ZLIB:
        case V34_COMPRESSION_ZLIB_PLUS: return Codec::CODEC_ZLIB;
        case V34_COMPRESSION_AV:        return Codec::CODEC_AVHUFF;
        default:
            // Unknown codes keep a nonzero tag so the open fails as unsupported
            return compression;
    }
}

void ChdHeader::parseV3(const uint8_t* data)
{
    flags = readBE32(data + 16);
    compression = readBE32(data + 20);
    compressors[0] = v34CompressionTag(compression);
    hunk_count = readBE32(data + 24);
    logical_bytes = readBE64(data + 28);
    meta_offset = readBE64(data + 36);
    std::memcpy(md5.data(), data + 44, md5.size());
    std::memcpy(parent_md5.data(), data + 60, parent_md5.size());
    hunk_bytes = readBE32(data + 76);
    std::memcpy(sha1.data(), data + 80, sha1.size());
    std::memcpy(parent_sha1.data(), data + 100, parent_sha1.size());
    map_offset = V3_HEADER_SIZE;
    unit_bytes = hunk_bytes;
    unit_count = unit_bytes ? (logical_bytes + unit_bytes - 1) / unit_bytes : 0;
}

void ChdHeader::parseV4(const uint8_t* data)
{
    flags = readBE32(data + 16);
    compression = readBE32(data + 20);
    compressors[0] = v34CompressionTag(compression);
    hunk_count = readBE32(data + 24);
    logical_bytes = readBE64(data + 28);
    meta_offset = readBE64(data + 36);
    hunk_bytes = readBE32(data + 44);
    std::memcpy(sha1.data(), data + 48, sha1.size());
    std::memcpy(parent_sha1.data(), data + 68, parent_sha1.size());
    std::memcpy(raw_sha1.data(), data + 88, raw_sha1.size());
    map_offset = V4_HEADER_SIZE;
    unit_bytes = hunk_bytes;
    unit_count = unit_bytes ? (logical_bytes + unit_bytes - 1) / unit_bytes : 0;
}

void ChdHeader::parseV5(const uint8_t* data)
{
    for (size_t i = 0; i < compressors.size(); i++) {
        compressors[i] = readBE32(data + 16 + i * 4);
    }
    logical_bytes = readBE64(data + 32);
    map_offset = readBE64(data + 40);
    meta_offset = readBE64(data + 48);
    hunk_bytes = readBE32(data + 56);
    unit_bytes = readBE32(data + 60);
    std::memcpy(raw_sha1.data(), data + 64, raw_sha1.size());
    std::memcpy(sha1.data(), data + 84, sha1.size());
    std::memcpy(parent_sha1.data(), data + 104, parent_sha1.size());

    if (hunk_bytes != 0) {
        uint64_t count = (logical_bytes + hunk_bytes - 1) / hunk_bytes;
        if (count > std::numeric_limits<uint32_t>::max()) {
            throw ChdException(ChdError::MALFORMED_HEADER, "hunk count does not fit in 32 bits");
        }
        hunk_count = static_cast<uint32_t>(count);
    }
    unit_count = unit_bytes ? (logical_bytes + unit_bytes - 1) / unit_bytes : 0;
}

void ChdHeader::validate() const
{
    if (hunk_bytes == 0) {
        throw ChdException(ChdError::MALFORMED_HEADER, "hunk size is zero");
    }
    if (unit_bytes == 0) {
        throw ChdException(ChdError::MALFORMED_HEADER, "unit size is zero");
    }
    if (hunk_bytes % unit_bytes != 0) {
        std::ostringstream oss;
        oss << "unit size " << unit_bytes << " does not divide hunk size " << hunk_bytes;
        throw ChdException(ChdError::MALFORMED_HEADER, oss.str());
    }
    uint64_t needed = (logical_bytes + hunk_bytes - 1) / hunk_bytes;
    if (hunk_count < needed) {
        std::ostringstream oss;
        oss << "hunk count " << hunk_count << " does not cover logical size " << logical_bytes
            << " with " << hunk_bytes << "-byte hunks";
        throw ChdException(ChdError::MALFORMED_HEADER, oss.str());
    }
    if (version == 5 && isCompressed()) {
        // Codecs must be packed into the leading slots
        for (size_t i = 1; i < compressors.size(); i++) {
            if (compressors[i] != Codec::CODEC_NONE && compressors[i - 1] == Codec::CODEC_NONE) {
                throw ChdException(ChdError::MALFORMED_HEADER, "codec list has a gap");
            }
        }
    }
}

bool ChdHeader::hasParent() const
{
    if (version == 5) {
        return !isZeroDigest(parent_sha1);
    }
    return (flags & HEADER_FLAG_HAS_PARENT) != 0;
}

bool ChdHeader::isCompressed() const
{
    return compressors[0] != Codec::CODEC_NONE;
}

uint32_t ChdHeader::mapEntryBytes() const
{
    if (version < 5) {
        return 16;
    }
    return isCompressed() ? 12 : 4;
}

void ChdHeader::setUnitBytes(uint32_t bytes)
{
    if (bytes == 0 || hunk_bytes % bytes != 0) {
        std::ostringstream oss;
        oss << "unit size " << bytes << " does not divide hunk size " << hunk_bytes;
        throw ChdException(ChdError::MALFORMED_HEADER, oss.str());
    }
    unit_bytes = bytes;
    unit_count = (logical_bytes + unit_bytes - 1) / unit_bytes;
}

std::string formatDigest(const uint8_t* digest, size_t length)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < length; i++) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace Chd
} // namespace ChdRead
