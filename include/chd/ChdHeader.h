/*
 * ChdHeader.h - CHD container header (versions 3, 4 and 5)
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

#ifndef CHDREAD_CHD_CHDHEADER_H
#define CHDREAD_CHD_CHDHEADER_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Chd {

constexpr char CHD_MAGIC[8] = { 'M', 'C', 'o', 'm', 'p', 'r', 'H', 'D' };

constexpr uint32_t V3_HEADER_SIZE = 120;
constexpr uint32_t V4_HEADER_SIZE = 108;
constexpr uint32_t V5_HEADER_SIZE = 124;
constexpr uint32_t MAX_HEADER_SIZE = V5_HEADER_SIZE;

// v3/v4 header flags
constexpr uint32_t HEADER_FLAG_HAS_PARENT = 0x00000001;
constexpr uint32_t HEADER_FLAG_WRITEABLE = 0x00000002;

// v3/v4 compression field
constexpr uint32_t V34_COMPRESSION_NONE = 0;
constexpr uint32_t V34_COMPRESSION_ZLIB = 1;
constexpr uint32_t V34_COMPRESSION_ZLIB_PLUS = 2;
constexpr uint32_t V34_COMPRESSION_AV = 3;

using Sha1Digest = std::array<uint8_t, 20>;
using Md5Digest = std::array<uint8_t, 16>;

/**
 * @brief Fields of a container header, normalised across versions
 *
 * v3 and v4 headers carry a single compression code; it is translated
 * into codec slot 0 so that the rest of the reader only deals with the
 * v5 four-slot model.
 */
struct ChdHeader {
    uint32_t length = 0;
    uint32_t version = 0;
    uint32_t flags = 0;
    uint32_t compression = 0;               // v3/v4 only, as stored
    std::array<uint32_t, 4> compressors{};  // codec tags per slot
    uint64_t logical_bytes = 0;
    uint64_t map_offset = 0;
    uint64_t meta_offset = 0;
    uint32_t hunk_bytes = 0;
    uint32_t unit_bytes = 0;
    uint32_t hunk_count = 0;
    uint64_t unit_count = 0;
    Sha1Digest sha1{};
    Sha1Digest raw_sha1{};
    Sha1Digest parent_sha1{};
    Md5Digest md5{};
    Md5Digest parent_md5{};

    /**
     * @brief Parse and validate a raw header
     *
     * @param data At least the version's header size, starting at offset 0
     * @param size Bytes available
     * @throws ChdException OPEN_ERROR for bad magic, an unsupported
     * version or too few bytes; MALFORMED_HEADER for inconsistent fields
     */
    static ChdHeader parse(const uint8_t* data, size_t size);

    /**
     * @brief Header size for a version, 0 if unsupported
     */
    static uint32_t headerSizeFor(uint32_t version);

    bool hasParent() const;
    bool isCompressed() const;

    /**
     * @brief Size of one raw map entry for this header
     */
    uint32_t mapEntryBytes() const;

    /**
     * @brief Set unit size for v3/v4 containers once metadata is known
     */
    void setUnitBytes(uint32_t bytes);

private:
    void parseV3(const uint8_t* data);
    void parseV4(const uint8_t* data);
    void parseV5(const uint8_t* data);
    void validate() const;
};

std::string formatDigest(const uint8_t* digest, size_t length);

template<size_t N>
bool isZeroDigest(const std::array<uint8_t, N>& digest)
{
    return std::all_of(digest.begin(), digest.end(), [](uint8_t b) { return b == 0; });
}

} // namespace Chd
} // namespace ChdRead

#endif // CHDREAD_CHD_CHDHEADER_H
