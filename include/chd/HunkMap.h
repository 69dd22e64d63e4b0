/*
 * HunkMap.h - Per-hunk directory of a CHD container
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

#ifndef CHDREAD_CHD_HUNKMAP_H
#define CHDREAD_CHD_HUNKMAP_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Chd {

/**
 * @brief Where one hunk's bytes come from
 *
 * codec_slot is 0-3 for a compressed payload, or one of the
 * Codec::SLOT_* kinds. source_offset depends on the kind:
 *   0-3, NONE   byte offset of the payload in the container
 *   SELF        index of the hunk holding the same data
 *   PARENT      v5: unit index in the parent; v3/v4: parent hunk index
 *   MINI        8-byte big-endian fill pattern
 */
struct HunkMapEntry {
    uint8_t codec_slot = Codec::SLOT_NONE;
    uint32_t compressed_length = 0;
    uint64_t source_offset = 0;
    Core::DigestKind digest_kind = Core::DigestKind::NONE;
    uint32_t digest = 0;
};

/**
 * @brief Immutable, index addressed sequence of map entries
 */
class HunkMap {
public:
    HunkMap() = default;

    /**
     * @brief Parse a header and the raw map region that follows it
     *
     * @param header_bytes Raw header, see ChdHeader::parse
     * @param map_bytes Bytes starting at the header's map offset; for v5
     * compressed maps this includes the 16-byte map header
     * @return Header and map; the inputs are not retained
     * @throws ChdException OPEN_ERROR or MALFORMED_HEADER from the header;
     * MALFORMED_MAP if the map is short, fails its CRC or names an
     * undeclared codec slot
     */
    static std::pair<ChdHeader, HunkMap> parse(const std::vector<uint8_t>& header_bytes,
                                               const std::vector<uint8_t>& map_bytes);

    /**
     * @brief Parse a map region for an already parsed header
     */
    static HunkMap parse(const ChdHeader& header, const uint8_t* map_bytes, size_t map_size);

    /**
     * @brief Bytes of map region to read for this header
     *
     * v5 compressed maps record their own size in a 16-byte prefix, which
     * must be supplied; other maps ignore it.
     */
    static uint64_t regionSize(const ChdHeader& header, const uint8_t* prefix, size_t prefix_size);

    static constexpr uint32_t V5_COMPRESSED_MAP_HEADER_SIZE = 16;

    const HunkMapEntry& entry(uint32_t hunk_index) const;
    const HunkMapEntry& operator[](uint32_t hunk_index) const { return m_entries[hunk_index]; }
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    std::vector<HunkMapEntry>::const_iterator begin() const { return m_entries.begin(); }
    std::vector<HunkMapEntry>::const_iterator end() const { return m_entries.end(); }

    /**
     * @brief Check payload ranges against the backing source size
     * @throws ChdException MALFORMED_MAP
     */
    void validatePayloads(uint64_t source_size) const;

    // Number of entries of each kind, indexed by codec slot
    std::array<uint32_t, 8> kindCounts() const;

private:
    explicit HunkMap(std::vector<HunkMapEntry> entries) : m_entries(std::move(entries)) {}

    static std::vector<HunkMapEntry> parseV34(const ChdHeader& header, const uint8_t* map, size_t size);
    static std::vector<HunkMapEntry> parseV5Uncompressed(const ChdHeader& header, const uint8_t* map, size_t size);
    static std::vector<HunkMapEntry> parseV5Compressed(const ChdHeader& header, const uint8_t* map, size_t size);
    static void validateEntries(const ChdHeader& header, const std::vector<HunkMapEntry>& entries);

    std::vector<HunkMapEntry> m_entries;
};

} // namespace Chd
} // namespace ChdRead

#endif // CHDREAD_CHD_HUNKMAP_H
