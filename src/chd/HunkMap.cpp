/*
 * HunkMap.cpp - Per-hunk directory of a CHD container
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

using Codec::SLOT_CODEC_COUNT;
using Codec::SLOT_NONE;
using Codec::SLOT_SELF;
using Codec::SLOT_PARENT;
using Codec::SLOT_MINI;

namespace {

// v3/v4 map entry flags
constexpr uint8_t V34_TYPE_MASK = 0x0F;
constexpr uint8_t V34_TYPE_COMPRESSED = 1;
constexpr uint8_t V34_TYPE_UNCOMPRESSED = 2;
constexpr uint8_t V34_TYPE_MINI = 3;
constexpr uint8_t V34_TYPE_SELF_HUNK = 4;
constexpr uint8_t V34_TYPE_PARENT_HUNK = 5;
constexpr uint8_t V34_FLAG_NO_CRC = 0x10;

// Symbols of the v5 compressed map's type stream
enum V5MapSymbol : uint32_t {
    COMPRESSION_TYPE_0 = 0,
    COMPRESSION_TYPE_1 = 1,
    COMPRESSION_TYPE_2 = 2,
    COMPRESSION_TYPE_3 = 3,
    COMPRESSION_NONE = 4,
    COMPRESSION_SELF = 5,
    COMPRESSION_PARENT = 6,
    COMPRESSION_RLE_SMALL = 7,
    COMPRESSION_RLE_LARGE = 8,
    COMPRESSION_SELF_0 = 9,
    COMPRESSION_SELF_1 = 10,
    COMPRESSION_PARENT_SELF = 11,
    COMPRESSION_PARENT_0 = 12,
    COMPRESSION_PARENT_1 = 13
};

constexpr uint32_t V5_RAW_ENTRY_SIZE = 12;

} // anonymous namespace

std::pair<ChdHeader, HunkMap> HunkMap::parse(const std::vector<uint8_t>& header_bytes,
                                             const std::vector<uint8_t>& map_bytes)
{
    ChdHeader header = ChdHeader::parse(header_bytes.data(), header_bytes.size());
    HunkMap map = parse(header, map_bytes.data(), map_bytes.size());
    return std::make_pair(header, std::move(map));
}

HunkMap HunkMap::parse(const ChdHeader& header, const uint8_t* map_bytes, size_t map_size)
{
    std::vector<HunkMapEntry> entries;
    if (header.version < 5) {
        entries = parseV34(header, map_bytes, map_size);
    } else if (!header.isCompressed()) {
        entries = parseV5Uncompressed(header, map_bytes, map_size);
    } else {
        entries = parseV5Compressed(header, map_bytes, map_size);
    }
    validateEntries(header, entries);
    Debug::log("chd_map", "HunkMap: parsed ", entries.size(), " entries from ", map_size, " map bytes");
    return HunkMap(std::move(entries));
}

uint64_t HunkMap::regionSize(const ChdHeader& header, const uint8_t* prefix, size_t prefix_size)
{
    if (header.version < 5 || !header.isCompressed()) {
        return static_cast<uint64_t>(header.hunk_count) * header.mapEntryBytes();
    }
    if (prefix == nullptr || prefix_size < V5_COMPRESSED_MAP_HEADER_SIZE) {
        throw ChdException(ChdError::MALFORMED_MAP, "compressed map header is truncated");
    }
    return V5_COMPRESSED_MAP_HEADER_SIZE + static_cast<uint64_t>(Core::readBE32(prefix));
}

static void requireMapBytes(size_t have, uint64_t need, const char* what)
{
    if (have < need) {
        std::ostringstream oss;
        oss << what << " needs " << need << " bytes, only " << have << " available";
        throw ChdException(ChdError::MALFORMED_MAP, oss.str());
    }
}

std::vector<HunkMapEntry> HunkMap::parseV34(const ChdHeader& header, const uint8_t* map, size_t size)
{
    requireMapBytes(size, static_cast<uint64_t>(header.hunk_count) * 16, "v3/v4 map");

    std::vector<HunkMapEntry> entries(header.hunk_count);
    for (uint32_t hunk = 0; hunk < header.hunk_count; hunk++) {
        const uint8_t* raw = map + static_cast<size_t>(hunk) * 16;
        HunkMapEntry& entry = entries[hunk];

        uint64_t offset = Core::readBE64(raw);
        uint32_t crc = Core::readBE32(raw + 8);
        uint32_t length = Core::readBE16(raw + 12) | (static_cast<uint32_t>(raw[14]) << 16);
        uint8_t flags = raw[15];
        bool has_crc = (flags & V34_FLAG_NO_CRC) == 0;

        switch (flags & V34_TYPE_MASK) {
            case V34_TYPE_COMPRESSED:
                entry.codec_slot = 0;
                entry.compressed_length = length;
                entry.source_offset = offset;
                break;
            case V34_TYPE_UNCOMPRESSED:
                entry.codec_slot = SLOT_NONE;
                entry.compressed_length = header.hunk_bytes;
                entry.source_offset = offset;
                break;
            case V34_TYPE_MINI:
                entry.codec_slot = SLOT_MINI;
                entry.source_offset = offset;
                break;
            case V34_TYPE_SELF_HUNK:
                entry.codec_slot = SLOT_SELF;
                entry.source_offset = offset;
                has_crc = false;
                break;
            case V34_TYPE_PARENT_HUNK:
                entry.codec_slot = SLOT_PARENT;
                entry.source_offset = offset;
                has_crc = false;
                break;
            default: {
                std::ostringstream oss;
                oss << "hunk " << hunk << " has invalid map entry type " << static_cast<int>(flags & V34_TYPE_MASK);
                throw ChdException(ChdError::MALFORMED_MAP, oss.str(), hunk);
            }
        }

        if (has_crc) {
            entry.digest_kind = Core::DigestKind::CRC32;
            entry.digest = crc;
        }
    }
    return entries;
}

std::vector<HunkMapEntry> HunkMap::parseV5Uncompressed(const ChdHeader& header, const uint8_t* map, size_t size)
{
    requireMapBytes(size, static_cast<uint64_t>(header.hunk_count) * 4, "uncompressed v5 map");

    std::vector<HunkMapEntry> entries(header.hunk_count);
    for (uint32_t hunk = 0; hunk < header.hunk_count; hunk++) {
        uint32_t block = Core::readBE32(map + static_cast<size_t>(hunk) * 4);
        HunkMapEntry& entry = entries[hunk];
        if (block != 0) {
            entry.codec_slot = SLOT_NONE;
            entry.compressed_length = header.hunk_bytes;
            entry.source_offset = static_cast<uint64_t>(block) * header.hunk_bytes;
        } else if (header.hasParent()) {
            entry.codec_slot = SLOT_PARENT;
            entry.source_offset = static_cast<uint64_t>(hunk) * (header.hunk_bytes / header.unit_bytes);
        } else {
            // Never written: reads as zeros
            entry.codec_slot = SLOT_MINI;
            entry.source_offset = 0;
        }
    }
    return entries;
}

std::vector<HunkMapEntry> HunkMap::parseV5Compressed(const ChdHeader& header, const uint8_t* map, size_t size)
{
    requireMapBytes(size, V5_COMPRESSED_MAP_HEADER_SIZE, "compressed map header");

    uint32_t map_bytes = Core::readBE32(map);
    uint64_t first_offset = Core::readBE48(map + 4);
    uint16_t map_crc = Core::readBE16(map + 10);
    uint8_t length_bits = map[12];
    uint8_t self_bits = map[13];
    uint8_t parent_bits = map[14];

    requireMapBytes(size, V5_COMPRESSED_MAP_HEADER_SIZE + static_cast<uint64_t>(map_bytes), "compressed map");
    if (length_bits > 32 || self_bits > 32 || parent_bits > 32) {
        std::ostringstream oss;
        oss << "compressed map field widths out of range: length=" << static_cast<int>(length_bits)
            << " self=" << static_cast<int>(self_bits) << " parent=" << static_cast<int>(parent_bits);
        throw ChdException(ChdError::MALFORMED_MAP, oss.str());
    }

    Debug::log("chd_map", "HunkMap: compressed map of ", map_bytes, " bytes, first offset ", first_offset,
               ", bits length/self/parent ", static_cast<int>(length_bits), "/", static_cast<int>(self_bits),
               "/", static_cast<int>(parent_bits));

    const uint32_t hunk_count = header.hunk_count;
    std::vector<uint8_t> raw(static_cast<size_t>(hunk_count) * V5_RAW_ENTRY_SIZE, 0);
    std::vector<HunkMapEntry> entries(hunk_count);

    try {
        Codec::BitstreamReader reader(map + V5_COMPRESSED_MAP_HEADER_SIZE, map_bytes);
        Codec::HuffmanDecoder decoder(16, 8);
        decoder.importTreeRle(reader);

        // Pass 1: the run-length coded stream of entry types
        uint8_t last_type = 0;
        uint32_t repcount = 0;
        for (uint32_t hunk = 0; hunk < hunk_count; hunk++) {
            uint8_t* entry = &raw[static_cast<size_t>(hunk) * V5_RAW_ENTRY_SIZE];
            if (repcount > 0) {
                entry[0] = last_type;
                repcount--;
                continue;
            }
            uint32_t symbol = decoder.decodeOne(reader);
            if (symbol == COMPRESSION_RLE_SMALL) {
                entry[0] = last_type;
                repcount = 2 + decoder.decodeOne(reader);
            } else if (symbol == COMPRESSION_RLE_LARGE) {
                entry[0] = last_type;
                repcount = 2 + 16 + (decoder.decodeOne(reader) << 4);
                repcount += decoder.decodeOne(reader);
            } else {
                entry[0] = last_type = static_cast<uint8_t>(symbol);
            }
        }

        // Pass 2: per-entry fields
        uint64_t cur_offset = first_offset;
        uint64_t last_self = 0;
        uint64_t last_parent = 0;
        const uint64_t units_per_hunk = header.hunk_bytes / header.unit_bytes;
        for (uint32_t hunk = 0; hunk < hunk_count; hunk++) {
            uint8_t* entry = &raw[static_cast<size_t>(hunk) * V5_RAW_ENTRY_SIZE];
            uint64_t offset = cur_offset;
            uint32_t length = 0;
            uint16_t crc = 0;

            switch (entry[0]) {
                case COMPRESSION_TYPE_0:
                case COMPRESSION_TYPE_1:
                case COMPRESSION_TYPE_2:
                case COMPRESSION_TYPE_3:
                    length = reader.readBits(length_bits);
                    cur_offset += length;
                    crc = static_cast<uint16_t>(reader.readBits(16));
                    break;

                case COMPRESSION_NONE:
                    length = header.hunk_bytes;
                    cur_offset += length;
                    crc = static_cast<uint16_t>(reader.readBits(16));
                    break;

                case COMPRESSION_SELF:
                    last_self = offset = reader.readBits(self_bits);
                    break;

                case COMPRESSION_PARENT:
                    offset = reader.readBits(parent_bits);
                    last_parent = offset;
                    break;

                case COMPRESSION_SELF_1:
                    last_self++;
                    // fall through
                case COMPRESSION_SELF_0:
                    entry[0] = COMPRESSION_SELF;
                    offset = last_self;
                    break;

                case COMPRESSION_PARENT_SELF:
                    entry[0] = COMPRESSION_PARENT;
                    last_parent = offset = static_cast<uint64_t>(hunk) * units_per_hunk;
                    break;

                case COMPRESSION_PARENT_1:
                    last_parent += units_per_hunk;
                    // fall through
                case COMPRESSION_PARENT_0:
                    entry[0] = COMPRESSION_PARENT;
                    offset = last_parent;
                    break;

                default: {
                    std::ostringstream oss;
                    oss << "hunk " << hunk << " has invalid compressed map type " << static_cast<int>(entry[0]);
                    throw ChdException(ChdError::MALFORMED_MAP, oss.str(), hunk);
                }
            }

            Core::writeBE24(entry + 1, length);
            Core::writeBE48(entry + 4, offset);
            Core::writeBE16(entry + 10, crc);
        }
    } catch (const ChdException& e) {
        if (e.getError() == ChdError::MALFORMED_MAP) {
            throw;
        }
        Debug::log("chd_map", "HunkMap: compressed map decode failed: ", e.what());
        throw e.withError(ChdError::MALFORMED_MAP);
    }

    uint16_t computed = Core::Checksum::crc16(raw.data(), raw.size());
    if (computed != map_crc) {
        std::ostringstream oss;
        oss << "compressed map CRC mismatch: stored 0x" << std::hex << map_crc << ", computed 0x" << computed;
        throw ChdException(ChdError::MALFORMED_MAP, oss.str());
    }

    for (uint32_t hunk = 0; hunk < hunk_count; hunk++) {
        const uint8_t* raw_entry = &raw[static_cast<size_t>(hunk) * V5_RAW_ENTRY_SIZE];
        HunkMapEntry& entry = entries[hunk];
        entry.codec_slot = raw_entry[0];
        entry.compressed_length = Core::readBE24(raw_entry + 1);
        entry.source_offset = Core::readBE48(raw_entry + 4);
        if (entry.codec_slot < SLOT_CODEC_COUNT || entry.codec_slot == SLOT_NONE) {
            entry.digest_kind = Core::DigestKind::CRC16;
            entry.digest = Core::readBE16(raw_entry + 10);
        }
    }
    return entries;
}

void HunkMap::validateEntries(const ChdHeader& header, const std::vector<HunkMapEntry>& entries)
{
    for (uint32_t hunk = 0; hunk < entries.size(); hunk++) {
        const HunkMapEntry& entry = entries[hunk];
        if (entry.codec_slot < SLOT_CODEC_COUNT) {
            if (header.compressors[entry.codec_slot] == Codec::CODEC_NONE) {
                std::ostringstream oss;
                oss << "hunk " << hunk << " uses codec slot " << static_cast<int>(entry.codec_slot)
                    << " which the header does not declare";
                throw ChdException(ChdError::MALFORMED_MAP, oss.str(), hunk, entry.codec_slot);
            }
        } else if (entry.codec_slot == SLOT_SELF) {
            if (entry.source_offset >= entries.size() || entry.source_offset == hunk) {
                std::ostringstream oss;
                oss << "hunk " << hunk << " refers to hunk " << entry.source_offset
                    << " of " << entries.size();
                throw ChdException(ChdError::MALFORMED_MAP, oss.str(), hunk, entry.codec_slot);
            }
        } else if (entry.codec_slot == SLOT_PARENT) {
            if (!header.hasParent()) {
                std::ostringstream oss;
                oss << "hunk " << hunk << " refers to a parent but the header declares none";
                throw ChdException(ChdError::MALFORMED_MAP, oss.str(), hunk, entry.codec_slot);
            }
        } else if (entry.codec_slot != SLOT_NONE && entry.codec_slot != SLOT_MINI) {
            std::ostringstream oss;
            oss << "hunk " << hunk << " has unknown entry kind " << static_cast<int>(entry.codec_slot);
            throw ChdException(ChdError::MALFORMED_MAP, oss.str(), hunk);
        }
    }
}

void HunkMap::validatePayloads(uint64_t source_size) const
{
    for (uint32_t hunk = 0; hunk < m_entries.size(); hunk++) {
        const HunkMapEntry& entry = m_entries[hunk];
        if (entry.codec_slot > SLOT_NONE) {
            continue;
        }
        if (entry.source_offset > source_size || entry.compressed_length > source_size - entry.source_offset) {
            std::ostringstream oss;
            oss << "hunk " << hunk << " payload [" << entry.source_offset << ", +" << entry.compressed_length
                << ") lies beyond the end of the " << source_size << "-byte container";
            throw ChdException(ChdError::MALFORMED_MAP, oss.str(), hunk, entry.codec_slot);
        }
    }
}

const HunkMapEntry& HunkMap::entry(uint32_t hunk_index) const
{
    if (hunk_index >= m_entries.size()) {
        std::ostringstream oss;
        oss << "hunk " << hunk_index << " is outside the map of " << m_entries.size() << " entries";
        throw ChdException(ChdError::OUT_OF_RANGE, oss.str(), hunk_index);
    }
    return m_entries[hunk_index];
}

std::array<uint32_t, 8> HunkMap::kindCounts() const
{
    std::array<uint32_t, 8> counts{};
    for (const auto& entry : m_entries) {
        if (entry.codec_slot < counts.size()) {
            counts[entry.codec_slot]++;
        }
    }
    return counts;
}

} // namespace Chd
} // namespace ChdRead
