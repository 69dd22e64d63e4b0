/*
 * Metadata.cpp - CHD metadata chain
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

MetadataIndex MetadataIndex::scan(IO::ByteSource& source, uint64_t first_offset)
{
    MetadataIndex index;
    std::unordered_set<uint64_t> visited;
    const uint64_t source_size = source.size();

    uint64_t offset = first_offset;
    while (offset != 0) {
        if (!visited.insert(offset).second) {
            std::ostringstream oss;
            oss << "metadata chain loops back to offset " << offset;
            throw ChdException(ChdError::MALFORMED_MAP, oss.str());
        }
        if (offset > source_size || source_size - offset < METADATA_ENTRY_HEADER_SIZE) {
            std::ostringstream oss;
            oss << "metadata entry at " << offset << " lies beyond the end of the container";
            throw ChdException(ChdError::MALFORMED_MAP, oss.str());
        }

        uint8_t raw[METADATA_ENTRY_HEADER_SIZE];
        source.readAt(offset, raw, sizeof(raw));

        MetadataEntry entry;
        entry.offset = offset;
        entry.tag = Core::readBE32(raw);
        entry.flags = raw[4];
        entry.length = Core::readBE24(raw + 5);
        entry.next = Core::readBE64(raw + 8);

        if (entry.length > source_size - entry.dataOffset()) {
            std::ostringstream oss;
            oss << "metadata entry " << Core::tagToString(entry.tag) << " at " << offset
                << " has " << entry.length << " bytes past the end of the container";
            throw ChdException(ChdError::MALFORMED_MAP, oss.str());
        }

        Debug::log("chd", "MetadataIndex: ", Core::tagToString(entry.tag), " flags=",
                   static_cast<int>(entry.flags), " length=", entry.length, " at ", offset);

        index.m_entries.push_back(entry);
        offset = entry.next;
    }
    return index;
}

const MetadataEntry* MetadataIndex::find(uint32_t tag, uint32_t index) const
{
    for (const auto& entry : m_entries) {
        if (tag == METADATA_ANY_TAG || entry.tag == tag) {
            if (index == 0) {
                return &entry;
            }
            index--;
        }
    }
    return nullptr;
}

std::vector<uint8_t> MetadataIndex::readData(IO::ByteSource& source, const MetadataEntry& entry)
{
    return source.readAt(entry.dataOffset(), entry.length);
}

bool MetadataIndex::isCdTrackTag(uint32_t tag)
{
    return tag == METADATA_CDROM_OLD || tag == METADATA_CDROM_TRACK || tag == METADATA_CDROM_TRACK2 ||
           tag == METADATA_GDROM_OLD || tag == METADATA_GDROM_TRACK;
}

uint32_t MetadataIndex::guessUnitBytes(IO::ByteSource& source, uint32_t hunk_bytes) const
{
    if (const MetadataEntry* geometry = find(METADATA_HARD_DISK)) {
        // "CYLS:%d,HEADS:%d,SECS:%d,BPS:%d"
        std::string text = metadataText(readData(source, *geometry));
        size_t pos = text.find("BPS:");
        if (pos != std::string::npos) {
            unsigned long bps = std::strtoul(text.c_str() + pos + 4, nullptr, 10);
            if (bps > 0 && bps <= hunk_bytes) {
                return static_cast<uint32_t>(bps);
            }
        }
        Debug::log("chd", "MetadataIndex: unreadable hard disk geometry \"", text, "\"");
    }

    for (const auto& entry : m_entries) {
        if (isCdTrackTag(entry.tag)) {
            return Codec::Cdrom::FRAME_SIZE;
        }
    }

    return hunk_bytes;
}

std::string metadataText(const std::vector<uint8_t>& data)
{
    std::string text(data.begin(), data.end());
    while (!text.empty() && text.back() == '\0') {
        text.pop_back();
    }
    return text;
}

} // namespace Chd
} // namespace ChdRead
