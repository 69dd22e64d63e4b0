/*
 * Metadata.h - CHD metadata chain
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

#ifndef CHDREAD_CHD_METADATA_H
#define CHDREAD_CHD_METADATA_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Chd {

constexpr uint32_t METADATA_ANY_TAG = 0;
constexpr uint32_t METADATA_HARD_DISK = Core::makeTag('G', 'D', 'D', 'D');
constexpr uint32_t METADATA_HARD_DISK_IDENT = Core::makeTag('I', 'D', 'N', 'T');
constexpr uint32_t METADATA_CDROM_OLD = Core::makeTag('C', 'H', 'C', 'D');
constexpr uint32_t METADATA_CDROM_TRACK = Core::makeTag('C', 'H', 'T', 'R');
constexpr uint32_t METADATA_CDROM_TRACK2 = Core::makeTag('C', 'H', 'T', '2');
constexpr uint32_t METADATA_GDROM_OLD = Core::makeTag('C', 'H', 'G', 'T');
constexpr uint32_t METADATA_GDROM_TRACK = Core::makeTag('C', 'H', 'G', 'D');

// Entry flag: data is covered by the container SHA-1
constexpr uint8_t METADATA_FLAG_CHECKSUM = 0x01;

constexpr uint32_t METADATA_ENTRY_HEADER_SIZE = 16;

/**
 * @brief One entry of the metadata chain
 */
struct MetadataEntry {
    uint32_t tag = 0;
    uint8_t flags = 0;
    uint32_t length = 0;
    uint64_t offset = 0;    // of the 16-byte entry header
    uint64_t next = 0;

    uint64_t dataOffset() const { return offset + METADATA_ENTRY_HEADER_SIZE; }
};

/**
 * @brief Index over the metadata chain of an open container
 *
 * The chain is walked once; entry data is read on request.
 */
class MetadataIndex {
public:
    MetadataIndex() = default;

    /**
     * @brief Walk the chain starting at @p first_offset (0 = empty)
     * @throws ChdException MALFORMED_MAP on a cycle or an entry past the
     * end of the source; IO_ERROR from the source
     */
    static MetadataIndex scan(IO::ByteSource& source, uint64_t first_offset);

    const std::vector<MetadataEntry>& entries() const { return m_entries; }

    /**
     * @brief Find the index-th entry with a tag (METADATA_ANY_TAG matches all)
     * @return nullptr if there is no such entry
     */
    const MetadataEntry* find(uint32_t tag, uint32_t index = 0) const;

    /**
     * @brief Read an entry's payload
     */
    static std::vector<uint8_t> readData(IO::ByteSource& source, const MetadataEntry& entry);

    /**
     * @brief Unit size implied by v3/v4 metadata
     *
     * Hard disk geometry gives the sector size, any CD or GD-ROM track
     * tag gives the raw CD frame size, otherwise the hunk size.
     */
    uint32_t guessUnitBytes(IO::ByteSource& source, uint32_t hunk_bytes) const;

    static bool isCdTrackTag(uint32_t tag);

private:
    std::vector<MetadataEntry> m_entries;
};

/**
 * @brief Printable form of a text metadata payload, trailing NULs dropped
 */
std::string metadataText(const std::vector<uint8_t>& data);

} // namespace Chd
} // namespace ChdRead

#endif // CHDREAD_CHD_METADATA_H
