/*
 * ChdReader.h - Random access reader for CHD containers
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

#ifndef CHDREAD_CHD_CHDREADER_H
#define CHDREAD_CHD_CHDREADER_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Chd {

/**
 * @brief Open CHD container exposing its medium as a flat byte range
 *
 * The header, hunk map and metadata index are read at open and never
 * change afterwards. Codec state and the hunk cache are created per
 * reader, so several readers over the same file do not interfere.
 *
 * THREAD SAFETY:
 * ==============
 * All public methods may be called from any thread. read(), readHunk()
 * and verify() are serialised by one internal mutex because the cache
 * and codec state are mutable. Callers wanting parallel decoding should
 * open one reader per thread over the same file.
 *
 * USAGE:
 * ======
 * auto reader = ChdReader::open("disc.chd");
 * std::vector<uint8_t> sector = reader->read(lba * 2448, 2352);
 */
class ChdReader {
public:
    /**
     * @brief Open a container from a byte source
     *
     * @throws ChdException OPEN_ERROR, MALFORMED_HEADER, MALFORMED_MAP,
     * UNSUPPORTED_CODEC or IO_ERROR
     */
    static std::unique_ptr<ChdReader> open(std::shared_ptr<IO::ByteSource> source,
                                           const ReaderOptions& options = ReaderOptions());

    /**
     * @brief Open a container file
     */
    static std::unique_ptr<ChdReader> open(const std::string& path,
                                           const ReaderOptions& options = ReaderOptions());

    ~ChdReader();

    ChdReader(const ChdReader&) = delete;
    ChdReader& operator=(const ChdReader&) = delete;

    /**
     * @brief Read a byte range of the medium
     *
     * @throws ChdException OUT_OF_RANGE if the range extends past
     * logicalSize(); any hunk error with its hunk index
     */
    std::vector<uint8_t> read(uint64_t offset, size_t length);

    /**
     * @brief Read a byte range into a caller buffer
     */
    void read(uint64_t offset, uint8_t* dest, size_t length);

    /**
     * @brief Logical bytes of one hunk
     */
    std::vector<uint8_t> readHunk(uint32_t index);

    /**
     * @brief Decode every hunk and check all digests
     *
     * Hunk digests are always checked, whatever verify_digests says. When
     * the header carries a digest of the whole medium (SHA-1, or MD5 for
     * v3) that is checked too.
     *
     * @throws ChdException for the first failure
     */
    void verify();

    /**
     * @brief Release codec state, cached hunks and the byte source
     */
    void close();

    bool isOpen() const;

    uint32_t version() const { return m_header.version; }
    uint32_t hunkSize() const { return m_header.hunk_bytes; }
    uint32_t unitSize() const { return m_header.unit_bytes; }
    uint64_t logicalSize() const { return m_header.logical_bytes; }
    uint32_t hunkCount() const { return m_header.hunk_count; }
    const ChdHeader& header() const { return m_header; }
    const HunkMap& hunkMap() const { return m_map; }
    ChdReader* parent() const { return m_options.parent; }

    /**
     * @brief Payload of the index-th metadata entry with a tag
     * @param tag Four character code, METADATA_ANY_TAG for any
     * @throws ChdException METADATA_NOT_FOUND
     */
    std::vector<uint8_t> metadata(uint32_t tag, uint32_t index = 0);

    const std::vector<MetadataEntry>& metadataEntries() const { return m_metadata.entries(); }

    CacheStats cacheStats() const;

    // Payloads handed to codecs since open
    uint64_t codecDecodeCount() const;

private:
    ChdReader(std::shared_ptr<IO::ByteSource> source, const ReaderOptions& options);

    void parseContainer();
    void checkParent();
    void requireOpen_unlocked() const;
    void read_unlocked(uint64_t offset, uint8_t* dest, size_t length);
    void verifyMediumDigests_unlocked();

    std::shared_ptr<IO::ByteSource> m_source;
    ReaderOptions m_options;
    ChdHeader m_header;
    HunkMap m_map;
    MetadataIndex m_metadata;
    std::unique_ptr<Codec::CodecDispatcher> m_dispatcher;
    std::unique_ptr<HunkCache> m_cache;
    bool m_open;
    mutable std::mutex m_mutex;
};

} // namespace Chd
} // namespace ChdRead

#endif // CHDREAD_CHD_CHDREADER_H
