/*
 * HunkCache.h - LRU cache of decoded hunks
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

#ifndef CHDREAD_CHD_HUNKCACHE_H
#define CHDREAD_CHD_HUNKCACHE_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Chd {

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t decodes = 0;       // payloads handed to the codec dispatcher
    uint64_t evictions = 0;
    size_t resident_bytes = 0;
    size_t resident_hunks = 0;
};

/**
 * @brief Decoded hunks of one open container, bounded by a byte budget
 *
 * get() returns a hunk's logical bytes: hunkSize bytes, or fewer for the
 * final hunk of a medium whose size is not a multiple of the hunk size.
 * On a miss the map entry is resolved (payload decode, self or parent
 * reference, mini fill), checked against its digest, and only then
 * inserted. Least recently used hunks are evicted to stay within the
 * budget.
 *
 * Not thread safe; ChdReader serialises access.
 */
class HunkCache {
public:
    using HunkData = std::shared_ptr<const std::vector<uint8_t>>;

    HunkCache(const ChdHeader& header, const HunkMap& map, Codec::CodecDispatcher& dispatcher,
              IO::ByteSource& source, const ReaderOptions& options);
    ~HunkCache() = default;

    HunkCache(const HunkCache&) = delete;
    HunkCache& operator=(const HunkCache&) = delete;

    /**
     * @brief Fetch a hunk, decoding it on a miss
     *
     * @throws ChdException OUT_OF_RANGE for a bad index; INTEGRITY_ERROR
     * on a digest mismatch; REQUIRES_PARENT; any codec or I/O error.
     * Nothing is cached for a failed hunk.
     */
    HunkData get(uint32_t index);

    /**
     * @brief Decode a hunk with digest checking, bypassing the cache
     */
    void verifyHunk(uint32_t index);

    void clear();

    CacheStats stats() const;
    size_t budget() const { return m_budget; }

    /**
     * @brief Bytes of hunk @p index that lie inside the medium
     */
    uint32_t logicalHunkBytes(uint32_t index) const;

private:
    struct Slot {
        HunkData data;
        std::list<uint32_t>::iterator lru_pos;
    };

    HunkData lookup(uint32_t index, std::vector<uint32_t>& chain);
    HunkData load(uint32_t index, bool verify, std::vector<uint32_t>& chain);
    std::vector<uint8_t> loadFullHunk(uint32_t index, const HunkMapEntry& entry);
    std::vector<uint8_t> readParent(uint32_t index, const HunkMapEntry& entry);
    void checkDigest(uint32_t index, const HunkMapEntry& entry, const std::vector<uint8_t>& hunk) const;
    void insert(uint32_t index, const HunkData& data);
    void evictUntilFits(size_t incoming);

    const ChdHeader& m_header;
    const HunkMap& m_map;
    Codec::CodecDispatcher& m_dispatcher;
    IO::ByteSource& m_source;
    ChdReader* m_parent;
    bool m_verify;
    size_t m_budget;

    std::list<uint32_t> m_lru;      // front is most recently used
    std::unordered_map<uint32_t, Slot> m_slots;
    CacheStats m_stats;
};

} // namespace Chd
} // namespace ChdRead

#endif // CHDREAD_CHD_HUNKCACHE_H
