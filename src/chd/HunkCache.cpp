/*
 * HunkCache.cpp - LRU cache of decoded hunks
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

HunkCache::HunkCache(const ChdHeader& header, const HunkMap& map, Codec::CodecDispatcher& dispatcher,
                     IO::ByteSource& source, const ReaderOptions& options)
    : m_header(header)
    , m_map(map)
    , m_dispatcher(dispatcher)
    , m_source(source)
    , m_parent(options.parent)
    , m_verify(options.verify_digests)
    , m_budget(options.cache_budget_bytes)
{
}

uint32_t HunkCache::logicalHunkBytes(uint32_t index) const
{
    uint64_t start = static_cast<uint64_t>(index) * m_header.hunk_bytes;
    if (start >= m_header.logical_bytes) {
        return 0;
    }
    return static_cast<uint32_t>(std::min<uint64_t>(m_header.hunk_bytes, m_header.logical_bytes - start));
}

HunkCache::HunkData HunkCache::get(uint32_t index)
{
    std::vector<uint32_t> chain;
    return lookup(index, chain);
}

void HunkCache::verifyHunk(uint32_t index)
{
    if (index >= m_map.size()) {
        std::ostringstream oss;
        oss << "hunk " << index << " out of range (" << m_map.size() << " hunks)";
        throw ChdException(ChdError::OUT_OF_RANGE, oss.str(), index);
    }
    std::vector<uint32_t> chain;
    load(index, true, chain);
}

void HunkCache::clear()
{
    m_slots.clear();
    m_lru.clear();
    m_stats.resident_bytes = 0;
}

CacheStats HunkCache::stats() const
{
    CacheStats stats = m_stats;
    stats.resident_hunks = m_slots.size();
    return stats;
}

HunkCache::HunkData HunkCache::lookup(uint32_t index, std::vector<uint32_t>& chain)
{
    if (index >= m_map.size()) {
        std::ostringstream oss;
        oss << "hunk " << index << " out of range (" << m_map.size() << " hunks)";
        throw ChdException(ChdError::OUT_OF_RANGE, oss.str(), index);
    }

    auto it = m_slots.find(index);
    if (it != m_slots.end()) {
        m_stats.hits++;
        m_lru.splice(m_lru.begin(), m_lru, it->second.lru_pos);
        return it->second.data;
    }

    m_stats.misses++;
    Debug::log("chd_cache", "HunkCache: miss on hunk ", index);
    HunkData data = load(index, m_verify, chain);
    insert(index, data);
    return data;
}

HunkCache::HunkData HunkCache::load(uint32_t index, bool verify, std::vector<uint32_t>& chain)
{
    const HunkMapEntry& entry = m_map[index];

    if (entry.codec_slot == Codec::SLOT_SELF) {
        if (std::find(chain.begin(), chain.end(), index) != chain.end()) {
            std::ostringstream oss;
            oss << "self reference cycle through hunk " << index;
            throw ChdException(ChdError::MALFORMED_MAP, oss.str(), index, entry.codec_slot);
        }
        chain.push_back(index);
        HunkData target = lookup(static_cast<uint32_t>(entry.source_offset), chain);
        chain.pop_back();

        uint32_t wanted = logicalHunkBytes(index);
        if (target->size() == wanted) {
            return target;
        }
        // Target is the short final hunk; the rest reads as zeros
        auto copy = std::make_shared<std::vector<uint8_t>>(wanted, 0);
        std::memcpy(copy->data(), target->data(), std::min<size_t>(wanted, target->size()));
        return copy;
    }

    std::vector<uint8_t> hunk = loadFullHunk(index, entry);
    if (verify) {
        checkDigest(index, entry, hunk);
    }
    hunk.resize(logicalHunkBytes(index));
    return std::make_shared<const std::vector<uint8_t>>(std::move(hunk));
}

std::vector<uint8_t> HunkCache::loadFullHunk(uint32_t index, const HunkMapEntry& entry)
{
    const uint32_t hunk_bytes = m_header.hunk_bytes;

    switch (entry.codec_slot) {
        case 0:
        case 1:
        case 2:
        case 3:
        case Codec::SLOT_NONE: {
            std::vector<uint8_t> payload;
            try {
                payload = m_source.readAt(entry.source_offset, entry.compressed_length);
            } catch (const ChdException& e) {
                throw e.withContext(index, entry.codec_slot);
            }
            m_stats.decodes++;
            return m_dispatcher.decode(entry.codec_slot, payload.data(), payload.size(), hunk_bytes, index);
        }

        case Codec::SLOT_MINI: {
            std::vector<uint8_t> hunk(hunk_bytes);
            for (uint32_t i = 0; i < hunk_bytes; i++) {
                hunk[i] = static_cast<uint8_t>(entry.source_offset >> (56 - 8 * (i % 8)));
            }
            return hunk;
        }

        case Codec::SLOT_PARENT:
            return readParent(index, entry);

        default: {
            std::ostringstream oss;
            oss << "hunk " << index << " has unknown entry kind " << static_cast<int>(entry.codec_slot);
            throw ChdException(ChdError::MALFORMED_MAP, oss.str(), index, entry.codec_slot);
        }
    }
}

std::vector<uint8_t> HunkCache::readParent(uint32_t index, const HunkMapEntry& entry)
{
    if (m_parent == nullptr) {
        std::ostringstream oss;
        oss << "hunk " << index << " is stored in a parent container that was not supplied";
        throw ChdException(ChdError::REQUIRES_PARENT, oss.str(), index, entry.codec_slot);
    }

    // v5 addresses the parent in units, older versions in hunks
    uint64_t scale = m_header.version >= 5 ? m_parent->unitSize() : m_parent->hunkSize();
    uint64_t offset = entry.source_offset * scale;

    std::vector<uint8_t> hunk(m_header.hunk_bytes, 0);
    uint64_t parent_size = m_parent->logicalSize();
    if (offset < parent_size) {
        size_t length = static_cast<size_t>(std::min<uint64_t>(hunk.size(), parent_size - offset));
        try {
            m_parent->read(offset, hunk.data(), length);
        } catch (const ChdException& e) {
            throw e.withContext(index, entry.codec_slot);
        }
    }
    return hunk;
}

void HunkCache::checkDigest(uint32_t index, const HunkMapEntry& entry, const std::vector<uint8_t>& hunk) const
{
    if (entry.digest_kind == Core::DigestKind::NONE) {
        return;
    }
    uint32_t computed = Core::Checksum::compute(entry.digest_kind, hunk.data(), hunk.size());
    if (computed != entry.digest) {
        std::ostringstream oss;
        oss << "hunk " << index << " " << Core::digestKindName(entry.digest_kind) << " mismatch: stored 0x"
            << std::hex << entry.digest << ", computed 0x" << computed;
        Debug::log("chd_cache", "HunkCache: ", oss.str());
        throw ChdException(ChdError::INTEGRITY_ERROR, oss.str(), index, entry.codec_slot);
    }
}

void HunkCache::insert(uint32_t index, const HunkData& data)
{
    const size_t size = data->size();
    if (size > m_budget) {
        Debug::log("chd_cache", "HunkCache: hunk ", index, " (", size, " bytes) exceeds budget of ",
                   m_budget, ", not retained");
        return;
    }

    evictUntilFits(size);

    m_lru.push_front(index);
    Slot slot;
    slot.data = data;
    slot.lru_pos = m_lru.begin();
    m_slots[index] = slot;
    m_stats.resident_bytes += size;
}

void HunkCache::evictUntilFits(size_t incoming)
{
    while (!m_lru.empty() && m_stats.resident_bytes + incoming > m_budget) {
        uint32_t victim = m_lru.back();
        m_lru.pop_back();
        auto it = m_slots.find(victim);
        if (it != m_slots.end()) {
            m_stats.resident_bytes -= it->second.data->size();
            m_slots.erase(it);
        }
        m_stats.evictions++;
        Debug::log("chd_cache", "HunkCache: evicted hunk ", victim);
    }
}

} // namespace Chd
} // namespace ChdRead
