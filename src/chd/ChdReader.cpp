/*
 * ChdReader.cpp - Random access reader for CHD containers
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

ChdReader::ChdReader(std::shared_ptr<IO::ByteSource> source, const ReaderOptions& options)
    : m_source(std::move(source))
    , m_options(options)
    , m_open(false)
{
}

ChdReader::~ChdReader()
{
    close();
}

std::unique_ptr<ChdReader> ChdReader::open(std::shared_ptr<IO::ByteSource> source, const ReaderOptions& options)
{
    if (!source || !source->isOpen()) {
        throw ChdException(ChdError::INVALID_PARAMETER, "no open byte source to read from");
    }
    std::unique_ptr<ChdReader> reader(new ChdReader(std::move(source), options));
    reader->parseContainer();
    return reader;
}

std::unique_ptr<ChdReader> ChdReader::open(const std::string& path, const ReaderOptions& options)
{
    auto source = std::make_shared<IO::FileByteSource>(path);
    return open(source, options);
}

void ChdReader::parseContainer()
{
    const uint64_t source_size = m_source->size();

    // Header
    std::vector<uint8_t> raw_header(static_cast<size_t>(std::min<uint64_t>(source_size, MAX_HEADER_SIZE)));
    if (!raw_header.empty()) {
        m_source->readAt(0, raw_header.data(), raw_header.size());
    }
    m_header = ChdHeader::parse(raw_header.data(), raw_header.size());

    // Metadata, which v3/v4 containers need to know their unit size
    m_metadata = MetadataIndex::scan(*m_source, m_header.meta_offset);
    if (m_header.version < 5) {
        uint32_t unit_bytes = m_metadata.guessUnitBytes(*m_source, m_header.hunk_bytes);
        if (m_header.hunk_bytes % unit_bytes == 0) {
            m_header.setUnitBytes(unit_bytes);
        } else {
            Debug::log("chd", "ChdReader: unit size ", unit_bytes, " does not divide hunk size ",
                       m_header.hunk_bytes, ", using the hunk size");
        }
    }

    // Codecs are fixed for the life of the container, so reject them now
    m_dispatcher = std::make_unique<Codec::CodecDispatcher>(m_header.compressors, m_header.hunk_bytes);
    m_dispatcher->validate();

    // Hunk map
    if (m_header.map_offset > source_size) {
        std::ostringstream oss;
        oss << "map offset " << m_header.map_offset << " lies beyond the end of the container";
        throw ChdException(ChdError::MALFORMED_MAP, oss.str());
    }
    uint8_t prefix[HunkMap::V5_COMPRESSED_MAP_HEADER_SIZE] = {};
    size_t prefix_size = static_cast<size_t>(std::min<uint64_t>(sizeof(prefix), source_size - m_header.map_offset));
    if (prefix_size > 0) {
        m_source->readAt(m_header.map_offset, prefix, prefix_size);
    }
    uint64_t region = HunkMap::regionSize(m_header, prefix, prefix_size);
    if (region > source_size - m_header.map_offset) {
        std::ostringstream oss;
        oss << "map needs " << region << " bytes at offset " << m_header.map_offset
            << " but the container holds " << source_size;
        throw ChdException(ChdError::MALFORMED_MAP, oss.str());
    }
    std::vector<uint8_t> map_bytes(static_cast<size_t>(region));
    if (!map_bytes.empty()) {
        m_source->readAt(m_header.map_offset, map_bytes.data(), map_bytes.size());
    }
    m_map = HunkMap::parse(m_header, map_bytes.data(), map_bytes.size());
    m_map.validatePayloads(source_size);

    checkParent();

    m_cache = std::make_unique<HunkCache>(m_header, m_map, *m_dispatcher, *m_source, m_options);
    m_open = true;

    Debug::log("chd", "ChdReader: opened ", m_source->describe(), ": v", m_header.version,
               ", ", m_header.hunk_count, " hunks of ", m_header.hunk_bytes, " bytes, logical size ",
               m_header.logical_bytes, ", ", m_metadata.entries().size(), " metadata entries");
}

void ChdReader::checkParent()
{
    ChdReader* parent = m_options.parent;

    if (!m_header.hasParent()) {
        if (parent) {
            Debug::log("chd", "ChdReader: container has no parent, ignoring the one supplied");
            m_options.parent = nullptr;
        }
        return;
    }

    if (!parent) {
        Debug::log("chd", "ChdReader: parent required but not supplied; parent hunks will fail");
        return;
    }
    if (parent == this || !parent->isOpen()) {
        throw ChdException(ChdError::INVALID_PARAMETER, "parent container is not open");
    }

    const ChdHeader& parent_header = parent->header();
    if (!isZeroDigest(m_header.parent_sha1) && !isZeroDigest(parent_header.sha1) &&
        m_header.parent_sha1 != parent_header.sha1) {
        throw ChdException(ChdError::OPEN_ERROR, "parent SHA-1 " + formatDigest(parent_header.sha1.data(), 20) +
                           " does not match expected " + formatDigest(m_header.parent_sha1.data(), 20));
    }
    if (m_header.version == 3 && !isZeroDigest(m_header.parent_md5) && !isZeroDigest(parent_header.md5) &&
        m_header.parent_md5 != parent_header.md5) {
        throw ChdException(ChdError::OPEN_ERROR, "parent MD5 " + formatDigest(parent_header.md5.data(), 16) +
                           " does not match expected " + formatDigest(m_header.parent_md5.data(), 16));
    }

    Debug::log("chd", "ChdReader: using parent ", formatDigest(parent_header.sha1.data(), 20));
}

void ChdReader::close()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_open && !m_source) {
        return;
    }
    // The cache refers to the dispatcher and source
    m_cache.reset();
    m_dispatcher.reset();
    m_source.reset();
    m_open = false;
}

bool ChdReader::isOpen() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_open;
}

void ChdReader::requireOpen_unlocked() const
{
    if (!m_open) {
        throw ChdException(ChdError::INVALID_PARAMETER, "CHD reader is closed");
    }
}

std::vector<uint8_t> ChdReader::read(uint64_t offset, size_t length)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    requireOpen_unlocked();
    if (offset > m_header.logical_bytes || length > m_header.logical_bytes - offset) {
        std::ostringstream oss;
        oss << "read of " << length << " bytes at " << offset << " exceeds logical size " << m_header.logical_bytes;
        throw ChdException(ChdError::OUT_OF_RANGE, oss.str());
    }
    std::vector<uint8_t> result(length);
    read_unlocked(offset, result.data(), length);
    return result;
}

void ChdReader::read(uint64_t offset, uint8_t* dest, size_t length)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    requireOpen_unlocked();
    read_unlocked(offset, dest, length);
}

void ChdReader::read_unlocked(uint64_t offset, uint8_t* dest, size_t length)
{
    if (offset > m_header.logical_bytes || length > m_header.logical_bytes - offset) {
        std::ostringstream oss;
        oss << "read of " << length << " bytes at " << offset << " exceeds logical size " << m_header.logical_bytes;
        throw ChdException(ChdError::OUT_OF_RANGE, oss.str());
    }

    const uint32_t hunk_bytes = m_header.hunk_bytes;
    size_t done = 0;
    while (done < length) {
        uint64_t position = offset + done;
        uint32_t hunk = static_cast<uint32_t>(position / hunk_bytes);
        size_t within = static_cast<size_t>(position % hunk_bytes);

        HunkCache::HunkData data = m_cache->get(hunk);
        if (within >= data->size()) {
            std::ostringstream oss;
            oss << "hunk " << hunk << " holds " << data->size() << " bytes, need offset " << within;
            throw ChdException(ChdError::DECODE_FAILURE, oss.str(), hunk);
        }
        size_t chunk = std::min(length - done, data->size() - within);
        std::memcpy(dest + done, data->data() + within, chunk);
        done += chunk;
    }
}

std::vector<uint8_t> ChdReader::readHunk(uint32_t index)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    requireOpen_unlocked();
    if (index >= m_header.hunk_count) {
        std::ostringstream oss;
        oss << "hunk " << index << " out of range (" << m_header.hunk_count << " hunks)";
        throw ChdException(ChdError::OUT_OF_RANGE, oss.str(), index);
    }
    HunkCache::HunkData data = m_cache->get(index);
    return *data;
}

void ChdReader::verify()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    requireOpen_unlocked();
    for (uint32_t hunk = 0; hunk < m_header.hunk_count; hunk++) {
        m_cache->verifyHunk(hunk);
    }
    verifyMediumDigests_unlocked();
    Debug::log("chd", "ChdReader: verified ", m_header.hunk_count, " hunks");
}

void ChdReader::verifyMediumDigests_unlocked()
{
    using Core::DigestValidator;

    struct MediumCheck {
        std::unique_ptr<DigestValidator> validator;
        const uint8_t* expected;
        size_t expected_size;
    };
    std::vector<MediumCheck> checks;

    auto add = [&checks](DigestValidator::Algorithm algorithm, const uint8_t* expected, size_t size) {
        MediumCheck check;
        check.validator = std::make_unique<DigestValidator>(algorithm);
        check.expected = expected;
        check.expected_size = size;
        checks.push_back(std::move(check));
    };

    // v3 digests cover the raw data; v4/v5 keep it in a separate field
    if (m_header.version == 3) {
        if (!isZeroDigest(m_header.sha1)) {
            add(DigestValidator::Algorithm::SHA1, m_header.sha1.data(), m_header.sha1.size());
        }
        if (!isZeroDigest(m_header.md5)) {
            add(DigestValidator::Algorithm::MD5, m_header.md5.data(), m_header.md5.size());
        }
    } else if (!isZeroDigest(m_header.raw_sha1)) {
        add(DigestValidator::Algorithm::SHA1, m_header.raw_sha1.data(), m_header.raw_sha1.size());
    }

    if (checks.empty()) {
        return;
    }

    for (auto& check : checks) {
        if (!check.validator->reset()) {
            throw ChdException(ChdError::INTEGRITY_ERROR, "unable to start medium digest");
        }
    }
    // Digests cover the logical medium, not the padding of the final hunk
    uint64_t remaining = m_header.logical_bytes;
    for (uint32_t hunk = 0; hunk < m_header.hunk_count && remaining > 0; hunk++) {
        HunkCache::HunkData data = m_cache->get(hunk);
        size_t length = static_cast<size_t>(std::min<uint64_t>(remaining, data->size()));
        remaining -= length;
        for (auto& check : checks) {
            if (!check.validator->update(data->data(), length)) {
                throw ChdException(ChdError::INTEGRITY_ERROR, "unable to update medium digest", hunk);
            }
        }
    }
    for (auto& check : checks) {
        std::vector<uint8_t> computed;
        if (!check.validator->finalize(computed)) {
            throw ChdException(ChdError::INTEGRITY_ERROR, "unable to finish medium digest");
        }
        if (computed.size() != check.expected_size ||
            std::memcmp(computed.data(), check.expected, check.expected_size) != 0) {
            std::ostringstream oss;
            oss << "medium " << DigestValidator::algorithmName(check.validator->algorithm()) << " mismatch: stored "
                << formatDigest(check.expected, check.expected_size) << ", computed "
                << formatDigest(computed.data(), computed.size());
            throw ChdException(ChdError::INTEGRITY_ERROR, oss.str());
        }
    }
}

std::vector<uint8_t> ChdReader::metadata(uint32_t tag, uint32_t index)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    requireOpen_unlocked();
    const MetadataEntry* entry = m_metadata.find(tag, index);
    if (!entry) {
        std::ostringstream oss;
        oss << "no metadata entry " << Core::tagToString(tag) << " #" << index;
        throw ChdException(ChdError::METADATA_NOT_FOUND, oss.str());
    }
    return MetadataIndex::readData(*m_source, *entry);
}

CacheStats ChdReader::cacheStats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache ? m_cache->stats() : CacheStats();
}

uint64_t ChdReader::codecDecodeCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dispatcher ? m_dispatcher->decodeCount() : 0;
}

} // namespace Chd
} // namespace ChdRead
