/*
 * test_chd_reader.cpp - End to end tests for ChdReader
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
#include "test_framework.h"
#include "chd_test_utils.h"

#include <filesystem>
#include <thread>
#include <unistd.h>

using namespace ChdRead;
using namespace ChdRead::Chd;
using namespace ChdRead::Codec;
using namespace TestFramework;

namespace {

const uint32_t HUNK = 4096;

ChdTest::ChdImageBuilder zlibBuilder(uint32_t hunks)
{
    ChdTest::ChdImageBuilder builder(5, HUNK, static_cast<uint64_t>(hunks) * HUNK);
    builder.setCodecs({CODEC_ZLIB, 0, 0, 0});
    for (uint32_t i = 0; i < hunks; i++) {
        std::vector<uint8_t> data = ChdTest::textBytes(HUNK, 40 + i);
        builder.addCodec(0, ChdTest::deflateRaw(data), data);
    }
    return builder;
}

std::vector<uint8_t> slice(const std::vector<uint8_t>& data, size_t offset, size_t length)
{
    std::vector<uint8_t> out(length, 0);
    if (offset < data.size()) {
        size_t n = std::min(length, data.size() - offset);
        std::copy(data.begin() + static_cast<std::ptrdiff_t>(offset),
                  data.begin() + static_cast<std::ptrdiff_t>(offset + n), out.begin());
    }
    return out;
}

std::vector<uint8_t> cdDataHunk(uint32_t frames, uint32_t first_lba)
{
    std::vector<uint8_t> hunk;
    for (uint32_t f = 0; f < frames; f++) {
        std::vector<uint8_t> sector = ChdTest::makeMode1Sector(first_lba + f, static_cast<uint8_t>(f + 3));
        hunk.insert(hunk.end(), sector.begin(), sector.end());
        hunk.insert(hunk.end(), Cdrom::MAX_SUBCODE_DATA, 0);
    }
    return hunk;
}

std::vector<uint8_t> cdAudioHunk(uint32_t frames, uint32_t seed)
{
    std::vector<uint8_t> hunk;
    for (uint32_t f = 0; f < frames; f++) {
        std::vector<uint8_t> sector = ChdTest::textBytes(Cdrom::MAX_SECTOR_DATA, seed + f);
        hunk.insert(hunk.end(), sector.begin(), sector.end());
        hunk.insert(hunk.end(), Cdrom::MAX_SUBCODE_DATA, 0);
    }
    return hunk;
}

class TempFile {
public:
    explicit TempFile(const std::vector<uint8_t>& contents)
    {
        m_path = (std::filesystem::temp_directory_path() /
                  ("chdread_reader_" + std::to_string(getpid()) + ".chd")).string();
        std::ofstream out(m_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw TestSetupFailure("unable to create " + m_path);
        }
        out.write(reinterpret_cast<const char*>(contents.data()), static_cast<std::streamsize>(contents.size()));
    }

    ~TempFile()
    {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

} // anonymous namespace

// ========== Opening ==========

void test_open_reports_geometry() {
    ChdTest::ChdImageBuilder builder = zlibBuilder(10);
    auto reader = ChdReader::open(builder.build().source());

    ASSERT_TRUE(reader->isOpen(), "Open");
    ASSERT_EQUALS(5u, reader->version(), "Version");
    ASSERT_EQUALS(HUNK, reader->hunkSize(), "Hunk size");
    ASSERT_EQUALS(HUNK, reader->unitSize(), "Unit size");
    ASSERT_EQUALS(static_cast<uint64_t>(40960), reader->logicalSize(), "Logical size");
    ASSERT_EQUALS(10u, reader->hunkCount(), "Hunk count");
    ASSERT_EQUALS(10u, reader->hunkMap().size(), "Map entries");
    ASSERT_NULL(reader->parent(), "No parent");
    ASSERT_EQUALS(0u, reader->codecDecodeCount(), "Nothing decoded at open");
}

void test_open_rejects_bad_sources() {
    ChdTest::expectChdError([]() { ChdReader::open(std::shared_ptr<IO::ByteSource>()); },
                            ChdError::INVALID_PARAMETER, "Null source");

    auto closed = zlibBuilder(1).build().source();
    closed->close();
    ChdTest::expectChdError([&]() { ChdReader::open(closed); }, ChdError::INVALID_PARAMETER, "Closed source");

    auto junk = std::make_shared<IO::MemoryByteSource>(ChdTest::patternBytes(512, 1));
    ChdTest::expectChdError([&]() { ChdReader::open(junk); }, ChdError::OPEN_ERROR, "Not a CHD");

    ChdTest::expectChdError([]() { ChdReader::open(std::string("/nonexistent/chdread/disc.chd")); },
                            ChdError::OPEN_ERROR, "Missing file");
}

void test_open_from_file() {
    ChdTest::ChdImageBuilder builder = zlibBuilder(3);
    TempFile file(builder.build().bytes);
    auto reader = ChdReader::open(file.path());
    ASSERT_TRUE(reader->read(0, 3 * HUNK) == builder.expectedMedium(), "Medium read from disk");
}

void test_open_rejects_unsupported_codec() {
    ChdTest::ChdImageBuilder builder(5, HUNK, HUNK);
    builder.setCodecs({CODEC_ZSTD, 0, 0, 0});
    builder.addStored(ChdTest::patternBytes(HUNK, 1));
    ChdTest::expectChdError([&]() { ChdReader::open(builder.build().source()); },
                            ChdError::UNSUPPORTED_CODEC, "zstd is refused at open");
}

void test_open_rejects_map_past_end() {
    ChdTest::ChdImage image = zlibBuilder(2).build();
    Core::writeBE64(&image.bytes[40], image.bytes.size() + 100);
    ChdTest::expectChdError([&]() { ChdReader::open(image.source()); },
                            ChdError::MALFORMED_MAP, "Map offset past the end");

    ChdTest::ChdImage cut = zlibBuilder(2).build();
    cut.bytes.resize(cut.bytes.size() - 3);
    ChdTest::expectChdError([&]() { ChdReader::open(cut.source()); },
                            ChdError::MALFORMED_MAP, "Map cut short");
}

// ========== Reading ==========

void test_read_ranges() {
    ChdTest::ChdImageBuilder builder = zlibBuilder(10);
    std::vector<uint8_t> medium = builder.expectedMedium();
    auto reader = ChdReader::open(builder.build().source());

    ASSERT_TRUE(reader->read(4095, 2) == slice(medium, 4095, 2), "Range across a hunk boundary");
    ASSERT_TRUE(reader->read(0, medium.size()) == medium, "Whole medium");
    ASSERT_TRUE(reader->read(3 * HUNK + 17, 3 * HUNK) == slice(medium, 3 * HUNK + 17, 3 * HUNK), "Several hunks");
    ASSERT_TRUE(reader->read(medium.size(), 0).empty(), "Empty read at the end");

    std::vector<uint8_t> buffer(100);
    reader->read(8190, buffer.data(), buffer.size());
    ASSERT_TRUE(buffer == slice(medium, 8190, 100), "Caller buffer");
}

void test_read_out_of_range() {
    ChdTest::ChdImageBuilder builder = zlibBuilder(10);
    auto reader = ChdReader::open(builder.build().source());

    ChdTest::expectChdError([&]() { reader->read(40960, 1); }, ChdError::OUT_OF_RANGE, "Past the end");
    ChdTest::expectChdError([&]() { reader->read(40000, 961); }, ChdError::OUT_OF_RANGE, "Straddles the end");
    ChdTest::expectChdError([&]() { reader->read(std::numeric_limits<uint64_t>::max(), 2); },
                            ChdError::OUT_OF_RANGE, "Offset overflow");
    std::vector<uint8_t> buffer(10);
    ChdTest::expectChdError([&]() { reader->read(40955, buffer.data(), buffer.size()); },
                            ChdError::OUT_OF_RANGE, "Caller buffer past the end");
    ChdTest::expectChdError([&]() { reader->readHunk(10); }, ChdError::OUT_OF_RANGE, "Hunk 10 of 10");
}

void test_short_final_hunk_reads() {
    ChdTest::ChdImageBuilder builder(5, HUNK, 2 * HUNK + 1000);
    builder.setCodecs({CODEC_ZLIB, 0, 0, 0});
    for (uint32_t i = 0; i < 3; i++) {
        std::vector<uint8_t> data = ChdTest::textBytes(HUNK, 60 + i);
        builder.addCodec(0, ChdTest::deflateRaw(data), data);
    }
    std::vector<uint8_t> medium = builder.expectedMedium();
    auto reader = ChdReader::open(builder.build().source());

    ASSERT_TRUE(reader->read(0, 2 * HUNK + 1000) == medium, "Whole medium");
    ASSERT_EQUALS(1000u, reader->readHunk(2).size(), "Final hunk is short");
    ChdTest::expectChdError([&]() { reader->read(2 * HUNK + 999, 2); }, ChdError::OUT_OF_RANGE, "Past the short hunk");
}

void test_self_reference_does_not_decode() {
    ChdTest::ChdImageBuilder builder(5, HUNK, 6 * HUNK);
    builder.setCodecs({CODEC_ZLIB, 0, 0, 0});
    for (uint32_t i = 0; i < 5; i++) {
        std::vector<uint8_t> data = ChdTest::textBytes(HUNK, 80 + i);
        builder.addCodec(0, ChdTest::deflateRaw(data), data);
    }
    builder.addSelf(2);
    auto reader = ChdReader::open(builder.build().source());

    std::vector<uint8_t> two = reader->readHunk(2);
    uint64_t decodes = reader->codecDecodeCount();
    ASSERT_TRUE(reader->readHunk(5) == two, "Hunk 5 mirrors hunk 2");
    ASSERT_EQUALS(decodes, reader->codecDecodeCount(), "No extra decode");
}

void test_every_codec_end_to_end() {
    ChdTest::ChdImageBuilder builder(5, HUNK, 5 * HUNK);
    builder.setCodecs({CODEC_LZMA, CODEC_ZLIB, CODEC_HUFFMAN, CODEC_FLAC});

    std::vector<uint8_t> a = ChdTest::textBytes(HUNK, 1);
    builder.addCodec(0, ChdTest::lzmaRaw(a, HUNK), a);
    std::vector<uint8_t> b = ChdTest::textBytes(HUNK, 2);
    builder.addCodec(1, ChdTest::deflateRaw(b), b);
    std::vector<uint8_t> c(HUNK);
    for (size_t i = 0; i < c.size(); i++) {
        c[i] = (i % 5 == 0) ? 'B' : 'A';
    }
    builder.addCodec(2, ChdTest::huffmanEncode(c, ChdTest::skewedByteLengths()), c);
    std::vector<uint8_t> d = ChdTest::textBytes(HUNK, 4);
    builder.addCodec(3, ChdTest::flacEncodeHunk(d, false), d);
    builder.addStored(ChdTest::patternBytes(HUNK, 5));

    std::vector<uint8_t> medium = builder.expectedMedium();
    auto reader = ChdReader::open(builder.build().source());
    ASSERT_TRUE(reader->read(0, medium.size()) == medium, "All codecs decode");
    ASSERT_EQUALS(5u, reader->codecDecodeCount(), "One decode per hunk");
    reader->verify();
}

void test_cd_codecs_end_to_end() {
    const uint32_t frames = 4;
    const uint32_t hunk = frames * Cdrom::FRAME_SIZE;
    ChdTest::ChdImageBuilder builder(5, hunk, 4ull * hunk);
    builder.setCodecs({CODEC_CD_LZMA, CODEC_CD_ZLIB, CODEC_CD_FLAC, 0}).setUnitBytes(Cdrom::FRAME_SIZE);

    std::vector<uint8_t> h0 = cdDataHunk(frames, 0);
    builder.addCodec(0, ChdTest::cdCompress(h0, ChdTest::CdBase::LZMA, std::vector<bool>(frames, true)), h0);
    std::vector<uint8_t> h1 = cdDataHunk(frames, frames);
    builder.addCodec(1, ChdTest::cdCompress(h1, ChdTest::CdBase::ZLIB, {true, false, false, true}), h1);
    std::vector<uint8_t> h2 = cdAudioHunk(frames, 9);
    builder.addCodec(2, ChdTest::cdFlacCompress(h2), h2);
    builder.addStored(cdDataHunk(frames, 3 * frames));

    std::vector<uint8_t> medium = builder.expectedMedium();
    auto reader = ChdReader::open(builder.build().source());
    ASSERT_EQUALS(Cdrom::FRAME_SIZE, reader->unitSize(), "Unit is one frame");

    // Sector 5 user data: frame 1 of hunk 1, after the 16-byte sync and header
    std::vector<uint8_t> user = reader->read(5 * Cdrom::FRAME_SIZE + 16, 2048);
    ASSERT_TRUE(user == slice(medium, 5 * Cdrom::FRAME_SIZE + 16, 2048), "Mode 1 user data");
    ASSERT_TRUE(reader->read(0, medium.size()) == medium, "Whole disc");
    reader->verify();
}

void test_mini_and_stored_v4() {
    ChdTest::ChdImageBuilder builder(4, HUNK, 3 * HUNK);
    builder.addMini(0xA5A5A5A5A5A5A5A5ull);
    std::vector<uint8_t> data = ChdTest::textBytes(HUNK, 3);
    builder.addCodec(0, ChdTest::deflateRaw(data), data);
    builder.addStored(ChdTest::patternBytes(HUNK, 4));

    std::vector<uint8_t> medium = builder.expectedMedium();
    auto reader = ChdReader::open(builder.build().source());
    ASSERT_TRUE(reader->read(0, medium.size()) == medium, "v4 medium");
    ASSERT_EQUALS(0xA5, static_cast<int>(reader->read(17, 1)[0]), "Mini fill");
    reader->verify();
}

void test_concurrent_reads() {
    ChdTest::ChdImageBuilder builder = zlibBuilder(10);
    std::vector<uint8_t> medium = builder.expectedMedium();
    ReaderOptions options;
    options.cache_budget_bytes = 3 * HUNK;
    auto reader = ChdReader::open(builder.build().source(), options);

    std::atomic<int> mismatches(0);
    std::vector<std::thread> threads;
    for (uint32_t t = 0; t < 4; t++) {
        threads.emplace_back([&, t]() {
            uint32_t state = 1234 + t;
            for (int i = 0; i < 200; i++) {
                state = state * 1103515245u + 12345u;
                size_t offset = (state >> 8) % (medium.size() - 1);
                size_t length = std::min<size_t>(1 + (state % 6000), medium.size() - offset);
                if (reader->read(offset, length) != slice(medium, offset, length)) {
                    mismatches++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    ASSERT_EQUALS(0, mismatches.load(), "Every concurrent read matched");
    ASSERT_TRUE(reader->cacheStats().resident_bytes <= 3 * HUNK, "Budget respected");
}

// ========== Parents ==========

namespace {

const Sha1Digest PARENT_SHA1 = {{0x50, 0x41, 0x52, 0x45, 0x4E, 0x54}};

ChdTest::ChdImageBuilder parentBuilder(const Sha1Digest& sha1)
{
    ChdTest::ChdImageBuilder builder(5, HUNK, 4 * HUNK);
    builder.setUnitBytes(512).setSha1(sha1);
    for (uint32_t i = 0; i < 4; i++) {
        builder.addStored(ChdTest::patternBytes(HUNK, 200 + i));
    }
    return builder;
}

ChdTest::ChdImageBuilder childBuilder(const std::vector<uint8_t>& parent_medium)
{
    ChdTest::ChdImageBuilder builder(5, HUNK, 4 * HUNK);
    builder.setCodecs({CODEC_ZLIB, 0, 0, 0}).setParentSha1(PARENT_SHA1);
    std::vector<uint8_t> own = ChdTest::textBytes(HUNK, 300);
    builder.addCodec(0, ChdTest::deflateRaw(own), own);
    // Parent offsets are in the parent's 512-byte units
    builder.addParent(8, slice(parent_medium, 8 * 512, HUNK));
    builder.addParent(4, slice(parent_medium, 4 * 512, HUNK));
    builder.addParent(28, slice(parent_medium, 28 * 512, HUNK));
    return builder;
}

} // anonymous namespace

void test_v5_parent_units() {
    ChdTest::ChdImageBuilder parent_builder = parentBuilder(PARENT_SHA1);
    auto parent = ChdReader::open(parent_builder.build().source());
    std::vector<uint8_t> parent_medium = parent_builder.expectedMedium();

    ChdTest::ChdImageBuilder builder = childBuilder(parent_medium);
    std::vector<uint8_t> medium = builder.expectedMedium();
    ReaderOptions options;
    options.parent = parent.get();
    auto reader = ChdReader::open(builder.build().source(), options);

    ASSERT_TRUE(reader->parent() == parent.get(), "Parent attached");
    ASSERT_TRUE(reader->readHunk(1) == slice(parent_medium, HUNK, HUNK), "Unit 8 is parent hunk 1");
    ASSERT_TRUE(reader->readHunk(2) == slice(parent_medium, 2048, HUNK), "Unit 4 starts mid hunk");
    std::vector<uint8_t> last = reader->readHunk(3);
    ASSERT_TRUE(std::all_of(last.begin() + 2048, last.end(), [](uint8_t b) { return b == 0; }),
                "Bytes past the parent's end are zero");
    ASSERT_TRUE(reader->read(0, medium.size()) == medium, "Whole child medium");
    reader->verify();
}

void test_v5_missing_parent() {
    ChdTest::ChdImageBuilder parent_builder = parentBuilder(PARENT_SHA1);
    ChdTest::ChdImageBuilder builder = childBuilder(parent_builder.expectedMedium());
    auto reader = ChdReader::open(builder.build().source());

    ASSERT_TRUE(reader->header().hasParent(), "Child declares a parent");
    ASSERT_TRUE(reader->readHunk(0) == ChdTest::textBytes(HUNK, 300), "Own hunks still read");
    ChdException e = ChdTest::expectChdError([&]() { reader->readHunk(1); },
                                             ChdError::REQUIRES_PARENT, "Parent hunk without a parent");
    ASSERT_EQUALS(1, static_cast<int>(e.hunkIndex()), "Hunk reported");
    ChdTest::expectChdError([&]() { reader->read(0, 2 * HUNK); }, ChdError::REQUIRES_PARENT, "Range through a parent hunk");
}

void test_parent_digest_mismatch() {
    Sha1Digest other = PARENT_SHA1;
    other[0] ^= 0xFF;
    ChdTest::ChdImageBuilder parent_builder = parentBuilder(other);
    auto parent = ChdReader::open(parent_builder.build().source());

    ReaderOptions options;
    options.parent = parent.get();
    ChdTest::ChdImageBuilder builder = childBuilder(parent_builder.expectedMedium());
    ChdTest::expectChdError([&]() { ChdReader::open(builder.build().source(), options); },
                            ChdError::OPEN_ERROR, "Wrong parent");
}

void test_closed_parent_rejected() {
    ChdTest::ChdImageBuilder parent_builder = parentBuilder(PARENT_SHA1);
    auto parent = ChdReader::open(parent_builder.build().source());
    parent->close();

    ReaderOptions options;
    options.parent = parent.get();
    ChdTest::ChdImageBuilder builder = childBuilder(parent_builder.expectedMedium());
    ChdTest::expectChdError([&]() { ChdReader::open(builder.build().source(), options); },
                            ChdError::INVALID_PARAMETER, "Closed parent");
}

void test_unneeded_parent_ignored() {
    ChdTest::ChdImageBuilder parent_builder = parentBuilder(PARENT_SHA1);
    auto parent = ChdReader::open(parent_builder.build().source());

    ReaderOptions options;
    options.parent = parent.get();
    auto reader = ChdReader::open(zlibBuilder(2).build().source(), options);
    ASSERT_NULL(reader->parent(), "Container without a parent drops it");
}

void test_v4_parent_hunks() {
    ChdTest::ChdImageBuilder parent_builder(4, HUNK, 3 * HUNK);
    parent_builder.setSha1(PARENT_SHA1);
    for (uint32_t i = 0; i < 3; i++) {
        parent_builder.addStored(ChdTest::patternBytes(HUNK, 400 + i));
    }
    auto parent = ChdReader::open(parent_builder.build().source());

    ChdTest::ChdImageBuilder builder(4, HUNK, 3 * HUNK);
    builder.setParentSha1(PARENT_SHA1);
    builder.addStored(ChdTest::patternBytes(HUNK, 500));
    builder.addParent(2, ChdTest::patternBytes(HUNK, 402));
    builder.addParent(0, ChdTest::patternBytes(HUNK, 400));
    std::vector<uint8_t> medium = builder.expectedMedium();

    ReaderOptions options;
    options.parent = parent.get();
    auto reader = ChdReader::open(builder.build().source(), options);
    ASSERT_TRUE(reader->readHunk(1) == ChdTest::patternBytes(HUNK, 402), "Parent hunk 2");
    ASSERT_TRUE(reader->read(0, medium.size()) == medium, "Whole medium");
    reader->verify();
}

// ========== Verification ==========

void test_verify_clean_container() {
    ChdTest::ChdImageBuilder builder = zlibBuilder(6);
    auto reader = ChdReader::open(builder.build().source());
    reader->verify();
    ASSERT_TRUE(reader->read(0, 6 * HUNK) == builder.expectedMedium(), "Readable after verify");
}

void test_verify_reports_hunk_corruption() {
    ChdTest::ChdImageBuilder builder = zlibBuilder(6);
    builder.corruptDigest(4);
    auto reader = ChdReader::open(builder.build().source());
    ChdException e = ChdTest::expectChdError([&]() { reader->verify(); },
                                             ChdError::INTEGRITY_ERROR, "Hunk 4 digest");
    ASSERT_EQUALS(4, static_cast<int>(e.hunkIndex()), "Hunk reported");
}

void test_verify_reports_medium_corruption() {
    ChdTest::ChdImage image = zlibBuilder(3).build();
    image.bytes[64] ^= 0x01;
    auto reader = ChdReader::open(image.source());
    reader->readHunk(0);
    ChdTest::expectChdError([&]() { reader->verify(); }, ChdError::INTEGRITY_ERROR, "Raw SHA-1 mismatch");
}

void test_verify_v3_digests() {
    ChdTest::ChdImageBuilder builder(3, HUNK, 2 * HUNK);
    std::vector<uint8_t> data = ChdTest::textBytes(HUNK, 7);
    builder.addCodec(0, ChdTest::deflateRaw(data), data);
    builder.addStored(ChdTest::patternBytes(HUNK, 8));
    ChdTest::ChdImage image = builder.build();

    ChdReader::open(image.source())->verify();

    ChdTest::ChdImage bad_md5 = image;
    bad_md5.bytes[44] ^= 0x80;
    auto reader = ChdReader::open(bad_md5.source());
    ChdException e = ChdTest::expectChdError([&]() { reader->verify(); }, ChdError::INTEGRITY_ERROR, "MD5 mismatch");
    ASSERT_TRUE(std::string(e.what()).find("MD5") != std::string::npos, "Names the digest");

    ChdTest::ChdImage bad_sha1 = image;
    bad_sha1.bytes[80] ^= 0x80;
    auto sha_reader = ChdReader::open(bad_sha1.source());
    ChdTest::expectChdError([&]() { sha_reader->verify(); }, ChdError::INTEGRITY_ERROR, "SHA-1 mismatch");
}

void test_verify_v4_raw_digest() {
    ChdTest::ChdImageBuilder builder(4, HUNK, 2 * HUNK);
    builder.addStored(ChdTest::patternBytes(HUNK, 1));
    builder.addStored(ChdTest::patternBytes(HUNK, 2));
    ChdTest::ChdImage image = builder.build();
    ChdReader::open(image.source())->verify();

    image.bytes[88 + 19] ^= 0x10;
    auto reader = ChdReader::open(image.source());
    ChdTest::expectChdError([&]() { reader->verify(); }, ChdError::INTEGRITY_ERROR, "v4 raw SHA-1 mismatch");
}

// ========== Lifetime ==========

void test_closed_reader() {
    ChdTest::ChdImageBuilder builder = zlibBuilder(2);
    builder.addMetadata(METADATA_HARD_DISK, "CYLS:1,HEADS:1,SECS:8,BPS:512");
    auto reader = ChdReader::open(builder.build().source());
    reader->readHunk(0);

    reader->close();
    ASSERT_FALSE(reader->isOpen(), "Closed");
    reader->close();

    ChdTest::expectChdError([&]() { reader->read(0, 1); }, ChdError::INVALID_PARAMETER, "read");
    ChdTest::expectChdError([&]() { reader->readHunk(0); }, ChdError::INVALID_PARAMETER, "readHunk");
    ChdTest::expectChdError([&]() { reader->verify(); }, ChdError::INVALID_PARAMETER, "verify");
    ChdTest::expectChdError([&]() { reader->metadata(METADATA_HARD_DISK); }, ChdError::INVALID_PARAMETER, "metadata");
    ASSERT_EQUALS(0u, reader->cacheStats().resident_hunks, "Cache released");
    ASSERT_EQUALS(0u, reader->codecDecodeCount(), "Codecs released");
}

int main() {
    TestSuite suite("ChdReader Tests");

    suite.addTest("Open Reports Geometry", test_open_reports_geometry);
    suite.addTest("Open Rejects Bad Sources", test_open_rejects_bad_sources);
    suite.addTest("Open From File", test_open_from_file);
    suite.addTest("Open Rejects Unsupported Codec", test_open_rejects_unsupported_codec);
    suite.addTest("Open Rejects Map Past End", test_open_rejects_map_past_end);
    suite.addTest("Read Ranges", test_read_ranges);
    suite.addTest("Read Out Of Range", test_read_out_of_range);
    suite.addTest("Short Final Hunk", test_short_final_hunk_reads);
    suite.addTest("Self Reference", test_self_reference_does_not_decode);
    suite.addTest("Every Codec", test_every_codec_end_to_end);
    suite.addTest("CD Codecs", test_cd_codecs_end_to_end);
    suite.addTest("v4 Mini And Stored", test_mini_and_stored_v4);
    suite.addTest("Concurrent Reads", test_concurrent_reads);
    suite.addTest("v5 Parent Units", test_v5_parent_units);
    suite.addTest("v5 Missing Parent", test_v5_missing_parent);
    suite.addTest("Parent Digest Mismatch", test_parent_digest_mismatch);
    suite.addTest("Closed Parent", test_closed_parent_rejected);
    suite.addTest("Unneeded Parent", test_unneeded_parent_ignored);
    suite.addTest("v4 Parent Hunks", test_v4_parent_hunks);
    suite.addTest("Verify Clean", test_verify_clean_container);
    suite.addTest("Verify Hunk Corruption", test_verify_reports_hunk_corruption);
    suite.addTest("Verify Medium Corruption", test_verify_reports_medium_corruption);
    suite.addTest("Verify v3 Digests", test_verify_v3_digests);
    suite.addTest("Verify v4 Raw Digest", test_verify_v4_raw_digest);
    suite.addTest("Closed Reader", test_closed_reader);

    auto results = suite.runAll();
    suite.printResults(results);
    return (suite.getFailureCount(results) == 0) ? 0 : 1;
}
