/*
 * test_hunk_cache.cpp - Unit tests for hunk caching and reference resolution
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

using namespace ChdRead;
using namespace ChdRead::Chd;
using namespace TestFramework;

namespace {

const uint32_t HUNK = 4096;

// v5 zlib container whose hunks are all distinct codec payloads
ChdTest::ChdImageBuilder zlibBuilder(uint32_t hunks, uint64_t logical = 0)
{
    ChdTest::ChdImageBuilder builder(5, HUNK, logical ? logical : static_cast<uint64_t>(hunks) * HUNK);
    builder.setCodecs({Codec::CODEC_ZLIB, 0, 0, 0});
    for (uint32_t i = 0; i < hunks; i++) {
        std::vector<uint8_t> data = ChdTest::textBytes(HUNK, 100 + i);
        builder.addCodec(0, ChdTest::deflateRaw(data), data);
    }
    return builder;
}

ReaderOptions budgetOf(size_t bytes)
{
    ReaderOptions options;
    options.cache_budget_bytes = bytes;
    return options;
}

} // anonymous namespace

void test_lru_sequence() {
    ChdTest::ChdImageBuilder builder = zlibBuilder(4);
    auto reader = ChdReader::open(builder.build().source(), budgetOf(2 * HUNK));

    const uint32_t sequence[] = {1, 2, 1, 3, 1};
    for (uint32_t hunk : sequence) {
        reader->readHunk(hunk);
    }
    CacheStats stats = reader->cacheStats();
    ASSERT_EQUALS(3u, stats.misses, "Hunks 1, 2 and 3 missed once each");
    ASSERT_EQUALS(2u, stats.hits, "Hunk 1 hit twice");
    ASSERT_EQUALS(3u, stats.decodes, "One decode per miss");
    ASSERT_EQUALS(1u, stats.evictions, "Hunk 2 made room for hunk 3");
    ASSERT_EQUALS(2u, stats.resident_hunks, "Two hunks fit");
    ASSERT_EQUALS(static_cast<size_t>(2 * HUNK), stats.resident_bytes, "Resident bytes");
    ASSERT_EQUALS(3u, reader->codecDecodeCount(), "Dispatcher saw three payloads");

    // Hunk 3 is now least recently used
    reader->readHunk(2);
    stats = reader->cacheStats();
    ASSERT_EQUALS(4u, stats.misses, "Hunk 2 was evicted");
    reader->readHunk(1);
    ASSERT_EQUALS(3u, reader->cacheStats().hits, "Hunk 1 survived");
    reader->readHunk(3);
    ASSERT_EQUALS(5u, reader->cacheStats().misses, "Hunk 3 was evicted");
}

void test_repeated_reads_are_identical() {
    ChdTest::ChdImageBuilder builder = zlibBuilder(2);
    auto reader = ChdReader::open(builder.build().source());

    std::vector<uint8_t> first = reader->readHunk(0);
    std::vector<uint8_t> second = reader->readHunk(0);
    ASSERT_TRUE(first == second, "Same bytes from the cache");
    std::vector<uint8_t> medium = builder.expectedMedium();
    ASSERT_TRUE(std::equal(first.begin(), first.end(), medium.begin()), "Matches the source data");
    ASSERT_EQUALS(1u, reader->cacheStats().decodes, "Decoded once");
    ASSERT_EQUALS(1u, reader->cacheStats().hits, "Second read was a hit");
}

void test_digest_failure_not_cached() {
    ChdTest::ChdImageBuilder builder = zlibBuilder(3);
    builder.corruptDigest(1);
    auto reader = ChdReader::open(builder.build().source());

    ChdException e = ChdTest::expectChdError([&]() { reader->readHunk(1); },
                                             ChdError::INTEGRITY_ERROR, "CRC-16 mismatch");
    ASSERT_EQUALS(1, static_cast<int>(e.hunkIndex()), "Failing hunk reported");
    ChdTest::expectChdError([&]() { reader->readHunk(1); }, ChdError::INTEGRITY_ERROR, "Still failing");

    CacheStats stats = reader->cacheStats();
    ASSERT_EQUALS(2u, stats.decodes, "Each attempt decoded again");
    ASSERT_EQUALS(0u, stats.resident_hunks, "Nothing kept");

    ChdTest::expectChdError([&]() { reader->read(HUNK - 10, 20); },
                            ChdError::INTEGRITY_ERROR, "Reads spanning the hunk fail too");
    reader->readHunk(2);
    ASSERT_EQUALS(2u, reader->cacheStats().resident_hunks, "Hunks 0 and 2 are cached");
}

void test_digest_check_can_be_disabled() {
    ChdTest::ChdImageBuilder builder = zlibBuilder(2);
    builder.corruptDigest(0);
    ReaderOptions options;
    options.verify_digests = false;
    auto reader = ChdReader::open(builder.build().source(), options);

    std::vector<uint8_t> data = reader->readHunk(0);
    ASSERT_TRUE(data == ChdTest::textBytes(HUNK, 100), "Decoded bytes returned");
    ChdTest::expectChdError([&]() { reader->verify(); }, ChdError::INTEGRITY_ERROR,
                            "verify() always checks");
}

void test_budget_smaller_than_a_hunk() {
    ChdTest::ChdImageBuilder builder = zlibBuilder(2);
    auto reader = ChdReader::open(builder.build().source(), budgetOf(HUNK - 1));

    std::vector<uint8_t> first = reader->readHunk(0);
    std::vector<uint8_t> second = reader->readHunk(0);
    ASSERT_TRUE(first == second, "Hunk still returned");
    CacheStats stats = reader->cacheStats();
    ASSERT_EQUALS(0u, stats.resident_hunks, "Nothing retained");
    ASSERT_EQUALS(2u, stats.misses, "Both reads missed");
    ASSERT_EQUALS(2u, stats.decodes, "Both reads decoded");
    ASSERT_EQUALS(0u, stats.evictions, "Nothing to evict");
}

void test_short_final_hunk() {
    ChdTest::ChdImageBuilder builder = zlibBuilder(3, 2 * HUNK + 100);
    auto reader = ChdReader::open(builder.build().source());

    std::vector<uint8_t> last = reader->readHunk(2);
    ASSERT_EQUALS(100u, last.size(), "Final hunk trimmed to the medium");
    ASSERT_TRUE(std::equal(last.begin(), last.end(), ChdTest::textBytes(HUNK, 102).begin()), "Leading bytes");
    ASSERT_EQUALS(static_cast<size_t>(100), reader->cacheStats().resident_bytes, "Only logical bytes are kept");
}

void test_self_reference_resolves_through_cache() {
    ChdTest::ChdImageBuilder builder(5, HUNK, 4 * HUNK);
    builder.setCodecs({Codec::CODEC_ZLIB, 0, 0, 0});
    std::vector<uint8_t> data = ChdTest::textBytes(HUNK, 7);
    builder.addCodec(0, ChdTest::deflateRaw(data), data);
    builder.addStored(ChdTest::patternBytes(HUNK, 8));
    builder.addSelf(0);
    builder.addSelf(1);
    auto reader = ChdReader::open(builder.build().source());

    ASSERT_TRUE(reader->readHunk(2) == data, "Self reference returns the target");
    CacheStats stats = reader->cacheStats();
    ASSERT_EQUALS(2u, stats.misses, "Referrer and target both missed");
    ASSERT_EQUALS(1u, stats.decodes, "Only the target decoded");

    reader->readHunk(0);
    ASSERT_EQUALS(1u, reader->cacheStats().hits, "Target was cached on the way");
    ASSERT_TRUE(reader->readHunk(3) == ChdTest::patternBytes(HUNK, 8), "Stored target");
    ASSERT_EQUALS(2u, reader->codecDecodeCount(), "Stored hunk counted once");
}

void test_self_reference_to_short_hunk() {
    ChdTest::ChdImageBuilder builder(5, HUNK, 2 * HUNK + 100);
    builder.setCodecs({Codec::CODEC_ZLIB, 0, 0, 0});
    std::vector<uint8_t> data = ChdTest::textBytes(HUNK, 9);
    builder.addCodec(0, ChdTest::deflateRaw(data), data);
    builder.addStored(ChdTest::patternBytes(HUNK, 10));
    builder.addSelf(0);
    auto reader = ChdReader::open(builder.build().source());

    std::vector<uint8_t> tail = reader->readHunk(2);
    ASSERT_EQUALS(100u, tail.size(), "Referrer keeps its own logical size");
    ASSERT_TRUE(std::equal(tail.begin(), tail.end(), data.begin()), "Prefix of the target");
    ASSERT_EQUALS(static_cast<size_t>(HUNK), reader->readHunk(0).size(), "Target keeps its full size");
}

void test_self_reference_cycle() {
    ChdTest::ChdImageBuilder builder(4, HUNK, 3 * HUNK);
    builder.addSelf(1);
    builder.addSelf(0);
    builder.addStored(ChdTest::patternBytes(HUNK, 1));
    auto reader = ChdReader::open(builder.build().source());

    ChdTest::expectChdError([&]() { reader->readHunk(0); }, ChdError::MALFORMED_MAP, "Hunks 0 and 1 refer to each other");
    ASSERT_TRUE(reader->readHunk(2) == ChdTest::patternBytes(HUNK, 1), "Other hunks still read");
}

void test_mini_hunks() {
    ChdTest::ChdImageBuilder builder(4, HUNK, 2 * HUNK);
    builder.addMini(0x0102030405060708ull);
    builder.addMini(0);
    auto reader = ChdReader::open(builder.build().source());

    std::vector<uint8_t> pattern = reader->readHunk(0);
    ASSERT_EQUALS(1, static_cast<int>(pattern[0]), "Most significant byte first");
    ASSERT_EQUALS(8, static_cast<int>(pattern[7]), "Eighth byte");
    ASSERT_EQUALS(1, static_cast<int>(pattern[HUNK - 8]), "Pattern repeats to the end");
    std::vector<uint8_t> zeros = reader->readHunk(1);
    ASSERT_TRUE(std::all_of(zeros.begin(), zeros.end(), [](uint8_t b) { return b == 0; }), "Zero fill");
    ASSERT_EQUALS(0u, reader->cacheStats().decodes, "Fills are not decodes");
    reader->verify();
}

int main() {
    TestSuite suite("Hunk Cache Unit Tests");

    suite.addTest("LRU Sequence", test_lru_sequence);
    suite.addTest("Repeated Reads", test_repeated_reads_are_identical);
    suite.addTest("Digest Failure Not Cached", test_digest_failure_not_cached);
    suite.addTest("Digest Check Disabled", test_digest_check_can_be_disabled);
    suite.addTest("Budget Smaller Than A Hunk", test_budget_smaller_than_a_hunk);
    suite.addTest("Short Final Hunk", test_short_final_hunk);
    suite.addTest("Self Reference Through Cache", test_self_reference_resolves_through_cache);
    suite.addTest("Self Reference To Short Hunk", test_self_reference_to_short_hunk);
    suite.addTest("Self Reference Cycle", test_self_reference_cycle);
    suite.addTest("Mini Hunks", test_mini_hunks);

    auto results = suite.runAll();
    suite.printResults(results);
    return (suite.getFailureCount(results) == 0) ? 0 : 1;
}
