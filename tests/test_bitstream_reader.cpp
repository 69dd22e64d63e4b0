/*
 * test_bitstream_reader.cpp - Unit tests for BitstreamReader
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
using namespace ChdRead::Codec;
using namespace TestFramework;

// Test bit reading accuracy
void test_bit_reading_accuracy() {
    // 0b10110011 0b11001010
    uint8_t data[] = {0xB3, 0xCA};
    BitstreamReader reader(data, 2);

    uint32_t value;
    ASSERT_TRUE(reader.readBits(value, 4), "Read 4 bits");
    ASSERT_EQUALS(11u, value, "First 4 bits should be 11");

    ASSERT_TRUE(reader.readBits(value, 3), "Read 3 bits");
    ASSERT_EQUALS(1u, value, "Next 3 bits should be 1");

    ASSERT_TRUE(reader.readBits(value, 5), "Read 5 bits");
    ASSERT_EQUALS(28u, value, "Next 5 bits should be 28");

    ASSERT_TRUE(reader.readBits(value, 4), "Read 4 bits");
    ASSERT_EQUALS(10u, value, "Last 4 bits should be 10");

    ASSERT_FALSE(reader.readBits(value, 1), "Should fail when no more data");
}

void test_signed_bit_reading() {
    uint8_t data[] = {0xFF, 0x80};
    BitstreamReader reader(data, 2);

    int32_t value;
    ASSERT_TRUE(reader.readBitsSigned(value, 8), "Read signed 8 bits");
    ASSERT_EQUALS(-1, value, "Should read -1");

    ASSERT_TRUE(reader.readBitsSigned(value, 8), "Read signed 8 bits");
    ASSERT_EQUALS(-128, value, "Should read -128");
}

void test_unary_decoding() {
    // 0b00001xxx (unary 4), 0b01xxxxxx (unary 1), 0b1xxxxxxx (unary 0)
    uint8_t data[] = {0x08, 0x40, 0x80};
    BitstreamReader reader(data, 3);

    uint32_t value;
    ASSERT_TRUE(reader.readUnary(value), "Read unary value");
    ASSERT_EQUALS(4u, value, "Should read unary 4");
    reader.alignToByte();

    ASSERT_TRUE(reader.readUnary(value), "Read unary value");
    ASSERT_EQUALS(1u, value, "Should read unary 1");
    reader.alignToByte();

    ASSERT_TRUE(reader.readUnary(value), "Read unary value");
    ASSERT_EQUALS(0u, value, "Should read unary 0");
}

void test_utf8_numbers() {
    uint8_t data[] = {0x42, 0xC2, 0x80, 0xE0, 0xA0, 0x80};
    BitstreamReader reader(data, sizeof(data));

    uint64_t value;
    ASSERT_TRUE(reader.readUTF8(value), "Read 1-byte UTF-8 value");
    ASSERT_EQUALS(0x42u, value, "Should read 0x42");
    ASSERT_TRUE(reader.readUTF8(value), "Read 2-byte UTF-8 value");
    ASSERT_EQUALS(0x80u, value, "Should read 0x80");
    ASSERT_TRUE(reader.readUTF8(value), "Read 3-byte UTF-8 value");
    ASSERT_EQUALS(0x800u, value, "Should read 0x800");
}

void test_utf8_rejects_bad_continuation() {
    uint8_t data[] = {0xC2, 0x00};
    BitstreamReader reader(data, 2);
    uint64_t value;
    ASSERT_FALSE(reader.readUTF8(value), "Continuation byte without 10xxxxxx must fail");
}

// Rice code with parameter 3:
//   1|000 -> folded 0 -> 0
//   1|001 -> folded 1 -> -1
//   01|000 -> folded 8 -> 4
void test_rice_code_decoding() {
    uint8_t data[] = {0x89, 0x40};
    BitstreamReader reader(data, 2);

    int32_t value;
    ASSERT_TRUE(reader.readRiceCode(value, 3), "Read Rice code");
    ASSERT_EQUALS(0, value, "Folded 0 -> zigzag 0");
    ASSERT_TRUE(reader.readRiceCode(value, 3), "Read Rice code");
    ASSERT_EQUALS(-1, value, "Folded 1 -> zigzag -1");
    ASSERT_TRUE(reader.readRiceCode(value, 3), "Read Rice code");
    ASSERT_EQUALS(4, value, "Folded 8 -> zigzag 4");
}

void test_byte_alignment() {
    uint8_t data[] = {0xAA, 0xBB, 0xCC};
    BitstreamReader reader(data, 3);

    ASSERT_TRUE(reader.isAligned(), "Should be initially aligned");

    uint32_t value;
    ASSERT_TRUE(reader.readBits(value, 3), "Read 3 bits");
    ASSERT_FALSE(reader.isAligned(), "Should not be aligned after reading 3 bits");

    ASSERT_TRUE(reader.alignToByte(), "Align to byte");
    ASSERT_TRUE(reader.isAligned(), "Should be aligned after alignToByte");

    ASSERT_TRUE(reader.readBits(value, 8), "Read 8 bits");
    ASSERT_EQUALS(0xBBu, value, "Should read 0xBB from byte boundary");
}

void test_position_tracking() {
    uint8_t data[] = {0xAA, 0xBB, 0xCC};
    BitstreamReader reader(data, 3);

    ASSERT_EQUALS(0u, reader.getBitPosition(), "Initial bit position should be 0");

    uint32_t value;
    ASSERT_TRUE(reader.readBits(value, 12), "Read 12 bits");
    ASSERT_EQUALS(12u, reader.getBitPosition(), "Bit position should be 12");
    ASSERT_EQUALS(1u, reader.getBytePosition(), "Byte position should be 1");
    ASSERT_EQUALS(12u, reader.getAvailableBits(), "12 bits should remain");

    ASSERT_TRUE(reader.readBits(value, 4), "Read 4 bits");
    ASSERT_EQUALS(2u, reader.getBytePosition(), "Byte position should be 2");
}

void test_read_32_bits() {
    uint8_t data[] = {0x12, 0x34, 0x56, 0x78};
    BitstreamReader reader(data, 4);

    uint32_t value;
    ASSERT_TRUE(reader.readBits(value, 32), "Read 32 bits");
    ASSERT_EQUALS(0x12345678u, value, "Should read 0x12345678");
}

void test_throwing_read_reports_out_of_data() {
    uint8_t data[] = {0xAA};
    BitstreamReader reader(data, 1);

    ASSERT_EQUALS(0xAu, reader.readBits(4), "First nibble");
    ChdTest::expectChdError([&]() { reader.readBits(8); }, ChdError::OUT_OF_DATA, "Reading past the end");
}

void test_flush_and_byte_aligned_copy() {
    uint8_t data[] = {0xF0, 0x11, 0x22, 0x33};
    BitstreamReader reader(data, 4);

    ASSERT_EQUALS(0xFu, reader.readBits(4), "Leading nibble");
    ASSERT_EQUALS(1u, reader.flush(), "Partial byte counts as consumed");

    uint8_t copy[2] = {};
    ASSERT_TRUE(reader.readByteAligned(copy, 2), "Copy two whole bytes");
    ASSERT_EQUALS(0x11, static_cast<int>(copy[0]), "First copied byte");
    ASSERT_EQUALS(0x22, static_cast<int>(copy[1]), "Second copied byte");
    ASSERT_EQUALS(0x33u, reader.readBits(8), "Bit reads resume after the copy");
    ASSERT_FALSE(reader.readByteAligned(copy, 1), "Nothing left to copy");
}

void test_skip_bits() {
    uint8_t data[] = {0xAA, 0xBB, 0xCC};
    BitstreamReader reader(data, 3);

    ASSERT_TRUE(reader.skipBits(12), "Skip 12 bits");
    uint32_t value;
    ASSERT_TRUE(reader.readBits(value, 8), "Read 8 bits");
    ASSERT_EQUALS(0xBCu, value, "Should read 0xBC after skipping");
}

void test_writer_round_trip() {
    ChdTest::BitWriter writer;
    writer.write(5, 3);
    writer.writeRice(-7, 2);
    writer.writeUTF8(0x7FF);
    writer.write(0xDEADBEEF, 32);
    std::vector<uint8_t> bytes = writer.finish();

    BitstreamReader reader(bytes.data(), bytes.size());
    ASSERT_EQUALS(5u, reader.readBits(3), "3-bit field");
    int32_t rice = 0;
    ASSERT_TRUE(reader.readRiceCode(rice, 2), "Rice value");
    ASSERT_EQUALS(-7, rice, "Rice value round trips");
    uint64_t coded = 0;
    ASSERT_TRUE(reader.readUTF8(coded), "Coded number");
    ASSERT_EQUALS(0x7FFu, coded, "Coded number round trips");
    ASSERT_EQUALS(0xDEADBEEFu, reader.readBits(32), "32-bit field");
}

int main() {
    TestSuite suite("BitstreamReader Unit Tests");

    suite.addTest("Bit Reading Accuracy", test_bit_reading_accuracy);
    suite.addTest("Signed Bit Reading", test_signed_bit_reading);
    suite.addTest("Unary Decoding", test_unary_decoding);
    suite.addTest("UTF-8 Numbers", test_utf8_numbers);
    suite.addTest("UTF-8 Bad Continuation", test_utf8_rejects_bad_continuation);
    suite.addTest("Rice Code Decoding", test_rice_code_decoding);
    suite.addTest("Byte Alignment", test_byte_alignment);
    suite.addTest("Position Tracking", test_position_tracking);
    suite.addTest("Read 32 Bits", test_read_32_bits);
    suite.addTest("Out Of Data", test_throwing_read_reports_out_of_data);
    suite.addTest("Flush And Byte Copy", test_flush_and_byte_aligned_copy);
    suite.addTest("Skip Bits", test_skip_bits);
    suite.addTest("Writer Round Trip", test_writer_round_trip);

    auto results = suite.runAll();
    suite.printResults(results);
    return (suite.getFailureCount(results) == 0) ? 0 : 1;
}
