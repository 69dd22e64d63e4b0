/*
 * FrameParser.cpp - FLAC frame header and footer parsing
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
namespace Codec {
namespace FLAC {

namespace {

const uint32_t block_size_table[] = {
    0,     // 0000: reserved
    192,   // 0001: 192
    576,   // 0010: 576
    1152,  // 0011: 1152
    2304,  // 0100: 2304
    4608,  // 0101: 4608
    0,     // 0110: 8-bit follows
    0,     // 0111: 16-bit follows
    256,   // 1000: 256
    512,   // 1001: 512
    1024,  // 1010: 1024
    2048,  // 1011: 2048
    4096,  // 1100: 4096
    8192,  // 1101: 8192
    16384, // 1110: 16384
    32768  // 1111: 32768
};

const uint32_t sample_rate_table[] = {
    0,      // 0000: get from STREAMINFO
    88200,  // 0001: 88.2 kHz
    176400, // 0010: 176.4 kHz
    192000, // 0011: 192 kHz
    8000,   // 0100: 8 kHz
    16000,  // 0101: 16 kHz
    22050,  // 0110: 22.05 kHz
    24000,  // 0111: 24 kHz
    32000,  // 1000: 32 kHz
    44100,  // 1001: 44.1 kHz
    48000,  // 1010: 48 kHz
    96000,  // 1011: 96 kHz
    0,      // 1100: 8-bit kHz follows
    0,      // 1101: 16-bit Hz follows
    0,      // 1110: 16-bit Hz/10 follows
    0       // 1111: forbidden
};

const uint32_t bit_depth_table[] = {
    0,  // 000: get from STREAMINFO
    8,  // 001: 8 bits
    12, // 010: 12 bits
    0,  // 011: reserved
    16, // 100: 16 bits
    20, // 101: 20 bits
    24, // 110: 24 bits
    32  // 111: 32 bits
};

} // anonymous namespace

const char* channelAssignmentName(ChannelAssignment assignment)
{
    switch (assignment) {
        case ChannelAssignment::INDEPENDENT: return "independent";
        case ChannelAssignment::LEFT_SIDE:   return "left-side";
        case ChannelAssignment::RIGHT_SIDE:  return "right-side";
        case ChannelAssignment::MID_SIDE:    return "mid-side";
    }
    return "reserved";
}

FrameParser::FrameParser(BitstreamReader* reader)
    : m_reader(reader)
    , m_frame_start(0)
{
}

bool FrameParser::parseFrameHeader(FrameHeader& header, const StreamDefaults& defaults)
{
    if (!m_reader->isAligned()) {
        Debug::log("flac_codec", "Frame header does not start on a byte boundary");
        return false;
    }
    m_frame_start = static_cast<size_t>(m_reader->getBytePosition());

    uint32_t sync = 0;
    if (!m_reader->readBits(sync, 16)) {
        Debug::log("flac_codec", "Failed to read frame sync at byte ", m_frame_start);
        return false;
    }
    // 0xFFF8 (fixed blocking) or 0xFFF9 (variable blocking)
    if ((sync & 0xFFFE) != 0xFFF8) {
        Debug::log("flac_codec", "Invalid frame sync 0x", std::hex, sync, std::dec, " at byte ", m_frame_start);
        return false;
    }
    header.is_variable_block_size = (sync & 0x0001) != 0;

    uint32_t block_size_bits = 0;
    uint32_t sample_rate_bits = 0;
    uint32_t channel_bits = 0;
    uint32_t bit_depth_bits = 0;
    uint32_t reserved = 0;
    if (!m_reader->readBits(block_size_bits, 4) || !m_reader->readBits(sample_rate_bits, 4) ||
        !m_reader->readBits(channel_bits, 4) || !m_reader->readBits(bit_depth_bits, 3) ||
        !m_reader->readBits(reserved, 1)) {
        Debug::log("flac_codec", "Frame header truncated");
        return false;
    }

    if (sample_rate_bits == 0x0F) {
        Debug::log("flac_codec", "Forbidden sample rate bits 0b1111");
        return false;
    }
    if (reserved != 0) {
        Debug::log("flac_codec", "Reserved frame header bit is not 0");
        return false;
    }

    if (!m_reader->readUTF8(header.coded_number)) {
        Debug::log("flac_codec", "Failed to parse coded number");
        return false;
    }

    // Uncommon block size and sample rate follow the coded number
    if (block_size_bits == 0x6) {
        if (!parseUncommonBlockSize(header, 8)) {
            return false;
        }
    } else if (block_size_bits == 0x7) {
        if (!parseUncommonBlockSize(header, 16)) {
            return false;
        }
    } else {
        header.block_size = block_size_table[block_size_bits];
        if (header.block_size == 0) {
            Debug::log("flac_codec", "Reserved block size bits: 0x", std::hex, block_size_bits, std::dec);
            return false;
        }
    }

    if (sample_rate_bits >= 0xC) {
        if (!parseUncommonSampleRate(header, sample_rate_bits)) {
            return false;
        }
    } else {
        header.sample_rate = sample_rate_table[sample_rate_bits];
        if (header.sample_rate == 0) {
            header.sample_rate = defaults.sample_rate;
        }
    }

    if (channel_bits <= 7) {
        header.channels = channel_bits + 1;
        header.channel_assignment = ChannelAssignment::INDEPENDENT;
    } else if (channel_bits == 8) {
        header.channels = 2;
        header.channel_assignment = ChannelAssignment::LEFT_SIDE;
    } else if (channel_bits == 9) {
        header.channels = 2;
        header.channel_assignment = ChannelAssignment::RIGHT_SIDE;
    } else if (channel_bits == 10) {
        header.channels = 2;
        header.channel_assignment = ChannelAssignment::MID_SIDE;
    } else {
        Debug::log("flac_codec", "Reserved channel assignment: ", channel_bits);
        return false;
    }

    if (bit_depth_bits == 0) {
        header.bit_depth = defaults.bit_depth;
    } else {
        header.bit_depth = bit_depth_table[bit_depth_bits];
        if (header.bit_depth == 0) {
            Debug::log("flac_codec", "Reserved bit depth bits: ", bit_depth_bits);
            return false;
        }
    }

    // CRC-8 covers everything from the sync code up to here
    size_t crc_end = static_cast<size_t>(m_reader->getBytePosition());
    uint8_t computed = CRCValidator::computeCRC8(m_reader->data() + m_frame_start, crc_end - m_frame_start);

    uint32_t crc8 = 0;
    if (!m_reader->readBits(crc8, 8)) {
        Debug::log("flac_codec", "Failed to read CRC-8");
        return false;
    }
    header.crc8 = static_cast<uint8_t>(crc8);
    if (computed != header.crc8) {
        Debug::log("flac_codec", "Frame header CRC-8 mismatch: computed=0x", std::hex,
                   static_cast<int>(computed), ", stored=0x", static_cast<int>(header.crc8), std::dec);
        return false;
    }
    header.header_bytes = static_cast<size_t>(m_reader->getBytePosition()) - m_frame_start;

    Debug::log("flac_codec", "Frame ", header.coded_number, ": block_size=", header.block_size,
               ", rate=", header.sample_rate, ", channels=", header.channels, " (",
               channelAssignmentName(header.channel_assignment), "), bits=", header.bit_depth);
    return true;
}

bool FrameParser::parseUncommonBlockSize(FrameHeader& header, uint32_t bits)
{
    uint32_t size_minus_one = 0;
    if (!m_reader->readBits(size_minus_one, bits)) {
        Debug::log("flac_codec", "Failed to read uncommon block size");
        return false;
    }
    header.block_size = size_minus_one + 1;
    if (header.block_size > 65535) {
        Debug::log("flac_codec", "Forbidden block size: ", header.block_size);
        return false;
    }
    return true;
}

bool FrameParser::parseUncommonSampleRate(FrameHeader& header, uint32_t sample_rate_bits)
{
    uint32_t rate = 0;
    uint32_t bits = (sample_rate_bits == 0xC) ? 8 : 16;
    if (!m_reader->readBits(rate, bits)) {
        Debug::log("flac_codec", "Failed to read uncommon sample rate");
        return false;
    }
    if (sample_rate_bits == 0xC) {
        header.sample_rate = rate * 1000;
    } else if (sample_rate_bits == 0xD) {
        header.sample_rate = rate;
    } else {
        header.sample_rate = rate * 10;
    }
    if (header.sample_rate == 0) {
        Debug::log("flac_codec", "Uncommon sample rate is zero");
        return false;
    }
    return true;
}

bool FrameParser::parseFrameFooter()
{
    if (!m_reader->alignToByte()) {
        Debug::log("flac_codec", "Frame ended inside padding");
        return false;
    }
    size_t crc_end = static_cast<size_t>(m_reader->getBytePosition());
    uint16_t computed = CRCValidator::computeCRC16(m_reader->data() + m_frame_start, crc_end - m_frame_start);

    uint32_t stored = 0;
    if (!m_reader->readBits(stored, 16)) {
        Debug::log("flac_codec", "Failed to read frame CRC-16");
        return false;
    }
    if (computed != stored) {
        Debug::log("flac_codec", "Frame CRC-16 mismatch: computed=0x", std::hex, computed,
                   ", stored=0x", stored, std::dec);
        return false;
    }
    return true;
}

} // namespace FLAC
} // namespace Codec
} // namespace ChdRead
