/*
 * ChdCodecs.cpp - Hunk codecs layered on the generic decompressors
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

void interleaveCdFrames(const uint8_t* sectors, const uint8_t* subcode, uint32_t frames, uint8_t* dest)
{
    for (uint32_t frame = 0; frame < frames; frame++) {
        uint8_t* out = dest + static_cast<size_t>(frame) * Cdrom::FRAME_SIZE;
        std::memcpy(out, sectors + static_cast<size_t>(frame) * Cdrom::MAX_SECTOR_DATA, Cdrom::MAX_SECTOR_DATA);
        std::memcpy(out + Cdrom::MAX_SECTOR_DATA,
                    subcode + static_cast<size_t>(frame) * Cdrom::MAX_SUBCODE_DATA, Cdrom::MAX_SUBCODE_DATA);
    }
}

// ========== HuffmanCodec ==========

HuffmanCodec::HuffmanCodec()
    : m_decoder(256, 16)
{
}

void HuffmanCodec::decompress(const uint8_t* src, size_t src_len, uint8_t* dest, size_t dest_len)
{
    BitstreamReader reader(src, src_len);
    m_decoder.importTreeHuffman(reader);
    for (size_t i = 0; i < dest_len; i++) {
        dest[i] = static_cast<uint8_t>(m_decoder.decodeOne(reader));
    }
}

// ========== FlacCodec ==========

FlacCodec::FlacCodec()
    : m_decoder(FLAC::StreamDefaults())
{
}

void FlacCodec::decompress(const uint8_t* src, size_t src_len, uint8_t* dest, size_t dest_len)
{
    if (src_len < 1) {
        throw ChdException(ChdError::DECODE_FAILURE, "empty FLAC hunk");
    }
    bool big_endian;
    if (src[0] == 'L') {
        big_endian = false;
    } else if (src[0] == 'B') {
        big_endian = true;
    } else {
        std::ostringstream oss;
        oss << "invalid FLAC endianness marker 0x" << std::hex << static_cast<int>(src[0]);
        throw ChdException(ChdError::DECODE_FAILURE, oss.str());
    }

    m_decoder.decodeInterleaved16(src + 1, src_len - 1, dest, static_cast<uint32_t>(dest_len / 4), big_endian);
}

// ========== CdCodec ==========

template<typename BaseCodec>
void CdCodec<BaseCodec>::validateHunkBytes(uint32_t hunk_bytes)
{
    if (hunk_bytes == 0 || hunk_bytes % Cdrom::FRAME_SIZE != 0) {
        std::ostringstream oss;
        oss << "hunk size " << hunk_bytes << " is not a multiple of the CD frame size";
        throw ChdException(ChdError::MALFORMED_HEADER, oss.str());
    }
}

template<typename BaseCodec>
void CdCodec<BaseCodec>::decompress(const uint8_t* src, size_t src_len, uint8_t* dest, size_t dest_len)
{
    const uint32_t frames = static_cast<uint32_t>(dest_len / Cdrom::FRAME_SIZE);
    const size_t complen_bytes = (dest_len < 65536) ? 2 : 3;
    const size_t ecc_bytes = (frames + 7) / 8;
    const size_t header_bytes = ecc_bytes + complen_bytes;

    if (src_len < header_bytes) {
        throw ChdException(ChdError::DECODE_FAILURE, "CD hunk shorter than its header");
    }

    size_t complen_base = (complen_bytes == 2) ? Core::readBE16(src + ecc_bytes) : Core::readBE24(src + ecc_bytes);
    if (header_bytes + complen_base > src_len) {
        std::ostringstream oss;
        oss << "CD base stream length " << complen_base << " exceeds hunk payload " << src_len;
        throw ChdException(ChdError::DECODE_FAILURE, oss.str());
    }

    const size_t sector_bytes = static_cast<size_t>(frames) * Cdrom::MAX_SECTOR_DATA;
    const size_t subcode_bytes = static_cast<size_t>(frames) * Cdrom::MAX_SUBCODE_DATA;
    m_buffer.resize(sector_bytes + subcode_bytes);

    m_base.decompress(src + header_bytes, complen_base, m_buffer.data(), sector_bytes);
    m_subcode.decompress(src + header_bytes + complen_base, src_len - header_bytes - complen_base,
                         m_buffer.data() + sector_bytes, subcode_bytes);

    interleaveCdFrames(m_buffer.data(), m_buffer.data() + sector_bytes, frames, dest);

    for (uint32_t frame = 0; frame < frames; frame++) {
        if (src[frame / 8] & (1 << (frame % 8))) {
            uint8_t* sector = dest + static_cast<size_t>(frame) * Cdrom::FRAME_SIZE;
            std::memcpy(sector, Cdrom::SYNC_HEADER.data(), Cdrom::SYNC_HEADER.size());
            Cdrom::Ecc::generate(sector);
        }
    }
}

template class CdCodec<ZlibDecompressor>;
template class CdCodec<LzmaDecompressor>;

// ========== CdFlacCodec ==========

CdFlacCodec::CdFlacCodec(uint32_t hunk_bytes)
    : m_buffer(hunk_bytes)
{
    if (hunk_bytes == 0 || hunk_bytes % Cdrom::FRAME_SIZE != 0) {
        std::ostringstream oss;
        oss << "hunk size " << hunk_bytes << " is not a multiple of the CD frame size";
        throw ChdException(ChdError::MALFORMED_HEADER, oss.str());
    }
}

void CdFlacCodec::decompress(const uint8_t* src, size_t src_len, uint8_t* dest, size_t dest_len)
{
    const uint32_t frames = static_cast<uint32_t>(dest_len / Cdrom::FRAME_SIZE);
    const size_t sector_bytes = static_cast<size_t>(frames) * Cdrom::MAX_SECTOR_DATA;
    const size_t subcode_bytes = static_cast<size_t>(frames) * Cdrom::MAX_SUBCODE_DATA;
    m_buffer.resize(sector_bytes + subcode_bytes);

    size_t offset = m_decoder.decodeInterleaved16(src, src_len, m_buffer.data(),
                                                  static_cast<uint32_t>(sector_bytes / 4), true);
    if (offset > src_len) {
        throw ChdException(ChdError::DECODE_FAILURE, "CD FLAC stream overran the hunk payload");
    }

    m_subcode.decompress(src + offset, src_len - offset, m_buffer.data() + sector_bytes, subcode_bytes);

    interleaveCdFrames(m_buffer.data(), m_buffer.data() + sector_bytes, frames, dest);
}

} // namespace Codec
} // namespace ChdRead
