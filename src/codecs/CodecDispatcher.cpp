/*
 * CodecDispatcher.cpp - Per-slot codec state and hunk decoding
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

const char* slotName(uint8_t slot)
{
    switch (slot) {
        case 0:           return "codec0";
        case 1:           return "codec1";
        case 2:           return "codec2";
        case 3:           return "codec3";
        case SLOT_NONE:   return "uncompressed";
        case SLOT_SELF:   return "self";
        case SLOT_PARENT: return "parent";
        case SLOT_MINI:   return "mini";
        default:          return "invalid";
    }
}

CodecDispatcher::CodecDispatcher(const std::array<uint32_t, 4>& codec_tags, uint32_t hunk_bytes)
    : m_tags(codec_tags)
    , m_hunk_bytes(hunk_bytes)
    , m_decode_count(0)
{
    for (size_t i = 0; i < m_tags.size(); i++) {
        m_kinds[i] = codecKindForTag(m_tags[i]);
    }
}

bool CodecDispatcher::isSupported(uint32_t tag)
{
    return codecKindForTag(tag) != CodecKind::UNSUPPORTED;
}

void CodecDispatcher::validate() const
{
    for (size_t i = 0; i < m_tags.size(); i++) {
        if (m_tags[i] != CODEC_NONE && m_kinds[i] == CodecKind::UNSUPPORTED) {
            throw ChdException(ChdError::UNSUPPORTED_CODEC,
                               "codec " + Core::tagToString(m_tags[i]) + " is not supported",
                               -1, static_cast<int>(i));
        }
        bool cd_codec = m_kinds[i] == CodecKind::CD_ZLIB || m_kinds[i] == CodecKind::CD_LZMA ||
                        m_kinds[i] == CodecKind::CD_FLAC;
        if (cd_codec && m_hunk_bytes % Cdrom::FRAME_SIZE != 0) {
            std::ostringstream oss;
            oss << "codec " << Core::tagToString(m_tags[i]) << " needs whole CD frames, hunk size is "
                << m_hunk_bytes;
            throw ChdException(ChdError::MALFORMED_HEADER, oss.str(), -1, static_cast<int>(i));
        }
    }
}

uint32_t CodecDispatcher::codecTag(uint8_t slot) const
{
    return slot < SLOT_CODEC_COUNT ? m_tags[slot] : CODEC_NONE;
}

CodecKind CodecDispatcher::codecKind(uint8_t slot) const
{
    return slot < SLOT_CODEC_COUNT ? m_kinds[slot] : CodecKind::UNSUPPORTED;
}

void CodecDispatcher::reset()
{
    for (auto& state : m_states) {
        state.emplace<std::monostate>();
    }
}

CodecState& CodecDispatcher::stateFor(uint8_t slot)
{
    CodecState& state = m_states[slot];
    // A constructor that threw leaves the variant valueless; rebuild it
    if (!std::holds_alternative<std::monostate>(state) && !state.valueless_by_exception()) {
        return state;
    }

    Debug::log("chd_codec", "CodecDispatcher: creating ", codecKindName(m_kinds[slot]),
               " state for slot ", static_cast<int>(slot));

    switch (m_kinds[slot]) {
        case CodecKind::ZLIB:
            state.emplace<ZlibDecompressor>();
            break;
        case CodecKind::LZMA:
            state.emplace<LzmaDecompressor>(m_hunk_bytes);
            break;
        case CodecKind::HUFFMAN:
            state.emplace<HuffmanCodec>();
            break;
        case CodecKind::FLAC:
            state.emplace<FlacCodec>();
            break;
        case CodecKind::CD_ZLIB:
            state.emplace<CdZlibCodec>(m_hunk_bytes);
            break;
        case CodecKind::CD_LZMA:
            // The base stream only holds sector data
            state.emplace<CdLzmaCodec>(m_hunk_bytes, (m_hunk_bytes / Cdrom::FRAME_SIZE) * Cdrom::MAX_SECTOR_DATA);
            break;
        case CodecKind::CD_FLAC:
            state.emplace<CdFlacCodec>(m_hunk_bytes);
            break;
        case CodecKind::UNSUPPORTED:
            break;
    }
    return state;
}

std::vector<uint8_t> CodecDispatcher::decode(uint8_t slot, const uint8_t* compressed, size_t compressed_length,
                                             uint32_t out_size, int64_t hunk_index)
{
    if (slot == SLOT_NONE) {
        if (compressed_length < out_size) {
            std::ostringstream oss;
            oss << "stored hunk has " << compressed_length << " bytes, expected " << out_size;
            throw ChdException(ChdError::DECODE_FAILURE, oss.str(), hunk_index, slot);
        }
        m_decode_count++;
        return std::vector<uint8_t>(compressed, compressed + out_size);
    }

    if (slot >= SLOT_CODEC_COUNT) {
        std::ostringstream oss;
        oss << "map entry kind " << slotName(slot) << " cannot be decoded directly";
        throw ChdException(ChdError::INVALID_PARAMETER, oss.str(), hunk_index, slot);
    }

    if (m_kinds[slot] == CodecKind::UNSUPPORTED) {
        std::string message = m_tags[slot] == CODEC_NONE
            ? std::string("no codec declared in slot ") + std::to_string(slot)
            : "codec " + Core::tagToString(m_tags[slot]) + " is not supported";
        throw ChdException(ChdError::UNSUPPORTED_CODEC, message, hunk_index, slot);
    }

    std::vector<uint8_t> output(out_size);
    try {
        CodecState& state = stateFor(slot);
        m_decode_count++;
        std::visit([&](auto& codec) {
            using T = std::decay_t<decltype(codec)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                throw ChdException(ChdError::UNSUPPORTED_CODEC, "codec state missing");
            } else {
                codec.decompress(compressed, compressed_length, output.data(), output.size());
            }
        }, state);
    } catch (const ChdException& e) {
        Debug::log("chd_codec", "CodecDispatcher: hunk ", hunk_index, " slot ", static_cast<int>(slot),
                   " (", Core::tagToString(m_tags[slot]), ") failed: ", e.what());
        // A stream that ends early is corrupt, not short
        if (e.getError() == ChdError::OUT_OF_DATA) {
            throw e.withError(ChdError::DECODE_FAILURE).withContext(hunk_index, slot);
        }
        throw e.withContext(hunk_index, slot);
    }

    return output;
}

} // namespace Codec
} // namespace ChdRead
