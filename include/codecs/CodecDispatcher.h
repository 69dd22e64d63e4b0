/*
 * CodecDispatcher.h - Per-slot codec state and hunk decoding
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

#ifndef CHDREAD_CODECS_CODECDISPATCHER_H
#define CHDREAD_CODECS_CODECDISPATCHER_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Codec {

// Map entry kinds shared by all container versions. 0-3 index the
// header's codec list.
constexpr uint8_t SLOT_CODEC_COUNT = 4;
constexpr uint8_t SLOT_NONE = 4;
constexpr uint8_t SLOT_SELF = 5;
constexpr uint8_t SLOT_PARENT = 6;
constexpr uint8_t SLOT_MINI = 7;

const char* slotName(uint8_t slot);

/**
 * @brief Live decoder for one codec slot
 *
 * std::monostate marks a slot that has not been used yet.
 */
using CodecState = std::variant<std::monostate,
                                ZlibDecompressor,
                                LzmaDecompressor,
                                HuffmanCodec,
                                FlacCodec,
                                CdZlibCodec,
                                CdLzmaCodec,
                                CdFlacCodec>;

/**
 * @brief Turns a compressed hunk payload into hunk bytes
 *
 * Owns one CodecState per codec slot of one open container. States are
 * created on first use and kept until reset(), so buffers and inflate
 * windows are reused from hunk to hunk. Not thread safe; the owning
 * reader serialises access.
 *
 * Self, parent and mini references never reach the dispatcher; the
 * hunk cache resolves them.
 */
class CodecDispatcher {
public:
    /**
     * @param codec_tags Codec identifiers from the container header
     * @param hunk_bytes Uncompressed size of one hunk
     */
    CodecDispatcher(const std::array<uint32_t, 4>& codec_tags, uint32_t hunk_bytes);
    ~CodecDispatcher() = default;

    CodecDispatcher(const CodecDispatcher&) = delete;
    CodecDispatcher& operator=(const CodecDispatcher&) = delete;

    /**
     * @brief Decode one hunk payload
     *
     * @param slot Codec slot 0-3, or SLOT_NONE for a stored hunk
     * @param compressed Payload bytes
     * @param compressed_length Payload size
     * @param out_size Bytes to produce (the hunk size)
     * @param hunk_index Reported in exceptions
     * @return Exactly out_size bytes
     * @throws ChdException UNSUPPORTED_CODEC before any decoding if the
     * slot's identifier is unknown; DECODE_FAILURE, INVALID_TABLE or
     * INVALID_PREDICTION from the codec, always with hunk and slot set
     */
    std::vector<uint8_t> decode(uint8_t slot, const uint8_t* compressed, size_t compressed_length,
                                uint32_t out_size, int64_t hunk_index = -1);

    /**
     * @brief Throw UNSUPPORTED_CODEC if any declared identifier is unknown
     */
    void validate() const;

    /**
     * @brief True if decode() can handle this identifier
     */
    static bool isSupported(uint32_t tag);

    uint32_t codecTag(uint8_t slot) const;
    CodecKind codecKind(uint8_t slot) const;

    // Number of payloads handed to a codec (stored hunks included)
    uint64_t decodeCount() const { return m_decode_count; }

    /**
     * @brief Drop all codec state; the next decode recreates it
     */
    void reset();

private:
    CodecState& stateFor(uint8_t slot);

    std::array<uint32_t, 4> m_tags;
    std::array<CodecKind, 4> m_kinds;
    std::array<CodecState, 4> m_states;
    uint32_t m_hunk_bytes;
    uint64_t m_decode_count;
};

} // namespace Codec
} // namespace ChdRead

#endif // CHDREAD_CODECS_CODECDISPATCHER_H
