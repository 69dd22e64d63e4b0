/*
 * ChdError.h - Error types and exception handling for the CHD reader
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

#ifndef CHDREAD_CORE_CHDERROR_H
#define CHDREAD_CORE_CHDERROR_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {

/**
 * @brief Error codes for CHD reader operations
 *
 * Every failure the reader reports carries one of these codes. None of
 * them are transient: compressed bytes do not change between attempts,
 * so callers should not retry a failed hunk.
 */
enum class ChdError {
    /**
     * @brief No error occurred
     */
    NONE = 0,

    /**
     * @brief Bad magic, unsupported version or truncated header
     */
    OPEN_ERROR,

    /**
     * @brief Header fields are inconsistent with each other
     */
    MALFORMED_HEADER,

    /**
     * @brief Hunk map is truncated, fails its checksum or references
     * something that does not exist
     */
    MALFORMED_MAP,

    /**
     * @brief Codec identifier is not one this reader can decode
     */
    UNSUPPORTED_CODEC,

    /**
     * @brief A codec failed to produce the expected hunk bytes
     */
    DECODE_FAILURE,

    /**
     * @brief Huffman code lengths do not form a valid prefix code
     */
    INVALID_TABLE,

    /**
     * @brief Audio predictor header is outside the supported ranges
     */
    INVALID_PREDICTION,

    /**
     * @brief Decoded hunk does not match its stored digest
     */
    INTEGRITY_ERROR,

    /**
     * @brief The backing byte source failed a read
     */
    IO_ERROR,

    /**
     * @brief Logical range lies outside the medium
     */
    OUT_OF_RANGE,

    /**
     * @brief Bitstream ran out of bits before a field was complete
     */
    OUT_OF_DATA,

    /**
     * @brief Hunk references a parent container that was not supplied
     */
    REQUIRES_PARENT,

    /**
     * @brief Requested metadata entry does not exist
     */
    METADATA_NOT_FOUND,

    /**
     * @brief API misuse, such as reading from a closed reader
     */
    INVALID_PARAMETER
};

/**
 * @brief Get a stable name for an error code
 *
 * @param error Error code
 * @return Upper-case name such as "DECODE_FAILURE"
 */
const char* getErrorName(ChdError error);

// Stream operator for ChdError (for logging and testing)
std::ostream& operator<<(std::ostream& os, ChdError error);

/**
 * @brief Exception class for CHD reader errors
 *
 * Wraps a ChdError with a descriptive message and, for per-hunk failures,
 * the hunk index and codec slot that were being decoded.
 *
 * USAGE:
 * ======
 * try {
 *     auto bytes = reader.read(offset, length);
 * } catch (const ChdException& e) {
 *     if (e.getError() == ChdError::INTEGRITY_ERROR && e.hasHunkIndex()) {
 *         // report e.hunkIndex() as corrupt
 *     }
 * }
 */
class ChdException : public std::runtime_error {
public:
    ChdException(ChdError error, const std::string& message)
        : std::runtime_error(message), m_error(error) {}

    ChdException(ChdError error, const std::string& message,
                 int64_t hunk_index, int codec_slot = -1)
        : std::runtime_error(message), m_error(error),
          m_hunk_index(hunk_index), m_codec_slot(codec_slot) {}

    ChdError getError() const noexcept { return m_error; }

    const char* getErrorName() const noexcept { return ChdRead::getErrorName(m_error); }

    bool hasHunkIndex() const noexcept { return m_hunk_index >= 0; }
    int64_t hunkIndex() const noexcept { return m_hunk_index; }

    bool hasCodecSlot() const noexcept { return m_codec_slot >= 0; }
    int codecSlot() const noexcept { return m_codec_slot; }

    /**
     * @brief Copy of this exception with hunk context attached
     *
     * Context already present is kept, so the innermost hunk wins when a
     * self reference resolves through another hunk.
     */
    ChdException withContext(int64_t hunk_index, int codec_slot) const;

    /**
     * @brief Copy of this exception with a different error code
     */
    ChdException withError(ChdError error) const;

private:
    ChdError m_error;
    int64_t m_hunk_index = -1;
    int m_codec_slot = -1;
};

} // namespace ChdRead

#endif // CHDREAD_CORE_CHDERROR_H
