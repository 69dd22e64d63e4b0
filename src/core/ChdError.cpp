/*
 * ChdError.cpp - Error names and exception helpers
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

const char* getErrorName(ChdError error)
{
    switch (error) {
        case ChdError::NONE:               return "NONE";
        case ChdError::OPEN_ERROR:         return "OPEN_ERROR";
        case ChdError::MALFORMED_HEADER:   return "MALFORMED_HEADER";
        case ChdError::MALFORMED_MAP:      return "MALFORMED_MAP";
        case ChdError::UNSUPPORTED_CODEC:  return "UNSUPPORTED_CODEC";
        case ChdError::DECODE_FAILURE:     return "DECODE_FAILURE";
        case ChdError::INVALID_TABLE:      return "INVALID_TABLE";
        case ChdError::INVALID_PREDICTION: return "INVALID_PREDICTION";
        case ChdError::INTEGRITY_ERROR:    return "INTEGRITY_ERROR";
        case ChdError::IO_ERROR:           return "IO_ERROR";
        case ChdError::OUT_OF_RANGE:       return "OUT_OF_RANGE";
        case ChdError::OUT_OF_DATA:        return "OUT_OF_DATA";
        case ChdError::REQUIRES_PARENT:    return "REQUIRES_PARENT";
        case ChdError::METADATA_NOT_FOUND: return "METADATA_NOT_FOUND";
        case ChdError::INVALID_PARAMETER:  return "INVALID_PARAMETER";
    }
    return "UNKNOWN";
}

ChdException ChdException::withContext(int64_t hunk_index, int codec_slot) const
{
    return ChdException(m_error, what(),
                        hasHunkIndex() ? m_hunk_index : hunk_index,
                        hasCodecSlot() ? m_codec_slot : codec_slot);
}

ChdException ChdException::withError(ChdError error) const
{
    return ChdException(error, what(), m_hunk_index, m_codec_slot);
}

std::ostream& operator<<(std::ostream& os, ChdError error)
{
    return os << getErrorName(error);
}

} // namespace ChdRead
