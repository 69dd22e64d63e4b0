/*
 * ByteSource.cpp - Random-access byte source interface
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
namespace IO {

std::vector<uint8_t> ByteSource::readAt(uint64_t offset, uint32_t length)
{
    std::vector<uint8_t> buffer(length);
    readAt(offset, buffer.data(), buffer.size());
    return buffer;
}

void ByteSource::readAt(uint64_t offset, uint8_t* dest, size_t length)
{
    if (length == 0) {
        return;
    }
    if (!isOpen()) {
        throw ChdException(ChdError::IO_ERROR, "read from closed source " + describe());
    }
    if (offset > size() || length > size() - offset) {
        std::ostringstream oss;
        oss << "read of " << length << " bytes at offset " << offset
            << " is past the end of " << describe() << " (" << size() << " bytes)";
        throw ChdException(ChdError::IO_ERROR, oss.str());
    }

    size_t got = readAtImpl(offset, dest, length);
    if (got != length) {
        std::ostringstream oss;
        oss << "short read from " << describe() << ": wanted " << length
            << " bytes at offset " << offset << ", got " << got;
        Debug::log("io", "ByteSource::readAt() - ", oss.str());
        throw ChdException(ChdError::IO_ERROR, oss.str());
    }
}

} // namespace IO
} // namespace ChdRead
