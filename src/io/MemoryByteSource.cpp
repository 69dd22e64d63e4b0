/*
 * MemoryByteSource.cpp - Memory-backed byte source
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

MemoryByteSource::MemoryByteSource(const void* data, size_t size)
{
    if (data && size > 0) {
        const uint8_t* bytes = static_cast<const uint8_t*>(data);
        m_data.assign(bytes, bytes + size);
    }
}

MemoryByteSource::MemoryByteSource(std::vector<uint8_t> data)
    : m_data(std::move(data))
{
}

uint64_t MemoryByteSource::size() const
{
    return m_data.size();
}

void MemoryByteSource::close()
{
    m_open = false;
    m_data.clear();
    m_data.shrink_to_fit();
}

bool MemoryByteSource::isOpen() const
{
    return m_open;
}

std::string MemoryByteSource::describe() const
{
    std::ostringstream oss;
    oss << "memory image (" << m_data.size() << " bytes)";
    return oss.str();
}

size_t MemoryByteSource::readAtImpl(uint64_t offset, uint8_t* dest, size_t length)
{
    ++m_read_count;
    if (offset >= m_data.size()) {
        return 0;
    }
    size_t available = static_cast<size_t>(m_data.size() - offset);
    size_t to_copy = std::min(length, available);
    std::memcpy(dest, m_data.data() + offset, to_copy);
    return to_copy;
}

} // namespace IO
} // namespace ChdRead
