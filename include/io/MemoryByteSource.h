/*
 * MemoryByteSource.h - Memory-backed byte source
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

#ifndef CHDREAD_IO_MEMORYBYTESOURCE_H
#define CHDREAD_IO_MEMORYBYTESOURCE_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace IO {

/**
 * @brief ByteSource over an in-memory image
 *
 * Owns its bytes. Used for images already loaded into memory and by the
 * test suites, which build containers on the fly.
 */
class MemoryByteSource : public ByteSource {
public:
    /**
     * @brief Construct from existing data, copying it
     */
    MemoryByteSource(const void* data, size_t size);

    /**
     * @brief Construct by taking ownership of a buffer
     */
    explicit MemoryByteSource(std::vector<uint8_t> data);

    ~MemoryByteSource() override = default;

    uint64_t size() const override;
    void close() override;
    bool isOpen() const override;
    std::string describe() const override;

    /**
     * @brief Number of readAt calls served, for access-pattern checks
     */
    uint64_t readCount() const { return m_read_count; }

protected:
    size_t readAtImpl(uint64_t offset, uint8_t* dest, size_t length) override;

private:
    std::vector<uint8_t> m_data;
    bool m_open = true;
    std::atomic<uint64_t> m_read_count{0};
};

} // namespace IO
} // namespace ChdRead

#endif // CHDREAD_IO_MEMORYBYTESOURCE_H
