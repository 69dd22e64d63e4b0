/*
 * ByteSource.h - Random-access byte source interface
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

#ifndef CHDREAD_IO_BYTESOURCE_H
#define CHDREAD_IO_BYTESOURCE_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace IO {

/**
 * @brief Random-access, read-only byte container
 *
 * The reader consumes its backing container exclusively through this
 * interface. Implementations report every failure as a ChdException
 * with ChdError::IO_ERROR and never retry on their own.
 */
class ByteSource {
public:
    ByteSource() = default;
    virtual ~ByteSource() = default;

    ByteSource(const ByteSource&) = delete;
    ByteSource& operator=(const ByteSource&) = delete;

    /**
     * @brief Read exactly @p length bytes starting at @p offset
     * @throws ChdException IO_ERROR on a short read or a closed source
     */
    std::vector<uint8_t> readAt(uint64_t offset, uint32_t length);

    /**
     * @brief Read exactly @p length bytes into a caller buffer
     * @throws ChdException IO_ERROR on a short read or a closed source
     */
    void readAt(uint64_t offset, uint8_t* dest, size_t length);

    /**
     * @brief Total size of the source in bytes
     */
    virtual uint64_t size() const = 0;

    /**
     * @brief Release the underlying resource; further reads fail
     */
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /**
     * @brief Human readable name used in log and error messages
     */
    virtual std::string describe() const = 0;

protected:
    /**
     * @brief Read up to @p length bytes, returning the count actually read
     *
     * Returning fewer bytes than requested means end of source. Hard
     * failures throw ChdException IO_ERROR.
     */
    virtual size_t readAtImpl(uint64_t offset, uint8_t* dest, size_t length) = 0;
};

} // namespace IO
} // namespace ChdRead

#endif // CHDREAD_IO_BYTESOURCE_H
