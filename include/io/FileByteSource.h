/*
 * FileByteSource.h - Local file byte source
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

#ifndef CHDREAD_IO_FILEBYTESOURCE_H
#define CHDREAD_IO_FILEBYTESOURCE_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace IO {

/**
 * @brief ByteSource over a local file
 *
 * Uses stdio with 64-bit offsets. Reads are serialised by a mutex so one
 * source can back several reader handles.
 */
class FileByteSource : public ByteSource {
public:
    /**
     * @brief Open @p path for reading
     * @throws ChdException OPEN_ERROR if the file cannot be opened
     */
    explicit FileByteSource(const std::string& path);
    ~FileByteSource() override;

    uint64_t size() const override;
    void close() override;
    bool isOpen() const override;
    std::string describe() const override;

    const std::string& path() const { return m_path; }

protected:
    size_t readAtImpl(uint64_t offset, uint8_t* dest, size_t length) override;

private:
    void close_unlocked();

    std::string m_path;
    FILE* m_file = nullptr;
    uint64_t m_size = 0;
    mutable std::mutex m_file_mutex;
};

} // namespace IO
} // namespace ChdRead

#endif // CHDREAD_IO_FILEBYTESOURCE_H
