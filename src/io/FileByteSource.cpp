/*
 * FileByteSource.cpp - Local file byte source
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

FileByteSource::FileByteSource(const std::string& path)
    : m_path(path)
{
    m_file = fopen(path.c_str(), "rb");
    if (!m_file) {
        int error = errno;
        Debug::log("io", "FileByteSource: fopen failed for ", path, ", errno: ", error, " (", strerror(error), ")");
        throw ChdException(ChdError::OPEN_ERROR, "unable to open " + path + ": " + strerror(error));
    }

    // Large file support: fseeko/ftello take off_t
    if (fseeko(m_file, 0, SEEK_END) != 0) {
        int error = errno;
        close_unlocked();
        throw ChdException(ChdError::OPEN_ERROR, "unable to seek in " + path + ": " + strerror(error));
    }
    off_t end = ftello(m_file);
    if (end < 0) {
        int error = errno;
        close_unlocked();
        throw ChdException(ChdError::OPEN_ERROR, "unable to size " + path + ": " + strerror(error));
    }
    m_size = static_cast<uint64_t>(end);

    Debug::log("io", "FileByteSource: opened ", path, " (", m_size, " bytes)");
}

FileByteSource::~FileByteSource()
{
    std::lock_guard<std::mutex> lock(m_file_mutex);
    close_unlocked();
}

uint64_t FileByteSource::size() const
{
    return m_size;
}

void FileByteSource::close()
{
    std::lock_guard<std::mutex> lock(m_file_mutex);
    close_unlocked();
}

void FileByteSource::close_unlocked()
{
    if (m_file) {
        fclose(m_file);
        m_file = nullptr;
    }
}

bool FileByteSource::isOpen() const
{
    std::lock_guard<std::mutex> lock(m_file_mutex);
    return m_file != nullptr;
}

std::string FileByteSource::describe() const
{
    return m_path;
}

size_t FileByteSource::readAtImpl(uint64_t offset, uint8_t* dest, size_t length)
{
    std::lock_guard<std::mutex> lock(m_file_mutex);
    if (!m_file) {
        throw ChdException(ChdError::IO_ERROR, "read from closed file " + m_path);
    }

    if (fseeko(m_file, static_cast<off_t>(offset), SEEK_SET) != 0) {
        int error = errno;
        Debug::log("io", "FileByteSource: fseeko to ", offset, " failed, errno: ", error, " (", strerror(error), ")");
        throw ChdException(ChdError::IO_ERROR, "seek failed in " + m_path + ": " + strerror(error));
    }

    size_t bytes_read = fread(dest, 1, length, m_file);
    if (bytes_read < length && ferror(m_file)) {
        int error = errno;
        clearerr(m_file);
        Debug::log("io", "FileByteSource: fread failed at ", offset, ", errno: ", error, " (", strerror(error), ")");
        throw ChdException(ChdError::IO_ERROR, "read failed in " + m_path + ": " + strerror(error));
    }
    return bytes_read;
}

} // namespace IO
} // namespace ChdRead
