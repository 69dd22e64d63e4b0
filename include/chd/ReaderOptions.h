/*
 * ReaderOptions.h - Configuration for opening a CHD container
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

#ifndef CHDREAD_CHD_READEROPTIONS_H
#define CHDREAD_CHD_READEROPTIONS_H

// No direct includes - all includes should be in chdread.h

namespace ChdRead {
namespace Chd {

class ChdReader;

constexpr size_t DEFAULT_CACHE_BUDGET_BYTES = 8 * 1024 * 1024;

struct ReaderOptions {
    // Upper bound on decompressed bytes kept in the hunk cache. A hunk
    // larger than the whole budget is still returned, just not kept.
    size_t cache_budget_bytes = DEFAULT_CACHE_BUDGET_BYTES;

    // Check each decoded hunk against its map digest
    bool verify_digests = true;

    // Already open parent container, not owned. Must outlive the child.
    ChdReader* parent = nullptr;
};

} // namespace Chd
} // namespace ChdRead

#endif // CHDREAD_CHD_READEROPTIONS_H
