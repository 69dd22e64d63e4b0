/*
 * chdread.h - Main header for the chdread CHD container reader
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

#ifndef __CHDREAD_H__
#define __CHDREAD_H__

#include <cstdint>
#include <ostream>

// defines
#define CHDREAD_VERSION "1.0.0"
#define CHDREAD_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"

//
// C++ Standard Library
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

// C Standard Library (wrapped)
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// System-specific headers
#include <sys/stat.h>
#include <sys/types.h>

// Compression libraries
#include <zlib.h>
#include <lzma.h>

// Message digests
#include <openssl/evp.h>

// Project headers
#include "debug.h"
#include "core/ChdError.h"
#include "core/ByteOrder.h"
#include "core/Checksum.h"
#include "core/DigestValidator.h"
#include "io/ByteSource.h"
#include "io/FileByteSource.h"
#include "io/MemoryByteSource.h"
#include "codecs/BitstreamReader.h"
#include "codecs/HuffmanDecoder.h"
#include "codecs/flac/FLACTypes.h"
#include "codecs/flac/CRCValidator.h"
#include "codecs/flac/FrameParser.h"
#include "codecs/flac/SubframeDecoder.h"
#include "codecs/flac/ChannelDecorrelator.h"
#include "codecs/flac/FlacDecoder.h"
#include "codecs/cdrom/CdromEcc.h"
#include "codecs/ZlibDecompressor.h"
#include "codecs/LzmaDecompressor.h"
#include "codecs/CodecTypes.h"
#include "codecs/ChdCodecs.h"
#include "codecs/CodecDispatcher.h"
#include "chd/ChdHeader.h"
#include "chd/HunkMap.h"
#include "chd/Metadata.h"
#include "chd/ReaderOptions.h"
#include "chd/HunkCache.h"
#include "chd/ChdReader.h"

#endif // __CHDREAD_H__
