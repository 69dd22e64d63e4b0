/*
 * chdtool.cpp - Command line front end for the CHD reader
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
#include <getopt.h>

using namespace ChdRead;
using namespace ChdRead::Chd;

namespace {

struct ToolOptions {
    std::string command;
    std::string file;
    std::string parent_file;
    std::string output_file;
    std::string logfile;
    std::vector<std::string> debug_channels;
    uint64_t offset = 0;
    uint64_t length = 0;
    bool has_length = false;
    size_t cache_bytes = DEFAULT_CACHE_BUDGET_BYTES;
    bool verify_digests = true;
};

void usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [options] <info|extract|verify> <file.chd>\n"
              << "\n"
              << "Options:\n"
              << "  -d, --debug=CHANNELS   enable debug channels (comma separated, or \"all\")\n"
              << "  -l, --logfile=PATH     write debug output to PATH instead of stderr\n"
              << "  -p, --parent=FILE      parent container for differential images\n"
              << "  -c, --cache=MIB        hunk cache budget in MiB (default 8)\n"
              << "  -o, --output=FILE      extract to FILE instead of stdout\n"
              << "      --offset=N         extract starting at byte N\n"
              << "      --length=N         extract N bytes\n"
              << "      --no-verify        skip per-hunk digest checks while extracting\n"
              << "  -h, --help             show this help\n"
              << "  -v, --version          show version information\n";
}

void version()
{
    std::cout << "chdtool (chdread) " << CHDREAD_VERSION << "\n"
              << "Maintainer: " << CHDREAD_MAINTAINER << "\n"
              << "zlib " << zlibVersion() << ", liblzma " << lzma_version_string() << std::endl;
}

bool parseNumber(const char* text, uint64_t& value)
{
    if (text == nullptr || *text == '\0' || *text == '-') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long parsed = std::strtoull(text, &end, 0);
    if (errno != 0 || end == text || *end != '\0') {
        return false;
    }
    value = parsed;
    return true;
}

std::string formatSize(uint64_t bytes)
{
    std::ostringstream oss;
    oss << bytes << " bytes";
    if (bytes >= 1024 * 1024) {
        oss << " (" << std::fixed << std::setprecision(1) << (bytes / (1024.0 * 1024.0)) << " MiB)";
    }
    return oss.str();
}

bool isPrintableText(const std::string& text)
{
    return std::all_of(text.begin(), text.end(), [](char c) {
        return (c >= 0x20 && c < 0x7F) || c == '\n' || c == '\t';
    });
}

void printInfo(ChdReader& reader, const ToolOptions& options)
{
    const ChdHeader& header = reader.header();

    std::cout << "File:            " << options.file << "\n"
              << "CHD version:     " << header.version << "\n"
              << "Logical size:    " << formatSize(header.logical_bytes) << "\n"
              << "Hunk size:       " << header.hunk_bytes << " bytes\n"
              << "Unit size:       " << header.unit_bytes << " bytes\n"
              << "Total hunks:     " << header.hunk_count << "\n"
              << "Total units:     " << header.unit_count << "\n";

    std::cout << "Compression:     ";
    if (!header.isCompressed()) {
        std::cout << "none";
    } else {
        bool first = true;
        for (uint32_t tag : header.compressors) {
            if (tag == Codec::CODEC_NONE) {
                continue;
            }
            std::cout << (first ? "" : ", ") << Codec::describeCodec(tag);
            first = false;
        }
    }
    std::cout << "\n";

    if (header.version >= 4) {
        std::cout << "SHA1:            " << formatDigest(header.sha1.data(), header.sha1.size()) << "\n"
                  << "Data SHA1:       " << formatDigest(header.raw_sha1.data(), header.raw_sha1.size()) << "\n";
    } else {
        std::cout << "MD5:             " << formatDigest(header.md5.data(), header.md5.size()) << "\n"
                  << "SHA1:            " << formatDigest(header.sha1.data(), header.sha1.size()) << "\n";
    }
    if (header.hasParent()) {
        std::cout << "Parent SHA1:     " << formatDigest(header.parent_sha1.data(), header.parent_sha1.size()) << "\n";
    }

    std::array<uint32_t, 8> counts = reader.hunkMap().kindCounts();
    std::cout << "Hunk map:\n";
    for (uint8_t slot = 0; slot < counts.size(); slot++) {
        if (counts[slot] == 0) {
            continue;
        }
        std::cout << "  " << std::setw(10) << counts[slot] << "  ";
        if (slot < Codec::SLOT_CODEC_COUNT) {
            std::cout << Codec::describeCodec(header.compressors[slot]);
        } else {
            std::cout << Codec::slotName(slot);
        }
        std::cout << "\n";
    }

    const auto& entries = reader.metadataEntries();
    std::cout << "Metadata:        " << entries.size() << " entries\n";
    std::map<uint32_t, uint32_t> seen;
    for (const auto& entry : entries) {
        uint32_t index = seen[entry.tag]++;
        std::cout << "  " << Core::tagToString(entry.tag) << " #" << index << "  flags=0x" << std::hex
                  << static_cast<int>(entry.flags) << std::dec << "  " << entry.length << " bytes";
        if (entry.length <= 256) {
            std::string text = metadataText(reader.metadata(entry.tag, index));
            if (isPrintableText(text)) {
                std::cout << "  \"" << text << "\"";
            }
        }
        std::cout << "\n";
    }
    std::cout.flush();
}

int extract(ChdReader& reader, const ToolOptions& options)
{
    uint64_t logical = reader.logicalSize();
    if (options.offset > logical) {
        std::cerr << "Offset " << options.offset << " is beyond the logical size " << logical << std::endl;
        return 1;
    }
    uint64_t length = options.has_length ? options.length : logical - options.offset;

    std::ofstream file;
    std::ostream* out = &std::cout;
    if (!options.output_file.empty()) {
        file.open(options.output_file, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            std::cerr << "Unable to open " << options.output_file << " for writing" << std::endl;
            return 1;
        }
        out = &file;
    }

    // Whole hunks at a time keep the cache warm for the next chunk
    const size_t chunk_size = std::max<size_t>(reader.hunkSize(), 1024 * 1024);
    std::vector<uint8_t> buffer;
    uint64_t position = options.offset;
    uint64_t remaining = length;
    while (remaining > 0) {
        size_t chunk = static_cast<size_t>(std::min<uint64_t>(remaining, chunk_size));
        buffer = reader.read(position, chunk);
        out->write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (!*out) {
            std::cerr << "Write failed after " << (position - options.offset) << " bytes" << std::endl;
            return 1;
        }
        position += chunk;
        remaining -= chunk;
    }
    out->flush();

    CacheStats stats = reader.cacheStats();
    Debug::log("chd_cache", "chdtool: extracted ", length, " bytes; hits=", stats.hits, " misses=", stats.misses,
               " evictions=", stats.evictions);
    return 0;
}

int verify(ChdReader& reader)
{
    reader.verify();
    std::cout << "Verified " << reader.hunkCount() << " hunks, " << formatSize(reader.logicalSize()) << std::endl;
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    ToolOptions options;

    enum {
        OPT_OFFSET = 1000,
        OPT_LENGTH,
        OPT_NO_VERIFY
    };

    static const struct option long_options[] = {
        {"debug", required_argument, 0, 'd'},
        {"logfile", required_argument, 0, 'l'},
        {"parent", required_argument, 0, 'p'},
        {"cache", required_argument, 0, 'c'},
        {"output", required_argument, 0, 'o'},
        {"offset", required_argument, 0, OPT_OFFSET},
        {"length", required_argument, 0, OPT_LENGTH},
        {"no-verify", no_argument, 0, OPT_NO_VERIFY},
        {"help", no_argument, 0, 'h'},
        {"version", no_argument, 0, 'v'},
        {0, 0, 0, 0}
    };

    int opt;
    uint64_t number = 0;
    while ((opt = getopt_long(argc, argv, "d:l:p:c:o:hv", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'd': {
                std::vector<std::string> channels = Debug::parseChannelList(optarg);
                options.debug_channels.insert(options.debug_channels.end(), channels.begin(), channels.end());
                break;
            }
            case 'l':
                options.logfile = optarg;
                break;
            case 'p':
                options.parent_file = optarg;
                break;
            case 'c':
                if (!parseNumber(optarg, number)) {
                    std::cerr << "Invalid cache size: " << optarg << std::endl;
                    return 2;
                }
                options.cache_bytes = static_cast<size_t>(number) * 1024 * 1024;
                break;
            case 'o':
                options.output_file = optarg;
                break;
            case OPT_OFFSET:
                if (!parseNumber(optarg, options.offset)) {
                    std::cerr << "Invalid offset: " << optarg << std::endl;
                    return 2;
                }
                break;
            case OPT_LENGTH:
                if (!parseNumber(optarg, options.length)) {
                    std::cerr << "Invalid length: " << optarg << std::endl;
                    return 2;
                }
                options.has_length = true;
                break;
            case OPT_NO_VERIFY:
                options.verify_digests = false;
                break;
            case 'h':
                usage(argv[0]);
                return 0;
            case 'v':
                version();
                return 0;
            case '?':
                return 2; // getopt_long already printed the error
        }
    }

    if (argc - optind != 2) {
        usage(argv[0]);
        return 2;
    }
    options.command = argv[optind];
    options.file = argv[optind + 1];

    if (options.command != "info" && options.command != "extract" && options.command != "verify") {
        std::cerr << "Unknown command: " << options.command << std::endl;
        usage(argv[0]);
        return 2;
    }

    if (!options.debug_channels.empty() || !options.logfile.empty()) {
        Debug::init(options.logfile, options.debug_channels);
    }

    int status = 0;
    try {
        std::unique_ptr<ChdReader> parent;
        ReaderOptions reader_options;
        reader_options.cache_budget_bytes = options.cache_bytes;
        reader_options.verify_digests = options.verify_digests;
        if (!options.parent_file.empty()) {
            parent = ChdReader::open(options.parent_file);
            reader_options.parent = parent.get();
        }

        std::unique_ptr<ChdReader> reader = ChdReader::open(options.file, reader_options);

        if (options.command == "info") {
            printInfo(*reader, options);
        } else if (options.command == "extract") {
            status = extract(*reader, options);
        } else {
            status = verify(*reader);
        }

        reader.reset();
    } catch (const ChdException& e) {
        std::cerr << options.file << ": " << e.getErrorName();
        if (e.hasHunkIndex()) {
            std::cerr << " at hunk " << e.hunkIndex();
        }
        std::cerr << ": " << e.what() << std::endl;
        status = 1;
    }

    Debug::shutdown();
    return status;
}
