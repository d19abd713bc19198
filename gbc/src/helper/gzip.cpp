/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <gbc/helper/gzip.h>

#define ZLIB_CONST
#include <zlib.h>

namespace gbc::gzip {

namespace {

// 15 bits of window, +16 selects the gzip wrapper instead of zlib
constexpr int gzip_window_bits = 15 + 16;
constexpr usize gzip_header_size = 18_usize;

z_stream make_z_stream() noexcept
{
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    return stream;
}

} // namespace

std::optional<vector<u8>> compress(const vector<u8>& uncompressed) noexcept
{
    z_stream stream = make_z_stream();

    if(const int status = deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, gzip_window_bits, 8, Z_DEFAULT_STRATEGY);
      status != Z_OK) {
        LOG_ERROR(gzip, "deflateInit2: {}", zError(status));
        return std::nullopt;
    }

    vector<u8> compressed{usize{deflateBound(&stream, static_cast<uLong>(uncompressed.size().get()))}};

    stream.next_in = reinterpret_cast<const Bytef*>(uncompressed.data()); // NOLINT
    stream.avail_in = static_cast<uInt>(uncompressed.size().get());
    stream.next_out = reinterpret_cast<Bytef*>(compressed.data()); // NOLINT
    stream.avail_out = static_cast<uInt>(compressed.size().get());

    if(const int status = deflate(&stream, Z_FINISH); status != Z_STREAM_END) {
        LOG_ERROR(gzip, "deflate: {}", zError(status));
        deflateEnd(&stream);
        return std::nullopt;
    }

    compressed.resize(usize{stream.total_out});
    deflateEnd(&stream);
    return compressed;
}

std::optional<vector<u8>> decompress(const vector<u8>& compressed) noexcept
{
    if(compressed.size() < gzip_header_size) {
        LOG_ERROR(gzip, "input is too small to be a gzip stream: {} bytes", compressed.size());
        return std::nullopt;
    }

    z_stream stream = make_z_stream();
    if(const int status = inflateInit2(&stream, gzip_window_bits); status != Z_OK) {
        LOG_ERROR(gzip, "inflateInit2: {}", zError(status));
        return std::nullopt;
    }

    // last 4 bytes encode the uncompressed size modulo 2^32
    const u32 uncompressed_size = read_unaligned<u32>(compressed, compressed.size() - 4_usize);

    vector<u8> uncompressed{usize{uncompressed_size}};
    stream.next_in = reinterpret_cast<const Bytef*>(compressed.data()); // NOLINT
    stream.avail_in = static_cast<uInt>(compressed.size().get());
    stream.next_out = reinterpret_cast<Bytef*>(uncompressed.data()); // NOLINT
    stream.avail_out = static_cast<uInt>(uncompressed.size().get());

    if(const int status = inflate(&stream, Z_FINISH); status != Z_STREAM_END) {
        LOG_ERROR(gzip, "inflate: {}", zError(status));
        inflateEnd(&stream);
        return std::nullopt;
    }

    inflateEnd(&stream);
    return uncompressed;
}

} // namespace gbc::gzip
