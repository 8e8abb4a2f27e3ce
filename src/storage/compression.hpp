#pragma once

// Raw DEFLATE (no zlib/gzip header) for presentation snapshots.
//
// Internal header, not installed.

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <zlib.h>

namespace slides_cpp::storage {

// Snapshots larger than this after inflation are rejected.
inline constexpr std::size_t max_snapshot_size = std::size_t{256} * 1024 * 1024;

inline auto deflate_compress(std::string_view input)
    -> std::optional<std::vector<std::byte>> {

    auto stream = z_stream{};
    // windowBits = -15 for raw deflate (negative = no header)
    auto ret = ::deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED,
                              -15, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) return std::nullopt;

    auto bound = ::deflateBound(&stream, static_cast<uLong>(input.size()));
    auto output = std::vector<std::byte>(bound);

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(bound);

    ret = ::deflate(&stream, Z_FINISH);
    ::deflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

// Inflate into text, growing the buffer up to max_output_size.
inline auto deflate_decompress(const std::vector<std::byte>& input,
                               std::size_t max_output_size = max_snapshot_size)
    -> std::optional<std::string> {

    if (input.empty()) return std::nullopt;

    auto output_size = std::min(std::max(input.size() * 4, std::size_t{1024}), max_output_size);
    auto output = std::string(output_size, '\0');

    auto stream = z_stream{};
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output_size);

    auto ret = ::inflateInit2(&stream, -15);
    if (ret != Z_OK) return std::nullopt;

    ret = ::inflate(&stream, Z_FINISH);

    while ((ret == Z_BUF_ERROR || ret == Z_OK) && stream.avail_out == 0
           && output_size < max_output_size) {
        auto written = stream.total_out;
        output_size = std::min(output_size * 2, max_output_size);
        output.resize(output_size);
        stream.next_out = reinterpret_cast<Bytef*>(output.data() + written);
        stream.avail_out = static_cast<uInt>(output_size - written);
        ret = ::inflate(&stream, Z_FINISH);
    }

    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

}  // namespace slides_cpp::storage
