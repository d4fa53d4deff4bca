#include "digitloom/compression.hpp"

#include <cstring>

#include <zlib.h>

#include "digitloom/error.hpp"

namespace digitloom {

namespace {

const int GZIP_WINDOW_BITS = 15 + 16;

std::string zlib_message(const z_stream& stream, int code) {
    if (stream.msg) return stream.msg;
    return "zlib error " + std::to_string(code);
}

} // namespace

const char* compression_name(CompressionId compression) {
    switch (compression) {
        case CompressionId::None: return "none";
        case CompressionId::Gzip: return "gzip";
    }
    return "?";
}

CompressionId parse_compression(const std::string& name) {
    if (name == "none" || name.empty()) return CompressionId::None;
    if (name == "gzip") return CompressionId::Gzip;
    throw InvalidRequest("unknown compression '" + name + "'");
}

CompressionId compression_from_id(uint8_t id) {
    switch (id) {
        case 0: return CompressionId::None;
        case 1: return CompressionId::Gzip;
    }
    throw ContainerFormatError("unknown compression id", std::to_string(id));
}

Bytes gzip_compress(const Bytes& data, int level) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    int code = deflateInit2(&stream, level, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY);
    if (code != Z_OK) throw ContainerFormatError("deflateInit2 failed", zlib_message(stream, code));

    Bytes out(deflateBound(&stream, static_cast<uLong>(data.size())));
    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    code = deflate(&stream, Z_FINISH);
    if (code != Z_STREAM_END) {
        std::string message = zlib_message(stream, code);
        deflateEnd(&stream);
        throw ContainerFormatError("deflate failed", message);
    }
    out.resize(stream.total_out);
    deflateEnd(&stream);
    return out;
}

Bytes gzip_decompress(const Bytes& data, size_t expected_size) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    int code = inflateInit2(&stream, GZIP_WINDOW_BITS);
    if (code != Z_OK) throw ContainerFormatError("inflateInit2 failed", zlib_message(stream, code));

    //  One spare byte so an over-long stream is detected rather than cut.
    Bytes out(expected_size + 1);
    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    code = inflate(&stream, Z_FINISH);
    if (code != Z_STREAM_END) {
        std::string message = zlib_message(stream, code);
        inflateEnd(&stream);
        throw ContainerFormatError("inflate failed", message);
    }
    size_t produced = stream.total_out;
    inflateEnd(&stream);

    if (produced != expected_size) {
        throw ContainerFormatError("inflated size mismatch",
                                   std::to_string(produced) + " != " + std::to_string(expected_size));
    }
    out.resize(produced);
    return out;
}

} // namespace digitloom
