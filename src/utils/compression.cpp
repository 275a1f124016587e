/**
 * skymesh - Block Codec Adapter Implementation
 */

#include "skymesh/compression.hpp"
#include "skymesh/logging.hpp"
#include <zlib.h>
#include <lz4.h>
#include <stdexcept>
#include <string>

namespace skymesh {

static const char* zlib_error_string(int err) {
    switch (err) {
        case Z_OK:            return "Z_OK";
        case Z_STREAM_END:    return "Z_STREAM_END";
        case Z_NEED_DICT:     return "Z_NEED_DICT";
        case Z_ERRNO:         return "Z_ERRNO";
        case Z_STREAM_ERROR:  return "Z_STREAM_ERROR";
        case Z_DATA_ERROR:    return "Z_DATA_ERROR";
        case Z_MEM_ERROR:     return "Z_MEM_ERROR";
        case Z_BUF_ERROR:     return "Z_BUF_ERROR";
        case Z_VERSION_ERROR: return "Z_VERSION_ERROR";
        default:              return "UNKNOWN_ERROR";
    }
}

Result<std::vector<uint8_t>> decompress_lz4(const uint8_t* data, size_t size, size_t expected_size) {
    if (size == 0 || expected_size == 0) {
        return Error::decompression_failure("Empty LZ4 block");
    }

    std::vector<uint8_t> result(expected_size);

    int decompressed_size = LZ4_decompress_safe(
        reinterpret_cast<const char*>(data),
        reinterpret_cast<char*>(result.data()),
        static_cast<int>(size),
        static_cast<int>(expected_size)
    );

    if (decompressed_size <= 0) {
        return Error::decompression_failure("LZ4 decompression failed (ret=" +
                                            std::to_string(decompressed_size) + ")");
    }

    if (static_cast<size_t>(decompressed_size) != expected_size) {
        return Error::decompression_failure("LZ4 output size mismatch: got " +
                                            std::to_string(decompressed_size) +
                                            ", expected " + std::to_string(expected_size));
    }

    return result;
}

Result<std::vector<uint8_t>> decompress_zlib(const uint8_t* data, size_t size, size_t expected_size) {
    std::vector<uint8_t> result(expected_size);

    z_stream strm = {};
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    strm.next_out = result.data();
    strm.avail_out = static_cast<uInt>(expected_size);

    int ret = inflateInit(&strm);
    if (ret != Z_OK) {
        return Error::decompression_failure(std::string("Failed to initialize zlib: ") +
                                            zlib_error_string(ret));
    }

    ret = inflate(&strm, Z_FINISH);
    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return Error::decompression_failure(std::string("Zlib decompression failed: ") +
                                            zlib_error_string(ret) +
                                            " (input=" + std::to_string(size) +
                                            ", expected=" + std::to_string(expected_size) + ")");
    }

    if (strm.total_out != expected_size) {
        return Error::decompression_failure("Zlib output size mismatch: got " +
                                            std::to_string(strm.total_out) +
                                            ", expected " + std::to_string(expected_size));
    }

    return result;
}

Result<std::vector<uint8_t>> decompress_block(const CompressedBlock& block) {
    const uint8_t* data = block.compressed_bytes.data();
    size_t size = block.compressed_bytes.size();
    size_t expected = block.declared_uncompressed_size;

    if (block.stored) {
        if (size < expected) {
            return Error::size_mismatch("Stored payload shorter than declared size");
        }
        return std::vector<uint8_t>(data, data + expected);
    }

    auto lz4_result = decompress_lz4(data, size, expected);
    if (lz4_result) {
        return lz4_result;
    }

    if (detect_compression(data, size) == CompressionType::Zlib) {
        auto zlib_result = decompress_zlib(data, size, expected);
        if (zlib_result) {
            return zlib_result;
        }
        LOG_DEBUG("Codec", "zlib fallback failed: " << zlib_result.error().message);
    }

    return lz4_result.error();
}

Result<void> verify_codec() {
    if (LZ4_versionNumber() <= 0) {
        return Error(Error::Code::CodecUnavailable, "LZ4 library reports no version");
    }

    std::vector<uint8_t> probe(256);
    for (size_t i = 0; i < probe.size(); i++) {
        probe[i] = static_cast<uint8_t>((i * 7) & 0x1F);
    }

    std::vector<uint8_t> packed;
    try {
        packed = compress_lz4(probe);
    } catch (const std::runtime_error& e) {
        return Error(Error::Code::CodecUnavailable, e.what());
    }

    auto unpacked = decompress_lz4(packed.data(), packed.size(), probe.size());
    if (!unpacked || *unpacked != probe) {
        return Error(Error::Code::CodecUnavailable, "LZ4 round trip failed");
    }

    LOG_DEBUG("Codec", "LZ4 " << LZ4_versionString() << " ready");
    return Result<void>::success();
}

CompressionType detect_compression(const uint8_t* data, size_t size) {
    if (size < 2) {
        return CompressionType::None;
    }

    // 78 01 / 78 9C / 78 DA - zlib low / default / best compression
    if (data[0] == 0x78 && (data[1] == 0x01 || data[1] == 0x9C || data[1] == 0xDA)) {
        return CompressionType::Zlib;
    }

    // LZ4 blocks carry no magic
    return CompressionType::LZ4;
}

std::vector<uint8_t> compress_lz4(const uint8_t* data, size_t size) {
    int bound = LZ4_compressBound(static_cast<int>(size));
    std::vector<uint8_t> result(static_cast<size_t>(bound));

    int compressed_size = LZ4_compress_default(
        reinterpret_cast<const char*>(data),
        reinterpret_cast<char*>(result.data()),
        static_cast<int>(size),
        bound
    );

    if (compressed_size <= 0) {
        throw std::runtime_error("LZ4 compression failed");
    }

    result.resize(static_cast<size_t>(compressed_size));
    return result;
}

std::vector<uint8_t> compress_lz4(const std::vector<uint8_t>& data) {
    return compress_lz4(data.data(), data.size());
}

std::vector<uint8_t> compress_zlib(const std::vector<uint8_t>& data, int level) {
    uLongf bound = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> result(bound);

    int ret = compress2(
        result.data(), &bound,
        data.data(), static_cast<uLong>(data.size()),
        level
    );

    if (ret != Z_OK) {
        throw std::runtime_error(std::string("Zlib compression failed: ") + zlib_error_string(ret));
    }

    result.resize(bound);
    return result;
}

} // namespace skymesh
