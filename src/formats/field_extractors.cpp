/**
 * skymesh - Field Extractors Implementation
 */

#include "skymesh/field_extractors.hpp"
#include <string>
#include <cstdio>

namespace skymesh {

namespace {

// True when count records of record_size bytes, stride apart, fit from start
bool block_fits(const ByteView& payload, size_t start, size_t count, size_t stride, size_t record_size) {
    if (count == 0) return payload.has(start, 0);
    if (stride == 0 || count > payload.size()) return false;
    size_t last = (count - 1) * stride;
    if (!payload.has(start, last)) return false;
    return payload.has(start + last, record_size);
}

std::string hex(size_t value) {
    char buf[24];
    snprintf(buf, sizeof(buf), "0x%zX", value);
    return buf;
}

std::string block_error(const char* what, size_t start, size_t count, size_t stride, size_t size) {
    return std::string(what) + " block does not fit: " + std::to_string(count) + " x " +
           std::to_string(stride) + " at " + hex(start) + " (payload " + std::to_string(size) + " bytes)";
}

} // namespace

UV decode_uv(const uint8_t* p, UvEncoding encoding) {
    switch (encoding) {
        case UvEncoding::Half:
            return UV(half_to_float(read_u16_le(p)), half_to_float(read_u16_le(p + 2)));
        case UvEncoding::Float32:
            return UV(read_f32_le(p), read_f32_le(p + 4));
        case UvEncoding::Unorm16:
            return UV(read_u16_le(p) / UNORM16_DIVISOR, read_u16_le(p + 2) / UNORM16_DIVISOR);
    }
    return UV(0.0f);
}

Result<std::vector<Vertex>> read_float_positions(const ByteView& payload, size_t start,
                                                 size_t count, size_t stride) {
    if (!block_fits(payload, start, count, stride, 12)) {
        return Error::size_mismatch(block_error("Position", start, count, stride, payload.size()));
    }

    std::vector<Vertex> vertices;
    vertices.reserve(count);
    const uint8_t* base = payload.data() + start;
    for (size_t i = 0; i < count; i++) {
        const uint8_t* p = base + i * stride;
        vertices.emplace_back(read_f32_le(p), read_f32_le(p + 4), read_f32_le(p + 8));
    }
    return vertices;
}

Result<std::vector<UV>> read_uvs(const ByteView& payload, const UvLayout& layout) {
    size_t pair_size = uv_encoding_size(layout.encoding);
    std::vector<UV> uvs;
    uvs.reserve(layout.count);

    for (size_t i = 0; i < layout.count; i++) {
        size_t off = layout.start + i * layout.stride + layout.record_offset;
        if (!payload.has(off, pair_size)) {
            if (!layout.default_missing) {
                return Error::size_mismatch(block_error("UV", layout.start, layout.count,
                                                        layout.stride, payload.size()));
            }
            uvs.emplace_back(0.0f, 0.0f);
            continue;
        }
        uvs.push_back(decode_uv(payload.data() + off, layout.encoding));
    }
    return uvs;
}

Result<std::vector<Face>> read_faces(const ByteView& payload, size_t offset,
                                     size_t face_count, IndexWidth width) {
    size_t triple = 3 * index_width_bytes(width);
    if (!block_fits(payload, offset, face_count, triple, triple)) {
        return Error::size_mismatch(block_error("Index", offset, face_count, triple, payload.size()));
    }

    std::vector<Face> faces;
    faces.reserve(face_count);
    const uint8_t* p = payload.data() + offset;
    for (size_t i = 0; i < face_count; i++, p += triple) {
        if (width == IndexWidth::U16) {
            faces.emplace_back(read_u16_le(p), read_u16_le(p + 2), read_u16_le(p + 4));
        } else {
            faces.emplace_back(read_u32_le(p), read_u32_le(p + 4), read_u32_le(p + 8));
        }
    }
    return faces;
}

Result<ExtractedAttributes> extract_direct_float(const ByteView& payload, size_t vertex_count,
                                                 const DirectFloatLayout& layout) {
    ExtractedAttributes out;
    out.block_offset = layout.vertex_start;

    auto vertices = read_float_positions(payload, layout.vertex_start, vertex_count, layout.vertex_stride);
    if (!vertices) {
        return vertices.error();
    }
    out.vertices = std::move(*vertices);

    UvLayout uv_layout;
    uv_layout.start = layout.vertex_start + vertex_count * layout.vertex_stride + layout.uv_skip;
    uv_layout.count = vertex_count;
    uv_layout.stride = layout.uv_stride;
    uv_layout.record_offset = layout.uv_record_offset;
    uv_layout.encoding = layout.uv_encoding;
    uv_layout.default_missing = layout.default_missing_uvs;

    auto uvs = read_uvs(payload, uv_layout);
    if (!uvs) {
        return uvs.error();
    }
    out.uvs = std::move(*uvs);

    out.search_anchor = uv_layout.start + vertex_count * layout.uv_stride + layout.index_skip;
    return out;
}

Result<QuantizationHeader> read_quantization_header(const ByteView& payload) {
    if (!payload.has(QUANT_OFF_MIN, QUANT_OFF_SHARED_COUNT - QUANT_OFF_MIN)) {
        return Error::size_mismatch("Payload too short for quantization header");
    }

    QuantizationHeader header;
    header.min = glm::vec3(*payload.f32(QUANT_OFF_MIN),
                           *payload.f32(QUANT_OFF_MIN + 4),
                           *payload.f32(QUANT_OFF_MIN + 8));
    float range_y = *payload.f32(QUANT_OFF_RANGE_Y);
    header.range = glm::vec3(*payload.f32(QUANT_OFF_RANGE_X), range_y, range_y);
    return header;
}

Result<ExtractedAttributes> extract_quantized(const ByteView& payload, size_t vertex_count) {
    auto header = read_quantization_header(payload);
    if (!header) {
        return header.error();
    }

    if (!block_fits(payload, QUANT_OFF_VERTICES, vertex_count, QUANT_VERTEX_SIZE, QUANT_VERTEX_SIZE)) {
        return Error::size_mismatch(block_error("Quantized vertex", QUANT_OFF_VERTICES, vertex_count,
                                                QUANT_VERTEX_SIZE, payload.size()));
    }

    ExtractedAttributes out;
    out.block_offset = QUANT_OFF_VERTICES;
    out.vertices.reserve(vertex_count);

    const uint8_t* p = payload.data() + QUANT_OFF_VERTICES;
    for (size_t i = 0; i < vertex_count; i++, p += QUANT_VERTEX_SIZE) {
        out.vertices.emplace_back(
            dequantize_unorm16(read_u16_le(p),     header->min.x, header->range.x),
            dequantize_unorm16(read_u16_le(p + 2), header->min.y, header->range.y),
            dequantize_unorm16(read_u16_le(p + 4), header->min.z, header->range.z));
    }

    UvLayout uv_layout;
    uv_layout.start = QUANT_OFF_VERTICES + vertex_count * QUANT_VERTEX_SIZE;
    uv_layout.count = vertex_count;
    uv_layout.stride = QUANT_UV_SIZE;
    uv_layout.encoding = UvEncoding::Unorm16;
    uv_layout.default_missing = true;

    auto uvs = read_uvs(payload, uv_layout);
    if (!uvs) {
        return uvs.error();
    }
    out.uvs = std::move(*uvs);
    out.search_anchor = uv_layout.start + vertex_count * QUANT_UV_SIZE;
    return out;
}

Result<ExtractedAttributes> extract_raw_u16(const ByteView& payload, size_t vertex_count) {
    if (!block_fits(payload, RAW_OFF_VERTICES, vertex_count, QUANT_VERTEX_SIZE, QUANT_VERTEX_SIZE)) {
        return Error::size_mismatch(block_error("Raw u16 vertex", RAW_OFF_VERTICES, vertex_count,
                                                QUANT_VERTEX_SIZE, payload.size()));
    }

    ExtractedAttributes out;
    out.block_offset = RAW_OFF_VERTICES;
    out.vertices.reserve(vertex_count);

    const uint8_t* p = payload.data() + RAW_OFF_VERTICES;
    for (size_t i = 0; i < vertex_count; i++, p += QUANT_VERTEX_SIZE) {
        out.vertices.emplace_back(static_cast<float>(read_u16_le(p)),
                                  static_cast<float>(read_u16_le(p + 2)),
                                  static_cast<float>(read_u16_le(p + 4)));
    }

    UvLayout uv_layout;
    uv_layout.start = RAW_OFF_VERTICES + vertex_count * QUANT_VERTEX_SIZE;
    uv_layout.count = vertex_count;
    uv_layout.stride = QUANT_UV_SIZE;
    uv_layout.encoding = UvEncoding::Unorm16;
    uv_layout.default_missing = true;

    auto uvs = read_uvs(payload, uv_layout);
    if (!uvs) {
        return uvs.error();
    }
    out.uvs = std::move(*uvs);
    out.search_anchor = uv_layout.start + vertex_count * QUANT_UV_SIZE;
    return out;
}

Result<ExtractedAttributes> extract_normalized_byte(const ByteView& payload, size_t vertex_count) {
    if (vertex_count == 0 || vertex_count > payload.size() / PACKED_VERTEX_SIZE) {
        return Error::size_mismatch("Payload of " + std::to_string(payload.size()) +
                                    " bytes cannot hold " + std::to_string(vertex_count) +
                                    " packed vertices");
    }

    ExtractedAttributes out;
    out.block_offset = payload.size() - vertex_count * PACKED_VERTEX_SIZE;
    out.search_anchor = payload.size();
    out.vertices.reserve(vertex_count);

    const uint8_t* p = payload.data() + out.block_offset;
    for (size_t i = 0; i < vertex_count; i++, p += PACKED_VERTEX_SIZE) {
        out.vertices.emplace_back(dequantize_snorm8(p[1]), dequantize_snorm8(p[2]), dequantize_snorm8(p[3]));
    }
    out.uvs.assign(vertex_count, UV(0.0f, 0.0f));
    return out;
}

std::optional<std::vector<UV>> read_companion_uvs(const ByteView& payload, size_t offset,
                                                  size_t vertex_count) {
    if (!block_fits(payload, offset, vertex_count, QUANT_UV_SIZE, QUANT_UV_SIZE)) {
        return std::nullopt;
    }

    std::vector<UV> uvs;
    uvs.reserve(vertex_count);
    const uint8_t* p = payload.data() + offset;
    for (size_t i = 0; i < vertex_count; i++, p += QUANT_UV_SIZE) {
        uvs.push_back(decode_uv(p, UvEncoding::Unorm16));
    }
    return uvs;
}

} // namespace skymesh
