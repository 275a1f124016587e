/**
 * skymesh - Binary read helpers
 *
 * Little-endian scalar reads over raw byte pointers plus a bounds-checked
 * view used by the field extractors. All .mesh fields are little-endian.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <span>
#include <optional>

namespace skymesh {

inline uint32_t read_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline int32_t read_i32_le(const uint8_t* p) {
    return static_cast<int32_t>(read_u32_le(p));
}

inline uint16_t read_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0]) | (static_cast<uint16_t>(p[1]) << 8);
}

inline float read_f32_le(const uint8_t* p) {
    float f;
    std::memcpy(&f, p, sizeof(float));
    return f;
}

/**
 * Convert IEEE 754 half-precision (16-bit) float to single-precision (32-bit).
 * Layout: 1 sign bit, 5 exponent bits (bias 15), 10 mantissa bits.
 *
 * Subnormal halves are renormalised (mantissa shifted until the implicit bit
 * appears) and re-encoded with bias 127, so every half value maps to the
 * exact float32 bit pattern.
 */
inline float half_to_float(uint16_t h) {
    uint32_t sign = (h >> 15) & 0x1;
    int32_t exp = (h >> 10) & 0x1F;
    uint32_t mant = h & 0x3FF;
    uint32_t bits;

    if (exp == 0) {
        if (mant == 0) {
            bits = sign << 31;
            float f;
            std::memcpy(&f, &bits, sizeof(f));
            return f;
        }
        while ((mant & 0x400) == 0) {
            mant <<= 1;
            exp -= 1;
        }
        exp += 1;
        mant &= ~0x400u;
    } else if (exp == 31) {
        bits = (sign << 31) | (mant == 0 ? 0x7F800000u : 0x7FC00000u);
        float f;
        std::memcpy(&f, &bits, sizeof(f));
        return f;
    }

    bits = (sign << 31) |
           (static_cast<uint32_t>(exp - 15 + 127) << 23) |
           (mant << 13);
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

/**
 * Bounds-checked little-endian view over an immutable buffer.
 * Reads past the end return std::nullopt instead of touching memory.
 */
class ByteView {
public:
    ByteView() = default;
    explicit ByteView(std::span<const uint8_t> data) : data_(data) {}

    size_t size() const { return data_.size(); }
    const uint8_t* data() const { return data_.data(); }
    std::span<const uint8_t> span() const { return data_; }

    bool has(size_t offset, size_t count) const {
        return offset <= data_.size() && count <= data_.size() - offset;
    }

    std::optional<uint8_t> u8(size_t offset) const {
        if (!has(offset, 1)) return std::nullopt;
        return data_[offset];
    }

    std::optional<uint16_t> u16(size_t offset) const {
        if (!has(offset, 2)) return std::nullopt;
        return read_u16_le(data_.data() + offset);
    }

    std::optional<uint32_t> u32(size_t offset) const {
        if (!has(offset, 4)) return std::nullopt;
        return read_u32_le(data_.data() + offset);
    }

    std::optional<int32_t> i32(size_t offset) const {
        if (!has(offset, 4)) return std::nullopt;
        return read_i32_le(data_.data() + offset);
    }

    std::optional<float> f32(size_t offset) const {
        if (!has(offset, 4)) return std::nullopt;
        return read_f32_le(data_.data() + offset);
    }

    std::span<const uint8_t> slice(size_t offset, size_t count) const {
        if (!has(offset, count)) return {};
        return data_.subspan(offset, count);
    }

private:
    std::span<const uint8_t> data_;
};

} // namespace skymesh
