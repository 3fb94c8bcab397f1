#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <format>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace lgtools::binutil {

// Assumes little-endian (x86/x64). Fail at compile time otherwise.
static_assert(std::endian::native == std::endian::little,
              "lgtools requires a little-endian platform");

using Vec3 = std::array<float, 3>;

// OutOfBounds is thrown when a read would run past the end of the buffer.
class OutOfBounds : public std::runtime_error {
public:
    OutOfBounds(size_t offset, size_t width, size_t size)
        : std::runtime_error(std::format(
              "binutil: read of {} bytes at offset {} exceeds buffer size {}",
              width, offset, size)),
          offset_(offset) {}

    size_t offset() const { return offset_; }

private:
    size_t offset_;
};

// ByteReader is a little-endian cursor over a fixed byte buffer. It does not
// own the bytes; the buffer must outlive the reader.
//
// Every typed read has an overload taking an absolute position. That overload
// reads at the position and leaves the cursor just past the value, so a
// following plain read continues from there.
class ByteReader {
public:
    ByteReader() = default;
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    size_t size() const { return data_.size(); }
    size_t tell() const { return pos_; }
    size_t remaining() const { return pos_ < data_.size() ? data_.size() - pos_ : 0; }

    void seek(size_t pos) {
        if (pos > data_.size())
            throw OutOfBounds(pos, 0, data_.size());
        pos_ = pos;
    }

    void skip(size_t n) {
        check(pos_, n);
        pos_ += n;
    }

    uint8_t read_u8() { return read_pod<uint8_t>(pos_); }
    int8_t read_i8() { return read_pod<int8_t>(pos_); }
    uint16_t read_u16() { return read_pod<uint16_t>(pos_); }
    int16_t read_i16() { return read_pod<int16_t>(pos_); }
    uint32_t read_u32() { return read_pod<uint32_t>(pos_); }
    int32_t read_i32() { return read_pod<int32_t>(pos_); }
    float read_f32() { return read_pod<float>(pos_); }
    double read_f64() { return read_pod<double>(pos_); }

    uint8_t read_u8(size_t at) { return read_pod<uint8_t>(at); }
    int8_t read_i8(size_t at) { return read_pod<int8_t>(at); }
    uint16_t read_u16(size_t at) { return read_pod<uint16_t>(at); }
    int16_t read_i16(size_t at) { return read_pod<int16_t>(at); }
    uint32_t read_u32(size_t at) { return read_pod<uint32_t>(at); }
    int32_t read_i32(size_t at) { return read_pod<int32_t>(at); }
    float read_f32(size_t at) { return read_pod<float>(at); }
    double read_f64(size_t at) { return read_pod<double>(at); }

    Vec3 read_vec3() { return read_vec3(pos_); }

    Vec3 read_vec3(size_t at) {
        check(at, 12);
        Vec3 v{};
        std::memcpy(v.data(), data_.data() + at, 12);
        pos_ = at + 12;
        return v;
    }

    // read_fixed_string consumes size bytes and returns the text up to the
    // first NUL; the rest is padding.
    std::string read_fixed_string(size_t size) { return read_fixed_string(pos_, size); }

    std::string read_fixed_string(size_t at, size_t size) {
        check(at, size);
        const auto* begin = reinterpret_cast<const char*>(data_.data() + at);
        std::string s(begin, size);
        auto nul = s.find('\0');
        if (nul != std::string::npos)
            s.resize(nul);
        pos_ = at + size;
        return s;
    }

    std::vector<float> read_f32_slice(size_t n) { return read_slice<float>(pos_, n); }
    std::vector<float> read_f32_slice(size_t at, size_t n) { return read_slice<float>(at, n); }
    std::vector<uint16_t> read_u16_slice(size_t n) { return read_slice<uint16_t>(pos_, n); }

private:
    std::span<const uint8_t> data_;
    size_t pos_ = 0;

    void check(size_t at, size_t width) const {
        if (at > data_.size() || width > data_.size() - at)
            throw OutOfBounds(at, width, data_.size());
    }

    template <typename T>
    T read_pod(size_t at) {
        check(at, sizeof(T));
        T v;
        std::memcpy(&v, data_.data() + at, sizeof(T));
        pos_ = at + sizeof(T);
        return v;
    }

    template <typename T>
    std::vector<T> read_slice(size_t at, size_t n) {
        if (n > data_.size() / sizeof(T))
            throw OutOfBounds(at, n * sizeof(T), data_.size());
        check(at, n * sizeof(T));
        std::vector<T> out(n);
        if (n > 0)
            std::memcpy(out.data(), data_.data() + at, n * sizeof(T));
        pos_ = at + n * sizeof(T);
        return out;
    }
};

// --- Write helpers (throw on failure) ---

inline void write_u8(std::ostream& w, uint8_t v) {
    if (!w.write(reinterpret_cast<const char*>(&v), 1))
        throw std::runtime_error("binutil: failed to write u8");
}

inline void write_u16(std::ostream& w, uint16_t v) {
    if (!w.write(reinterpret_cast<const char*>(&v), 2))
        throw std::runtime_error("binutil: failed to write u16");
}

inline void write_u32(std::ostream& w, uint32_t v) {
    if (!w.write(reinterpret_cast<const char*>(&v), 4))
        throw std::runtime_error("binutil: failed to write u32");
}

inline void write_f32(std::ostream& w, float v) {
    if (!w.write(reinterpret_cast<const char*>(&v), 4))
        throw std::runtime_error("binutil: failed to write f32");
}

// write_fixed_string writes s truncated or NUL-padded to exactly size bytes.
inline void write_fixed_string(std::ostream& w, const std::string& s, size_t size) {
    std::string buf(size, '\0');
    std::memcpy(buf.data(), s.data(), std::min(s.size(), size));
    if (!w.write(buf.data(), static_cast<std::streamsize>(size)))
        throw std::runtime_error("binutil: failed to write fixed string");
}

} // namespace lgtools::binutil
