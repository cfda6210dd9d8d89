#pragma once

/// @file reader.hpp
/// @brief Binary reader shared by the decoder and the interpreter

#include <seedbed/wasm/types.hpp>

#include <bit>
#include <cstring>
#include <span>
#include <string>
#include <type_traits>

namespace seedbed_wasm::detail {

/// @brief Cursor over a WASM byte stream
///
/// Every read is bounds checked and throws WasmException(InvalidModule) on
/// truncated or overlong input.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> bytes, std::size_t pos = 0)
        : bytes_(bytes), pos_(pos) {}

    [[nodiscard]] bool at_end() const { return pos_ >= bytes_.size(); }
    [[nodiscard]] std::size_t position() const { return pos_; }
    [[nodiscard]] std::size_t size() const { return bytes_.size(); }
    [[nodiscard]] std::size_t remaining() const { return bytes_.size() - pos_; }

    void seek(std::size_t pos) { pos_ = pos; }

    std::uint8_t read_byte() {
        if (pos_ >= bytes_.size()) {
            throw WasmException(WasmError::InvalidModule, "unexpected end of input");
        }
        return bytes_[pos_++];
    }

    [[nodiscard]] std::uint8_t peek_byte() const {
        if (pos_ >= bytes_.size()) {
            throw WasmException(WasmError::InvalidModule, "unexpected end of input");
        }
        return bytes_[pos_];
    }

    std::uint32_t read_u32() { return read_unsigned<std::uint32_t>(5); }
    std::int32_t read_i32() { return read_signed<std::int32_t>(5); }
    std::int64_t read_i64() { return read_signed<std::int64_t>(10); }

    /// Signed 33-bit block type index, widened
    std::int64_t read_s33() { return read_signed<std::int64_t>(5); }

    float read_f32() {
        auto raw = read_fixed<std::uint32_t>();
        return std::bit_cast<float>(raw);
    }

    double read_f64() {
        auto raw = read_fixed<std::uint64_t>();
        return std::bit_cast<double>(raw);
    }

    std::span<const std::uint8_t> read_bytes(std::size_t count) {
        if (count > remaining()) {
            throw WasmException(WasmError::InvalidModule, "length out of bounds");
        }
        auto out = bytes_.subspan(pos_, count);
        pos_ += count;
        return out;
    }

    std::string read_name() {
        auto len = read_u32();
        auto raw = read_bytes(len);
        return std::string(reinterpret_cast<const char*>(raw.data()), raw.size());
    }

private:
    template <typename T>
    T read_unsigned(std::size_t max_bytes) {
        T result = 0;
        unsigned shift = 0;
        for (std::size_t i = 0;; ++i) {
            if (i >= max_bytes) {
                throw WasmException(WasmError::InvalidModule, "integer representation too long");
            }
            std::uint8_t byte = read_byte();
            result |= static_cast<T>(byte & 0x7F) << shift;
            shift += 7;
            if ((byte & 0x80) == 0) break;
        }
        return result;
    }

    template <typename T>
    T read_signed(std::size_t max_bytes) {
        using U = std::make_unsigned_t<T>;
        U result = 0;
        unsigned shift = 0;
        std::uint8_t byte = 0;
        for (std::size_t i = 0;; ++i) {
            if (i >= max_bytes) {
                throw WasmException(WasmError::InvalidModule, "integer representation too long");
            }
            byte = read_byte();
            result |= static_cast<U>(byte & 0x7F) << shift;
            shift += 7;
            if ((byte & 0x80) == 0) break;
        }
        if (shift < sizeof(T) * 8 && (byte & 0x40)) {
            result |= ~U{0} << shift;
        }
        return static_cast<T>(result);
    }

    template <typename T>
    T read_fixed() {
        auto raw = read_bytes(sizeof(T));
        T value{};
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            value |= static_cast<T>(raw[i]) << (8 * i);
        }
        return value;
    }

    std::span<const std::uint8_t> bytes_;
    std::size_t pos_ = 0;
};

} // namespace seedbed_wasm::detail
