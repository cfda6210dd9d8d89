#pragma once

/// @file memory.hpp
/// @brief Linear memory for seedbed_wasm instances

#include "types.hpp"

#include <cstring>
#include <span>
#include <vector>

namespace seedbed_wasm {

/// Zero-initialised byte array sized in 64 KiB pages.
///
/// Typed access throws WasmException(OutOfBounds), which the interpreter
/// reports as a trap. Host code can test a range with check_bounds first.
class WasmMemory {
public:
    static constexpr std::size_t page_size = 65536;

    WasmMemory(std::size_t initial_pages, std::size_t max_pages);

    [[nodiscard]] std::uint8_t* data() { return bytes_.data(); }
    [[nodiscard]] const std::uint8_t* data() const { return bytes_.data(); }
    [[nodiscard]] std::size_t size() const { return bytes_.size(); }
    [[nodiscard]] std::size_t pages() const { return bytes_.size() / page_size; }
    [[nodiscard]] std::size_t max_pages() const { return max_pages_; }

    [[nodiscard]] std::span<std::uint8_t> bytes() { return bytes_; }
    [[nodiscard]] std::span<const std::uint8_t> bytes() const { return bytes_; }

    /// Append zeroed pages, returning the page count before growth
    WasmResult<std::size_t> grow(std::size_t delta_pages);

    [[nodiscard]] bool check_bounds(std::size_t offset, std::size_t length) const {
        return offset <= bytes_.size() && length <= bytes_.size() - offset;
    }

    template <typename T>
    [[nodiscard]] T read(std::size_t offset) const {
        T value;
        std::memcpy(&value, at(offset, sizeof(T), "load"), sizeof(T));
        return value;
    }

    template <typename T>
    void write(std::size_t offset, T value) {
        std::memcpy(at(offset, sizeof(T), "store"), &value, sizeof(T));
    }

    void write_bytes(std::size_t offset, std::span<const std::uint8_t> source);
    void fill(std::size_t offset, std::uint8_t value, std::size_t count);
    void copy_within(std::size_t dest, std::size_t src, std::size_t count);

private:
    /// Pointer to [offset, offset + length), throws when the range leaves memory
    std::uint8_t* at(std::size_t offset, std::size_t length, const char* access);
    const std::uint8_t* at(std::size_t offset, std::size_t length, const char* access) const;

    std::vector<std::uint8_t> bytes_;
    std::size_t max_pages_;
};

} // namespace seedbed_wasm
