/// @file memory.cpp
/// @brief WasmMemory implementation

#include <seedbed/wasm/memory.hpp>

#include <algorithm>
#include <string>

namespace seedbed_wasm {

WasmMemory::WasmMemory(std::size_t initial_pages, std::size_t max_pages)
    : bytes_(initial_pages * page_size, 0)
    , max_pages_(max_pages) {}

WasmResult<std::size_t> WasmMemory::grow(std::size_t delta_pages) {
    const std::size_t before = pages();
    if (delta_pages > max_pages_ || before > max_pages_ - delta_pages) {
        return seedbed_core::Error(seedbed_core::ErrorCode::OutOfMemory,
                                   "memory.grow by " + std::to_string(delta_pages) + " pages exceeds the limit of " +
                                       std::to_string(max_pages_));
    }
    bytes_.resize((before + delta_pages) * page_size, 0);
    return before;
}

std::uint8_t* WasmMemory::at(std::size_t offset, std::size_t length, const char* access) {
    if (!check_bounds(offset, length)) {
        throw WasmException(WasmError::OutOfBounds, std::string(access) + " of " + std::to_string(length) +
                                                        " bytes at " + std::to_string(offset) + " exceeds " +
                                                        std::to_string(bytes_.size()));
    }
    return bytes_.data() + offset;
}

const std::uint8_t* WasmMemory::at(std::size_t offset, std::size_t length, const char* access) const {
    return const_cast<WasmMemory*>(this)->at(offset, length, access);
}

void WasmMemory::write_bytes(std::size_t offset, std::span<const std::uint8_t> source) {
    auto* dest = at(offset, source.size(), "data copy");
    std::copy(source.begin(), source.end(), dest);
}

void WasmMemory::fill(std::size_t offset, std::uint8_t value, std::size_t count) {
    auto* dest = at(offset, count, "memory.fill");
    std::fill_n(dest, count, value);
}

void WasmMemory::copy_within(std::size_t dest, std::size_t src, std::size_t count) {
    auto* to = at(dest, count, "memory.copy");
    const auto* from = at(src, count, "memory.copy");
    std::memmove(to, from, count);
}

} // namespace seedbed_wasm
