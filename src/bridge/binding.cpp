/// @file binding.cpp
/// @brief Memory binding codec and layout table

#include <seedbed/bridge/binding.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <bit>
#include <charconv>

namespace seedbed_bridge {

using seedbed_core::BindingError;
using seedbed_core::Error;
using seedbed_core::Ok;
using seedbed_core::Result;
using seedbed_core::StoreError;
using seedbed_state::Value;

namespace {

std::uint64_t read_le(std::span<const std::uint8_t> bytes) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        value |= static_cast<std::uint64_t>(bytes[i]) << (8 * i);
    }
    return value;
}

void write_le(std::span<std::uint8_t> out, std::uint64_t value) {
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<std::uint8_t>(value >> (8 * i));
    }
}

bool is_valid_width(std::size_t width) {
    return width == 1 || width == 2 || width == 4 || width == 8;
}

} // namespace

const char* encoding_name(Encoding encoding) {
    switch (encoding) {
        case Encoding::UnsignedLE: return "unsigned";
        case Encoding::SignedLE: return "signed";
        case Encoding::FloatLE: return "float";
        case Encoding::Bool: return "bool";
        case Encoding::Custom: return "custom";
    }
    return "unknown";
}

// =============================================================================
// MemoryBinding
// =============================================================================

std::string MemoryBinding::type_name() const {
    switch (encoding) {
        case Encoding::UnsignedLE: return "u" + std::to_string(width * 8);
        case Encoding::SignedLE: return "i" + std::to_string(width * 8);
        case Encoding::FloatLE: return "f" + std::to_string(width * 8);
        case Encoding::Bool: return "bool";
        case Encoding::Custom: return "custom";
    }
    return "unknown";
}

Result<void> MemoryBinding::validate_shape() const {
    if (key.empty()) {
        return Error(BindingError::invalid_layout("binding key must not be empty"));
    }
    if (!is_valid_width(width)) {
        return Error(BindingError::invalid_width(key, width));
    }
    if (encoding == Encoding::FloatLE && width != 4 && width != 8) {
        return Error(BindingError::encoding_mismatch(key, encoding_name(encoding), width));
    }
    if (encoding == Encoding::Custom && !codec) {
        return Error(BindingError::invalid_layout("custom binding '" + key + "' has no codec"));
    }
    return Ok();
}

Result<Value> MemoryBinding::decode(std::span<const std::uint8_t> memory) const {
    if (end() > memory.size()) {
        return Error(BindingError::out_of_bounds(key, offset, width, memory.size()));
    }
    auto bytes = memory.subspan(offset, width);

    switch (encoding) {
        case Encoding::UnsignedLE:
            // u64 values above INT64_MAX wrap to negative Ints
            return Value(static_cast<std::int64_t>(read_le(bytes)));
        case Encoding::SignedLE: {
            std::uint64_t raw = read_le(bytes);
            const unsigned shift = static_cast<unsigned>(64 - 8 * width);
            return Value(static_cast<std::int64_t>(raw << shift) >> shift);
        }
        case Encoding::FloatLE:
            if (width == 4) {
                return Value(static_cast<double>(std::bit_cast<float>(static_cast<std::uint32_t>(read_le(bytes)))));
            }
            return Value(std::bit_cast<double>(read_le(bytes)));
        case Encoding::Bool:
            return Value(std::any_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b != 0; }));
        case Encoding::Custom:
            if (!codec) {
                return Error(BindingError::invalid_layout("custom binding '" + key + "' has no codec"));
            }
            return codec->decode(bytes);
    }
    return Error(BindingError::invalid_layout("unknown encoding for '" + key + "'"));
}

Result<void> MemoryBinding::encode(const Value& value, std::span<std::uint8_t> memory) const {
    if (end() > memory.size()) {
        return Error(BindingError::out_of_bounds(key, offset, width, memory.size()));
    }
    if (value.is_null()) {
        return Ok();
    }
    auto out = memory.subspan(offset, width);
    const unsigned bits = static_cast<unsigned>(width * 8);

    switch (encoding) {
        case Encoding::UnsignedLE:
        case Encoding::SignedLE: {
            auto v = value.try_int();
            if (!v) {
                return Error(StoreError::type_mismatch(key, "Int", value.type_name()));
            }
            if (bits < 64) {
                bool fits = encoding == Encoding::UnsignedLE
                    ? (*v >= 0 && (static_cast<std::uint64_t>(*v) >> bits) == 0)
                    : (*v >= -(std::int64_t{1} << (bits - 1)) && *v < (std::int64_t{1} << (bits - 1)));
                if (!fits) {
                    return Error(StoreError::limit_exceeded(key, std::to_string(*v) + " does not fit " + type_name()));
                }
            }
            write_le(out, static_cast<std::uint64_t>(*v));
            return Ok();
        }
        case Encoding::FloatLE: {
            if (!value.is_numeric()) {
                return Error(StoreError::type_mismatch(key, "Float", value.type_name()));
            }
            double d = value.as_numeric();
            if (width == 4) {
                write_le(out, std::bit_cast<std::uint32_t>(static_cast<float>(d)));
            } else {
                write_le(out, std::bit_cast<std::uint64_t>(d));
            }
            return Ok();
        }
        case Encoding::Bool: {
            auto b = value.try_bool();
            if (!b) {
                return Error(StoreError::type_mismatch(key, "Bool", value.type_name()));
            }
            write_le(out, *b ? 1 : 0);
            return Ok();
        }
        case Encoding::Custom:
            if (!codec) {
                return Error(BindingError::invalid_layout("custom binding '" + key + "' has no codec"));
            }
            return codec->encode(value, out);
    }
    return Error(BindingError::invalid_layout("unknown encoding for '" + key + "'"));
}

Result<MemoryBinding> make_binding(const std::string& key, std::size_t offset, std::string_view type,
                                   std::optional<std::size_t> width) {
    MemoryBinding binding;
    binding.key = key;
    binding.offset = offset;

    if (type == "bool") {
        binding.encoding = Encoding::Bool;
        binding.width = width.value_or(1);
    } else if (type.size() >= 2 && (type[0] == 'u' || type[0] == 'i' || type[0] == 'f')) {
        unsigned bits = 0;
        auto digits = type.substr(1);
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), bits);
        if (ec != std::errc{} || ptr != digits.data() + digits.size() || bits % 8 != 0) {
            return Error(BindingError::invalid_layout("unknown binding type '" + std::string(type) + "' for '" + key + "'"));
        }
        binding.encoding = type[0] == 'u' ? Encoding::UnsignedLE
                         : type[0] == 'i' ? Encoding::SignedLE
                                          : Encoding::FloatLE;
        binding.width = bits / 8;
        if (width && *width != binding.width) {
            return Error(BindingError::encoding_mismatch(key, std::string(type), *width));
        }
    } else {
        return Error(BindingError::invalid_layout("unknown binding type '" + std::string(type) + "' for '" + key + "'"));
    }

    auto shape = binding.validate_shape();
    if (!shape) {
        return shape.error();
    }
    return binding;
}

// =============================================================================
// LayoutTable
// =============================================================================

Result<LayoutTable> LayoutTable::from_json(const nlohmann::json& json) {
    const nlohmann::json* entries = &json;
    if (json.is_object()) {
        if (!json.contains("bindings")) {
            return Error(BindingError::invalid_layout("layout object has no 'bindings' array"));
        }
        entries = &json["bindings"];
    }
    if (!entries->is_array()) {
        return Error(BindingError::invalid_layout("'bindings' must be an array"));
    }

    LayoutTable table;
    for (const auto& entry : *entries) {
        if (!entry.is_object()) {
            return Error(BindingError::invalid_layout("binding entries must be objects"));
        }
        if (!entry.contains("key") || !entry["key"].is_string()) {
            return Error(BindingError::invalid_layout("binding entry needs a string 'key'"));
        }
        const std::string key = entry["key"].get<std::string>();

        if (!entry.contains("offset") || !entry["offset"].is_number_unsigned()) {
            return Error(BindingError::invalid_layout("binding '" + key + "' needs a non-negative 'offset'"));
        }
        const auto offset = entry["offset"].get<std::uint64_t>();

        const char* type_field = entry.contains("type") ? "type" : "encoding";
        if (!entry.contains(type_field) || !entry[type_field].is_string()) {
            return Error(BindingError::invalid_layout("binding '" + key + "' needs a 'type'"));
        }

        std::optional<std::size_t> width;
        if (entry.contains("width")) {
            if (!entry["width"].is_number_unsigned()) {
                return Error(BindingError::invalid_layout("binding '" + key + "' has an invalid 'width'"));
            }
            width = entry["width"].get<std::size_t>();
        }

        auto binding = make_binding(key, static_cast<std::size_t>(offset), entry[type_field].get<std::string>(), width);
        if (!binding) {
            return binding.error();
        }
        auto added = table.add(std::move(*binding));
        if (!added) {
            return added.error();
        }
    }
    return table;
}

Result<LayoutTable> LayoutTable::parse(std::string_view text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Error(BindingError::invalid_layout("layout JSON parse error: " + std::string(e.what())));
    }
    return from_json(j);
}

Result<void> LayoutTable::add(MemoryBinding binding) {
    if (find(binding.key)) {
        return Error(BindingError::duplicate_key(binding.key));
    }
    m_bindings.push_back(std::move(binding));
    return Ok();
}

Result<void> LayoutTable::merge(const LayoutTable& other) {
    for (const auto& binding : other.m_bindings) {
        auto added = add(binding);
        if (!added) {
            return added;
        }
    }
    return Ok();
}

Result<void> LayoutTable::validate(std::size_t memory_size) const {
    for (const auto& binding : m_bindings) {
        auto shape = binding.validate_shape();
        if (!shape) {
            return shape;
        }
        if (binding.end() > memory_size || binding.end() < binding.offset) {
            return Error(BindingError::out_of_bounds(binding.key, binding.offset, binding.width, memory_size));
        }
    }

    std::vector<const MemoryBinding*> sorted;
    sorted.reserve(m_bindings.size());
    for (const auto& binding : m_bindings) {
        sorted.push_back(&binding);
    }
    std::sort(sorted.begin(), sorted.end(), [](const MemoryBinding* a, const MemoryBinding* b) {
        return a->offset < b->offset;
    });
    for (std::size_t i = 1; i < sorted.size(); ++i) {
        if (sorted[i - 1]->overlaps(*sorted[i])) {
            return Error(BindingError::overlap(sorted[i]->key, sorted[i - 1]->key, sorted[i]->offset));
        }
    }
    return Ok();
}

const MemoryBinding* LayoutTable::find(const std::string& key) const {
    auto it = std::find_if(m_bindings.begin(), m_bindings.end(),
                           [&](const MemoryBinding& b) { return b.key == key; });
    return it != m_bindings.end() ? &*it : nullptr;
}

nlohmann::json LayoutTable::to_json() const {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& binding : m_bindings) {
        nlohmann::json entry;
        entry["key"] = binding.key;
        entry["offset"] = binding.offset;
        entry["type"] = binding.type_name();
        entry["width"] = binding.width;
        entries.push_back(std::move(entry));
    }
    return nlohmann::json{{"bindings", std::move(entries)}};
}

} // namespace seedbed_bridge
