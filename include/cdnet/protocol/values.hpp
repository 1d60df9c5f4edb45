#pragma once

#include "cdnet/protocol/error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace cdnet::protocol {

/// Data source kinds. The enumerator values are the wire tags.
enum class ValueKind : uint8_t {
    Counter = 0,
    Gauge = 1,
    Derive = 2,
    Absolute = 3,
};

/// Lowercase keyword for a kind ("counter", "gauge", ...).
[[nodiscard]] std::string_view value_kind_name(ValueKind kind);

/// Inverse of value_kind_name. Matching is case-insensitive.
[[nodiscard]] std::optional<ValueKind> value_kind_from_name(std::string_view name);

[[nodiscard]] constexpr uint8_t value_kind_tag(ValueKind kind) {
    return static_cast<uint8_t>(kind);
}

/// Inverse of value_kind_tag. Returns nullopt for tags outside the vocabulary.
[[nodiscard]] std::optional<ValueKind> value_kind_from_tag(uint8_t tag);

/// One decoded data source value.
/// Gauges hold a double; counters and derives hold a signed 64-bit integer.
struct Value {
    ValueKind kind = ValueKind::Gauge;
    std::variant<double, int64_t> payload{0.0};

    static Value gauge(double v) { return Value{ValueKind::Gauge, v}; }
    static Value counter(int64_t v) { return Value{ValueKind::Counter, v}; }
    static Value derive(int64_t v) { return Value{ValueKind::Derive, v}; }

    [[nodiscard]] bool is_integer() const { return std::holds_alternative<int64_t>(payload); }

    /// Payload widened to double, whatever the kind.
    [[nodiscard]] double as_double() const;

    bool operator==(const Value &) const = default;
};

/// Fixed per-value cost of a values part: one tag byte plus an 8-byte slot.
inline constexpr size_t kValueEntrySize = 1 + 8;

/// Decode the payload of a values part.
/// Layout: count(u16 BE), count tag bytes, then count 8-byte slots in tag
/// order. Gauge slots are little-endian doubles; counter and derive slots
/// are big-endian int64.
/// Returns nullopt on success. On failure out is left empty.
std::optional<DecodeError> decode_values(std::span<const uint8_t> payload,
                                         std::vector<Value> &out);

} // namespace cdnet::protocol
