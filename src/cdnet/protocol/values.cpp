#include "cdnet/protocol/values.hpp"
#include "cdnet/protocol/wire.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cctype>
#include <string>
#include <utility>

namespace cdnet::protocol {

namespace {

struct KindEntry {
    ValueKind kind;
    std::string_view name;
};

constexpr std::array<KindEntry, 4> kKinds{{
    {ValueKind::Counter, "counter"},
    {ValueKind::Gauge, "gauge"},
    {ValueKind::Derive, "derive"},
    {ValueKind::Absolute, "absolute"},
}};

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

std::string_view value_kind_name(ValueKind kind) {
    for (const auto &entry : kKinds) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<ValueKind> value_kind_from_name(std::string_view name) {
    for (const auto &entry : kKinds) {
        if (iequals(entry.name, name)) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

std::optional<ValueKind> value_kind_from_tag(uint8_t tag) {
    for (const auto &entry : kKinds) {
        if (value_kind_tag(entry.kind) == tag) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

double Value::as_double() const {
    if (const auto *i = std::get_if<int64_t>(&payload)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(payload);
}

std::optional<DecodeError> decode_values(std::span<const uint8_t> payload,
                                         std::vector<Value> &out) {
    out.clear();

    ByteReader reader(payload);
    uint16_t count = 0;
    if (!reader.read_u16(count)) {
        return DecodeError{ErrorKind::InvalidPacket, "values part shorter than its count field"};
    }

    const size_t expected = static_cast<size_t>(count) * kValueEntrySize;
    if (reader.remaining() != expected) {
        return DecodeError{ErrorKind::InvalidPacket,
                           "values length mismatch: " + std::to_string(count) + " values need " +
                               std::to_string(expected) + " bytes, got " +
                               std::to_string(reader.remaining())};
    }

    const auto tags = payload.subspan(reader.offset(), count);
    const auto slots = payload.subspan(reader.offset() + count);

    std::vector<Value> values;
    values.reserve(count);
    for (size_t i = 0; i < tags.size(); ++i) {
        const uint8_t *slot = slots.data() + i * 8;
        const auto kind = value_kind_from_tag(tags[i]);
        if (!kind) {
            return DecodeError{ErrorKind::UnknownValueType,
                               "unknown value type " + std::to_string(tags[i]) + " at index " +
                                   std::to_string(i)};
        }

        switch (*kind) {
        case ValueKind::Gauge:
            // The one little-endian field in the protocol.
            values.push_back(Value::gauge(std::bit_cast<double>(load_le64(slot))));
            break;
        case ValueKind::Counter:
            values.push_back(Value::counter(std::bit_cast<int64_t>(load_be64(slot))));
            break;
        case ValueKind::Derive:
            values.push_back(Value::derive(std::bit_cast<int64_t>(load_be64(slot))));
            break;
        case ValueKind::Absolute:
            return DecodeError{ErrorKind::UnsupportedValueType,
                               "absolute values are not supported (index " + std::to_string(i) +
                                   ")"};
        }
    }

    out = std::move(values);
    return std::nullopt;
}

} // namespace cdnet::protocol
