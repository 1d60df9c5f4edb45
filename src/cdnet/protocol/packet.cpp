#include "cdnet/protocol/packet.hpp"
#include "cdnet/data/diagnostics.hpp"
#include "cdnet/protocol/wire.hpp"

#include <cstdio>
#include <utility>

namespace cdnet::protocol {

namespace {

/// Running state threaded across parts of one packet.
struct DecodeState {
    MetricIdentity identity;
    Duration interval{};
    Timestamp timestamp{};
};

[[nodiscard]] std::string hex16(uint16_t v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%04x", v);
    return buf;
}

[[nodiscard]] const char *part_type_label(uint16_t type) {
    switch (static_cast<PartType>(type)) {
    case PartType::Message:
        return "message";
    case PartType::Severity:
        return "severity";
    case PartType::Signature:
        return "signature";
    case PartType::Encryption:
        return "encryption";
    default:
        return "unknown";
    }
}

[[nodiscard]] std::string *identity_slot(DecodeState &state, PartType type) {
    switch (type) {
    case PartType::Host:
        return &state.identity.host;
    case PartType::Plugin:
        return &state.identity.plugin;
    case PartType::PluginInstance:
        return &state.identity.plugin_instance;
    case PartType::Type:
        return &state.identity.type;
    case PartType::TypeInstance:
        return &state.identity.type_instance;
    default:
        return nullptr;
    }
}

/// Apply one numeric part (time or interval) to the running state.
std::optional<DecodeError> apply_time_part(DecodeState &state, PartType type,
                                           std::span<const uint8_t> payload) {
    uint64_t raw = 0;
    if (!decode_u64(payload, raw)) {
        return DecodeError{ErrorKind::InvalidPacket,
                           "numeric part must be 8 bytes, got " + std::to_string(payload.size())};
    }

    bool in_range = false;
    switch (type) {
    case PartType::Interval:
        in_range = seconds_to_duration(raw, state.interval);
        break;
    case PartType::IntervalHR:
        in_range = high_res_to_duration(raw, state.interval);
        break;
    case PartType::Time:
        in_range = seconds_to_timestamp(raw, state.timestamp);
        break;
    case PartType::TimeHR:
        in_range = high_res_to_timestamp(raw, state.timestamp);
        break;
    default:
        break;
    }

    if (!in_range) {
        return DecodeError{ErrorKind::InvalidPacket,
                           "time value " + std::to_string(raw) + " out of range"};
    }
    return std::nullopt;
}

} // namespace

std::string MetricIdentity::format_name() const {
    std::string name = host + "/" + plugin;
    if (!plugin_instance.empty()) {
        name += "-" + plugin_instance;
    }
    name += "/" + type;
    if (!type_instance.empty()) {
        name += "-" + type_instance;
    }
    return name;
}

DecodeResult decode_packet(std::span<const uint8_t> bytes, data::DiagnosticLog *log) {
    DecodeResult result;
    DecodeState state;
    ByteReader reader(bytes);

    auto fail = [&](size_t offset, DecodeError err) {
        if (log != nullptr) {
            log->error(std::string(error_kind_name(err.kind)) + ": " + err.message, offset);
        }
        result.error = std::move(err);
        result.error_offset = offset;
        return std::move(result);
    };

    while (!reader.empty()) {
        const size_t part_offset = reader.offset();

        uint16_t type = 0;
        uint16_t length = 0;
        if (!reader.read_u16(type) || !reader.read_u16(length)) {
            return fail(part_offset, {ErrorKind::InvalidPacket, "truncated part header"});
        }

        if (length < kMinPartLength || length - kPartHeaderSize > reader.remaining()) {
            return fail(part_offset, {ErrorKind::InvalidPacket,
                                      "invalid part length " + std::to_string(length) + " with " +
                                          std::to_string(reader.remaining()) + " bytes left"});
        }

        std::span<const uint8_t> payload;
        if (!reader.take(length - kPartHeaderSize, payload)) {
            return fail(part_offset, {ErrorKind::InvalidPacket, "short read of part payload"});
        }

        const auto part = static_cast<PartType>(type);
        switch (part) {
        case PartType::Host:
        case PartType::Plugin:
        case PartType::PluginInstance:
        case PartType::Type:
        case PartType::TypeInstance: {
            if (!decode_string(payload, *identity_slot(state, part))) {
                return fail(part_offset,
                            {ErrorKind::InvalidPacket, "string part is not NUL-terminated"});
            }
            break;
        }
        case PartType::Interval:
        case PartType::IntervalHR:
        case PartType::Time:
        case PartType::TimeHR:
            if (auto err = apply_time_part(state, part, payload)) {
                return fail(part_offset, std::move(*err));
            }
            break;
        case PartType::Values: {
            MetricSample sample{state.identity, state.interval, state.timestamp, {}};
            if (auto err = decode_values(payload, sample.values)) {
                return fail(part_offset, std::move(*err));
            }
            result.samples.push_back(std::move(sample));
            break;
        }
        default:
            if (log != nullptr) {
                log->info("ignoring " + std::string(part_type_label(type)) + " part of type " +
                              hex16(type) + " (" + std::to_string(payload.size()) + " bytes)",
                          part_offset);
            }
            break;
        }
    }

    return result;
}

} // namespace cdnet::protocol
