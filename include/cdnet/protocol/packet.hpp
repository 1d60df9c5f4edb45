#pragma once

#include "cdnet/protocol/cdtime.hpp"
#include "cdnet/protocol/error.hpp"
#include "cdnet/protocol/values.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace cdnet::data {
class DiagnosticLog;
}

namespace cdnet::protocol {

/// Identifies the metric a values part belongs to.
struct MetricIdentity {
    std::string host;
    std::string plugin;
    std::string plugin_instance;
    std::string type;
    std::string type_instance;

    /// "host/plugin[-plugin_instance]/type[-type_instance]"
    [[nodiscard]] std::string format_name() const;

    bool operator==(const MetricIdentity &) const = default;
};

/// One decoded value list: a snapshot of the running identity and timing
/// state, paired with the values of a single values part.
struct MetricSample {
    MetricIdentity identity;
    Duration interval{};
    Timestamp timestamp{};
    std::vector<Value> values;

    bool operator==(const MetricSample &) const = default;
};

struct DecodeResult {
    std::vector<MetricSample> samples;
    std::optional<DecodeError> error;
    size_t error_offset = 0; // start of the failing part

    [[nodiscard]] bool ok() const { return !error.has_value(); }
};

/// Decode a collectd network packet.
///
/// Parts are consumed in order. Identity, interval and time parts update a
/// running state local to this call; each values part emits a MetricSample
/// carrying a copy of that state. Unknown part types are skipped and noted
/// in the log.
///
/// Decoding stops at the first malformed part. The result then holds the
/// samples decoded before it together with the error.
DecodeResult decode_packet(std::span<const uint8_t> bytes, data::DiagnosticLog *log = nullptr);

} // namespace cdnet::protocol
