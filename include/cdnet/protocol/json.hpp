#pragma once

#include "cdnet/protocol/error.hpp"
#include "cdnet/protocol/packet.hpp"
#include "cdnet/protocol/values.hpp"

#include <nlohmann/json.hpp>

namespace cdnet::protocol {

/// JSON views of decoded data, found by nlohmann::json through ADL.
/// Durations and timestamps render as (fractional) seconds.
void to_json(nlohmann::json &j, const Value &value);
void to_json(nlohmann::json &j, const MetricIdentity &identity);
void to_json(nlohmann::json &j, const MetricSample &sample);
void to_json(nlohmann::json &j, const DecodeError &error);

/// {"samples": [...], "error": {...}} with "error" omitted on success.
nlohmann::json result_to_json(const DecodeResult &result);

} // namespace cdnet::protocol
