#include "cdnet/protocol/json.hpp"

#include <chrono>
#include <string>

namespace cdnet::protocol {

namespace {

[[nodiscard]] double to_seconds(Duration d) {
    return std::chrono::duration_cast<std::chrono::duration<double>>(d).count();
}

} // namespace

void to_json(nlohmann::json &j, const Value &value) {
    j = nlohmann::json{{"kind", std::string(value_kind_name(value.kind))}};
    if (const auto *i = std::get_if<int64_t>(&value.payload)) {
        j["value"] = *i;
    } else {
        j["value"] = std::get<double>(value.payload);
    }
}

void to_json(nlohmann::json &j, const MetricIdentity &identity) {
    j = nlohmann::json{
        {"name", identity.format_name()},
        {"host", identity.host},
        {"plugin", identity.plugin},
        {"plugin_instance", identity.plugin_instance},
        {"type", identity.type},
        {"type_instance", identity.type_instance},
    };
}

void to_json(nlohmann::json &j, const MetricSample &sample) {
    j = nlohmann::json{
        {"identity", sample.identity},
        {"interval", to_seconds(sample.interval)},
        {"time", to_seconds(sample.timestamp.time_since_epoch())},
        {"values", sample.values},
    };
}

void to_json(nlohmann::json &j, const DecodeError &error) {
    j = nlohmann::json{
        {"kind", std::string(error_kind_name(error.kind))},
        {"message", error.message},
    };
}

nlohmann::json result_to_json(const DecodeResult &result) {
    nlohmann::json j;
    j["samples"] = result.samples;
    if (result.error) {
        j["error"] = *result.error;
        j["error"]["offset"] = result.error_offset;
    }
    return j;
}

} // namespace cdnet::protocol
