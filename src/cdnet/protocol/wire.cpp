#include "cdnet/protocol/wire.hpp"

namespace cdnet::protocol {

bool decode_u64(std::span<const uint8_t> payload, uint64_t &out) {
    if (payload.size() != sizeof(uint64_t)) {
        return false;
    }
    out = load_be64(payload.data());
    return true;
}

bool decode_string(std::span<const uint8_t> payload, std::string &out) {
    if (payload.empty() || payload.back() != 0) {
        return false;
    }
    out.assign(reinterpret_cast<const char *>(payload.data()), payload.size() - 1);
    return true;
}

} // namespace cdnet::protocol
