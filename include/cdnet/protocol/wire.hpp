#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace cdnet::protocol {

/// Part type codes, from collectd's src/network.h.
enum class PartType : uint16_t {
    Host = 0x0000,
    Time = 0x0001,
    Plugin = 0x0002,
    PluginInstance = 0x0003,
    Type = 0x0004,
    TypeInstance = 0x0005,
    Values = 0x0006,
    Interval = 0x0007,
    TimeHR = 0x0008,
    IntervalHR = 0x0009,
    Message = 0x0100,
    Severity = 0x0101,
    Signature = 0x0200,
    Encryption = 0x0210,
};

/// type(u16) + length(u16), both big-endian.
inline constexpr size_t kPartHeaderSize = 4;

/// Header plus at least one payload byte.
inline constexpr size_t kMinPartLength = kPartHeaderSize + 1;

[[nodiscard]] inline uint16_t load_be16(const uint8_t *p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

[[nodiscard]] inline uint64_t load_be64(const uint8_t *p) {
    uint64_t v = 0;
    for (size_t i = 0; i < 8; ++i) {
        v = (v << 8) | p[i];
    }
    return v;
}

[[nodiscard]] inline uint64_t load_le64(const uint8_t *p) {
    uint64_t v = 0;
    for (size_t i = 8; i > 0; --i) {
        v = (v << 8) | p[i - 1];
    }
    return v;
}

/// Forward-only cursor over an immutable byte span.
/// Every read checks the remaining length before touching memory; a failed
/// read leaves the cursor where it was.
class ByteReader {
  public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    [[nodiscard]] size_t remaining() const { return data_.size() - offset_; }
    [[nodiscard]] size_t offset() const { return offset_; }
    [[nodiscard]] bool empty() const { return remaining() == 0; }

    bool read_u16(uint16_t &out) {
        if (remaining() < sizeof(uint16_t)) {
            return false;
        }
        out = load_be16(data_.data() + offset_);
        offset_ += sizeof(uint16_t);
        return true;
    }

    /// Slice the next n bytes without copying.
    bool take(size_t n, std::span<const uint8_t> &out) {
        if (remaining() < n) {
            return false;
        }
        out = data_.subspan(offset_, n);
        offset_ += n;
        return true;
    }

  private:
    std::span<const uint8_t> data_;
    size_t offset_ = 0;
};

/// Decode a numeric part payload: exactly 8 bytes, big-endian.
bool decode_u64(std::span<const uint8_t> payload, uint64_t &out);

/// Decode a string part payload. The final byte must be NUL; everything
/// before it is taken verbatim.
bool decode_string(std::span<const uint8_t> payload, std::string &out);

} // namespace cdnet::protocol
