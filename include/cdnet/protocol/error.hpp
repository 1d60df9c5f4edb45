#pragma once

#include <string>
#include <string_view>

namespace cdnet {

/// Failure categories shared by the packet decoder and the types.db parser.
enum class ErrorKind {
    InvalidPacket,
    UnsupportedValueType,
    UnknownValueType,
    UnknownDataSourceKind,
    MalformedSchemaLine,
    Io,
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

namespace protocol {

/// Describes the part that stopped a decode.
struct DecodeError {
    ErrorKind kind = ErrorKind::InvalidPacket;
    std::string message;
};

} // namespace protocol

} // namespace cdnet
