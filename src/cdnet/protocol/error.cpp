#include "cdnet/protocol/error.hpp"

namespace cdnet {

std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidPacket:
        return "invalid packet";
    case ErrorKind::UnsupportedValueType:
        return "unsupported value type";
    case ErrorKind::UnknownValueType:
        return "unknown value type";
    case ErrorKind::UnknownDataSourceKind:
        return "unknown data source type";
    case ErrorKind::MalformedSchemaLine:
        return "malformed types.db line";
    case ErrorKind::Io:
        return "i/o error";
    }
    return "unknown error";
}

} // namespace cdnet
