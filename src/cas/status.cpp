#include "cas/status.hpp"

namespace stubcas {
namespace cas {

const char* to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK: return "OK";
        case StatusCode::CANCELLED: return "CANCELLED";
        case StatusCode::UNKNOWN: return "UNKNOWN";
        case StatusCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case StatusCode::DEADLINE_EXCEEDED: return "DEADLINE_EXCEEDED";
        case StatusCode::NOT_FOUND: return "NOT_FOUND";
        case StatusCode::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case StatusCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case StatusCode::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
        case StatusCode::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
        case StatusCode::ABORTED: return "ABORTED";
        case StatusCode::OUT_OF_RANGE: return "OUT_OF_RANGE";
        case StatusCode::UNIMPLEMENTED: return "UNIMPLEMENTED";
        case StatusCode::INTERNAL: return "INTERNAL";
        case StatusCode::UNAVAILABLE: return "UNAVAILABLE";
        case StatusCode::DATA_LOSS: return "DATA_LOSS";
        case StatusCode::UNAUTHENTICATED: return "UNAUTHENTICATED";
        default: return "UNRECOGNIZED";
    }
}

std::ostream& operator<<(std::ostream& os, StatusCode code) {
    return os << to_string(code);
}

StatusCode status_code_from_wire(uint32_t value) {
    if (value > static_cast<uint32_t>(StatusCode::UNAUTHENTICATED)) {
        return StatusCode::UNKNOWN;
    }
    return static_cast<StatusCode>(value);
}

} // namespace cas
} // namespace stubcas
