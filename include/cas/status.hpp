#ifndef STUBCAS_CAS_STATUS_HPP
#define STUBCAS_CAS_STATUS_HPP

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

namespace stubcas {
namespace cas {

// Canonical RPC status codes, numbered as gRPC numbers them
enum class StatusCode : uint32_t {
    OK = 0,
    CANCELLED = 1,
    UNKNOWN = 2,
    INVALID_ARGUMENT = 3,
    DEADLINE_EXCEEDED = 4,
    NOT_FOUND = 5,
    ALREADY_EXISTS = 6,
    PERMISSION_DENIED = 7,
    RESOURCE_EXHAUSTED = 8,
    FAILED_PRECONDITION = 9,
    ABORTED = 10,
    OUT_OF_RANGE = 11,
    UNIMPLEMENTED = 12,
    INTERNAL = 13,
    UNAVAILABLE = 14,
    DATA_LOSS = 15,
    UNAUTHENTICATED = 16
};

// Convert StatusCode to its canonical name for logging
const char* to_string(StatusCode code);
std::ostream& operator<<(std::ostream& os, StatusCode code);

// Maps a raw wire value back to a code, anything out of range becomes UNKNOWN
StatusCode status_code_from_wire(uint32_t value);

// Terminal outcome of a call
struct Status {
    StatusCode code{StatusCode::OK};
    std::string message;

    bool ok() const { return code == StatusCode::OK; }
};

// Thrown by the responder as the single terminal failure of an RPC
class RpcError : public std::runtime_error {
public:
    RpcError(StatusCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    StatusCode code() const { return code_; }
    Status status() const { return Status{code_, what()}; }

private:
    StatusCode code_;
};

} // namespace cas
} // namespace stubcas

#endif // STUBCAS_CAS_STATUS_HPP
