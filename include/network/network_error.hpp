#ifndef STUBCAS_NETWORK_ERROR_HPP
#define STUBCAS_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace stubcas {
namespace network {

// Malformed frame or payload, or a broken stream underneath the codec
class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace network
} // namespace stubcas

#endif // STUBCAS_NETWORK_ERROR_HPP
