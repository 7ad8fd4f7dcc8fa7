#ifndef PEERDROP_NETWORK_ERROR_HPP
#define PEERDROP_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>
#include <type_traits>
#include <boost/system/error_code.hpp>

namespace peerdrop {
namespace network {

enum class NetworkError {
    SUCCESS = 0,
    CHANNEL_NOT_READY,
    KEY_FORMAT,
    PROBE_TIMEOUT,
    CONNECTION_DEGRADED,
    INVALID_STATE,
    INVALID_DESCRIPTION,
    TRANSPORT_FAILURE,
    CRYPTO_FAILURE,
    SEND_FAILED
};

inline const char* network_error_to_string(NetworkError error) {
    switch (error) {
        case NetworkError::SUCCESS: return "Success";
        case NetworkError::CHANNEL_NOT_READY: return "Channel not ready";
        case NetworkError::KEY_FORMAT: return "Malformed public key";
        case NetworkError::PROBE_TIMEOUT: return "Probe timeout";
        case NetworkError::CONNECTION_DEGRADED: return "Connection degraded";
        case NetworkError::INVALID_STATE: return "Invalid session state";
        case NetworkError::INVALID_DESCRIPTION: return "Malformed session description";
        case NetworkError::TRANSPORT_FAILURE: return "Transport failure";
        case NetworkError::CRYPTO_FAILURE: return "Crypto failure";
        case NetworkError::SEND_FAILED: return "Send failed";
        default: return "Undefined error";
    }
}

// Error category so NetworkError values travel as boost::system::error_code
const boost::system::error_category& network_category();

inline boost::system::error_code make_error_code(NetworkError error) {
    return boost::system::error_code(static_cast<int>(error), network_category());
}

// Thrown by transport implementations when an operation cannot be carried out
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error("Transport error: " + message) {}
};

} // namespace network
} // namespace peerdrop

namespace boost {
namespace system {

template <>
struct is_error_code_enum<peerdrop::network::NetworkError> : std::true_type {};

} // namespace system
} // namespace boost

#endif // PEERDROP_NETWORK_ERROR_HPP
