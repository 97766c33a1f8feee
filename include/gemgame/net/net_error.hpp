// GemGame Net
// net_error.hpp - Transport failures

#pragma once

#include <stdexcept>
#include <string>

namespace gemgame::net {

enum class NetErrorKind {
    ConnectionFault,   // Could not connect, or the transport failed
    MalformedPayload,  // A packet did not decode to a message
    PeerClosed         // The other side disconnected
};

[[nodiscard]] inline const char* net_error_kind_to_string(NetErrorKind kind) {
    switch (kind) {
        case NetErrorKind::ConnectionFault:
            return "connection fault";
        case NetErrorKind::MalformedPayload:
            return "malformed payload";
        case NetErrorKind::PeerClosed:
            return "peer closed";
    }
    return "unknown";
}

class NetworkError : public std::runtime_error {
public:
    NetworkError(NetErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(net_error_kind_to_string(kind)) + ": " + message), kind_(kind) {}

    [[nodiscard]] NetErrorKind kind() const { return kind_; }

private:
    NetErrorKind kind_;
};

}  // namespace gemgame::net
