#ifndef URDASH_PROTOCOL_EXCEPTION_H
#define URDASH_PROTOCOL_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace urdash::protocol {

/**
 * @brief Raised for malformed command arguments or replies that cannot be interpreted.
 */
class ProtocolException : public std::runtime_error {
public:
    explicit ProtocolException(const std::string& message)
        : std::runtime_error("Protocol Error: " + message) {}
};

} // namespace urdash::protocol

#endif // URDASH_PROTOCOL_EXCEPTION_H
