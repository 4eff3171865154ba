#ifndef URDASH_CONNECTION_EXCEPTION_H
#define URDASH_CONNECTION_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace urdash::protocol {

/**
 * @brief Raised by the socket layer when the dashboard link cannot be used.
 *
 * Covers refused or reset connections, an orderly close by the controller
 * (zero-byte read) and writes on a handle that is no longer open.
 */
class ConnectionException : public std::runtime_error {
public:
    explicit ConnectionException(const std::string& message)
        : std::runtime_error("Connection Error: " + message) {}
};

} // namespace urdash::protocol

#endif // URDASH_CONNECTION_EXCEPTION_H
