#ifndef URDASH_TIMEOUT_EXCEPTION_H
#define URDASH_TIMEOUT_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace urdash::protocol {

/**
 * @brief Raised when a connect attempt does not complete within its I/O timeout.
 */
class TimeoutException : public std::runtime_error {
public:
    explicit TimeoutException(const std::string& message)
        : std::runtime_error("Timeout Error: " + message) {}
};

} // namespace urdash::protocol

#endif // URDASH_TIMEOUT_EXCEPTION_H
