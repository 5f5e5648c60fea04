#ifndef CLIENT_EXCEPTION_H
#define CLIENT_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace tlcp::protocol {

/**
 * @brief Closed set of misuse conditions reported by the client.
 */
enum class ErrorKind {
    IllegalArgument, ///< A method was passed an illegal or inappropriate argument.
    IllegalState     ///< A method was invoked at an illegal or inappropriate time.
};

inline const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::IllegalArgument: return "IllegalArgument";
        case ErrorKind::IllegalState: return "IllegalState";
    }
    return "Unknown";
}

/**
 * @brief Exception class for client misuse errors.
 *
 * Carries one ErrorKind and a detail message. what() returns the message unchanged,
 * so generic std::exception handlers report exactly what the thrower wrote.
 */
class ClientException : public std::runtime_error {
public:
    ClientException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

    /**
     * @brief Kind-prefixed form for logs, e.g. "IllegalState: already installed".
     */
    std::string describe() const {
        return std::string(toString(kind_)) + ": " + what();
    }

private:
    ErrorKind kind_;
};

inline ClientException illegalArgument(const std::string& message) {
    return ClientException(ErrorKind::IllegalArgument, message);
}

inline ClientException illegalState(const std::string& message) {
    return ClientException(ErrorKind::IllegalState, message);
}

} // namespace tlcp::protocol

#endif // CLIENT_EXCEPTION_H
