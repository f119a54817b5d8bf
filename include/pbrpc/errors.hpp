#ifndef PBRPC_ERRORS_HPP
#define PBRPC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace pbrpc {

/// Thrown when a packet is encoded without its head or meta
class StateError : public std::logic_error {
public:
    explicit StateError(const std::string& message)
        : std::logic_error(message)
    {}
};

/// Thrown for invalid caller input (null decode buffer, bad magic length)
class ArgumentError : public std::invalid_argument {
public:
    explicit ArgumentError(const std::string& message)
        : std::invalid_argument(message)
    {}
};

/// Thrown for truncated or inconsistent wire data
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& message)
        : std::runtime_error(message)
    {}
};

} // namespace pbrpc

#endif // PBRPC_ERRORS_HPP
