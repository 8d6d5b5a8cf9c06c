#pragma once

#include <stdexcept>
#include <string>

// Error taxonomy shared by the engine, protocol layer and service façade.
// Each type derives from the closest standard exception.

namespace quantum_lab {

// Unknown gate token or kind, unknown protocol name, malformed environment.
class ConfigurationError : public std::runtime_error {
  public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Qubit or classical bit index outside the register.
class IndexError : public std::out_of_range {
  public:
    explicit IndexError(const std::string& message)
        : std::out_of_range(message) {}
};

class InvalidArgumentError : public std::invalid_argument {
  public:
    explicit InvalidArgumentError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Unknown circuit id.
class NotFoundError : public std::runtime_error {
  public:
    explicit NotFoundError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace quantum_lab
