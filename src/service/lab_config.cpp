#include "service/lab_config.hpp"

#include "cpu_state_backend.hpp"
#include "errors.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace service {

namespace {

std::optional<unsigned long long> read_env_unsigned(const char* name) {
    const char* env = std::getenv(name);
    if (!env || *env == '\0') {
        return std::nullopt;
    }
    const std::string text(env);
    const std::string malformed =
        std::string(name) + " must be a non-negative integer, got '" + text + "'";
    if (text.find_first_not_of("0123456789") != std::string::npos) {
        throw quantum_lab::ConfigurationError(malformed);
    }
    try {
        return std::stoull(text);
    } catch (const std::invalid_argument&) {
        throw quantum_lab::ConfigurationError(malformed);
    } catch (const std::out_of_range&) {
        throw quantum_lab::ConfigurationError(std::string(name) + " is out of range");
    }
}

int to_int(const char* name, unsigned long long value) {
    if (value > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
        throw quantum_lab::ConfigurationError(std::string(name) + " is out of range");
    }
    return static_cast<int>(value);
}

}  // namespace

LabConfig LabConfig::from_environment() {
    LabConfig config;
    if (const auto seed = read_env_unsigned("QLAB_SEED")) {
        config.seed = static_cast<std::uint64_t>(*seed);
    }
    if (const auto max_qubits = read_env_unsigned("QLAB_MAX_QUBITS")) {
        config.max_qubits = to_int("QLAB_MAX_QUBITS", *max_qubits);
    }
    if (const auto threads = read_env_unsigned("QLAB_MAX_THREADS")) {
        config.max_threads = static_cast<std::size_t>(*threads);
    }
    if (const auto shots = read_env_unsigned("QLAB_DEFAULT_SHOTS")) {
        config.default_shots = to_int("QLAB_DEFAULT_SHOTS", *shots);
    }
    config.validate();
    return config;
}

void LabConfig::validate() const {
    if (default_shots <= 0) {
        throw quantum_lab::ConfigurationError("default_shots must be positive");
    }
    if (max_qubits <= 0 || max_qubits > CpuStateBackend::kMaxQubits) {
        throw quantum_lab::ConfigurationError(
            "max_qubits must be between 1 and " + std::to_string(CpuStateBackend::kMaxQubits));
    }
}

}  // namespace service
