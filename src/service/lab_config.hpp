#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "noise.hpp"

namespace service {

struct LabConfig {
    int default_shots = 1024;
    int max_qubits = 24;
    // 0 uses std::thread::hardware_concurrency().
    std::size_t max_threads = 0;
    // Unset seeds the lab from std::random_device.
    std::optional<std::uint64_t> seed;
    std::optional<SimpleNoiseConfig> noise;

    // Defaults overridden by QLAB_SEED, QLAB_MAX_QUBITS, QLAB_MAX_THREADS
    // and QLAB_DEFAULT_SHOTS. A malformed value raises ConfigurationError.
    static LabConfig from_environment();

    void validate() const;
};

}  // namespace service
