#pragma once

#include <cstdint>
#include <string>

#include "circuit.hpp"
#include "simulator.hpp"

namespace quantum_lab {

// Error rate below which a sifted key is considered usable.
constexpr double kBb84SecurityThreshold = 0.11;

enum class Basis {
    Rectilinear,
    Diagonal,
};

// Channel model between sender and receiver. With both probabilities at
// zero the channel is ideal and the sifted error rate is exactly 0.
struct Bb84Channel {
    // Classical flip applied to the receiver's measured bit.
    double bit_flip_probability = 0.0;
    // Per-qubit chance that an eavesdropper measures in a random basis and
    // resends what they saw.
    double eavesdrop_probability = 0.0;
};

struct Bb84Report {
    int key_length = 0;
    std::string sender_key;
    std::string receiver_key;
    std::string key_hex;
    // Fraction of sifted bits where the receiver disagrees with the sender.
    double error_rate = 0.0;
    // Sifted bits per trial.
    double efficiency = 0.0;
    std::string security_level;
    int trials = 0;
    int intercepted = 0;
    // Fewer than key_length bits survived sifting within 2 * key_length
    // trials. The keys are returned as sifted, never padded.
    bool partial = false;
};

// One trial: sender prepares `bit` in `sender_basis`, an optional
// eavesdropper measures and resends in `eve_basis`, and the receiver reads
// out in `receiver_basis`. The single readout is qubit 0.
Circuit bb84_trial_circuit(
    int bit,
    Basis sender_basis,
    Basis receiver_basis,
    const Basis* eve_basis = nullptr
);

Bb84Report run_bb84(
    const Simulator& simulator,
    int key_length,
    const Bb84Channel& channel,
    std::uint64_t seed
);

}  // namespace quantum_lab
