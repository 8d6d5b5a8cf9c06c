#pragma once

#include <cstdint>
#include <string>

#include "circuit.hpp"
#include "histogram.hpp"
#include "simulator.hpp"

namespace quantum_lab {

struct GroverReport {
    int n_qubits = 0;
    std::uint64_t marked_item = 0;
    int iterations = 0;
    std::string found_bitstring;
    std::uint64_t found_item = 0;
    // Empirical frequency of the reported outcome.
    double probability = 0.0;
    bool success = false;
    Histogram counts;
};

// floor(pi/4 * sqrt(2^n))
int grover_iterations(int n_qubits);

// Uniform superposition followed by grover_iterations(n) rounds of
// oracle (phase flip on |marked_item>) and diffusion.
Circuit grover_circuit(int n_qubits, std::uint64_t marked_item);

GroverReport run_grover(
    const Simulator& simulator,
    int n_qubits,
    std::uint64_t marked_item,
    int shots,
    std::uint64_t seed
);

}  // namespace quantum_lab
