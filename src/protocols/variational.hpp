#pragma once

#include <cstdint>
#include <vector>

#include "circuit.hpp"
#include "histogram.hpp"
#include "simulator.hpp"

namespace quantum_lab {

struct VqeReport {
    int num_qubits = 0;
    std::vector<double> parameters;
    Histogram counts;
    // Mean integer value of the sampled outcomes.
    double expectation_value = 0.0;
    // Same quantity over the exact Born distribution.
    double exact_expectation = 0.0;
};

// One ansatz layer: H on every qubit, RY(parameters[q]) on qubit q, then a
// CNOT chain q -> q+1.
Circuit vqe_ansatz_circuit(const std::vector<double>& parameters);

// n angles drawn uniformly from [0, 2*pi).
std::vector<double> random_ansatz_parameters(int n_qubits, std::uint64_t seed);

VqeReport run_vqe(
    const Simulator& simulator,
    const std::vector<double>& parameters,
    int shots,
    std::uint64_t seed
);

}  // namespace quantum_lab
