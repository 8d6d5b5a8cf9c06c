#pragma once

#include <complex>
#include <cstdint>
#include <vector>

#include "circuit.hpp"
#include "histogram.hpp"
#include "simulator.hpp"

namespace quantum_lab {

struct BellStateReport {
    Histogram counts;
    std::vector<std::complex<double>> amplitudes;
    // Von Neumann entropy of qubit 0, 1.0 for a maximally entangled pair.
    double entanglement = 0.0;
    // Distribution fidelity of the counts against {00: 1/2, 11: 1/2}.
    double fidelity = 0.0;
};

// H(0), CNOT(0 -> 1).
Circuit bell_state_circuit();

BellStateReport run_bell_state(const Simulator& simulator, int shots, std::uint64_t seed);

}  // namespace quantum_lab
