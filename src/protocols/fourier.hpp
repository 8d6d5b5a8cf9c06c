#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "circuit.hpp"
#include "histogram.hpp"
#include "simulator.hpp"

namespace quantum_lab {

// Counting registers wider than this would need 2^n controlled-U copies.
constexpr int kMaxCountingQubits = 12;

// QFT over `qubits`, where qubits[i] plays the role of bit i: for i from
// high to low, H on qubits[i] then CP(pi / 2^(i-j)) controlled by every
// qubits[j] with j < i, followed by the bit-reversal swaps.
std::vector<GateOp> qft_gates(const std::vector<int>& qubits);

// Reverse order with negated angles.
std::vector<GateOp> inverse_gates(const std::vector<GateOp>& gates);

void append_qft(CircuitBuilder& builder, const std::vector<int>& qubits);
void append_inverse_qft(CircuitBuilder& builder, const std::vector<int>& qubits);

Circuit qft_circuit(int n_qubits);
Circuit inverse_qft_circuit(int n_qubits);

struct QftReport {
    int n_qubits = 0;
    int depth = 0;
    std::size_t gate_count = 0;
    Histogram counts;
    std::vector<std::complex<double>> amplitudes;
    // Largest amplitude deviation after applying QFT then its inverse.
    double round_trip_error = 0.0;
};

// Prepares X on every even qubit, applies the QFT and samples the result.
QftReport run_qft(const Simulator& simulator, int n_qubits, int shots, std::uint64_t seed);

struct PhaseEstimationReport {
    int n_counting_qubits = 0;
    double phase = 0.0;
    double estimated_phase = 0.0;
    // Most common counting-register outcome, most significant bit first.
    std::string measured_binary;
    std::uint64_t measured_value = 0;
    // Frequency of that outcome.
    double confidence = 0.0;
    Histogram counts;
};

// Counting qubits 0..n-1, eigenstate qubit n prepared in |1>. U is
// P(2 pi phase), so |1> is its eigenvector with eigenvalue e^{2 pi i phase}.
Circuit phase_estimation_circuit(int n_counting_qubits, double phase);

PhaseEstimationReport run_phase_estimation(
    const Simulator& simulator,
    int n_counting_qubits,
    double phase,
    int shots,
    std::uint64_t seed
);

}  // namespace quantum_lab
