#pragma once

#include <complex>
#include <cstdint>
#include <string>
#include <vector>

#include "circuit.hpp"
#include "histogram.hpp"
#include "simulator.hpp"

namespace quantum_lab {

struct TeleportationReport {
    int shots = 0;
    // Receiver readout of qubit 2 after correction.
    Histogram receiver_counts;
    // Per shot "c1c0": the sender's two measurement results.
    std::vector<std::string> sender_measurements;
    // Per shot overlap between the receiver's reduced state and the
    // prepared message.
    std::vector<double> fidelities;
    // Fraction of shots with fidelity >= 1 - 1e-9.
    double success_rate = 0.0;
    // |<1|message>|^2, the readout statistics the receiver should see.
    double expected_one_probability = 0.0;
};

// Message qubit 0 is prepared by `preparation` (single-qubit gates on
// qubit 0). Qubits 1 and 2 hold the shared pair. The sender's results land
// in classical bits 0 and 1 and drive Z and X corrections on qubit 2.
Circuit teleportation_circuit(const std::vector<GateOp>& preparation);

TeleportationReport run_teleportation(
    const Simulator& simulator,
    const std::vector<GateOp>& preparation,
    int shots,
    std::uint64_t seed
);

}  // namespace quantum_lab
