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

// Toy molecular model: one qubit pair per electron pair, each prepared as a
// Bell pair, with one RZ/RY bond interaction per bond.
struct MoleculeSpec {
    std::string name;
    std::vector<std::string> atoms;
    int bonds = 0;
    int num_qubits = 0;
};

struct MoleculeReport {
    std::string molecule;
    std::vector<std::string> atoms;
    int num_qubits = 0;
    double temperature = 0.0;
    double pressure = 0.0;
    std::size_t gate_count = 0;
    int depth = 0;

    // <Z Z> of each electron pair, in pair order.
    std::vector<double> pair_correlations;
    // Mean entanglement entropy over all qubits.
    double entanglement = 0.0;
    // -100 times the register norm.
    double energy = 0.0;
    double vibrational_frequency = 0.0;
    double conductivity = 0.0;
    double stability = 0.0;

    Histogram counts;
    std::string dominant_state;
    std::vector<std::complex<double>> amplitudes;
};

// h2o, co2, nh3 and ch4, case-insensitive. Anything else is a
// ConfigurationError.
const MoleculeSpec& lookup_molecule(const std::string& name);

std::vector<std::string> supported_molecules();

// H + CNOT on each pair (2k, 2k+1), then RZ(pi*T/1000) on qubit 2b and
// RY(pi*P/10) on qubit 2b+1 for every bond b.
Circuit molecule_circuit(const MoleculeSpec& spec, double temperature, double pressure);

MoleculeReport simulate_molecule(
    const Simulator& simulator,
    const std::string& name,
    double temperature,
    double pressure,
    int shots,
    std::uint64_t seed
);

}  // namespace quantum_lab
