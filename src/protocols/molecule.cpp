#include "protocols/molecule.hpp"

#include "errors.hpp"
#include "state_metrics.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace quantum_lab {

namespace {

const std::vector<MoleculeSpec>& molecule_table() {
    static const std::vector<MoleculeSpec> table = {
        {"h2o", {"H", "H", "O"}, 2, 6},
        {"co2", {"C", "O", "O"}, 2, 6},
        {"nh3", {"N", "H", "H", "H"}, 3, 8},
        {"ch4", {"C", "H", "H", "H", "H"}, 4, 10},
    };
    return table;
}

void check_conditions(double temperature, double pressure) {
    if (!std::isfinite(temperature) || temperature < 0.0) {
        throw InvalidArgumentError("Temperature must be a finite, non-negative value in kelvin");
    }
    if (!std::isfinite(pressure) || pressure < 0.0) {
        throw InvalidArgumentError("Pressure must be a finite, non-negative value in atm");
    }
}

}  // namespace

const MoleculeSpec& lookup_molecule(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (const auto& spec : molecule_table()) {
        if (spec.name == lowered) {
            return spec;
        }
    }
    throw ConfigurationError("Unsupported molecule: " + name);
}

std::vector<std::string> supported_molecules() {
    std::vector<std::string> names;
    for (const auto& spec : molecule_table()) {
        names.push_back(spec.name);
    }
    return names;
}

Circuit molecule_circuit(const MoleculeSpec& spec, double temperature, double pressure) {
    check_conditions(temperature, pressure);
    const int n = spec.num_qubits;
    CircuitBuilder builder(spec.name, n);
    for (int q = 0; q < n; q += 2) {
        builder.h(q);
        if (q + 1 < n) {
            builder.cnot(q, q + 1);
        }
    }
    for (int bond = 0; bond < spec.bonds; ++bond) {
        if (bond * 2 + 1 >= n) {
            break;
        }
        builder.rz(M_PI * temperature / 1000.0, bond * 2);
        builder.ry(M_PI * pressure / 10.0, bond * 2 + 1);
    }
    return builder.build();
}

MoleculeReport simulate_molecule(
    const Simulator& simulator,
    const std::string& name,
    double temperature,
    double pressure,
    int shots,
    std::uint64_t seed
) {
    const MoleculeSpec& spec = lookup_molecule(name);
    const Circuit circuit = molecule_circuit(spec, temperature, pressure);
    const auto result = simulator.run(circuit, shots, seed);
    const auto& amplitudes = result.final_amplitudes;

    MoleculeReport report;
    report.molecule = spec.name;
    report.atoms = spec.atoms;
    report.num_qubits = spec.num_qubits;
    report.temperature = temperature;
    report.pressure = pressure;
    report.gate_count = circuit.gate_count();
    report.depth = circuit.depth();

    for (int q = 0; q + 1 < spec.num_qubits; q += 2) {
        report.pair_correlations.push_back(zz_correlation(amplitudes, q, q + 1));
    }
    double entropy = 0.0;
    double norm = 0.0;
    for (int q = 0; q < spec.num_qubits; ++q) {
        entropy += entanglement_entropy(amplitudes, q);
    }
    for (const auto& amp : amplitudes) {
        norm += std::norm(amp);
    }
    report.entanglement = entropy / spec.num_qubits;
    report.energy = -100.0 * norm;
    report.vibrational_frequency = 3000.0 + temperature * 0.1;
    report.conductivity = temperature < 500.0 ? std::max(0.0, 1000.0 - temperature * 0.5) : 0.0;
    report.stability = std::exp(-std::abs(temperature - 298.0) / 100.0);

    report.counts = result.counts;
    report.dominant_state = result.counts.most_likely();
    report.amplitudes = amplitudes;
    return report;
}

}  // namespace quantum_lab
