#include "protocols/variational.hpp"

#include "errors.hpp"

#include <cmath>
#include <random>

namespace quantum_lab {

Circuit vqe_ansatz_circuit(const std::vector<double>& parameters) {
    if (parameters.empty()) {
        throw InvalidArgumentError("Ansatz needs at least one parameter");
    }
    const int n = static_cast<int>(parameters.size());
    CircuitBuilder builder("vqe_ansatz", n);
    for (int q = 0; q < n; ++q) {
        builder.h(q);
    }
    for (int q = 0; q < n; ++q) {
        builder.ry(parameters[static_cast<std::size_t>(q)], q);
    }
    for (int q = 0; q + 1 < n; ++q) {
        builder.cnot(q, q + 1);
    }
    return builder.build();
}

std::vector<double> random_ansatz_parameters(int n_qubits, std::uint64_t seed) {
    if (n_qubits <= 0) {
        throw InvalidArgumentError("Ansatz needs at least one qubit");
    }
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> angle(0.0, 2.0 * M_PI);
    std::vector<double> parameters;
    for (int q = 0; q < n_qubits; ++q) {
        parameters.push_back(angle(rng));
    }
    return parameters;
}

VqeReport run_vqe(
    const Simulator& simulator,
    const std::vector<double>& parameters,
    int shots,
    std::uint64_t seed
) {
    const Circuit circuit = vqe_ansatz_circuit(parameters);
    const auto result = simulator.run(circuit, shots, seed);

    VqeReport report;
    report.num_qubits = circuit.num_qubits();
    report.parameters = parameters;
    report.counts = result.counts;

    double weighted = 0.0;
    for (const auto& entry : result.counts.counts()) {
        weighted += static_cast<double>(bitstring_value(entry.first)) * static_cast<double>(entry.second);
    }
    report.expectation_value = weighted / static_cast<double>(result.counts.total());

    for (std::size_t outcome = 0; outcome < result.probabilities.size(); ++outcome) {
        report.exact_expectation += static_cast<double>(outcome) * result.probabilities[outcome];
    }
    return report;
}

}  // namespace quantum_lab
