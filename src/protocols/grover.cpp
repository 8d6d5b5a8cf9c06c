#include "protocols/grover.hpp"

#include "errors.hpp"

#include <cmath>
#include <vector>

namespace quantum_lab {

namespace {

// Phase pi on the all-ones state of the register.
void append_all_ones_flip(CircuitBuilder& builder, int n_qubits) {
    std::vector<int> controls;
    for (int q = 0; q + 1 < n_qubits; ++q) {
        controls.push_back(q);
    }
    builder.mcp(M_PI, controls, n_qubits - 1);
}

void append_oracle(CircuitBuilder& builder, int n_qubits, std::uint64_t marked_item) {
    for (int q = 0; q < n_qubits; ++q) {
        if (((marked_item >> q) & 1ULL) == 0) {
            builder.x(q);
        }
    }
    append_all_ones_flip(builder, n_qubits);
    for (int q = 0; q < n_qubits; ++q) {
        if (((marked_item >> q) & 1ULL) == 0) {
            builder.x(q);
        }
    }
}

// Reflection about the uniform superposition, up to a global phase.
void append_diffusion(CircuitBuilder& builder, int n_qubits) {
    for (int q = 0; q < n_qubits; ++q) {
        builder.h(q);
    }
    for (int q = 0; q < n_qubits; ++q) {
        builder.x(q);
    }
    append_all_ones_flip(builder, n_qubits);
    for (int q = 0; q < n_qubits; ++q) {
        builder.x(q);
    }
    for (int q = 0; q < n_qubits; ++q) {
        builder.h(q);
    }
}

}  // namespace

int grover_iterations(int n_qubits) {
    if (n_qubits <= 0 || n_qubits >= 63) {
        throw InvalidArgumentError("Grover search requires between 1 and 62 qubits");
    }
    const double space = std::ldexp(1.0, n_qubits);
    return static_cast<int>(std::floor(M_PI / 4.0 * std::sqrt(space)));
}

Circuit grover_circuit(int n_qubits, std::uint64_t marked_item) {
    const int iterations = grover_iterations(n_qubits);
    if (marked_item >= (1ULL << n_qubits)) {
        throw InvalidArgumentError(
            "Marked item " + std::to_string(marked_item) + " outside search space of " +
            std::to_string(n_qubits) + " qubits");
    }

    CircuitBuilder builder("grover", n_qubits);
    for (int q = 0; q < n_qubits; ++q) {
        builder.h(q);
    }
    for (int i = 0; i < iterations; ++i) {
        append_oracle(builder, n_qubits, marked_item);
        append_diffusion(builder, n_qubits);
    }
    return builder.build();
}

GroverReport run_grover(
    const Simulator& simulator,
    int n_qubits,
    std::uint64_t marked_item,
    int shots,
    std::uint64_t seed
) {
    const Circuit circuit = grover_circuit(n_qubits, marked_item);
    const auto result = simulator.run(circuit, shots, seed);

    GroverReport report;
    report.n_qubits = n_qubits;
    report.marked_item = marked_item;
    report.iterations = grover_iterations(n_qubits);
    report.counts = result.counts;
    report.found_bitstring = result.counts.most_likely();
    report.found_item = bitstring_value(report.found_bitstring);
    report.probability = static_cast<double>(result.counts.count(report.found_bitstring)) /
                         static_cast<double>(result.counts.total());
    report.success = report.found_item == marked_item;
    return report;
}

}  // namespace quantum_lab
