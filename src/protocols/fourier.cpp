#include "protocols/fourier.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace quantum_lab {

namespace {

GateOp single(GateKind kind, int target) {
    GateOp op;
    op.kind = kind;
    op.targets = {target};
    return op;
}

std::vector<int> register_qubits(int n_qubits) {
    if (n_qubits <= 0) {
        throw InvalidArgumentError("QFT requires a positive number of qubits");
    }
    std::vector<int> qubits(static_cast<std::size_t>(n_qubits));
    for (int q = 0; q < n_qubits; ++q) {
        qubits[static_cast<std::size_t>(q)] = q;
    }
    return qubits;
}

}  // namespace

std::vector<GateOp> qft_gates(const std::vector<int>& qubits) {
    std::vector<GateOp> ops;
    const int n = static_cast<int>(qubits.size());
    for (int i = n - 1; i >= 0; --i) {
        ops.push_back(single(GateKind::H, qubits[static_cast<std::size_t>(i)]));
        for (int j = 0; j < i; ++j) {
            GateOp cp;
            cp.kind = GateKind::CP;
            cp.targets = {qubits[static_cast<std::size_t>(i)]};
            cp.controls = {qubits[static_cast<std::size_t>(j)]};
            cp.theta = M_PI / std::ldexp(1.0, i - j);
            ops.push_back(cp);
        }
    }
    for (int i = 0; i < n / 2; ++i) {
        GateOp sw;
        sw.kind = GateKind::SWAP;
        sw.targets = {qubits[static_cast<std::size_t>(i)], qubits[static_cast<std::size_t>(n - 1 - i)]};
        ops.push_back(sw);
    }
    return ops;
}

std::vector<GateOp> inverse_gates(const std::vector<GateOp>& gates) {
    std::vector<GateOp> inv;
    inv.reserve(gates.size());
    for (auto it = gates.rbegin(); it != gates.rend(); ++it) {
        inv.push_back(inverse(*it));
    }
    return inv;
}

void append_qft(CircuitBuilder& builder, const std::vector<int>& qubits) {
    for (auto& op : qft_gates(qubits)) {
        builder.gate(std::move(op));
    }
}

void append_inverse_qft(CircuitBuilder& builder, const std::vector<int>& qubits) {
    for (auto& op : inverse_gates(qft_gates(qubits))) {
        builder.gate(std::move(op));
    }
}

Circuit qft_circuit(int n_qubits) {
    CircuitBuilder builder("qft", n_qubits);
    append_qft(builder, register_qubits(n_qubits));
    return builder.build();
}

Circuit inverse_qft_circuit(int n_qubits) {
    CircuitBuilder builder("inverse_qft", n_qubits);
    append_inverse_qft(builder, register_qubits(n_qubits));
    return builder.build();
}

QftReport run_qft(const Simulator& simulator, int n_qubits, int shots, std::uint64_t seed) {
    const std::vector<int> qubits = register_qubits(n_qubits);

    CircuitBuilder prepared("qft_input", n_qubits);
    for (int q = 0; q < n_qubits; q += 2) {
        prepared.x(q);
    }
    CircuitBuilder transformed = prepared;
    append_qft(transformed, qubits);
    CircuitBuilder round_trip = transformed;
    append_inverse_qft(round_trip, qubits);

    std::mt19937_64 seed_rng(seed);
    const Circuit qft = transformed.build();
    const auto result = simulator.run(qft, shots, seed_rng());
    const auto input = simulator.run(prepared.build(), 1, seed_rng());
    const auto restored = simulator.run(round_trip.build(), 1, seed_rng());

    QftReport report;
    report.n_qubits = n_qubits;
    report.depth = qft_circuit(n_qubits).depth();
    report.gate_count = qft_circuit(n_qubits).gate_count();
    report.counts = result.counts;
    report.amplitudes = result.final_amplitudes;
    for (std::size_t i = 0; i < input.final_amplitudes.size(); ++i) {
        report.round_trip_error = std::max(
            report.round_trip_error,
            std::abs(input.final_amplitudes[i] - restored.final_amplitudes[i]));
    }
    return report;
}

Circuit phase_estimation_circuit(int n_counting_qubits, double phase) {
    if (n_counting_qubits <= 0 || n_counting_qubits > kMaxCountingQubits) {
        throw InvalidArgumentError(
            "Phase estimation supports 1 to " + std::to_string(kMaxCountingQubits) +
            " counting qubits");
    }
    if (!std::isfinite(phase)) {
        throw InvalidArgumentError("Phase must be finite");
    }

    const int eigen = n_counting_qubits;
    const std::vector<int> counting = register_qubits(n_counting_qubits);
    CircuitBuilder builder("phase_estimation", n_counting_qubits + 1);
    builder.x(eigen);
    for (int q : counting) {
        builder.h(q);
    }
    const double angle = 2.0 * M_PI * phase;
    for (int q : counting) {
        const long repetitions = 1L << q;
        for (long r = 0; r < repetitions; ++r) {
            builder.cp(angle, q, eigen);
        }
    }
    append_inverse_qft(builder, counting);
    builder.readout(counting);
    return builder.build();
}

PhaseEstimationReport run_phase_estimation(
    const Simulator& simulator,
    int n_counting_qubits,
    double phase,
    int shots,
    std::uint64_t seed
) {
    const Circuit circuit = phase_estimation_circuit(n_counting_qubits, phase);
    const auto result = simulator.run(circuit, shots, seed);

    PhaseEstimationReport report;
    report.n_counting_qubits = n_counting_qubits;
    report.phase = phase;
    report.counts = result.counts;
    report.measured_binary = result.counts.most_likely();
    report.measured_value = bitstring_value(report.measured_binary);
    report.estimated_phase =
        static_cast<double>(report.measured_value) / std::ldexp(1.0, n_counting_qubits);
    report.confidence = static_cast<double>(result.counts.count(report.measured_binary)) /
                        static_cast<double>(result.counts.total());
    return report;
}

}  // namespace quantum_lab
