#include "protocols/teleportation.hpp"

#include "errors.hpp"
#include "state_metrics.hpp"

#include <random>

namespace quantum_lab {

namespace {

constexpr double kFidelityTolerance = 1e-9;

void check_preparation(const std::vector<GateOp>& preparation) {
    for (const auto& op : preparation) {
        if (op.condition) {
            throw InvalidArgumentError("Message preparation cannot be conditional");
        }
        // A one-qubit register admits exactly the gates that act on qubit 0.
        validate_gate(op, 1, 0);
    }
}

// Message state prepared on a lone qubit.
std::vector<std::complex<double>> message_state(
    const Simulator& simulator,
    const std::vector<GateOp>& preparation
) {
    CircuitBuilder builder("teleport_message", 1);
    for (const auto& op : preparation) {
        builder.gate(op);
    }
    return simulator.run(builder.build(), 1, 0).final_amplitudes;
}

double receiver_fidelity(
    const std::vector<std::complex<double>>& amplitudes,
    const std::vector<std::complex<double>>& message
) {
    const auto rho = reduced_density_matrix(amplitudes, 2);
    // <m| rho |m>
    const std::complex<double> value =
        std::conj(message[0]) * (rho[0] * message[0] + rho[1] * message[1]) +
        std::conj(message[1]) * (rho[2] * message[0] + rho[3] * message[1]);
    return value.real();
}

}  // namespace

Circuit teleportation_circuit(const std::vector<GateOp>& preparation) {
    check_preparation(preparation);

    CircuitBuilder builder("teleportation", 3, 2);
    for (const auto& op : preparation) {
        builder.gate(op);
    }
    builder.h(1).cnot(1, 2);
    builder.cnot(0, 1).h(0);
    builder.measure(0, 0).measure(1, 1);
    builder.x(2).c_if(1, 1);
    builder.z(2).c_if(0, 1);
    builder.readout({2});
    return builder.build();
}

TeleportationReport run_teleportation(
    const Simulator& simulator,
    const std::vector<GateOp>& preparation,
    int shots,
    std::uint64_t seed
) {
    if (shots <= 0) {
        throw InvalidArgumentError("Shot count must be positive");
    }
    const Circuit circuit = teleportation_circuit(preparation);
    const auto message = message_state(simulator, preparation);

    TeleportationReport report;
    report.shots = shots;
    report.expected_one_probability = std::norm(message[1]);
    report.sender_measurements.reserve(static_cast<std::size_t>(shots));
    report.fidelities.reserve(static_cast<std::size_t>(shots));

    std::mt19937_64 seed_rng(seed);
    int successes = 0;
    for (int shot = 0; shot < shots; ++shot) {
        const auto result = simulator.measure_single(circuit, seed_rng());
        report.receiver_counts.add(result.bitstring);
        MeasurementRecord sender;
        sender.bits = result.classical_bits;
        report.sender_measurements.push_back(bitstring_from_record(sender));

        const double fidelity = receiver_fidelity(result.final_amplitudes, message);
        report.fidelities.push_back(fidelity);
        if (fidelity >= 1.0 - kFidelityTolerance) {
            ++successes;
        }
    }
    report.success_rate = static_cast<double>(successes) / shots;
    return report;
}

}  // namespace quantum_lab
