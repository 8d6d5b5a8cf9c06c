#include "protocols/bell_state.hpp"

#include "state_metrics.hpp"

namespace quantum_lab {

Circuit bell_state_circuit() {
    return CircuitBuilder("bell_state", 2).h(0).cnot(0, 1).build();
}

BellStateReport run_bell_state(const Simulator& simulator, int shots, std::uint64_t seed) {
    const auto result = simulator.run(bell_state_circuit(), shots, seed);

    BellStateReport report;
    report.counts = result.counts;
    report.amplitudes = result.final_amplitudes;
    report.entanglement = entanglement_entropy(result.final_amplitudes, 0);
    report.fidelity = distribution_fidelity(result.counts, {{"00", 0.5}, {"11", 0.5}});
    return report;
}

}  // namespace quantum_lab
