#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "circuit.hpp"
#include "histogram.hpp"
#include "noise.hpp"
#include "progress_reporter.hpp"
#include "vm/measurement_record.types.hpp"

struct SimulatorOptions {
    // 0 uses std::thread::hardware_concurrency().
    std::size_t max_threads = 0;
    // Applied to every sampled readout and mid-circuit measurement.
    std::shared_ptr<const NoiseEngine> noise;
};

// Executes circuits and samples their readout qubits.
//
// Purely unitary circuits are evolved once and `shots` samples are drawn
// from the resulting Born distribution. Circuits with mid-circuit
// measurement are run as independent per-shot trajectories. Either way the
// work is split into fixed chunks with seeds drawn from the call's seed,
// so results depend on the seed only, not on the thread count.
class Simulator {
  public:
    explicit Simulator(SimulatorOptions options = {});

    const SimulatorOptions& options() const { return options_; }

    struct RunResult {
        Histogram counts;
        // Amplitudes after evolution, before the final readout. For circuits
        // that measure mid-way this is a separate reference trajectory.
        std::vector<std::complex<double>> final_amplitudes;
        // Exact Born distribution over the readout of that same state,
        // indexed by outcome value.
        std::vector<double> probabilities;
        std::vector<ExecutionLog> logs;
    };

    // `reporter`, when set, follows the reference evolution only: its total
    // is the instruction count and it receives that trajectory's logs.
    RunResult run(
        const Circuit& circuit,
        int shots,
        std::uint64_t seed,
        quantum_lab::ProgressReporter* reporter = nullptr
    ) const;

    struct SingleShot {
        std::string bitstring;
        std::vector<int> classical_bits;
        // Register before the final readout.
        std::vector<std::complex<double>> final_amplitudes;
        // Register after the readout qubits were projected onto the
        // observed outcome.
        std::vector<std::complex<double>> collapsed_state;
        std::vector<ExecutionLog> logs;
    };

    SingleShot measure_single(
        const Circuit& circuit,
        std::uint64_t seed,
        quantum_lab::ProgressReporter* reporter = nullptr
    ) const;

  private:
    std::size_t worker_count(std::size_t chunks) const;

    SimulatorOptions options_;
};
