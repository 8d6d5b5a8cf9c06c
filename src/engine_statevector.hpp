#pragma once

#include <complex>
#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "circuit.hpp"
#include "cpu_state_backend.hpp"
#include "noise.hpp"
#include "vm/measurement_record.types.hpp"

namespace quantum_lab {
class ProgressReporter;
}

// Statevector execution engine. Runs one trajectory of a Circuit: gates
// evolve the register, MeasureOp collapses it and writes a classical bit,
// and conditional gates read those bits.

struct StatevectorState {
    int n_qubits = 0;
    std::vector<int> clbits;
    std::vector<MeasurementRecord> measurements;
    std::vector<ExecutionLog> logs;
    int shot_index = 0;
    int step = 0;
};

class StatevectorEngine {
  public:
    explicit StatevectorEngine(
        std::unique_ptr<StateBackend> backend = nullptr,
        std::uint64_t seed = std::numeric_limits<std::uint64_t>::max()
    );

    // Attach a shared noise model instance. If nullptr, measurements are
    // recorded exactly as sampled.
    void set_noise_model(std::shared_ptr<const NoiseEngine> noise);

    void set_progress_reporter(quantum_lab::ProgressReporter* reporter);

    void set_logging_enabled(bool enabled) { logging_enabled_ = enabled; }
    void set_shot_index(int shot);

    // Allocates a fresh register and executes every instruction in order.
    void run(const Circuit& circuit);

    // Born-rule distribution over `targets`; entry k is the probability of
    // the outcome whose bit j is the value of targets[j].
    std::vector<double> outcome_probabilities(const std::vector<int>& targets) const;

    // Samples `targets`, collapses and renormalises the register, applies
    // measurement noise to the recorded bits and returns the record.
    MeasurementRecord measure(const std::vector<int>& targets);

    const std::vector<ExecutionLog>& logs() const { return state_.logs; }
    const std::vector<int>& classical_bits() const { return state_.clbits; }
    const std::string& backend_name() const { return backend_name_; }

    std::vector<std::complex<double>>& state_vector();
    const std::vector<std::complex<double>>& state_vector() const;

    const StatevectorState& state() const { return state_; }

  private:
    StatevectorState state_;

    std::shared_ptr<const NoiseEngine> noise_;
    std::mt19937_64 rng_{};
    std::unique_ptr<StateBackend> backend_;
    std::string backend_name_;
    quantum_lab::ProgressReporter* progress_reporter_ = nullptr;
    bool logging_enabled_ = true;

    void log_event(const std::string& category, const std::string& message);
    void execute_program(const std::vector<Instruction>& program);
    void alloc_array(int n, int n_clbits);
    void apply_gate(const GateOp& g);
    void measure_into(const MeasureOp& m);
    void check_normalized() const;
};
