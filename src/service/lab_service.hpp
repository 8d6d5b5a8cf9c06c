#pragma once

#include "circuit.hpp"
#include "histogram.hpp"
#include "progress_reporter.hpp"
#include "protocols/bb84.hpp"
#include "protocols/bell_state.hpp"
#include "protocols/fourier.hpp"
#include "protocols/grover.hpp"
#include "protocols/molecule.hpp"
#include "protocols/random_generator.hpp"
#include "protocols/teleportation.hpp"
#include "protocols/variational.hpp"
#include "service/circuit_registry.hpp"
#include "service/lab_config.hpp"
#include "simulator.hpp"

#include <chrono>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace service {

enum class ProtocolKind {
    BellState,
    Bb84,
    RandomNumbers,
    Grover,
    Qft,
    PhaseEstimation,
    Teleportation,
    Molecule,
    Vqe,
};

// Accepts "bell", "bb84", "qrng", "grover", "qft", "qpe", "teleport",
// "molecule", "vqe".
// Throws quantum_lab::ConfigurationError for anything else.
ProtocolKind protocol_from_string(const std::string& name);
std::string protocol_to_string(ProtocolKind kind);

struct CircuitInfo {
    std::string id;
    std::string name;
    int num_qubits = 0;
    std::vector<std::string> gates;
    int depth = 0;
    std::size_t gate_count = 0;
    std::chrono::system_clock::time_point created_at;
};

struct ExecutionReport {
    std::string circuit_id;
    int shots = 0;
    Histogram counts;
    // Empirical frequencies, count / shots.
    std::map<std::string, double> probabilities;
    // Born-rule probabilities of the final state, nonzero entries only.
    std::map<std::string, double> exact_probabilities;
    std::string most_likely;
    std::vector<std::complex<double>> final_amplitudes;
};

struct LabStatus {
    std::size_t total_circuits = 0;
    std::string backend;
    int max_qubits = 0;
    int default_shots = 0;
    std::size_t max_threads = 0;
    bool noise_enabled = false;
};

// Façade over the circuit registry, the simulator and the protocol layer.
// Every call draws its simulation seed from the service's own generator,
// seeded from LabConfig::seed, so a seeded lab replays identically.
class LabService {
  public:
    explicit LabService(LabConfig config = {});

    std::string create_circuit(
        const std::string& name,
        int num_qubits,
        const std::vector<std::string>& gates,
        const std::map<std::size_t, TokenBinding>& bindings = {}
    );

    // `reporter` observes the reference evolution of the circuit.
    ExecutionReport execute(
        const std::string& circuit_id,
        std::optional<int> shots = std::nullopt,
        quantum_lab::ProgressReporter* reporter = nullptr
    );

    CircuitInfo circuit_info(const std::string& circuit_id) const;
    std::vector<CircuitInfo> list_circuits() const;
    LabStatus status() const;

    quantum_lab::BellStateReport bell_state(std::optional<int> shots = std::nullopt);
    quantum_lab::Bb84Report bb84(int key_length, const quantum_lab::Bb84Channel& channel = {});
    quantum_lab::RandomBitsReport quantum_random(int num_bits);
    quantum_lab::GroverReport grover(int n_qubits, std::uint64_t marked_item);
    quantum_lab::QftReport qft(int n_qubits);
    quantum_lab::PhaseEstimationReport phase_estimation(int n_counting_qubits, double phase = 0.5);
    // Default preparation is X on the message qubit.
    quantum_lab::TeleportationReport teleport(
        std::optional<std::vector<GateOp>> preparation = std::nullopt,
        std::optional<int> shots = std::nullopt
    );
    quantum_lab::MoleculeReport simulate_molecule(
        const std::string& molecule,
        double temperature = 300.0,
        double pressure = 1.0
    );
    // Without parameters the angles are drawn from the lab's seed.
    quantum_lab::VqeReport vqe(
        int n_qubits,
        std::optional<std::vector<double>> parameters = std::nullopt
    );

    const LabConfig& config() const { return config_; }

  private:
    std::uint64_t next_seed();
    int resolve_shots(std::optional<int> shots) const;
    void check_qubits(int n_qubits) const;

    LabConfig config_;
    Simulator simulator_;
    CircuitRegistry registry_;
    std::mutex seed_mutex_;
    std::mt19937_64 seed_rng_;
};

}  // namespace service
