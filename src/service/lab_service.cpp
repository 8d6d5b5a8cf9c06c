#include "service/lab_service.hpp"

#include "cpu_state_backend.hpp"
#include "errors.hpp"
#include "noise.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <utility>

namespace service {

namespace {

LabConfig validated(LabConfig config) {
    config.validate();
    return config;
}

SimulatorOptions make_simulator_options(const LabConfig& config) {
    SimulatorOptions options;
    options.max_threads = config.max_threads;
    if (config.noise) {
        options.noise = std::make_shared<SimpleNoiseEngine>(*config.noise);
    }
    return options;
}

std::mt19937_64 make_seed_rng(const LabConfig& config) {
    if (config.seed) {
        return std::mt19937_64(*config.seed);
    }
    std::random_device rd;
    return std::mt19937_64((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
}

CircuitInfo make_info(const CircuitRecord& record) {
    CircuitInfo info;
    info.id = record.id;
    info.name = record.circuit.name();
    info.num_qubits = record.circuit.num_qubits();
    info.gates = record.tokens;
    info.depth = record.circuit.depth();
    info.gate_count = record.circuit.gate_count();
    info.created_at = record.circuit.created_at();
    return info;
}

}  // namespace

ProtocolKind protocol_from_string(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "bell") return ProtocolKind::BellState;
    if (lowered == "bb84") return ProtocolKind::Bb84;
    if (lowered == "qrng") return ProtocolKind::RandomNumbers;
    if (lowered == "grover") return ProtocolKind::Grover;
    if (lowered == "qft") return ProtocolKind::Qft;
    if (lowered == "qpe") return ProtocolKind::PhaseEstimation;
    if (lowered == "teleport") return ProtocolKind::Teleportation;
    if (lowered == "molecule") return ProtocolKind::Molecule;
    if (lowered == "vqe") return ProtocolKind::Vqe;
    throw quantum_lab::ConfigurationError("Unknown protocol: " + name);
}

std::string protocol_to_string(ProtocolKind kind) {
    switch (kind) {
        case ProtocolKind::BellState:
            return "bell";
        case ProtocolKind::Bb84:
            return "bb84";
        case ProtocolKind::RandomNumbers:
            return "qrng";
        case ProtocolKind::Grover:
            return "grover";
        case ProtocolKind::Qft:
            return "qft";
        case ProtocolKind::PhaseEstimation:
            return "qpe";
        case ProtocolKind::Teleportation:
            return "teleport";
        case ProtocolKind::Molecule:
            return "molecule";
        case ProtocolKind::Vqe:
            return "vqe";
    }
    return "unknown";
}

LabService::LabService(LabConfig config)
    : config_(validated(std::move(config))),
      simulator_(make_simulator_options(config_)),
      seed_rng_(make_seed_rng(config_)) {}

std::uint64_t LabService::next_seed() {
    std::lock_guard<std::mutex> lock(seed_mutex_);
    return seed_rng_();
}

int LabService::resolve_shots(std::optional<int> shots) const {
    const int resolved = shots.value_or(config_.default_shots);
    if (resolved <= 0) {
        throw quantum_lab::InvalidArgumentError("Shot count must be positive");
    }
    return resolved;
}

void LabService::check_qubits(int n_qubits) const {
    if (n_qubits <= 0 || n_qubits > config_.max_qubits) {
        throw quantum_lab::InvalidArgumentError(
            "Qubit count must be between 1 and " + std::to_string(config_.max_qubits) +
            ", got " + std::to_string(n_qubits));
    }
}

std::string LabService::create_circuit(
    const std::string& name,
    int num_qubits,
    const std::vector<std::string>& gates,
    const std::map<std::size_t, TokenBinding>& bindings
) {
    check_qubits(num_qubits);
    Circuit circuit = build_circuit(name, num_qubits, gates, bindings);
    return registry_.add(gates, std::move(circuit));
}

ExecutionReport LabService::execute(
    const std::string& circuit_id,
    std::optional<int> shots,
    quantum_lab::ProgressReporter* reporter
) {
    const auto record = registry_.get(circuit_id);
    const int shot_count = resolve_shots(shots);
    const Circuit& circuit = record->circuit;

    const Simulator::RunResult result = simulator_.run(circuit, shot_count, next_seed(), reporter);

    ExecutionReport report;
    report.circuit_id = circuit_id;
    report.shots = shot_count;
    report.counts = result.counts;
    report.probabilities = result.counts.probabilities();
    const std::size_t width = circuit.readout().size();
    for (std::size_t outcome = 0; outcome < result.probabilities.size(); ++outcome) {
        if (result.probabilities[outcome] > 0.0) {
            report.exact_probabilities[to_bitstring(outcome, width)] = result.probabilities[outcome];
        }
    }
    report.most_likely = result.counts.most_likely();
    report.final_amplitudes = result.final_amplitudes;
    return report;
}

CircuitInfo LabService::circuit_info(const std::string& circuit_id) const {
    return make_info(*registry_.get(circuit_id));
}

std::vector<CircuitInfo> LabService::list_circuits() const {
    std::vector<CircuitInfo> infos;
    for (const auto& record : registry_.list()) {
        infos.push_back(make_info(*record));
    }
    return infos;
}

LabStatus LabService::status() const {
    LabStatus status;
    status.total_circuits = registry_.size();
    status.backend = CpuStateBackend().name();
    status.max_qubits = config_.max_qubits;
    status.default_shots = config_.default_shots;
    status.max_threads = config_.max_threads;
    status.noise_enabled = config_.noise.has_value();
    return status;
}

quantum_lab::BellStateReport LabService::bell_state(std::optional<int> shots) {
    return quantum_lab::run_bell_state(simulator_, resolve_shots(shots), next_seed());
}

quantum_lab::Bb84Report LabService::bb84(int key_length, const quantum_lab::Bb84Channel& channel) {
    return quantum_lab::run_bb84(simulator_, key_length, channel, next_seed());
}

quantum_lab::RandomBitsReport LabService::quantum_random(int num_bits) {
    return quantum_lab::generate_random_bits(simulator_, num_bits, next_seed());
}

quantum_lab::GroverReport LabService::grover(int n_qubits, std::uint64_t marked_item) {
    check_qubits(n_qubits);
    return quantum_lab::run_grover(simulator_, n_qubits, marked_item, config_.default_shots, next_seed());
}

quantum_lab::QftReport LabService::qft(int n_qubits) {
    check_qubits(n_qubits);
    return quantum_lab::run_qft(simulator_, n_qubits, config_.default_shots, next_seed());
}

quantum_lab::PhaseEstimationReport LabService::phase_estimation(int n_counting_qubits, double phase) {
    check_qubits(n_counting_qubits + 1);
    return quantum_lab::run_phase_estimation(
        simulator_, n_counting_qubits, phase, config_.default_shots, next_seed());
}

quantum_lab::TeleportationReport LabService::teleport(
    std::optional<std::vector<GateOp>> preparation,
    std::optional<int> shots
) {
    std::vector<GateOp> prep;
    if (preparation) {
        prep = std::move(*preparation);
    } else {
        GateOp x;
        x.kind = GateKind::X;
        x.targets = {0};
        prep.push_back(x);
    }
    return quantum_lab::run_teleportation(simulator_, prep, resolve_shots(shots), next_seed());
}

quantum_lab::MoleculeReport LabService::simulate_molecule(
    const std::string& molecule,
    double temperature,
    double pressure
) {
    check_qubits(quantum_lab::lookup_molecule(molecule).num_qubits);
    return quantum_lab::simulate_molecule(
        simulator_, molecule, temperature, pressure, config_.default_shots, next_seed());
}

quantum_lab::VqeReport LabService::vqe(int n_qubits, std::optional<std::vector<double>> parameters) {
    check_qubits(n_qubits);
    if (parameters && static_cast<int>(parameters->size()) != n_qubits) {
        throw quantum_lab::InvalidArgumentError(
            "Expected " + std::to_string(n_qubits) + " ansatz parameters, got " +
            std::to_string(parameters->size()));
    }
    const std::vector<double> angles =
        parameters ? *parameters : quantum_lab::random_ansatz_parameters(n_qubits, next_seed());
    return quantum_lab::run_vqe(simulator_, angles, config_.default_shots, next_seed());
}

}  // namespace service
