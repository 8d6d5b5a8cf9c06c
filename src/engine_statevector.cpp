#include "engine_statevector.hpp"

#include "errors.hpp"
#include "gates.hpp"
#include "progress_reporter.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

constexpr double kNormTolerancePerQubit = 1e-9;

std::string format_targets(const std::vector<int>& targets) {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < targets.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << targets[i];
    }
    oss << "]";
    return oss.str();
}

std::size_t outcome_index(std::size_t basis, const std::vector<int>& targets) {
    std::size_t outcome = 0;
    for (std::size_t idx = 0; idx < targets.size(); ++idx) {
        const std::size_t bit = (basis >> targets[idx]) & 1ULL;
        outcome |= (bit << idx);
    }
    return outcome;
}

}  // namespace

StatevectorEngine::StatevectorEngine(
    std::unique_ptr<StateBackend> backend,
    std::uint64_t seed
)
    : backend_(backend ? std::move(backend) : std::make_unique<CpuStateBackend>()) {
    backend_name_ = backend_->name();
    if (seed != std::numeric_limits<std::uint64_t>::max()) {
        rng_.seed(seed);
    } else {
        std::random_device rd;
        rng_.seed(rd());
    }
}

void StatevectorEngine::set_shot_index(int shot) {
    state_.shot_index = shot;
}

void StatevectorEngine::log_event(const std::string& category, const std::string& message) {
    if (!logging_enabled_) {
        return;
    }
    state_.logs.push_back(
        ExecutionLog{state_.shot_index, state_.step, category, message});
    if (progress_reporter_) {
        progress_reporter_->record_log(state_.logs.back());
    }
}

std::vector<std::complex<double>>& StatevectorEngine::state_vector() {
    return backend_->state();
}

const std::vector<std::complex<double>>& StatevectorEngine::state_vector() const {
    return backend_->state();
}

void StatevectorEngine::set_noise_model(std::shared_ptr<const NoiseEngine> noise) {
    if (noise) {
        noise_ = noise->clone();
        auto sink = [this](const std::string& category, const std::string& message) {
            this->log_event(category, message);
        };
        // The clone is owned by this engine alone, so attaching the sink
        // does not affect the caller's instance.
        const_cast<NoiseEngine*>(noise_.get())->set_log_sink(std::move(sink));
    } else {
        noise_.reset();
    }
}

void StatevectorEngine::set_progress_reporter(quantum_lab::ProgressReporter* reporter) {
    progress_reporter_ = reporter;
}

void StatevectorEngine::run(const Circuit& circuit) {
    state_.logs.clear();
    state_.measurements.clear();
    state_.step = 0;
    alloc_array(circuit.num_qubits(), circuit.num_clbits());
    execute_program(circuit.instructions());
}

void StatevectorEngine::execute_program(const std::vector<Instruction>& program) {
    for (const auto& instr : program) {
        ++state_.step;
        switch (instr.op) {
            case Op::ApplyGate:
                apply_gate(std::get<GateOp>(instr.payload));
                break;
            case Op::Measure:
                measure_into(std::get<MeasureOp>(instr.payload));
                break;
        }
        if (progress_reporter_) {
            progress_reporter_->increment_completed_steps();
        }
    }
}

void StatevectorEngine::alloc_array(int n, int n_clbits) {
    backend_->alloc_array(n);
    state_.n_qubits = backend_->num_qubits();
    state_.clbits.assign(static_cast<std::size_t>(std::max(0, n_clbits)), 0);
    std::ostringstream oss;
    oss << "AllocArray n_qubits=" << n << " n_clbits=" << n_clbits;
    log_event("AllocArray", oss.str());
}

void StatevectorEngine::apply_gate(const GateOp& g) {
    if (g.condition) {
        const auto& cond = *g.condition;
        if (cond.clbit < 0 || cond.clbit >= static_cast<int>(state_.clbits.size())) {
            throw quantum_lab::IndexError(
                "Classical bit " + std::to_string(cond.clbit) + " out of range");
        }
        const int observed = state_.clbits[static_cast<std::size_t>(cond.clbit)];
        std::ostringstream oss;
        oss << ::to_string(g.kind) << " targets=" << format_targets(g.targets)
            << " c" << cond.clbit << "=" << observed
            << (observed == cond.value ? " applied" : " skipped");
        log_event("Conditional", oss.str());
        if (observed != cond.value) {
            return;
        }
    }

    switch (g.kind) {
        case GateKind::H:
        case GateKind::X:
        case GateKind::Y:
        case GateKind::Z:
        case GateKind::S:
        case GateKind::RZ:
        case GateKind::RY:
        case GateKind::P:
            if (g.targets.size() != 1) {
                throw quantum_lab::InvalidArgumentError(::to_string(g.kind) + " expects one target");
            }
            backend_->apply_single_qubit_unitary(g.targets[0], gates::base_matrix(g.kind, g.theta));
            break;
        case GateKind::CNOT:
        case GateKind::CZ:
        case GateKind::CP: {
            if (g.targets.size() != 1 || g.controls.empty()) {
                throw quantum_lab::InvalidArgumentError(
                    ::to_string(g.kind) + " expects one target and at least one control");
            }
            const auto base = gates::base_matrix(g.kind, g.theta);
            if (g.controls.size() == 1) {
                backend_->apply_two_qubit_unitary(g.controls[0], g.targets[0], gates::controlled(base));
            } else {
                backend_->apply_controlled_unitary(g.controls, g.targets[0], base);
            }
            break;
        }
        case GateKind::SWAP:
            if (g.targets.size() != 2) {
                throw quantum_lab::InvalidArgumentError("SWAP expects two targets");
            }
            backend_->apply_two_qubit_unitary(g.targets[0], g.targets[1], gates::swap());
            break;
        default:
            throw quantum_lab::ConfigurationError(
                "Unsupported gate kind " + std::to_string(static_cast<int>(g.kind)));
    }

    check_normalized();

    std::ostringstream oss;
    oss << ::to_string(g.kind) << " targets=" << format_targets(g.targets);
    if (!g.controls.empty()) {
        oss << " controls=" << format_targets(g.controls);
    }
    if (is_parametric(g.kind)) {
        oss << " theta=" << g.theta;
    }
    log_event("ApplyGate", oss.str());
}

void StatevectorEngine::check_normalized() const {
    double total = 0.0;
    for (const auto& amp : backend_->state()) {
        total += std::norm(amp);
    }
    const double tolerance = kNormTolerancePerQubit * std::max(1, state_.n_qubits);
    if (std::abs(total - 1.0) > tolerance) {
        std::ostringstream oss;
        oss << "Statevector norm drifted to " << total;
        throw std::runtime_error(oss.str());
    }
}

std::vector<double> StatevectorEngine::outcome_probabilities(const std::vector<int>& targets) const {
    if (state_.n_qubits == 0) {
        throw std::runtime_error("Cannot compute probabilities before allocation");
    }
    for (int t : targets) {
        if (t < 0 || t >= state_.n_qubits) {
            throw quantum_lab::IndexError("Measurement target out of range");
        }
    }
    const auto& amps = backend_->state();
    std::vector<double> probs(static_cast<std::size_t>(1) << targets.size(), 0.0);
    for (std::size_t i = 0; i < amps.size(); ++i) {
        const double p = std::norm(amps[i]);
        if (p == 0.0) {
            continue;
        }
        probs[outcome_index(i, targets)] += p;
    }
    return probs;
}

MeasurementRecord StatevectorEngine::measure(const std::vector<int>& targets) {
    MeasurementRecord record;
    if (targets.empty()) {
        return record;
    }

    std::vector<double> outcome_probs = outcome_probabilities(targets);
    double total_prob = 0.0;
    for (double p : outcome_probs) {
        total_prob += p;
    }
    if (total_prob == 0.0) {
        throw std::runtime_error("State has zero norm before measurement");
    }
    for (auto& p : outcome_probs) {
        p /= total_prob;
    }

    std::discrete_distribution<std::size_t> dist(outcome_probs.begin(), outcome_probs.end());
    const std::size_t selected = dist(rng_);

    const double selected_prob = outcome_probs[selected];
    if (selected_prob == 0.0) {
        throw std::runtime_error("Selected measurement outcome has zero probability");
    }
    const double norm_factor = std::sqrt(selected_prob * total_prob);

    auto& amps = backend_->state();
    for (std::size_t i = 0; i < amps.size(); ++i) {
        if (outcome_index(i, targets) == selected) {
            amps[i] /= norm_factor;
        } else {
            amps[i] = {0.0, 0.0};
        }
    }

    record.targets = targets;
    record.bits.reserve(targets.size());
    for (std::size_t idx = 0; idx < targets.size(); ++idx) {
        record.bits.push_back(static_cast<int>((selected >> idx) & 1ULL));
    }

    if (noise_) {
        StdRandomStream noise_rng(rng_);
        noise_->apply_measurement_noise(record, noise_rng);
    }

    state_.measurements.push_back(record);

    std::ostringstream oss;
    oss << "Measure targets=" << format_targets(record.targets)
        << " bits=" << format_targets(record.bits)
        << " p=" << selected_prob;
    log_event("Measure", oss.str());
    return record;
}

void StatevectorEngine::measure_into(const MeasureOp& m) {
    if (m.clbit < 0 || m.clbit >= static_cast<int>(state_.clbits.size())) {
        throw quantum_lab::IndexError(
            "Classical bit " + std::to_string(m.clbit) + " out of range");
    }
    const MeasurementRecord record = measure({m.qubit});
    state_.clbits[static_cast<std::size_t>(m.clbit)] = record.bits[0];
}
