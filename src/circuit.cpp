#include "circuit.hpp"

#include "errors.hpp"

#include <algorithm>
#include <utility>

namespace {

GateOp make_gate(GateKind kind, std::vector<int> targets, std::vector<int> controls = {}, double theta = 0.0) {
    GateOp op;
    op.kind = kind;
    op.targets = std::move(targets);
    op.controls = std::move(controls);
    op.theta = theta;
    return op;
}

void check_measure(const MeasureOp& m, int n_qubits, int n_clbits) {
    if (m.qubit < 0 || m.qubit >= n_qubits) {
        throw quantum_lab::IndexError(
            "Measurement qubit " + std::to_string(m.qubit) + " out of range");
    }
    if (m.clbit < 0 || m.clbit >= n_clbits) {
        throw quantum_lab::IndexError(
            "Classical bit " + std::to_string(m.clbit) + " out of range");
    }
}

}  // namespace

Circuit::Circuit(
    std::string name,
    int n_qubits,
    int n_clbits,
    std::vector<Instruction> instructions,
    std::vector<int> readout
)
    : name_(std::move(name))
    , n_qubits_(n_qubits)
    , n_clbits_(n_clbits)
    , instructions_(std::move(instructions))
    , readout_(std::move(readout))
    , created_at_(std::chrono::system_clock::now()) {
    if (n_qubits_ <= 0) {
        throw quantum_lab::InvalidArgumentError("Circuit requires a positive number of qubits");
    }
    if (n_clbits_ < 0) {
        throw quantum_lab::InvalidArgumentError("Classical bit count must be non-negative");
    }
    for (const auto& instr : instructions_) {
        switch (instr.op) {
            case Op::ApplyGate:
                validate_gate(std::get<GateOp>(instr.payload), n_qubits_, n_clbits_);
                break;
            case Op::Measure:
                check_measure(std::get<MeasureOp>(instr.payload), n_qubits_, n_clbits_);
                break;
        }
    }

    if (readout_.empty()) {
        readout_.resize(static_cast<std::size_t>(n_qubits_));
        for (int q = 0; q < n_qubits_; ++q) {
            readout_[static_cast<std::size_t>(q)] = q;
        }
    }
    std::vector<int> sorted = readout_;
    std::sort(sorted.begin(), sorted.end());
    if (sorted.front() < 0 || sorted.back() >= n_qubits_) {
        throw quantum_lab::IndexError("Readout qubit out of range");
    }
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
        throw quantum_lab::InvalidArgumentError("Readout qubits must be distinct");
    }
}

std::size_t Circuit::gate_count() const {
    return static_cast<std::size_t>(std::count_if(
        instructions_.begin(), instructions_.end(),
        [](const Instruction& instr) { return instr.op == Op::ApplyGate; }));
}

bool Circuit::has_mid_circuit_measurement() const {
    return std::any_of(
        instructions_.begin(), instructions_.end(),
        [](const Instruction& instr) { return instr.op == Op::Measure; });
}

int Circuit::depth() const {
    std::vector<int> qubit_level(static_cast<std::size_t>(n_qubits_), 0);
    std::vector<int> clbit_level(static_cast<std::size_t>(n_clbits_), 0);
    int depth = 0;

    for (const auto& instr : instructions_) {
        int level = 0;
        if (instr.op == Op::ApplyGate) {
            const auto& g = std::get<GateOp>(instr.payload);
            for (int q : g.targets) {
                level = std::max(level, qubit_level[static_cast<std::size_t>(q)]);
            }
            for (int q : g.controls) {
                level = std::max(level, qubit_level[static_cast<std::size_t>(q)]);
            }
            if (g.condition) {
                level = std::max(level, clbit_level[static_cast<std::size_t>(g.condition->clbit)]);
            }
            ++level;
            for (int q : g.targets) {
                qubit_level[static_cast<std::size_t>(q)] = level;
            }
            for (int q : g.controls) {
                qubit_level[static_cast<std::size_t>(q)] = level;
            }
        } else {
            const auto& m = std::get<MeasureOp>(instr.payload);
            level = std::max(
                qubit_level[static_cast<std::size_t>(m.qubit)],
                clbit_level[static_cast<std::size_t>(m.clbit)]) + 1;
            qubit_level[static_cast<std::size_t>(m.qubit)] = level;
            clbit_level[static_cast<std::size_t>(m.clbit)] = level;
        }
        depth = std::max(depth, level);
    }
    return depth;
}

CircuitBuilder::CircuitBuilder(std::string name, int n_qubits, int n_clbits)
    : name_(std::move(name))
    , n_qubits_(n_qubits)
    , n_clbits_(n_clbits) {
    if (n_qubits_ <= 0) {
        throw quantum_lab::InvalidArgumentError("Circuit requires a positive number of qubits");
    }
}

CircuitBuilder& CircuitBuilder::h(int q) {
    return gate(make_gate(GateKind::H, {q}));
}

CircuitBuilder& CircuitBuilder::x(int q) {
    return gate(make_gate(GateKind::X, {q}));
}

CircuitBuilder& CircuitBuilder::y(int q) {
    return gate(make_gate(GateKind::Y, {q}));
}

CircuitBuilder& CircuitBuilder::z(int q) {
    return gate(make_gate(GateKind::Z, {q}));
}

CircuitBuilder& CircuitBuilder::s(int q) {
    return gate(make_gate(GateKind::S, {q}));
}

CircuitBuilder& CircuitBuilder::rz(double theta, int q) {
    return gate(make_gate(GateKind::RZ, {q}, {}, theta));
}

CircuitBuilder& CircuitBuilder::ry(double theta, int q) {
    return gate(make_gate(GateKind::RY, {q}, {}, theta));
}

CircuitBuilder& CircuitBuilder::p(double theta, int q) {
    return gate(make_gate(GateKind::P, {q}, {}, theta));
}

CircuitBuilder& CircuitBuilder::cnot(int control, int target) {
    return gate(make_gate(GateKind::CNOT, {target}, {control}));
}

CircuitBuilder& CircuitBuilder::cz(int control, int target) {
    return gate(make_gate(GateKind::CZ, {target}, {control}));
}

CircuitBuilder& CircuitBuilder::cp(double theta, int control, int target) {
    return gate(make_gate(GateKind::CP, {target}, {control}, theta));
}

CircuitBuilder& CircuitBuilder::mcp(double theta, const std::vector<int>& controls, int target) {
    if (controls.empty()) {
        return p(theta, target);
    }
    return gate(make_gate(GateKind::CP, {target}, controls, theta));
}

CircuitBuilder& CircuitBuilder::swap(int a, int b) {
    return gate(make_gate(GateKind::SWAP, {a, b}));
}

CircuitBuilder& CircuitBuilder::gate(GateOp op) {
    validate_gate(op, n_qubits_, n_clbits_);
    instructions_.push_back(Instruction{Op::ApplyGate, std::move(op)});
    return *this;
}

CircuitBuilder& CircuitBuilder::measure(int qubit, int clbit) {
    const MeasureOp m{qubit, clbit};
    check_measure(m, n_qubits_, n_clbits_);
    instructions_.push_back(Instruction{Op::Measure, m});
    return *this;
}

CircuitBuilder& CircuitBuilder::c_if(int clbit, int value) {
    if (instructions_.empty() || instructions_.back().op != Op::ApplyGate) {
        throw quantum_lab::InvalidArgumentError("c_if must follow a gate");
    }
    auto& g = std::get<GateOp>(instructions_.back().payload);
    g.condition = ClassicalCondition{clbit, value};
    validate_gate(g, n_qubits_, n_clbits_);
    return *this;
}

CircuitBuilder& CircuitBuilder::readout(std::vector<int> qubits) {
    readout_ = std::move(qubits);
    return *this;
}

Circuit CircuitBuilder::build() const {
    return Circuit(name_, n_qubits_, n_clbits_, instructions_, readout_);
}

Circuit build_circuit(
    const std::string& name,
    int n_qubits,
    const std::vector<std::string>& tokens,
    const std::map<std::size_t, TokenBinding>& bindings
) {
    if (n_qubits <= 0) {
        throw quantum_lab::InvalidArgumentError("Circuit requires a positive number of qubits");
    }
    for (const auto& entry : bindings) {
        if (entry.first >= tokens.size()) {
            throw quantum_lab::IndexError(
                "Binding refers to missing token " + std::to_string(entry.first));
        }
    }

    CircuitBuilder builder(name, n_qubits);
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const GateToken parsed = parse_gate_token(tokens[i]);
        GateOp op;
        op.kind = parsed.kind;
        op.theta = parsed.theta;

        const auto bound = bindings.find(i);
        if (bound != bindings.end()) {
            op.targets = bound->second.targets;
            op.controls = bound->second.controls;
        } else {
            const int first = static_cast<int>(i % static_cast<std::size_t>(n_qubits));
            if (binding_arity(parsed.kind) == 1) {
                op.targets = {first};
            } else {
                if (n_qubits < 2) {
                    throw quantum_lab::InvalidArgumentError(
                        "Two-qubit token " + tokens[i] + " requires at least two qubits");
                }
                const int second = (first + 1) % n_qubits;
                if (parsed.kind == GateKind::SWAP) {
                    op.targets = {first, second};
                } else {
                    op.controls = {first};
                    op.targets = {second};
                }
            }
        }
        builder.gate(std::move(op));
    }
    return builder.build();
}
