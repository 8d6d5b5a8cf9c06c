#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

// Instruction model shared by circuit construction, the statevector engine
// and the simulator. Contains no simulation state.

enum class GateKind {
    H,
    X,
    Y,
    Z,
    S,
    RZ,
    RY,
    P,
    CNOT,
    CZ,
    CP,
    SWAP,
};

// Gate applies only when classical bit `clbit` currently holds `value`.
struct ClassicalCondition {
    int clbit = 0;
    int value = 1;
};

// For CNOT / CZ / CP every entry of `controls` must be 1 for the base
// operation to act on targets[0]. SWAP has two targets and no controls.
struct GateOp {
    GateKind kind = GateKind::H;
    std::vector<int> targets;
    std::vector<int> controls;
    double theta = 0.0;
    std::optional<ClassicalCondition> condition;
};

// Mid-circuit measurement of one qubit; the outcome is written to `clbit`
// and the register is collapsed before execution continues.
struct MeasureOp {
    int qubit = 0;
    int clbit = 0;
};

enum class Op {
    ApplyGate,
    Measure,
};

struct Instruction {
    Op op;
    std::variant<GateOp, MeasureOp> payload;
};

// Result of parsing a textual gate token such as "h", "CNOT" or "RZ(0.5)".
struct GateToken {
    GateKind kind = GateKind::H;
    double theta = 0.0;
};

std::string to_string(GateKind kind);

bool is_parametric(GateKind kind);
bool is_controlled(GateKind kind);

// Number of qubits the token binds to under the default binding policy.
int binding_arity(GateKind kind);

// Throws quantum_lab::ConfigurationError naming the token when it is not a
// known gate. Rotation tokens default to pi/4 without an explicit angle.
GateToken parse_gate_token(const std::string& token);

// Checks index ranges, duplicate qubits, operand counts and angle
// finiteness against an n-qubit register with `n_clbits` classical bits.
void validate_gate(const GateOp& gate, int n_qubits, int n_clbits);

// Inverse of a gate: rotations and phases are negated, S becomes P(-pi/2),
// everything else in the set is self-inverse. The condition is kept.
GateOp inverse(const GateOp& gate);
