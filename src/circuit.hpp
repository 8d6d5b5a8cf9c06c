#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "vm/gate_set.hpp"

// Immutable, validated instruction sequence over a fixed number of qubits
// and classical bits. `readout` lists the qubits sampled at the end of a
// run; bit j of an outcome is the value of readout[j].
class Circuit {
  public:
    Circuit(
        std::string name,
        int n_qubits,
        int n_clbits,
        std::vector<Instruction> instructions,
        std::vector<int> readout = {}
    );

    const std::string& name() const { return name_; }
    int num_qubits() const { return n_qubits_; }
    int num_clbits() const { return n_clbits_; }
    const std::vector<Instruction>& instructions() const { return instructions_; }
    const std::vector<int>& readout() const { return readout_; }
    std::chrono::system_clock::time_point created_at() const { return created_at_; }

    std::size_t gate_count() const;
    bool has_mid_circuit_measurement() const;

    // Number of layers when every instruction is scheduled right after the
    // latest instruction sharing one of its qubits or classical bits.
    int depth() const;

  private:
    std::string name_;
    int n_qubits_;
    int n_clbits_;
    std::vector<Instruction> instructions_;
    std::vector<int> readout_;
    std::chrono::system_clock::time_point created_at_;
};

class CircuitBuilder {
  public:
    CircuitBuilder(std::string name, int n_qubits, int n_clbits = 0);

    CircuitBuilder& h(int q);
    CircuitBuilder& x(int q);
    CircuitBuilder& y(int q);
    CircuitBuilder& z(int q);
    CircuitBuilder& s(int q);
    CircuitBuilder& rz(double theta, int q);
    CircuitBuilder& ry(double theta, int q);
    CircuitBuilder& p(double theta, int q);
    CircuitBuilder& cnot(int control, int target);
    CircuitBuilder& cz(int control, int target);
    CircuitBuilder& cp(double theta, int control, int target);
    // Phase applied when every control and the target are 1. With no
    // controls this is a plain P(theta) on the target.
    CircuitBuilder& mcp(double theta, const std::vector<int>& controls, int target);
    CircuitBuilder& swap(int a, int b);
    CircuitBuilder& gate(GateOp op);

    CircuitBuilder& measure(int qubit, int clbit);

    // Conditions the most recently added gate on a classical bit.
    CircuitBuilder& c_if(int clbit, int value = 1);

    CircuitBuilder& readout(std::vector<int> qubits);

    int num_qubits() const { return n_qubits_; }
    const std::vector<Instruction>& instructions() const { return instructions_; }

    Circuit build() const;

  private:
    std::string name_;
    int n_qubits_;
    int n_clbits_;
    std::vector<Instruction> instructions_;
    std::vector<int> readout_;
};

// Explicit operands for one gate token, overriding the default binding.
struct TokenBinding {
    std::vector<int> targets;
    std::vector<int> controls;
};

// Builds a circuit from textual gate tokens. Token i binds to qubit
// i mod n; two-qubit tokens bind to (i mod n, (i mod n + 1) mod n) as
// (control, target) or, for SWAP, both targets. `bindings` maps a token
// index to explicit operands. Unknown tokens raise ConfigurationError.
Circuit build_circuit(
    const std::string& name,
    int n_qubits,
    const std::vector<std::string>& tokens,
    const std::map<std::size_t, TokenBinding>& bindings = {}
);
