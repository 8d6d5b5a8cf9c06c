#include "vm/gate_set.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace {

constexpr double kDefaultTokenAngle = M_PI / 4.0;

std::string to_upper(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool lookup_kind(const std::string& name, GateKind& kind) {
    if (name == "H") {
        kind = GateKind::H;
    } else if (name == "X") {
        kind = GateKind::X;
    } else if (name == "Y") {
        kind = GateKind::Y;
    } else if (name == "Z") {
        kind = GateKind::Z;
    } else if (name == "S") {
        kind = GateKind::S;
    } else if (name == "RZ") {
        kind = GateKind::RZ;
    } else if (name == "RY") {
        kind = GateKind::RY;
    } else if (name == "P") {
        kind = GateKind::P;
    } else if (name == "CNOT" || name == "CX") {
        kind = GateKind::CNOT;
    } else if (name == "CZ") {
        kind = GateKind::CZ;
    } else if (name == "CP") {
        kind = GateKind::CP;
    } else if (name == "SWAP") {
        kind = GateKind::SWAP;
    } else {
        return false;
    }
    return true;
}

void check_qubit(int qubit, int n_qubits) {
    if (qubit < 0 || qubit >= n_qubits) {
        throw quantum_lab::IndexError(
            "Qubit index " + std::to_string(qubit) + " out of range for " +
            std::to_string(n_qubits) + "-qubit register");
    }
}

}  // namespace

std::string to_string(GateKind kind) {
    switch (kind) {
        case GateKind::H:
            return "H";
        case GateKind::X:
            return "X";
        case GateKind::Y:
            return "Y";
        case GateKind::Z:
            return "Z";
        case GateKind::S:
            return "S";
        case GateKind::RZ:
            return "RZ";
        case GateKind::RY:
            return "RY";
        case GateKind::P:
            return "P";
        case GateKind::CNOT:
            return "CNOT";
        case GateKind::CZ:
            return "CZ";
        case GateKind::CP:
            return "CP";
        case GateKind::SWAP:
            return "SWAP";
    }
    throw quantum_lab::ConfigurationError(
        "Unknown gate kind " + std::to_string(static_cast<int>(kind)));
}

bool is_parametric(GateKind kind) {
    return kind == GateKind::RZ || kind == GateKind::RY ||
           kind == GateKind::P || kind == GateKind::CP;
}

bool is_controlled(GateKind kind) {
    return kind == GateKind::CNOT || kind == GateKind::CZ || kind == GateKind::CP;
}

int binding_arity(GateKind kind) {
    return (is_controlled(kind) || kind == GateKind::SWAP) ? 2 : 1;
}

GateToken parse_gate_token(const std::string& token) {
    const std::string text = trim(token);
    std::string name = text;
    std::string angle_text;
    const auto open = text.find('(');
    if (open != std::string::npos) {
        if (text.back() != ')') {
            throw quantum_lab::ConfigurationError("Malformed gate token: " + token);
        }
        name = trim(text.substr(0, open));
        angle_text = trim(text.substr(open + 1, text.size() - open - 2));
    }

    GateToken parsed;
    if (!lookup_kind(to_upper(name), parsed.kind)) {
        throw quantum_lab::ConfigurationError("Unknown gate token: " + token);
    }

    if (!is_parametric(parsed.kind)) {
        if (open != std::string::npos) {
            throw quantum_lab::ConfigurationError(
                "Gate token takes no angle: " + token);
        }
        return parsed;
    }

    parsed.theta = kDefaultTokenAngle;
    if (open != std::string::npos && angle_text.empty()) {
        throw quantum_lab::ConfigurationError("Malformed gate angle: " + token);
    }
    if (!angle_text.empty()) {
        std::size_t consumed = 0;
        try {
            parsed.theta = std::stod(angle_text, &consumed);
        } catch (const std::invalid_argument&) {
            throw quantum_lab::ConfigurationError("Malformed gate angle: " + token);
        } catch (const std::out_of_range&) {
            throw quantum_lab::InvalidArgumentError("Gate angle out of range: " + token);
        }
        if (consumed != angle_text.size()) {
            throw quantum_lab::ConfigurationError("Malformed gate angle: " + token);
        }
    }
    if (!std::isfinite(parsed.theta)) {
        throw quantum_lab::InvalidArgumentError("Gate angle must be finite: " + token);
    }
    return parsed;
}

void validate_gate(const GateOp& gate, int n_qubits, int n_clbits) {
    const std::string name = to_string(gate.kind);
    const std::size_t expected_targets = gate.kind == GateKind::SWAP ? 2 : 1;
    if (gate.targets.size() != expected_targets) {
        throw quantum_lab::InvalidArgumentError(
            name + " expects " + std::to_string(expected_targets) + " target(s)");
    }
    if (is_controlled(gate.kind)) {
        if (gate.controls.empty()) {
            throw quantum_lab::InvalidArgumentError(name + " requires at least one control");
        }
    } else if (!gate.controls.empty()) {
        throw quantum_lab::InvalidArgumentError(name + " does not take controls");
    }

    std::vector<int> qubits = gate.targets;
    qubits.insert(qubits.end(), gate.controls.begin(), gate.controls.end());
    for (int q : qubits) {
        check_qubit(q, n_qubits);
    }
    std::sort(qubits.begin(), qubits.end());
    if (std::adjacent_find(qubits.begin(), qubits.end()) != qubits.end()) {
        std::ostringstream oss;
        oss << name << " uses the same qubit more than once";
        throw quantum_lab::InvalidArgumentError(oss.str());
    }

    if (!std::isfinite(gate.theta)) {
        throw quantum_lab::InvalidArgumentError(name + " angle must be finite");
    }

    if (gate.condition) {
        const auto& cond = *gate.condition;
        if (cond.clbit < 0 || cond.clbit >= n_clbits) {
            throw quantum_lab::IndexError(
                "Classical bit " + std::to_string(cond.clbit) + " out of range");
        }
        if (cond.value != 0 && cond.value != 1) {
            throw quantum_lab::InvalidArgumentError("Classical condition value must be 0 or 1");
        }
    }
}

GateOp inverse(const GateOp& gate) {
    GateOp inv = gate;
    switch (gate.kind) {
        case GateKind::RZ:
        case GateKind::RY:
        case GateKind::P:
        case GateKind::CP:
            inv.theta = -gate.theta;
            break;
        case GateKind::S:
            inv.kind = GateKind::P;
            inv.theta = -M_PI / 2.0;
            break;
        case GateKind::H:
        case GateKind::X:
        case GateKind::Y:
        case GateKind::Z:
        case GateKind::CNOT:
        case GateKind::CZ:
        case GateKind::SWAP:
            break;
    }
    return inv;
}
