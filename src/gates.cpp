#include "gates.hpp"

#include "errors.hpp"

#include <cmath>

namespace gates {

namespace {

const std::complex<double> kZero{0.0, 0.0};
const std::complex<double> kOne{1.0, 0.0};

std::complex<double> unit_phase(double angle) {
    return {std::cos(angle), std::sin(angle)};
}

}  // namespace

Matrix2 hadamard() {
    const double inv_sqrt2 = 1.0 / std::sqrt(2.0);
    return {{{inv_sqrt2, 0.0}, {inv_sqrt2, 0.0}, {inv_sqrt2, 0.0}, {-inv_sqrt2, 0.0}}};
}

Matrix2 pauli_x() {
    return {{kZero, kOne, kOne, kZero}};
}

Matrix2 pauli_y() {
    return {{kZero, {0.0, -1.0}, {0.0, 1.0}, kZero}};
}

Matrix2 pauli_z() {
    return {{kOne, kZero, kZero, {-1.0, 0.0}}};
}

Matrix2 s_gate() {
    return {{kOne, kZero, kZero, {0.0, 1.0}}};
}

Matrix2 rz(double theta) {
    return {{unit_phase(-0.5 * theta), kZero, kZero, unit_phase(0.5 * theta)}};
}

Matrix2 ry(double theta) {
    const double c = std::cos(0.5 * theta);
    const double s = std::sin(0.5 * theta);
    return {{{c, 0.0}, {-s, 0.0}, {s, 0.0}, {c, 0.0}}};
}

Matrix2 phase(double theta) {
    return {{kOne, kZero, kZero, unit_phase(theta)}};
}

Matrix2 base_matrix(GateKind kind, double theta) {
    switch (kind) {
        case GateKind::H:
            return hadamard();
        case GateKind::X:
        case GateKind::CNOT:
            return pauli_x();
        case GateKind::Y:
            return pauli_y();
        case GateKind::Z:
        case GateKind::CZ:
            return pauli_z();
        case GateKind::S:
            return s_gate();
        case GateKind::RZ:
            return rz(theta);
        case GateKind::RY:
            return ry(theta);
        case GateKind::P:
        case GateKind::CP:
            return phase(theta);
        case GateKind::SWAP:
            throw quantum_lab::InvalidArgumentError("SWAP has no single-qubit matrix");
    }
    throw quantum_lab::ConfigurationError(
        "Unknown gate kind " + std::to_string(static_cast<int>(kind)));
}

Matrix4 controlled(const Matrix2& u) {
    Matrix4 U{};
    U[0] = kOne;
    U[10] = kOne;
    // Control set: rows/cols 1 (|10>) and 3 (|11>).
    U[4 * 1 + 1] = u[0];
    U[4 * 1 + 3] = u[1];
    U[4 * 3 + 1] = u[2];
    U[4 * 3 + 3] = u[3];
    return U;
}

Matrix4 swap() {
    Matrix4 U{};
    U[0] = kOne;
    U[4 * 1 + 2] = kOne;
    U[4 * 2 + 1] = kOne;
    U[15] = kOne;
    return U;
}

}  // namespace gates
