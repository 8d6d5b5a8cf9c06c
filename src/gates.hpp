#pragma once

#include <array>
#include <complex>

#include "vm/gate_set.hpp"

// Unitary matrices for the supported gate set. 2x2 matrices are row-major
// over [|0>, |1>]; 4x4 matrices are row-major over [|00>, |10>, |01>, |11>]
// with the left digit being the first qubit passed to the backend.

namespace gates {

using Matrix2 = std::array<std::complex<double>, 4>;
using Matrix4 = std::array<std::complex<double>, 16>;

Matrix2 hadamard();
Matrix2 pauli_x();
Matrix2 pauli_y();
Matrix2 pauli_z();
Matrix2 s_gate();

// diag(e^{-i theta/2}, e^{i theta/2})
Matrix2 rz(double theta);
Matrix2 ry(double theta);
// diag(1, e^{i theta})
Matrix2 phase(double theta);

// Matrix applied to the target for `kind`. For CNOT, CZ and CP this is the
// operation gated by the controls (X, Z and phase(theta) respectively).
// SWAP has no single-qubit form and raises InvalidArgumentError.
Matrix2 base_matrix(GateKind kind, double theta);

// Controlled-U with the control as the first qubit.
Matrix4 controlled(const Matrix2& u);
Matrix4 swap();

}  // namespace gates
