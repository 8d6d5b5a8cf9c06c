#include "cpu_state_backend.hpp"
#include "errors.hpp"
#include "gates.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <complex>
#include <vector>

namespace {

double total_probability(const std::vector<std::complex<double>>& state) {
    double total = 0.0;
    for (const auto& amp : state) {
        total += std::norm(amp);
    }
    return total;
}

}  // namespace

TEST(CpuStateBackendTests, AllocStartsInGroundState) {
    CpuStateBackend backend;
    backend.alloc_array(3);

    const auto& state = backend.state();
    ASSERT_EQ(state.size(), 8u);
    EXPECT_EQ(backend.num_qubits(), 3);
    EXPECT_DOUBLE_EQ(std::real(state[0]), 1.0);
    for (std::size_t i = 1; i < state.size(); ++i) {
        EXPECT_EQ(state[i], std::complex<double>(0.0, 0.0));
    }
}

TEST(CpuStateBackendTests, RejectsInvalidRegisterSizes) {
    CpuStateBackend backend;
    EXPECT_THROW(backend.alloc_array(0), quantum_lab::InvalidArgumentError);
    EXPECT_THROW(backend.alloc_array(-2), quantum_lab::InvalidArgumentError);
    EXPECT_THROW(
        backend.alloc_array(CpuStateBackend::kMaxQubits + 1),
        quantum_lab::InvalidArgumentError);
}

TEST(CpuStateBackendTests, QubitIndexIsLittleEndian) {
    CpuStateBackend backend;
    backend.alloc_array(3);
    backend.apply_single_qubit_unitary(1, gates::pauli_x());

    const auto& state = backend.state();
    EXPECT_NEAR(std::abs(state[2]), 1.0, 1e-12);
    EXPECT_NEAR(std::abs(state[0]), 0.0, 1e-12);
}

TEST(CpuStateBackendTests, HadamardProducesUniformSuperposition) {
    CpuStateBackend backend;
    backend.alloc_array(1);
    backend.apply_single_qubit_unitary(0, gates::hadamard());

    const double inv_sqrt2 = 1.0 / std::sqrt(2.0);
    const auto& state = backend.state();
    EXPECT_NEAR(std::real(state[0]), inv_sqrt2, 1e-12);
    EXPECT_NEAR(std::real(state[1]), inv_sqrt2, 1e-12);
}

TEST(CpuStateBackendTests, ControlledGateUsesFirstQubitAsControl) {
    CpuStateBackend backend;
    backend.alloc_array(2);

    // Control on qubit 1 is |0>: nothing happens.
    backend.apply_two_qubit_unitary(1, 0, gates::controlled(gates::pauli_x()));
    EXPECT_NEAR(std::abs(backend.state()[0]), 1.0, 1e-12);

    backend.apply_single_qubit_unitary(1, gates::pauli_x());
    backend.apply_two_qubit_unitary(1, 0, gates::controlled(gates::pauli_x()));
    EXPECT_NEAR(std::abs(backend.state()[3]), 1.0, 1e-12);
    EXPECT_NEAR(std::abs(backend.state()[2]), 0.0, 1e-12);
}

TEST(CpuStateBackendTests, SwapExchangesQubits) {
    CpuStateBackend backend;
    backend.alloc_array(3);
    backend.apply_single_qubit_unitary(0, gates::pauli_x());
    backend.apply_two_qubit_unitary(0, 2, gates::swap());

    EXPECT_NEAR(std::abs(backend.state()[4]), 1.0, 1e-12);
    EXPECT_NEAR(std::abs(backend.state()[1]), 0.0, 1e-12);
}

TEST(CpuStateBackendTests, MultiControlledGateRequiresAllControls) {
    CpuStateBackend backend;
    backend.alloc_array(3);
    backend.apply_single_qubit_unitary(0, gates::pauli_x());

    backend.apply_controlled_unitary({0, 1}, 2, gates::pauli_x());
    EXPECT_NEAR(std::abs(backend.state()[1]), 1.0, 1e-12);

    backend.apply_single_qubit_unitary(1, gates::pauli_x());
    backend.apply_controlled_unitary({0, 1}, 2, gates::pauli_x());
    EXPECT_NEAR(std::abs(backend.state()[7]), 1.0, 1e-12);
}

TEST(CpuStateBackendTests, RejectsBadQubitArguments) {
    CpuStateBackend backend;
    backend.alloc_array(2);

    EXPECT_THROW(backend.apply_single_qubit_unitary(2, gates::hadamard()), quantum_lab::IndexError);
    EXPECT_THROW(backend.apply_single_qubit_unitary(-1, gates::hadamard()), quantum_lab::IndexError);
    EXPECT_THROW(
        backend.apply_two_qubit_unitary(1, 1, gates::swap()),
        quantum_lab::InvalidArgumentError);
    EXPECT_THROW(
        backend.apply_controlled_unitary({1}, 1, gates::pauli_x()),
        quantum_lab::InvalidArgumentError);
}

TEST(CpuStateBackendTests, RotationsPreserveNorm) {
    CpuStateBackend backend;
    backend.alloc_array(2);
    backend.apply_single_qubit_unitary(0, gates::ry(0.73));
    backend.apply_single_qubit_unitary(1, gates::hadamard());
    backend.apply_single_qubit_unitary(0, gates::rz(-1.9));
    backend.apply_two_qubit_unitary(0, 1, gates::controlled(gates::phase(2.1)));

    EXPECT_NEAR(total_probability(backend.state()), 1.0, 1e-12);
}

TEST(GateMatrixTests, RzIsSymmetricPhase) {
    const double theta = 0.8;
    const auto m = gates::rz(theta);
    EXPECT_NEAR(std::arg(m[0]), -theta / 2.0, 1e-12);
    EXPECT_NEAR(std::arg(m[3]), theta / 2.0, 1e-12);
    EXPECT_EQ(m[1], std::complex<double>(0.0, 0.0));
    EXPECT_EQ(m[2], std::complex<double>(0.0, 0.0));
}

TEST(GateMatrixTests, ControlledMatrixLayout) {
    const auto u = gates::controlled(gates::pauli_x());
    // Rows over [|00>, |10>, |01>, |11>]; the control is the left digit.
    EXPECT_EQ(u[0], std::complex<double>(1.0, 0.0));
    EXPECT_EQ(u[10], std::complex<double>(1.0, 0.0));
    EXPECT_EQ(u[4 * 1 + 3], std::complex<double>(1.0, 0.0));
    EXPECT_EQ(u[4 * 3 + 1], std::complex<double>(1.0, 0.0));
    EXPECT_EQ(u[4 * 1 + 1], std::complex<double>(0.0, 0.0));
}

TEST(GateMatrixTests, BaseMatrixOfSwapIsRejected) {
    EXPECT_THROW(gates::base_matrix(GateKind::SWAP, 0.0), quantum_lab::InvalidArgumentError);
}
