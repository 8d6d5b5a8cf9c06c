#include "cpu_state_backend.hpp"

#include "errors.hpp"

#include <algorithm>
#include <string>

void CpuStateBackend::alloc_array(int n) {
    if (n <= 0) {
        throw quantum_lab::InvalidArgumentError("AllocArray requires positive number of qubits");
    }
    if (n > kMaxQubits) {
        throw quantum_lab::InvalidArgumentError(
            "AllocArray supports at most " + std::to_string(kMaxQubits) + " qubits");
    }
    n_qubits_ = n;
    const std::size_t dim = static_cast<std::size_t>(1) << n;
    state_.assign(dim, std::complex<double>{0.0, 0.0});
    state_[0] = std::complex<double>{1.0, 0.0};
}

int CpuStateBackend::num_qubits() const {
    return n_qubits_;
}

std::vector<std::complex<double>>& CpuStateBackend::state() {
    return state_;
}

const std::vector<std::complex<double>>& CpuStateBackend::state() const {
    return state_;
}

void CpuStateBackend::check_qubit(int q) const {
    if (q < 0 || q >= n_qubits_) {
        throw quantum_lab::IndexError("Invalid qubit index " + std::to_string(q));
    }
}

void CpuStateBackend::apply_single_qubit_unitary(
    int q,
    const std::array<std::complex<double>, 4>& U
) {
    check_qubit(q);
    const std::size_t dim = state_.size();
    const std::size_t bit = static_cast<std::size_t>(1) << q;
    for (std::size_t i = 0; i < dim; ++i) {
        if ((i & bit) == 0) {
            const std::size_t j = i | bit;
            const auto a0 = state_[i];
            const auto a1 = state_[j];
            state_[i] = U[0] * a0 + U[1] * a1;
            state_[j] = U[2] * a0 + U[3] * a1;
        }
    }
}

void CpuStateBackend::apply_two_qubit_unitary(
    int q0,
    int q1,
    const std::array<std::complex<double>, 16>& U
) {
    check_qubit(q0);
    check_qubit(q1);
    if (q0 == q1) {
        throw quantum_lab::InvalidArgumentError("Two-qubit gate requires distinct targets");
    }
    const std::size_t dim = state_.size();
    const std::size_t b0 = static_cast<std::size_t>(1) << q0;
    const std::size_t b1 = static_cast<std::size_t>(1) << q1;

    for (std::size_t i = 0; i < dim; ++i) {
        if (((i & b0) == 0) && ((i & b1) == 0)) {
            // Block order follows the matrix layout: q0 is the low digit.
            const std::array<std::size_t, 4> idx = {i, i | b0, i | b1, i | b0 | b1};
            const std::array<std::complex<double>, 4> in = {
                state_[idx[0]], state_[idx[1]], state_[idx[2]], state_[idx[3]]};

            for (int row = 0; row < 4; ++row) {
                std::complex<double> acc{0.0, 0.0};
                for (int col = 0; col < 4; ++col) {
                    acc += U[4 * row + col] * in[col];
                }
                state_[idx[row]] = acc;
            }
        }
    }
}

void CpuStateBackend::apply_controlled_unitary(
    const std::vector<int>& controls,
    int target,
    const std::array<std::complex<double>, 4>& U
) {
    check_qubit(target);
    std::size_t control_mask = 0;
    for (int c : controls) {
        check_qubit(c);
        if (c == target) {
            throw quantum_lab::InvalidArgumentError("Control and target must differ");
        }
        control_mask |= static_cast<std::size_t>(1) << c;
    }
    const std::size_t dim = state_.size();
    const std::size_t bit = static_cast<std::size_t>(1) << target;
    for (std::size_t i = 0; i < dim; ++i) {
        if ((i & bit) == 0 && (i & control_mask) == control_mask) {
            const std::size_t j = i | bit;
            const auto a0 = state_[i];
            const auto a1 = state_[j];
            state_[i] = U[0] * a0 + U[1] * a1;
            state_[j] = U[2] * a0 + U[3] * a1;
        }
    }
}
