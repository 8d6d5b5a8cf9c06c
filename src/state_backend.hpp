#pragma once

#include <array>
#include <complex>
#include <cstddef>
#include <string>
#include <vector>

// Amplitude register interface. Bit i of a basis-state index is the value
// of qubit i.
class StateBackend {
  public:
    virtual ~StateBackend() = default;

    virtual std::string name() const = 0;

    virtual void alloc_array(int n) = 0;
    virtual int num_qubits() const = 0;

    virtual std::vector<std::complex<double>>& state() = 0;
    virtual const std::vector<std::complex<double>>& state() const = 0;

    virtual void apply_single_qubit_unitary(
        int q,
        const std::array<std::complex<double>, 4>& U
    ) = 0;

    // U acts on the pair (q0, q1) in basis order [|00>, |10>, |01>, |11>]
    // where the left digit is q0.
    virtual void apply_two_qubit_unitary(
        int q0,
        int q1,
        const std::array<std::complex<double>, 16>& U
    ) = 0;

    // Applies U to `target` on basis states where every control bit is 1.
    virtual void apply_controlled_unitary(
        const std::vector<int>& controls,
        int target,
        const std::array<std::complex<double>, 4>& U
    ) = 0;
};
