#pragma once

#include <array>
#include <complex>
#include <map>
#include <string>
#include <vector>

#include "histogram.hpp"

// Single-qubit reduced density matrix rho = Tr_rest |psi><psi|, row-major
// over [|0>, |1>].
std::array<std::complex<double>, 4> reduced_density_matrix(
    const std::vector<std::complex<double>>& amplitudes,
    int qubit
);

// Von Neumann entropy (base 2) of `qubit`'s reduced state. 0 for a product
// state, 1 for one half of a Bell pair.
double entanglement_entropy(
    const std::vector<std::complex<double>>& amplitudes,
    int qubit
);

// <Z_a Z_b>: +1 when the two qubits always agree, -1 when they always
// differ.
double zz_correlation(
    const std::vector<std::complex<double>>& amplitudes,
    int qubit_a,
    int qubit_b
);

// |<a|b>|^2
double state_fidelity(
    const std::vector<std::complex<double>>& a,
    const std::vector<std::complex<double>>& b
);

// Classical (Bhattacharyya) fidelity between observed frequencies and an
// ideal distribution, sum_k sqrt(p_k q_k), clipped to [0, 1].
double distribution_fidelity(
    const Histogram& observed,
    const std::map<std::string, double>& ideal
);
