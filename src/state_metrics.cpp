#include "state_metrics.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>

namespace {

double entropy_term(double lambda) {
    return lambda > 1e-15 ? -lambda * std::log2(lambda) : 0.0;
}

}  // namespace

std::array<std::complex<double>, 4> reduced_density_matrix(
    const std::vector<std::complex<double>>& amplitudes,
    int qubit
) {
    if (amplitudes.empty()) {
        throw quantum_lab::InvalidArgumentError("Empty statevector");
    }
    const std::size_t dim = amplitudes.size();
    if (qubit < 0 || (static_cast<std::size_t>(1) << qubit) >= dim) {
        throw quantum_lab::IndexError("Invalid qubit index " + std::to_string(qubit));
    }
    const std::size_t bit = static_cast<std::size_t>(1) << qubit;

    std::array<std::complex<double>, 4> rho{};
    for (std::size_t i = 0; i < dim; ++i) {
        if ((i & bit) != 0) {
            continue;
        }
        const auto a0 = amplitudes[i];
        const auto a1 = amplitudes[i | bit];
        rho[0] += a0 * std::conj(a0);
        rho[1] += a0 * std::conj(a1);
        rho[2] += a1 * std::conj(a0);
        rho[3] += a1 * std::conj(a1);
    }
    return rho;
}

double entanglement_entropy(
    const std::vector<std::complex<double>>& amplitudes,
    int qubit
) {
    const auto rho = reduced_density_matrix(amplitudes, qubit);
    // Eigenvalues of a 2x2 Hermitian matrix with unit trace.
    const double a = rho[0].real();
    const double d = rho[3].real();
    const double trace = a + d;
    const double gap = std::sqrt((a - d) * (a - d) + 4.0 * std::norm(rho[1]));
    const double l0 = std::clamp(0.5 * (trace + gap), 0.0, 1.0);
    const double l1 = std::clamp(0.5 * (trace - gap), 0.0, 1.0);
    return entropy_term(l0) + entropy_term(l1);
}

double zz_correlation(
    const std::vector<std::complex<double>>& amplitudes,
    int qubit_a,
    int qubit_b
) {
    const std::size_t dim = amplitudes.size();
    for (const int q : {qubit_a, qubit_b}) {
        if (q < 0 || (static_cast<std::size_t>(1) << q) >= dim) {
            throw quantum_lab::IndexError("Invalid qubit index " + std::to_string(q));
        }
    }
    if (qubit_a == qubit_b) {
        throw quantum_lab::InvalidArgumentError("Correlation needs two distinct qubits");
    }
    const std::size_t mask = (static_cast<std::size_t>(1) << qubit_a) |
                             (static_cast<std::size_t>(1) << qubit_b);
    double correlation = 0.0;
    for (std::size_t i = 0; i < dim; ++i) {
        const std::size_t bits = i & mask;
        const bool agree = bits == 0 || bits == mask;
        correlation += (agree ? 1.0 : -1.0) * std::norm(amplitudes[i]);
    }
    return correlation;
}

double state_fidelity(
    const std::vector<std::complex<double>>& a,
    const std::vector<std::complex<double>>& b
) {
    if (a.size() != b.size()) {
        throw quantum_lab::InvalidArgumentError("Statevector dimensions differ");
    }
    std::complex<double> overlap{0.0, 0.0};
    for (std::size_t i = 0; i < a.size(); ++i) {
        overlap += std::conj(a[i]) * b[i];
    }
    return std::norm(overlap);
}

double distribution_fidelity(
    const Histogram& observed,
    const std::map<std::string, double>& ideal
) {
    if (observed.empty()) {
        throw quantum_lab::InvalidArgumentError("Histogram is empty");
    }
    const auto measured = observed.probabilities();
    double sum = 0.0;
    for (const auto& entry : ideal) {
        const auto it = measured.find(entry.first);
        if (it != measured.end()) {
            sum += std::sqrt(entry.second * it->second);
        }
    }
    return std::clamp(sum, 0.0, 1.0);
}
