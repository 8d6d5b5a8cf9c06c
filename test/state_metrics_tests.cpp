#include "errors.hpp"
#include "histogram.hpp"
#include "state_metrics.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <complex>
#include <vector>

namespace {

using Amplitudes = std::vector<std::complex<double>>;

Amplitudes bell_amplitudes() {
    const double inv_sqrt2 = 1.0 / std::sqrt(2.0);
    return {inv_sqrt2, 0.0, 0.0, inv_sqrt2};
}

}  // namespace

TEST(StateMetricsTests, BellStateIsMaximallyEntangled) {
    EXPECT_NEAR(entanglement_entropy(bell_amplitudes(), 0), 1.0, 1e-9);
    EXPECT_NEAR(entanglement_entropy(bell_amplitudes(), 1), 1.0, 1e-9);
}

TEST(StateMetricsTests, ProductStateHasNoEntanglement) {
    const double inv_sqrt2 = 1.0 / std::sqrt(2.0);
    // |+> on qubit 0, |0> on qubit 1.
    const Amplitudes product = {inv_sqrt2, inv_sqrt2, 0.0, 0.0};
    EXPECT_NEAR(entanglement_entropy(product, 0), 0.0, 1e-9);
    EXPECT_NEAR(entanglement_entropy(product, 1), 0.0, 1e-9);
}

TEST(StateMetricsTests, ReducedDensityMatrixOfBellState) {
    const auto rho = reduced_density_matrix(bell_amplitudes(), 1);
    EXPECT_NEAR(rho[0].real(), 0.5, 1e-12);
    EXPECT_NEAR(rho[3].real(), 0.5, 1e-12);
    EXPECT_NEAR(std::abs(rho[1]), 0.0, 1e-12);
    EXPECT_NEAR(std::abs(rho[2]), 0.0, 1e-12);

    EXPECT_THROW(reduced_density_matrix(bell_amplitudes(), 2), quantum_lab::IndexError);
    EXPECT_THROW(reduced_density_matrix({}, 0), quantum_lab::InvalidArgumentError);
}

TEST(StateMetricsTests, StateFidelityIgnoresGlobalPhase) {
    const Amplitudes a = bell_amplitudes();
    Amplitudes b = a;
    for (auto& amp : b) {
        amp *= std::polar(1.0, 0.7);
    }
    EXPECT_NEAR(state_fidelity(a, b), 1.0, 1e-12);

    const Amplitudes zero = {1.0, 0.0, 0.0, 0.0};
    EXPECT_NEAR(state_fidelity(a, zero), 0.5, 1e-12);

    EXPECT_THROW(state_fidelity(a, {1.0, 0.0}), quantum_lab::InvalidArgumentError);
}

TEST(StateMetricsTests, DistributionFidelityMatchesBhattacharyya) {
    Histogram ideal_counts;
    ideal_counts.add("00", 50);
    ideal_counts.add("11", 50);
    EXPECT_NEAR(distribution_fidelity(ideal_counts, {{"00", 0.5}, {"11", 0.5}}), 1.0, 1e-12);

    Histogram skewed;
    skewed.add("00", 100);
    EXPECT_NEAR(
        distribution_fidelity(skewed, {{"00", 0.5}, {"11", 0.5}}),
        std::sqrt(0.5),
        1e-12);

    EXPECT_THROW(distribution_fidelity(Histogram(), {{"0", 1.0}}), quantum_lab::InvalidArgumentError);
}
