#include "protocols/bb84.hpp"

#include "errors.hpp"
#include "noise/measurement_noise_source.hpp"
#include "protocols/random_generator.hpp"

#include <random>

namespace quantum_lab {

namespace {

bool is_probability(double p) {
    return p >= 0.0 && p <= 1.0;
}

Basis random_basis(std::mt19937_64& rng) {
    return (rng() & 1ULL) ? Basis::Diagonal : Basis::Rectilinear;
}

}  // namespace

Circuit bb84_trial_circuit(
    int bit,
    Basis sender_basis,
    Basis receiver_basis,
    const Basis* eve_basis
) {
    CircuitBuilder builder("bb84_trial", 1, eve_basis ? 1 : 0);
    if (bit == 1) {
        builder.x(0);
    }
    if (sender_basis == Basis::Diagonal) {
        builder.h(0);
    }
    if (eve_basis) {
        // Intercept-resend: measure in Eve's basis, then re-prepare the
        // observed state in that same basis.
        if (*eve_basis == Basis::Diagonal) {
            builder.h(0);
        }
        builder.measure(0, 0);
        if (*eve_basis == Basis::Diagonal) {
            builder.h(0);
        }
    }
    if (receiver_basis == Basis::Diagonal) {
        builder.h(0);
    }
    return builder.build();
}

Bb84Report run_bb84(
    const Simulator& simulator,
    int key_length,
    const Bb84Channel& channel,
    std::uint64_t seed
) {
    if (key_length <= 0) {
        throw InvalidArgumentError("Key length must be positive");
    }
    if (!is_probability(channel.bit_flip_probability) ||
        !is_probability(channel.eavesdrop_probability)) {
        throw InvalidArgumentError("Channel probabilities must be in [0, 1]");
    }

    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    const MeasurementNoiseSource channel_noise(channel.bit_flip_probability, MeasurementNoiseConfig{});

    Bb84Report report;
    report.key_length = key_length;
    const int max_trials = 2 * key_length;
    int errors = 0;

    while (report.trials < max_trials &&
           static_cast<int>(report.sender_key.size()) < key_length) {
        ++report.trials;
        const int bit = static_cast<int>(rng() & 1ULL);
        const Basis sender_basis = random_basis(rng);
        const Basis receiver_basis = random_basis(rng);
        const bool intercept = channel.eavesdrop_probability > 0.0 &&
                               unit(rng) < channel.eavesdrop_probability;
        const Basis eve_basis = random_basis(rng);
        if (intercept) {
            ++report.intercepted;
        }

        const Circuit trial = bb84_trial_circuit(
            bit, sender_basis, receiver_basis, intercept ? &eve_basis : nullptr);
        const auto shot = simulator.measure_single(trial, rng());

        MeasurementRecord received;
        received.targets = {0};
        received.bits = {shot.bitstring == "1" ? 1 : 0};
        StdRandomStream noise_rng(rng);
        channel_noise.apply_measurement_noise(received, noise_rng);

        if (sender_basis != receiver_basis) {
            continue;
        }
        report.sender_key.push_back(bit == 1 ? '1' : '0');
        report.receiver_key.push_back(received.bits[0] == 1 ? '1' : '0');
        if (received.bits[0] != bit) {
            ++errors;
        }
    }

    const int sifted = static_cast<int>(report.sender_key.size());
    report.partial = sifted < key_length;
    report.error_rate = sifted > 0 ? static_cast<double>(errors) / sifted : 0.0;
    report.efficiency = static_cast<double>(sifted) / report.trials;
    report.key_hex = report.receiver_key.empty() ? "" : binary_to_hex(report.receiver_key);
    report.security_level =
        report.error_rate < kBb84SecurityThreshold ? "HIGH" : "COMPROMISED";
    return report;
}

}  // namespace quantum_lab
