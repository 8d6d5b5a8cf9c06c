#include "noise/measurement_noise_source.hpp"

#include "errors.hpp"

#include <string>

namespace {

bool is_probability(double p) {
    return p >= 0.0 && p <= 1.0;
}

}  // namespace

MeasurementNoiseSource::MeasurementNoiseSource(
    double p_bit_flip,
    MeasurementNoiseConfig readout
)
    : p_bit_flip_(p_bit_flip)
    , readout_(readout) {
    if (!is_probability(p_bit_flip_) ||
        !is_probability(readout_.p_flip0_to_1) ||
        !is_probability(readout_.p_flip1_to_0)) {
        throw quantum_lab::InvalidArgumentError("Noise probabilities must be in [0, 1]");
    }
}

std::shared_ptr<const NoiseEngine> MeasurementNoiseSource::clone() const {
    return std::make_shared<MeasurementNoiseSource>(*this);
}

void MeasurementNoiseSource::apply_measurement_noise(
    MeasurementRecord& record,
    RandomStream& rng
) const {
    const bool has_flip = p_bit_flip_ > 0.0;
    const bool has_readout =
        readout_.p_flip0_to_1 > 0.0 || readout_.p_flip1_to_0 > 0.0;

    if (!has_flip && !has_readout) {
        return;
    }

    for (std::size_t idx = 0; idx < record.bits.size(); ++idx) {
        int& bit = record.bits[idx];
        const std::string qubit =
            idx < record.targets.size() ? std::to_string(record.targets[idx]) : "?";

        if (has_flip && rng.uniform(0.0, 1.0) < p_bit_flip_) {
            const int before = bit;
            bit = 1 - bit;
            log_event(
                "Noise",
                "type=bit_flip qubit=" + qubit +
                    " before=" + std::to_string(before) +
                    " after=" + std::to_string(bit) +
                    " p=" + std::to_string(p_bit_flip_)
            );
        }

        if (has_readout) {
            const double r = rng.uniform(0.0, 1.0);
            const double p = bit == 0 ? readout_.p_flip0_to_1 : readout_.p_flip1_to_0;
            if (r < p) {
                const int before = bit;
                bit = 1 - bit;
                log_event(
                    "Noise",
                    "type=readout_flip qubit=" + qubit +
                        " before=" + std::to_string(before) +
                        " after=" + std::to_string(bit) +
                        " p=" + std::to_string(p)
                );
            }
        }
    }
}
