#pragma once

#include "noise.hpp"

// Flips measured bits: first a symmetric flip with probability
// p_bit_flip, then asymmetric readout error from `readout`.
class MeasurementNoiseSource : public NoiseEngine {
  public:
    MeasurementNoiseSource(
        double p_bit_flip,
        MeasurementNoiseConfig readout
    );

    std::shared_ptr<const NoiseEngine> clone() const override;

    void apply_measurement_noise(
        MeasurementRecord& record,
        RandomStream& rng
    ) const override;

  private:
    double p_bit_flip_;
    MeasurementNoiseConfig readout_;
};
