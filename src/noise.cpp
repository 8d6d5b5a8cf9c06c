#include "noise.hpp"

#include "errors.hpp"
#include "noise/measurement_noise_source.hpp"

#include <memory>
#include <random>
#include <utility>

StdRandomStream::StdRandomStream(std::mt19937_64& rng) : rng_(rng) {}

double StdRandomStream::uniform(double lo, double hi) {
    if (hi <= lo) {
        return lo;
    }
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

CompositeNoiseEngine::CompositeNoiseEngine(
    std::vector<std::shared_ptr<const NoiseEngine>> sources
)
    : sources_(std::move(sources)) {}

std::shared_ptr<const NoiseEngine> CompositeNoiseEngine::clone() const {
    std::vector<std::shared_ptr<const NoiseEngine>> clones;
    clones.reserve(sources_.size());
    for (const auto& source : sources_) {
        if (source) {
            clones.push_back(source->clone());
        }
    }
    return std::make_shared<CompositeNoiseEngine>(std::move(clones));
}

void CompositeNoiseEngine::add_source(std::shared_ptr<const NoiseEngine> source) {
    if (source) {
        sources_.push_back(std::move(source));
    }
}

void CompositeNoiseEngine::apply_measurement_noise(
    MeasurementRecord& record,
    RandomStream& rng
) const {
    for (const auto& source : sources_) {
        source->apply_measurement_noise(record, rng);
    }
}

void CompositeNoiseEngine::set_log_sink(LogSink sink) {
    for (const auto& source : sources_) {
        const_cast<NoiseEngine*>(source.get())->set_log_sink(sink);
    }
    NoiseEngine::set_log_sink(std::move(sink));
}

SimpleNoiseEngine::SimpleNoiseEngine(SimpleNoiseConfig config)
    : CompositeNoiseEngine(build_sources(config))
    , config_(config) {}

std::shared_ptr<const NoiseEngine> SimpleNoiseEngine::clone() const {
    return CompositeNoiseEngine::clone();
}

void SimpleNoiseEngine::validate_config(const SimpleNoiseConfig& config) {
    if (config.p_quantum_flip < 0.0 || config.p_quantum_flip > 1.0 ||
        config.readout.p_flip0_to_1 < 0.0 || config.readout.p_flip0_to_1 > 1.0 ||
        config.readout.p_flip1_to_0 < 0.0 || config.readout.p_flip1_to_0 > 1.0) {
        throw quantum_lab::InvalidArgumentError("Noise probabilities must be in [0, 1]");
    }
}

std::vector<std::shared_ptr<const NoiseEngine>> SimpleNoiseEngine::build_sources(
    const SimpleNoiseConfig& config
) {
    validate_config(config);
    std::vector<std::shared_ptr<const NoiseEngine>> sources;
    const bool has_measurement_noise =
        config.p_quantum_flip > 0.0 ||
        config.readout.p_flip0_to_1 > 0.0 ||
        config.readout.p_flip1_to_0 > 0.0;
    if (has_measurement_noise) {
        sources.push_back(std::make_shared<MeasurementNoiseSource>(
            config.p_quantum_flip,
            config.readout
        ));
    }
    return sources;
}
