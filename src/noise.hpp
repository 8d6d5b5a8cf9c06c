#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "vm/measurement_record.types.hpp"

// Configuration for classical readout noise on measurement outcomes.
// Probabilities are per bit and must lie in [0, 1].
struct MeasurementNoiseConfig {
    double p_flip0_to_1 = 0.0;
    double p_flip1_to_0 = 0.0;
};

// Measurement-time noise model, combining:
// - A symmetric bit flip standing in for channel or upstream errors.
// - Classical readout noise.
struct SimpleNoiseConfig {
    double p_quantum_flip = 0.0;
    MeasurementNoiseConfig readout{};
};

class RandomStream {
  public:
    virtual ~RandomStream() = default;
    virtual double uniform(double lo = 0.0, double hi = 1.0) = 0;
};

class StdRandomStream : public RandomStream {
  public:
    explicit StdRandomStream(std::mt19937_64& rng);

    double uniform(double lo, double hi) override;

  private:
    std::mt19937_64& rng_;
};

class NoiseEngine {
  public:
    using LogSink = std::function<void(const std::string&, const std::string&)>;

    virtual ~NoiseEngine() = default;

    virtual std::shared_ptr<const NoiseEngine> clone() const = 0;

    // Default implementation is a no-op to keep engines composable.
    virtual void apply_measurement_noise(
        MeasurementRecord& /*record*/,
        RandomStream& /*rng*/
    ) const {}

    virtual void set_log_sink(LogSink sink) { log_sink_ = std::move(sink); }

  protected:
    void log_event(const std::string& category, const std::string& message) const {
        if (log_sink_) {
            log_sink_(category, message);
        }
    }

  private:
    LogSink log_sink_;
};

class CompositeNoiseEngine : public NoiseEngine {
  public:
    CompositeNoiseEngine() = default;
    explicit CompositeNoiseEngine(
        std::vector<std::shared_ptr<const NoiseEngine>> sources
    );

    void add_source(std::shared_ptr<const NoiseEngine> source);

    std::shared_ptr<const NoiseEngine> clone() const override;

    void apply_measurement_noise(
        MeasurementRecord& record,
        RandomStream& rng
    ) const override;

    // Forwards the sink to every source. Only call on an engine obtained
    // from clone(), whose sources are not shared.
    void set_log_sink(LogSink sink) override;

  private:
    std::vector<std::shared_ptr<const NoiseEngine>> sources_;
};

// Simple engine realized as a composition of smaller noise sources.
class SimpleNoiseEngine : public CompositeNoiseEngine {
  public:
    explicit SimpleNoiseEngine(SimpleNoiseConfig config);

    std::shared_ptr<const NoiseEngine> clone() const override;

    const SimpleNoiseConfig& config() const { return config_; }

  private:
    static void validate_config(const SimpleNoiseConfig& config);
    static std::vector<std::shared_ptr<const NoiseEngine>> build_sources(
        const SimpleNoiseConfig& config
    );

    SimpleNoiseConfig config_;
};
