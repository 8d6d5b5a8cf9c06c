#include "circuit.hpp"
#include "errors.hpp"
#include "noise.hpp"
#include "progress_reporter.hpp"
#include "simulator.hpp"
#include "thread_joiner.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace {

Circuit bell_circuit() {
    return CircuitBuilder("bell", 2).h(0).cnot(0, 1).build();
}

Circuit coin_feed_forward_circuit() {
    // Qubit 1 copies the measured coin on qubit 0 through a classical bit.
    return CircuitBuilder("coin", 2, 1).h(0).measure(0, 0).x(1).c_if(0).readout({1}).build();
}

class RecordingReporter : public quantum_lab::ProgressReporter {
  public:
    void set_total_steps(std::size_t total_steps) override { total = total_steps; }
    void increment_completed_steps(std::size_t delta) override { completed += delta; }
    void record_log(const ExecutionLog& log) override { categories.push_back(log.category); }

    std::size_t total = 0;
    std::size_t completed = 0;
    std::vector<std::string> categories;
};

SimulatorOptions with_threads(std::size_t threads) {
    SimulatorOptions options;
    options.max_threads = threads;
    return options;
}

}  // namespace

TEST(SimulatorTests, BellCountsFollowBornRule) {
    const Simulator simulator;
    const int shots = 4000;
    const auto result = simulator.run(bell_circuit(), shots, 1234);

    EXPECT_EQ(result.counts.total(), static_cast<std::uint64_t>(shots));
    EXPECT_EQ(result.counts.count("01"), 0u);
    EXPECT_EQ(result.counts.count("10"), 0u);

    const double sigma = std::sqrt(shots * 0.25);
    EXPECT_NEAR(static_cast<double>(result.counts.count("00")), shots / 2.0, 3.0 * sigma);
    EXPECT_NEAR(static_cast<double>(result.counts.count("11")), shots / 2.0, 3.0 * sigma);

    ASSERT_EQ(result.probabilities.size(), 4u);
    EXPECT_NEAR(result.probabilities[0], 0.5, 1e-12);
    EXPECT_NEAR(result.probabilities[3], 0.5, 1e-12);
}

TEST(SimulatorTests, ReadoutSubsetOrdersBitsByReadoutPosition) {
    const Simulator simulator;
    // Qubit 2 is |1>; readout {2, 0} puts it in the lowest position.
    const Circuit circuit = CircuitBuilder("subset", 3).x(2).readout({2, 0}).build();
    const auto result = simulator.run(circuit, 10, 1);
    EXPECT_EQ(result.counts.count("01"), 10u);
}

TEST(SimulatorTests, SameSeedSameCountsAcrossThreadCounts) {
    const Circuit circuit = CircuitBuilder("uniform", 3).h(0).h(1).h(2).build();
    const auto single = Simulator(with_threads(1)).run(circuit, 3000, 42);
    const auto parallel = Simulator(with_threads(4)).run(circuit, 3000, 42);
    EXPECT_EQ(single.counts.counts(), parallel.counts.counts());

    const auto again = Simulator(with_threads(4)).run(circuit, 3000, 42);
    EXPECT_EQ(parallel.counts.counts(), again.counts.counts());
}

TEST(SimulatorTests, TrajectoriesForMidCircuitMeasurement) {
    const Circuit circuit = coin_feed_forward_circuit();
    const auto single = Simulator(with_threads(1)).run(circuit, 600, 9);
    const auto parallel = Simulator(with_threads(3)).run(circuit, 600, 9);

    EXPECT_EQ(single.counts.total(), 600u);
    EXPECT_GT(single.counts.count("0"), 0u);
    EXPECT_GT(single.counts.count("1"), 0u);
    EXPECT_EQ(single.counts.counts(), parallel.counts.counts());
}

TEST(SimulatorTests, RejectsNonPositiveShots) {
    const Simulator simulator;
    EXPECT_THROW(simulator.run(bell_circuit(), 0, 1), quantum_lab::InvalidArgumentError);
    EXPECT_THROW(simulator.run(bell_circuit(), -5, 1), quantum_lab::InvalidArgumentError);
}

TEST(SimulatorTests, ReadoutNoiseFlipsSampledBits) {
    SimpleNoiseConfig cfg;
    cfg.readout.p_flip0_to_1 = 1.0;
    SimulatorOptions options;
    options.noise = std::make_shared<SimpleNoiseEngine>(cfg);
    const Simulator simulator(options);

    const auto result = simulator.run(CircuitBuilder("idle", 2).build(), 50, 3);
    EXPECT_EQ(result.counts.count("11"), 50u);
}

TEST(SimulatorTests, BitFlipNoiseAppliesToEveryShot) {
    SimpleNoiseConfig cfg;
    cfg.p_quantum_flip = 1.0;
    SimulatorOptions options;
    options.noise = std::make_shared<SimpleNoiseEngine>(cfg);
    const Simulator simulator(options);

    const auto result = simulator.run(CircuitBuilder("flip", 1).x(0).build(), 40, 3);
    EXPECT_EQ(result.counts.count("0"), 40u);
}

TEST(SimulatorTests, MeasureSingleKeepsPreReadoutAmplitudes) {
    const Simulator simulator;
    const auto shot = simulator.measure_single(bell_circuit(), 77);

    ASSERT_TRUE(shot.bitstring == "00" || shot.bitstring == "11");
    const double inv_sqrt2 = 1.0 / std::sqrt(2.0);
    EXPECT_NEAR(std::abs(shot.final_amplitudes[0]), inv_sqrt2, 1e-12);
    EXPECT_NEAR(std::abs(shot.final_amplitudes[3]), inv_sqrt2, 1e-12);

    const std::size_t collapsed = shot.bitstring == "11" ? 3 : 0;
    EXPECT_NEAR(std::abs(shot.collapsed_state[collapsed]), 1.0, 1e-12);
}

TEST(SimulatorTests, MeasureSingleRecordsNoiseEvents) {
    SimpleNoiseConfig cfg;
    cfg.readout.p_flip0_to_1 = 1.0;
    SimulatorOptions options;
    options.noise = std::make_shared<SimpleNoiseEngine>(cfg);
    const Simulator simulator(options);

    const auto shot = simulator.measure_single(CircuitBuilder("idle", 1).build(), 5);
    EXPECT_EQ(shot.bitstring, "1");

    bool saw_noise = false;
    for (const auto& log : shot.logs) {
        if (log.category == "Noise" && log.message.find("type=readout_flip") != std::string::npos) {
            saw_noise = true;
        }
    }
    EXPECT_TRUE(saw_noise);
}

TEST(SimulatorTests, ReporterFollowsReferenceEvolution) {
    const Simulator simulator(with_threads(3));
    RecordingReporter reporter;
    const auto result = simulator.run(bell_circuit(), 600, 9, &reporter);

    EXPECT_EQ(result.counts.total(), 600u);
    EXPECT_EQ(reporter.total, 2u);
    EXPECT_EQ(reporter.completed, 2u);
    EXPECT_EQ(reporter.categories,
              (std::vector<std::string>{"AllocArray", "ApplyGate", "ApplyGate"}));
}

TEST(SimulatorTests, MeasureSingleReportsEveryLog) {
    const Simulator simulator;
    RecordingReporter reporter;
    const auto shot = simulator.measure_single(bell_circuit(), 5, &reporter);

    EXPECT_EQ(reporter.total, 2u);
    EXPECT_EQ(reporter.completed, 2u);
    ASSERT_EQ(reporter.categories.size(), shot.logs.size());
    EXPECT_EQ(reporter.categories.back(), "Measure");
}

TEST(ThreadJoinerTests, JoinsStartedWorkersWhenStartupThrows) {
    std::atomic<int> finished{0};
    std::vector<std::thread> threads;

    EXPECT_THROW(
        {
            ThreadJoiner joiner(threads);
            threads.emplace_back([&finished]() { ++finished; });
            threads.emplace_back([&finished]() { ++finished; });
            throw std::system_error(
                std::make_error_code(std::errc::resource_unavailable_try_again));
        },
        std::system_error);

    EXPECT_EQ(finished.load(), 2);
    for (const auto& thread : threads) {
        EXPECT_FALSE(thread.joinable());
    }
}
