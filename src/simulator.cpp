#include "simulator.hpp"

#include "engine_statevector.hpp"
#include "errors.hpp"
#include "thread_joiner.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <random>
#include <thread>
#include <utility>

namespace {

constexpr std::size_t kShotsPerChunk = 256;

struct ShotChunk {
    std::size_t first_shot = 0;
    std::size_t shots = 0;
    std::uint64_t seed = 0;
};

std::vector<ShotChunk> plan_chunks(int shots, std::mt19937_64& seed_rng) {
    std::vector<ShotChunk> chunks;
    const std::size_t total = static_cast<std::size_t>(shots);
    for (std::size_t first = 0; first < total; first += kShotsPerChunk) {
        chunks.push_back(ShotChunk{first, std::min(kShotsPerChunk, total - first), seed_rng()});
    }
    return chunks;
}

// Runs fn(chunk_index) for every chunk on `workers` threads. The first
// exception thrown by any worker is rethrown on the calling thread.
template <typename ChunkFn>
void for_each_chunk(std::size_t chunk_count, std::size_t workers, ChunkFn fn) {
    if (workers <= 1) {
        for (std::size_t idx = 0; idx < chunk_count; ++idx) {
            fn(idx);
        }
        return;
    }

    std::vector<std::thread> threads;
    threads.reserve(workers);
    std::mutex failure_mutex;
    std::exception_ptr failure;
    ThreadJoiner joiner(threads);

    for (std::size_t worker_idx = 0; worker_idx < workers; ++worker_idx) {
        threads.emplace_back([worker_idx, workers, chunk_count, &fn, &failure_mutex, &failure]() {
            for (std::size_t idx = worker_idx; idx < chunk_count; idx += workers) {
                try {
                    fn(idx);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(failure_mutex);
                    if (!failure) {
                        failure = std::current_exception();
                    }
                    return;
                }
            }
        });
    }

    joiner.join_all();
    if (failure) {
        std::rethrow_exception(failure);
    }
}

}  // namespace

Simulator::Simulator(SimulatorOptions options)
    : options_(std::move(options)) {}

std::size_t Simulator::worker_count(std::size_t chunks) const {
    const std::size_t hardware_threads = std::thread::hardware_concurrency();
    const std::size_t default_threads = hardware_threads > 0 ? hardware_threads : 1;
    const std::size_t worker_limit = options_.max_threads > 0 ? options_.max_threads : default_threads;
    return std::max<std::size_t>(1, std::min(chunks, worker_limit));
}

Simulator::RunResult Simulator::run(
    const Circuit& circuit,
    int shots,
    std::uint64_t seed,
    quantum_lab::ProgressReporter* reporter
) const {
    if (shots <= 0) {
        throw quantum_lab::InvalidArgumentError("Shot count must be positive");
    }

    std::mt19937_64 seed_rng(seed);
    const std::vector<int>& readout = circuit.readout();

    RunResult result;
    {
        StatevectorEngine engine(nullptr, seed_rng());
        if (reporter) {
            reporter->set_total_steps(circuit.instructions().size());
            engine.set_progress_reporter(reporter);
        }
        engine.set_noise_model(options_.noise);
        engine.run(circuit);
        result.final_amplitudes = engine.state_vector();
        result.probabilities = engine.outcome_probabilities(readout);
        result.logs = engine.logs();
    }

    const std::vector<ShotChunk> chunks = plan_chunks(shots, seed_rng);
    std::vector<Histogram> chunk_counts(chunks.size());
    const bool trajectories = circuit.has_mid_circuit_measurement();
    const std::vector<double>& probabilities = result.probabilities;
    const auto& noise = options_.noise;

    for_each_chunk(chunks.size(), worker_count(chunks.size()), [&](std::size_t idx) {
        const ShotChunk& chunk = chunks[idx];
        std::mt19937_64 rng(chunk.seed);
        Histogram& counts = chunk_counts[idx];

        if (trajectories) {
            for (std::size_t shot = 0; shot < chunk.shots; ++shot) {
                StatevectorEngine engine(nullptr, rng());
                engine.set_logging_enabled(false);
                engine.set_shot_index(static_cast<int>(chunk.first_shot + shot));
                engine.set_noise_model(noise);
                engine.run(circuit);
                counts.add(bitstring_from_record(engine.measure(readout)));
            }
            return;
        }

        std::discrete_distribution<std::size_t> dist(probabilities.begin(), probabilities.end());
        for (std::size_t shot = 0; shot < chunk.shots; ++shot) {
            const std::size_t outcome = dist(rng);
            if (!noise) {
                counts.add(to_bitstring(outcome, readout.size()));
                continue;
            }
            MeasurementRecord record;
            record.targets = readout;
            for (std::size_t j = 0; j < readout.size(); ++j) {
                record.bits.push_back(static_cast<int>((outcome >> j) & 1ULL));
            }
            StdRandomStream noise_rng(rng);
            noise->apply_measurement_noise(record, noise_rng);
            counts.add(bitstring_from_record(record));
        }
    });

    for (const auto& counts : chunk_counts) {
        result.counts.merge(counts);
    }
    return result;
}

Simulator::SingleShot Simulator::measure_single(
    const Circuit& circuit,
    std::uint64_t seed,
    quantum_lab::ProgressReporter* reporter
) const {
    StatevectorEngine engine(nullptr, seed);
    if (reporter) {
        reporter->set_total_steps(circuit.instructions().size());
        engine.set_progress_reporter(reporter);
    }
    engine.set_noise_model(options_.noise);
    engine.run(circuit);

    SingleShot shot;
    shot.final_amplitudes = engine.state_vector();
    const MeasurementRecord record = engine.measure(circuit.readout());
    shot.bitstring = bitstring_from_record(record);
    shot.classical_bits = engine.classical_bits();
    shot.collapsed_state = engine.state_vector();
    shot.logs = engine.logs();
    return shot;
}
