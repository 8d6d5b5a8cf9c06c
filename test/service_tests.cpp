#include "errors.hpp"
#include "progress_reporter.hpp"
#include "service/circuit_registry.hpp"
#include "service/lab_config.hpp"
#include "service/lab_service.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdlib>
#include <map>
#include <string>
#include <vector>

namespace {

service::LabConfig test_config() {
    service::LabConfig config;
    config.seed = 7;
    config.default_shots = 500;
    config.max_qubits = 8;
    config.max_threads = 2;
    return config;
}

std::map<std::size_t, TokenBinding> bell_bindings() {
    std::map<std::size_t, TokenBinding> bindings;
    bindings[1] = TokenBinding{{1}, {0}};
    return bindings;
}

class StepCounter : public quantum_lab::ProgressReporter {
  public:
    void set_total_steps(std::size_t total_steps) override { total = total_steps; }
    void increment_completed_steps(std::size_t delta) override { completed += delta; }
    void record_log(const ExecutionLog& /*log*/) override { ++logs; }

    std::size_t total = 0;
    std::size_t completed = 0;
    std::size_t logs = 0;
};

class ScopedEnv {
  public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() { unsetenv(name_); }

  private:
    const char* name_;
};

}  // namespace

TEST(LabServiceTests, CreateAndExecuteCircuit) {
    service::LabService lab(test_config());
    const std::string id = lab.create_circuit("bell", 2, {"H", "CNOT"}, bell_bindings());
    EXPECT_EQ(id, "circuit-1");

    const service::ExecutionReport report = lab.execute(id);
    EXPECT_EQ(report.circuit_id, id);
    EXPECT_EQ(report.shots, 500);
    EXPECT_EQ(report.counts.total(), 500u);
    EXPECT_EQ(report.counts.count("01") + report.counts.count("10"), 0u);

    double total = 0.0;
    for (const auto& entry : report.probabilities) {
        total += entry.second;
    }
    EXPECT_NEAR(total, 1.0, 1e-12);

    ASSERT_EQ(report.exact_probabilities.size(), 2u);
    EXPECT_NEAR(report.exact_probabilities.at("00"), 0.5, 1e-12);
    EXPECT_NEAR(report.exact_probabilities.at("11"), 0.5, 1e-12);
    EXPECT_TRUE(report.most_likely == "00" || report.most_likely == "11");
    EXPECT_EQ(report.final_amplitudes.size(), 4u);

    EXPECT_EQ(lab.execute(id, 32).counts.total(), 32u);
    EXPECT_THROW(lab.execute(id, 0), quantum_lab::InvalidArgumentError);
}

TEST(LabServiceTests, ExecuteReportsProgress) {
    service::LabService lab(test_config());
    const std::string id = lab.create_circuit("three", 2, {"H", "X", "RZ(0.2)"});

    StepCounter reporter;
    const service::ExecutionReport report = lab.execute(id, 600, &reporter);
    EXPECT_EQ(report.counts.total(), 600u);
    EXPECT_EQ(reporter.total, 3u);
    EXPECT_EQ(reporter.completed, 3u);
    // AllocArray followed by one ApplyGate per token.
    EXPECT_EQ(reporter.logs, 4u);
}

TEST(LabServiceTests, CircuitsAreListedInCreationOrder) {
    service::LabService lab(test_config());
    const std::string first = lab.create_circuit("one", 1, {"H"});
    const std::string second = lab.create_circuit("two", 3, {"H", "X", "CNOT"});
    EXPECT_EQ(first, "circuit-1");
    EXPECT_EQ(second, "circuit-2");

    const auto circuits = lab.list_circuits();
    ASSERT_EQ(circuits.size(), 2u);
    EXPECT_EQ(circuits[0].id, first);
    EXPECT_EQ(circuits[1].id, second);

    const service::CircuitInfo info = lab.circuit_info(second);
    EXPECT_EQ(info.name, "two");
    EXPECT_EQ(info.num_qubits, 3);
    EXPECT_EQ(info.gates, (std::vector<std::string>{"H", "X", "CNOT"}));
    EXPECT_EQ(info.gate_count, 3u);
    // CNOT on (2, 0) follows the H on qubit 0.
    EXPECT_EQ(info.depth, 2);
}

TEST(LabServiceTests, UnknownCircuitIsNotFound) {
    service::LabService lab(test_config());
    EXPECT_THROW(lab.execute("circuit-99"), quantum_lab::NotFoundError);
    EXPECT_THROW(lab.circuit_info("missing"), quantum_lab::NotFoundError);
}

TEST(LabServiceTests, FailedCreationRegistersNothing) {
    service::LabService lab(test_config());
    EXPECT_THROW(lab.create_circuit("wide", 9, {"H"}), quantum_lab::InvalidArgumentError);
    EXPECT_THROW(lab.create_circuit("bad", 2, {"H", "BOGUS"}), quantum_lab::ConfigurationError);
    EXPECT_THROW(lab.create_circuit("zero", 0, {"H"}), quantum_lab::InvalidArgumentError);
    EXPECT_EQ(lab.status().total_circuits, 0u);

    EXPECT_EQ(lab.create_circuit("ok", 1, {"X"}), "circuit-1");
}

TEST(LabServiceTests, StatusReflectsConfig) {
    service::LabService lab(test_config());
    lab.create_circuit("one", 1, {"H"});

    const service::LabStatus status = lab.status();
    EXPECT_EQ(status.total_circuits, 1u);
    EXPECT_EQ(status.backend, "cpu-statevector");
    EXPECT_EQ(status.max_qubits, 8);
    EXPECT_EQ(status.default_shots, 500);
    EXPECT_EQ(status.max_threads, 2u);
    EXPECT_FALSE(status.noise_enabled);
}

TEST(LabServiceTests, SeededLabsReplayIdentically) {
    service::LabService a(test_config());
    service::LabService b(test_config());

    const std::string id_a = a.create_circuit("uniform", 3, {"H", "H", "H"});
    const std::string id_b = b.create_circuit("uniform", 3, {"H", "H", "H"});
    EXPECT_EQ(a.execute(id_a).counts.counts(), b.execute(id_b).counts.counts());
    EXPECT_EQ(a.quantum_random(24).binary, b.quantum_random(24).binary);
}

TEST(LabServiceTests, ConfiguredNoiseReachesExecution) {
    service::LabConfig config = test_config();
    SimpleNoiseConfig noise;
    noise.readout.p_flip0_to_1 = 1.0;
    config.noise = noise;
    service::LabService lab(config);
    EXPECT_TRUE(lab.status().noise_enabled);

    const std::string id = lab.create_circuit("idle", 1, {});
    EXPECT_EQ(lab.execute(id, 20).counts.count("1"), 20u);
}

TEST(LabServiceTests, ProtocolsRunThroughTheLab) {
    service::LabService lab(test_config());

    const auto bell = lab.bell_state();
    EXPECT_EQ(bell.counts.total(), 500u);

    const auto key = lab.bb84(32);
    EXPECT_EQ(key.sender_key, key.receiver_key);

    EXPECT_EQ(lab.quantum_random(20).binary.size(), 20u);

    const auto search = lab.grover(3, 6);
    EXPECT_TRUE(search.success);

    EXPECT_LT(lab.qft(3).round_trip_error, 1e-9);

    const auto qpe = lab.phase_estimation(3);
    EXPECT_EQ(qpe.measured_binary, "100");
    EXPECT_NEAR(qpe.estimated_phase, 0.5, 1e-12);

    const auto teleport = lab.teleport(std::nullopt, 20);
    EXPECT_EQ(teleport.receiver_counts.count("1"), 20u);
}

TEST(LabServiceTests, MoleculesRunThroughTheLab) {
    service::LabService lab(test_config());

    const auto water = lab.simulate_molecule("H2O");
    EXPECT_EQ(water.molecule, "h2o");
    EXPECT_EQ(water.num_qubits, 6);
    EXPECT_DOUBLE_EQ(water.temperature, 300.0);
    EXPECT_DOUBLE_EQ(water.pressure, 1.0);
    EXPECT_EQ(water.counts.total(), 500u);

    EXPECT_THROW(lab.simulate_molecule("unobtainium"), quantum_lab::ConfigurationError);
    // Methane needs 10 qubits, above this lab's limit of 8.
    EXPECT_THROW(lab.simulate_molecule("ch4"), quantum_lab::InvalidArgumentError);
}

TEST(LabServiceTests, VqeThroughTheLab) {
    service::LabService lab(test_config());

    const auto fixed = lab.vqe(3, std::vector<double>{M_PI / 2, M_PI / 2, M_PI / 2});
    EXPECT_EQ(fixed.counts.count("101"), 500u);

    const auto drawn = lab.vqe(4);
    EXPECT_EQ(drawn.parameters.size(), 4u);
    EXPECT_EQ(drawn.counts.total(), 500u);

    EXPECT_THROW(lab.vqe(3, std::vector<double>{0.1}), quantum_lab::InvalidArgumentError);
    EXPECT_THROW(lab.vqe(9), quantum_lab::InvalidArgumentError);
}

TEST(LabServiceTests, TeleportsCustomPreparation) {
    service::LabService lab(test_config());
    GateOp ry;
    ry.kind = GateKind::RY;
    ry.targets = {0};
    ry.theta = M_PI;
    const auto report = lab.teleport(std::vector<GateOp>{ry}, 40);
    EXPECT_EQ(report.receiver_counts.count("1"), 40u);
}

TEST(LabServiceTests, ProtocolsRespectQubitLimit) {
    service::LabService lab(test_config());
    EXPECT_THROW(lab.grover(9, 1), quantum_lab::InvalidArgumentError);
    EXPECT_THROW(lab.qft(9), quantum_lab::InvalidArgumentError);
    EXPECT_THROW(lab.phase_estimation(8), quantum_lab::InvalidArgumentError);
}

TEST(LabServiceTests, InvalidConfigIsRejected) {
    service::LabConfig config = test_config();
    config.default_shots = 0;
    EXPECT_THROW(service::LabService{config}, quantum_lab::ConfigurationError);

    config = test_config();
    config.max_qubits = 31;
    EXPECT_THROW(config.validate(), quantum_lab::ConfigurationError);
}

TEST(ProtocolKindTests, ParsesProtocolNames) {
    EXPECT_EQ(service::protocol_from_string("bell"), service::ProtocolKind::BellState);
    EXPECT_EQ(service::protocol_from_string("BB84"), service::ProtocolKind::Bb84);
    EXPECT_EQ(service::protocol_from_string("qrng"), service::ProtocolKind::RandomNumbers);
    EXPECT_EQ(service::protocol_from_string("qpe"), service::ProtocolKind::PhaseEstimation);
    EXPECT_EQ(service::protocol_from_string("Molecule"), service::ProtocolKind::Molecule);
    EXPECT_THROW(service::protocol_from_string("molecule"), quantum_lab::ConfigurationError);

    for (const auto kind : {service::ProtocolKind::Grover, service::ProtocolKind::Qft,
                            service::ProtocolKind::Teleportation, service::ProtocolKind::Vqe}) {
        EXPECT_EQ(service::protocol_from_string(service::protocol_to_string(kind)), kind);
    }
}

TEST(CircuitRegistryTests, StoresImmutableRecords) {
    service::CircuitRegistry registry;
    const std::string id = registry.add({"H"}, build_circuit("one", 1, {"H"}));
    EXPECT_EQ(id, "circuit-1");
    EXPECT_EQ(registry.size(), 1u);

    const auto record = registry.get(id);
    EXPECT_EQ(record->tokens, (std::vector<std::string>{"H"}));
    EXPECT_EQ(record->circuit.name(), "one");
    EXPECT_THROW(registry.get("circuit-2"), quantum_lab::NotFoundError);
}

TEST(LabConfigTests, ReadsEnvironment) {
    ScopedEnv seed("QLAB_SEED", "42");
    ScopedEnv qubits("QLAB_MAX_QUBITS", "12");
    ScopedEnv threads("QLAB_MAX_THREADS", "3");
    ScopedEnv shots("QLAB_DEFAULT_SHOTS", "256");

    const service::LabConfig config = service::LabConfig::from_environment();
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(*config.seed, 42u);
    EXPECT_EQ(config.max_qubits, 12);
    EXPECT_EQ(config.max_threads, 3u);
    EXPECT_EQ(config.default_shots, 256);
}

TEST(LabConfigTests, MalformedEnvironmentIsConfigurationError) {
    {
        ScopedEnv shots("QLAB_DEFAULT_SHOTS", "many");
        EXPECT_THROW(service::LabConfig::from_environment(), quantum_lab::ConfigurationError);
    }
    {
        ScopedEnv shots("QLAB_DEFAULT_SHOTS", "-4");
        EXPECT_THROW(service::LabConfig::from_environment(), quantum_lab::ConfigurationError);
    }
    {
        ScopedEnv qubits("QLAB_MAX_QUBITS", "64");
        EXPECT_THROW(service::LabConfig::from_environment(), quantum_lab::ConfigurationError);
    }
}
