#include "errors.hpp"
#include "noise.hpp"
#include "service/lab_config.hpp"
#include "service/lab_service.hpp"

#include <pybind11/complex.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {

void fill_measurement_noise_config(const py::dict& src, MeasurementNoiseConfig& dst) {
    if (src.contains("p_flip0_to_1")) {
        dst.p_flip0_to_1 = py::cast<double>(src["p_flip0_to_1"]);
    }
    if (src.contains("p_flip1_to_0")) {
        dst.p_flip1_to_0 = py::cast<double>(src["p_flip1_to_0"]);
    }
}

service::LabConfig build_lab_config(const py::dict& cfg_obj) {
    service::LabConfig config = service::LabConfig::from_environment();
    if (cfg_obj.contains("default_shots")) {
        config.default_shots = py::cast<int>(cfg_obj["default_shots"]);
    }
    if (cfg_obj.contains("max_qubits")) {
        config.max_qubits = py::cast<int>(cfg_obj["max_qubits"]);
    }
    if (cfg_obj.contains("max_threads")) {
        config.max_threads = py::cast<std::size_t>(cfg_obj["max_threads"]);
    }
    if (cfg_obj.contains("seed") && !cfg_obj["seed"].is_none()) {
        config.seed = py::cast<std::uint64_t>(cfg_obj["seed"]);
    }
    if (cfg_obj.contains("noise") && !cfg_obj["noise"].is_none()) {
        const auto noise = py::cast<py::dict>(cfg_obj["noise"]);
        SimpleNoiseConfig cfg;
        if (noise.contains("p_quantum_flip")) {
            cfg.p_quantum_flip = py::cast<double>(noise["p_quantum_flip"]);
        }
        if (noise.contains("readout")) {
            fill_measurement_noise_config(py::cast<py::dict>(noise["readout"]), cfg.readout);
        }
        config.noise = cfg;
    }
    config.validate();
    return config;
}

std::map<std::size_t, TokenBinding> build_bindings(const py::handle& value) {
    std::map<std::size_t, TokenBinding> bindings;
    if (!value || value.is_none()) {
        return bindings;
    }
    for (const auto& item : py::cast<py::dict>(value)) {
        const auto entry = py::cast<py::dict>(item.second);
        TokenBinding binding;
        if (entry.contains("targets")) {
            binding.targets = py::cast<std::vector<int>>(entry["targets"]);
        }
        if (entry.contains("controls")) {
            binding.controls = py::cast<std::vector<int>>(entry["controls"]);
        }
        bindings.emplace(py::cast<std::size_t>(item.first), std::move(binding));
    }
    return bindings;
}

// Gate tokens applied to the message qubit, e.g. ["H", "RZ(0.4)"].
std::optional<std::vector<GateOp>> build_preparation(const py::handle& value) {
    if (!value || value.is_none()) {
        return std::nullopt;
    }
    std::vector<GateOp> preparation;
    for (const auto& token : py::cast<std::vector<std::string>>(value)) {
        const GateToken parsed = parse_gate_token(token);
        GateOp op;
        op.kind = parsed.kind;
        op.theta = parsed.theta;
        op.targets = {0};
        preparation.push_back(std::move(op));
    }
    return preparation;
}

double seconds_since_epoch(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

py::dict circuit_info_to_dict(const service::CircuitInfo& info) {
    py::dict out;
    out["id"] = info.id;
    out["name"] = info.name;
    out["num_qubits"] = info.num_qubits;
    out["gates"] = info.gates;
    out["depth"] = info.depth;
    out["gate_count"] = info.gate_count;
    out["created_at"] = seconds_since_epoch(info.created_at);
    return out;
}

py::dict execution_report_to_dict(const service::ExecutionReport& report) {
    py::dict out;
    out["circuit_id"] = report.circuit_id;
    out["shots"] = report.shots;
    out["counts"] = report.counts.counts();
    out["probabilities"] = report.probabilities;
    out["exact_probabilities"] = report.exact_probabilities;
    out["most_likely"] = report.most_likely;
    out["state_vector"] = report.final_amplitudes;
    return out;
}

py::dict status_to_dict(const service::LabStatus& status) {
    py::dict out;
    out["total_circuits"] = status.total_circuits;
    out["backend"] = status.backend;
    out["max_qubits"] = status.max_qubits;
    out["default_shots"] = status.default_shots;
    out["max_threads"] = status.max_threads;
    out["noise_enabled"] = status.noise_enabled;
    return out;
}

py::dict bell_to_dict(const quantum_lab::BellStateReport& report) {
    py::dict out;
    out["counts"] = report.counts.counts();
    out["state_vector"] = report.amplitudes;
    out["entanglement"] = report.entanglement;
    out["fidelity"] = report.fidelity;
    return out;
}

py::dict bb84_to_dict(const quantum_lab::Bb84Report& report) {
    py::dict out;
    out["key_length"] = report.key_length;
    out["sender_key"] = report.sender_key;
    out["receiver_key"] = report.receiver_key;
    out["key_hex"] = report.key_hex;
    out["error_rate"] = report.error_rate;
    out["efficiency"] = report.efficiency;
    out["security_level"] = report.security_level;
    out["trials"] = report.trials;
    out["intercepted"] = report.intercepted;
    out["partial"] = report.partial;
    return out;
}

py::dict random_to_dict(const quantum_lab::RandomBitsReport& report) {
    py::dict out;
    out["num_bits"] = report.num_bits;
    out["binary"] = report.binary;
    out["decimal"] = report.decimal;
    out["hex"] = report.hex;
    out["entropy"] = report.entropy;
    return out;
}

py::dict grover_to_dict(const quantum_lab::GroverReport& report) {
    py::dict out;
    out["n_qubits"] = report.n_qubits;
    out["marked_item"] = report.marked_item;
    out["iterations"] = report.iterations;
    out["found_bitstring"] = report.found_bitstring;
    out["found_item"] = report.found_item;
    out["probability"] = report.probability;
    out["success"] = report.success;
    out["counts"] = report.counts.counts();
    return out;
}

py::dict qft_to_dict(const quantum_lab::QftReport& report) {
    py::dict out;
    out["n_qubits"] = report.n_qubits;
    out["depth"] = report.depth;
    out["gate_count"] = report.gate_count;
    out["counts"] = report.counts.counts();
    out["state_vector"] = report.amplitudes;
    out["round_trip_error"] = report.round_trip_error;
    return out;
}

py::dict phase_estimation_to_dict(const quantum_lab::PhaseEstimationReport& report) {
    py::dict out;
    out["n_counting_qubits"] = report.n_counting_qubits;
    out["phase"] = report.phase;
    out["estimated_phase"] = report.estimated_phase;
    out["measured_binary"] = report.measured_binary;
    out["measured_value"] = report.measured_value;
    out["confidence"] = report.confidence;
    out["counts"] = report.counts.counts();
    return out;
}

py::dict teleportation_to_dict(const quantum_lab::TeleportationReport& report) {
    py::dict out;
    out["shots"] = report.shots;
    out["receiver_counts"] = report.receiver_counts.counts();
    out["sender_measurements"] = report.sender_measurements;
    out["fidelities"] = report.fidelities;
    out["success_rate"] = report.success_rate;
    out["expected_one_probability"] = report.expected_one_probability;
    return out;
}

py::dict molecule_to_dict(const quantum_lab::MoleculeReport& report) {
    py::dict out;
    out["molecule"] = report.molecule;
    out["atoms"] = report.atoms;
    out["num_qubits"] = report.num_qubits;
    out["temperature"] = report.temperature;
    out["pressure"] = report.pressure;
    out["gate_count"] = report.gate_count;
    out["depth"] = report.depth;
    out["pair_correlations"] = report.pair_correlations;
    out["entanglement"] = report.entanglement;
    out["energy"] = report.energy;
    out["vibrational_frequency"] = report.vibrational_frequency;
    out["conductivity"] = report.conductivity;
    out["stability"] = report.stability;
    out["counts"] = report.counts.counts();
    out["dominant_state"] = report.dominant_state;
    out["state_vector"] = report.amplitudes;
    return out;
}

py::dict vqe_to_dict(const quantum_lab::VqeReport& report) {
    py::dict out;
    out["num_qubits"] = report.num_qubits;
    out["parameters"] = report.parameters;
    out["counts"] = report.counts.counts();
    out["expectation_value"] = report.expectation_value;
    out["exact_expectation"] = report.exact_expectation;
    return out;
}

}  // namespace

PYBIND11_MODULE(_quantum_lab, m) {
    m.doc() = "Quantum lab simulation bindings";

    py::register_exception<quantum_lab::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<quantum_lab::NotFoundError>(m, "NotFoundError", PyExc_KeyError);

    py::class_<service::LabService>(m, "Lab")
        .def(
            py::init([](const py::dict& config) {
                return std::make_unique<service::LabService>(build_lab_config(config));
            }),
            py::arg("config") = py::dict(),
            "Create a lab. Keys of `config` mirror service::LabConfig; the QLAB_* "
            "environment variables supply the defaults."
        )
        .def(
            "create_circuit",
            [](service::LabService& lab,
               const std::string& name,
               int num_qubits,
               const std::vector<std::string>& gates,
               const py::object& bindings) {
                return lab.create_circuit(name, num_qubits, gates, build_bindings(bindings));
            },
            py::arg("name"),
            py::arg("num_qubits"),
            py::arg("gates"),
            py::arg("bindings") = py::none(),
            "Build a circuit from gate tokens and return its id."
        )
        .def(
            "execute",
            [](service::LabService& lab, const std::string& circuit_id, std::optional<int> shots) {
                return execution_report_to_dict(lab.execute(circuit_id, shots));
            },
            py::arg("circuit_id"),
            py::arg("shots") = py::none()
        )
        .def(
            "circuit_info",
            [](const service::LabService& lab, const std::string& circuit_id) {
                return circuit_info_to_dict(lab.circuit_info(circuit_id));
            },
            py::arg("circuit_id")
        )
        .def("list_circuits", [](const service::LabService& lab) {
            py::list out;
            for (const auto& info : lab.list_circuits()) {
                out.append(circuit_info_to_dict(info));
            }
            return out;
        })
        .def("status", [](const service::LabService& lab) { return status_to_dict(lab.status()); })
        .def(
            "bell_state",
            [](service::LabService& lab, std::optional<int> shots) {
                return bell_to_dict(lab.bell_state(shots));
            },
            py::arg("shots") = py::none()
        )
        .def(
            "bb84",
            [](service::LabService& lab, int key_length, double bit_flip, double eavesdrop) {
                quantum_lab::Bb84Channel channel;
                channel.bit_flip_probability = bit_flip;
                channel.eavesdrop_probability = eavesdrop;
                return bb84_to_dict(lab.bb84(key_length, channel));
            },
            py::arg("key_length"),
            py::arg("bit_flip_probability") = 0.0,
            py::arg("eavesdrop_probability") = 0.0
        )
        .def(
            "quantum_random",
            [](service::LabService& lab, int num_bits) {
                return random_to_dict(lab.quantum_random(num_bits));
            },
            py::arg("num_bits")
        )
        .def(
            "grover",
            [](service::LabService& lab, int n_qubits, std::uint64_t marked_item) {
                return grover_to_dict(lab.grover(n_qubits, marked_item));
            },
            py::arg("n_qubits"),
            py::arg("marked_item")
        )
        .def(
            "qft",
            [](service::LabService& lab, int n_qubits) { return qft_to_dict(lab.qft(n_qubits)); },
            py::arg("n_qubits")
        )
        .def(
            "phase_estimation",
            [](service::LabService& lab, int n_counting_qubits, double phase) {
                return phase_estimation_to_dict(lab.phase_estimation(n_counting_qubits, phase));
            },
            py::arg("n_counting_qubits"),
            py::arg("phase") = 0.5
        )
        .def(
            "teleport",
            [](service::LabService& lab, const py::object& preparation, std::optional<int> shots) {
                return teleportation_to_dict(lab.teleport(build_preparation(preparation), shots));
            },
            py::arg("preparation") = py::none(),
            py::arg("shots") = py::none(),
            "Teleport the state prepared on qubit 0 by `preparation` (gate tokens, "
            "default [\"X\"]) to qubit 2."
        )
        .def(
            "simulate_molecule",
            [](service::LabService& lab, const std::string& molecule, double temperature, double pressure) {
                return molecule_to_dict(lab.simulate_molecule(molecule, temperature, pressure));
            },
            py::arg("molecule"),
            py::arg("temperature") = 300.0,
            py::arg("pressure") = 1.0
        )
        .def(
            "vqe",
            [](service::LabService& lab, int n_qubits, std::optional<std::vector<double>> parameters) {
                return vqe_to_dict(lab.vqe(n_qubits, std::move(parameters)));
            },
            py::arg("n_qubits"),
            py::arg("parameters") = py::none()
        );

    m.def("supported_molecules", &quantum_lab::supported_molecules);
}
