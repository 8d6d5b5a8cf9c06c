#include "errors.hpp"
#include "service/lab_config.hpp"
#include "service/lab_service.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage(std::ostream& out) {
    out << "usage: quantum_lab_cli <command> [args]\n"
        << "  bell [shots]\n"
        << "  bb84 <key_length> [bit_flip] [eavesdrop]\n"
        << "  qrng <num_bits>\n"
        << "  grover <n_qubits> <marked_item>\n"
        << "  qft <n_qubits>\n"
        << "  qpe <n_counting_qubits> [phase]\n"
        << "  teleport [shots]\n"
        << "  molecule <h2o|co2|nh3|ch4> [temperature] [pressure]\n"
        << "  vqe <n_qubits> [angle]...\n"
        << "  circuit <n_qubits> <token>... [--shots N]\n"
        << "  status\n";
}

void print_counts(const Histogram& counts) {
    for (const auto& entry : counts.counts()) {
        std::cout << "  " << entry.first << ": " << entry.second << '\n';
    }
}

std::string arg_at(const std::vector<std::string>& args, std::size_t idx) {
    if (idx >= args.size()) {
        throw quantum_lab::InvalidArgumentError("missing argument");
    }
    return args[idx];
}

int run_command(const std::vector<std::string>& args) {
    service::LabService lab(service::LabConfig::from_environment());
    const std::string& command = args[0];

    if (command == "status") {
        const service::LabStatus status = lab.status();
        std::cout << "backend: " << status.backend << '\n'
                  << "max_qubits: " << status.max_qubits << '\n'
                  << "default_shots: " << status.default_shots << '\n'
                  << "max_threads: " << status.max_threads << '\n'
                  << "noise_enabled: " << (status.noise_enabled ? "true" : "false") << '\n';
        return 0;
    }

    if (command == "circuit") {
        const int n_qubits = std::stoi(arg_at(args, 1));
        std::vector<std::string> tokens;
        std::optional<int> shots;
        for (std::size_t i = 2; i < args.size(); ++i) {
            if (args[i] == "--shots") {
                shots = std::stoi(arg_at(args, ++i));
                continue;
            }
            tokens.push_back(args[i]);
        }
        const std::string id = lab.create_circuit("cli", n_qubits, tokens);
        const service::ExecutionReport report = lab.execute(id, shots);
        std::cout << "circuit: " << id << " (" << report.shots << " shots)\n";
        print_counts(report.counts);
        std::cout << "most likely: " << report.most_likely << '\n';
        return 0;
    }

    switch (service::protocol_from_string(command)) {
        case service::ProtocolKind::BellState: {
            std::optional<int> shots;
            if (args.size() > 1) {
                shots = std::stoi(args[1]);
            }
            const auto report = lab.bell_state(shots);
            print_counts(report.counts);
            std::cout << "entanglement: " << report.entanglement << '\n'
                      << "fidelity: " << report.fidelity << '\n';
            break;
        }
        case service::ProtocolKind::Bb84: {
            quantum_lab::Bb84Channel channel;
            if (args.size() > 2) {
                channel.bit_flip_probability = std::stod(args[2]);
            }
            if (args.size() > 3) {
                channel.eavesdrop_probability = std::stod(args[3]);
            }
            const auto report = lab.bb84(std::stoi(arg_at(args, 1)), channel);
            std::cout << "key: " << report.key_hex << " (" << report.key_length << " bits)\n"
                      << "error_rate: " << report.error_rate << '\n'
                      << "efficiency: " << report.efficiency << '\n'
                      << "security: " << report.security_level << '\n';
            break;
        }
        case service::ProtocolKind::RandomNumbers: {
            const auto report = lab.quantum_random(std::stoi(arg_at(args, 1)));
            std::cout << "binary: " << report.binary << '\n'
                      << "decimal: " << report.decimal << '\n'
                      << "hex: " << report.hex << '\n'
                      << "entropy: " << report.entropy << '\n';
            break;
        }
        case service::ProtocolKind::Grover: {
            const auto report = lab.grover(
                std::stoi(arg_at(args, 1)),
                static_cast<std::uint64_t>(std::stoull(arg_at(args, 2))));
            std::cout << "iterations: " << report.iterations << '\n'
                      << "found: " << report.found_item << " (" << report.found_bitstring << ")\n"
                      << "probability: " << report.probability << '\n'
                      << "success: " << (report.success ? "true" : "false") << '\n';
            break;
        }
        case service::ProtocolKind::Qft: {
            const auto report = lab.qft(std::stoi(arg_at(args, 1)));
            std::cout << "depth: " << report.depth << ", gates: " << report.gate_count << '\n'
                      << "round_trip_error: " << report.round_trip_error << '\n';
            print_counts(report.counts);
            break;
        }
        case service::ProtocolKind::PhaseEstimation: {
            const double phase = args.size() > 2 ? std::stod(args[2]) : 0.5;
            const auto report = lab.phase_estimation(std::stoi(arg_at(args, 1)), phase);
            std::cout << "measured: " << report.measured_binary << '\n'
                      << "estimated_phase: " << report.estimated_phase << '\n'
                      << "confidence: " << report.confidence << '\n';
            break;
        }
        case service::ProtocolKind::Teleportation: {
            std::optional<int> shots;
            if (args.size() > 1) {
                shots = std::stoi(args[1]);
            }
            const auto report = lab.teleport(std::nullopt, shots);
            print_counts(report.receiver_counts);
            std::cout << "success_rate: " << report.success_rate << '\n';
            break;
        }
        case service::ProtocolKind::Molecule: {
            const double temperature = args.size() > 2 ? std::stod(args[2]) : 300.0;
            const double pressure = args.size() > 3 ? std::stod(args[3]) : 1.0;
            const auto report = lab.simulate_molecule(arg_at(args, 1), temperature, pressure);
            std::cout << "molecule: " << report.molecule << " (" << report.num_qubits << " qubits)\n"
                      << "entanglement: " << report.entanglement << '\n'
                      << "energy: " << report.energy << '\n'
                      << "vibrational_frequency: " << report.vibrational_frequency << '\n'
                      << "conductivity: " << report.conductivity << '\n'
                      << "stability: " << report.stability << '\n'
                      << "dominant_state: " << report.dominant_state << '\n';
            break;
        }
        case service::ProtocolKind::Vqe: {
            const int n_qubits = std::stoi(arg_at(args, 1));
            std::optional<std::vector<double>> parameters;
            if (args.size() > 2) {
                parameters.emplace();
                for (std::size_t i = 2; i < args.size(); ++i) {
                    parameters->push_back(std::stod(args[i]));
                }
            }
            const auto report = lab.vqe(n_qubits, parameters);
            std::cout << "expectation_value: " << report.expectation_value << '\n'
                      << "exact_expectation: " << report.exact_expectation << '\n';
            print_counts(report.counts);
            break;
        }
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        print_usage(args.empty() ? std::cerr : std::cout);
        return args.empty() ? 1 : 0;
    }

    try {
        return run_command(args);
    } catch (const std::exception& ex) {
        std::cerr << "error: " << ex.what() << '\n';
        return 1;
    }
}
