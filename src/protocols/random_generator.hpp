#pragma once

#include <cstdint>
#include <string>

#include "simulator.hpp"

namespace quantum_lab {

// Qubits are sampled in independent registers of at most this width.
constexpr int kRandomRegisterQubits = 16;

struct RandomBitsReport {
    int num_bits = 0;
    // Big-endian: the first character is the most significant bit.
    std::string binary;
    std::string decimal;
    std::string hex;
    // Shannon entropy of the sampled distributions, in bits.
    double entropy = 0.0;
};

RandomBitsReport generate_random_bits(const Simulator& simulator, int num_bits, std::uint64_t seed);

// Upper-case hex of a big-endian bitstring, left-padded to whole nibbles.
std::string binary_to_hex(const std::string& bits);
// Arbitrary-length decimal value of a big-endian bitstring.
std::string binary_to_decimal(const std::string& bits);

}  // namespace quantum_lab
