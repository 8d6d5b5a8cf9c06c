#include "protocols/random_generator.hpp"

#include "circuit.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

namespace quantum_lab {

namespace {

double shannon_entropy(const std::vector<double>& probabilities) {
    double entropy = 0.0;
    for (double p : probabilities) {
        if (p > 0.0) {
            entropy -= p * std::log2(p);
        }
    }
    return entropy;
}

}  // namespace

RandomBitsReport generate_random_bits(const Simulator& simulator, int num_bits, std::uint64_t seed) {
    if (num_bits <= 0) {
        throw InvalidArgumentError("Number of random bits must be positive");
    }

    std::mt19937_64 seed_rng(seed);
    RandomBitsReport report;
    report.num_bits = num_bits;
    report.binary.reserve(static_cast<std::size_t>(num_bits));

    int remaining = num_bits;
    while (remaining > 0) {
        const int width = std::min(remaining, kRandomRegisterQubits);
        CircuitBuilder builder("qrng", width);
        for (int q = 0; q < width; ++q) {
            builder.h(q);
        }
        const auto result = simulator.run(builder.build(), 1, seed_rng());
        report.binary += result.counts.most_likely();
        report.entropy += shannon_entropy(result.probabilities);
        remaining -= width;
    }

    report.decimal = binary_to_decimal(report.binary);
    report.hex = binary_to_hex(report.binary);
    return report;
}

std::string binary_to_hex(const std::string& bits) {
    static const char kDigits[] = "0123456789ABCDEF";
    if (bits.empty()) {
        return "0";
    }
    const std::size_t pad = (4 - bits.size() % 4) % 4;
    const std::string padded = std::string(pad, '0') + bits;
    std::string hex;
    hex.reserve(padded.size() / 4);
    for (std::size_t i = 0; i < padded.size(); i += 4) {
        int nibble = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            const char c = padded[i + j];
            if (c != '0' && c != '1') {
                throw InvalidArgumentError("Invalid bitstring: " + bits);
            }
            nibble = (nibble << 1) | (c - '0');
        }
        hex.push_back(kDigits[nibble]);
    }
    return hex;
}

std::string binary_to_decimal(const std::string& bits) {
    // Little-endian base-10 digits.
    std::vector<int> digits{0};
    for (char c : bits) {
        if (c != '0' && c != '1') {
            throw InvalidArgumentError("Invalid bitstring: " + bits);
        }
        int carry = c - '0';
        for (auto& d : digits) {
            const int value = d * 2 + carry;
            d = value % 10;
            carry = value / 10;
        }
        if (carry > 0) {
            digits.push_back(carry);
        }
    }
    std::string out;
    out.reserve(digits.size());
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        out.push_back(static_cast<char>('0' + *it));
    }
    return out;
}

}  // namespace quantum_lab
