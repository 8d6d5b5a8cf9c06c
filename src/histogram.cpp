#include "histogram.hpp"

#include "errors.hpp"

namespace {

void check_bitstring(const std::string& bitstring) {
    if (bitstring.empty()) {
        throw quantum_lab::InvalidArgumentError("Bitstring must not be empty");
    }
    for (char c : bitstring) {
        if (c != '0' && c != '1') {
            throw quantum_lab::InvalidArgumentError("Invalid bitstring: " + bitstring);
        }
    }
}

}  // namespace

void Histogram::add(const std::string& bitstring, std::uint64_t count) {
    check_bitstring(bitstring);
    if (width_ == 0) {
        width_ = bitstring.size();
    } else if (bitstring.size() != width_) {
        throw quantum_lab::InvalidArgumentError(
            "Bitstring width " + std::to_string(bitstring.size()) +
            " does not match histogram width " + std::to_string(width_));
    }
    if (count == 0) {
        return;
    }
    counts_[bitstring] += count;
    total_ += count;
}

void Histogram::merge(const Histogram& other) {
    for (const auto& entry : other.counts_) {
        add(entry.first, entry.second);
    }
}

std::uint64_t Histogram::count(const std::string& bitstring) const {
    const auto it = counts_.find(bitstring);
    return it == counts_.end() ? 0 : it->second;
}

std::map<std::string, double> Histogram::probabilities() const {
    std::map<std::string, double> probs;
    if (total_ == 0) {
        return probs;
    }
    for (const auto& entry : counts_) {
        probs[entry.first] = static_cast<double>(entry.second) / static_cast<double>(total_);
    }
    return probs;
}

std::string Histogram::most_likely() const {
    if (counts_.empty()) {
        throw quantum_lab::InvalidArgumentError("Histogram is empty");
    }
    auto best = counts_.begin();
    for (auto it = counts_.begin(); it != counts_.end(); ++it) {
        // Strict comparison keeps the first (smallest) key on ties.
        if (it->second > best->second) {
            best = it;
        }
    }
    return best->first;
}

std::string to_bitstring(std::uint64_t value, std::size_t width) {
    std::string out(width, '0');
    for (std::size_t bit = 0; bit < width && bit < 64; ++bit) {
        if ((value >> bit) & 1ULL) {
            out[width - 1 - bit] = '1';
        }
    }
    return out;
}

std::uint64_t bitstring_value(const std::string& bitstring) {
    check_bitstring(bitstring);
    if (bitstring.size() > 64) {
        throw quantum_lab::InvalidArgumentError("Bitstring wider than 64 bits");
    }
    std::uint64_t value = 0;
    for (char c : bitstring) {
        value = (value << 1) | static_cast<std::uint64_t>(c == '1');
    }
    return value;
}

std::string bitstring_from_record(const MeasurementRecord& record) {
    const std::size_t width = record.bits.size();
    std::string out(width, '0');
    for (std::size_t j = 0; j < width; ++j) {
        if (record.bits[j] == 1) {
            out[width - 1 - j] = '1';
        }
    }
    return out;
}
