#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

#include "vm/measurement_record.types.hpp"

// Outcome counts keyed by bitstring. Keys are ordered lexicographically, so
// iteration order is stable and ties resolve to the smallest bitstring.
class Histogram {
  public:
    Histogram() = default;

    // Adds `count` observations of `bitstring`. All keys must share one
    // width and contain only '0' and '1'.
    void add(const std::string& bitstring, std::uint64_t count = 1);
    void merge(const Histogram& other);

    std::uint64_t total() const { return total_; }
    std::uint64_t count(const std::string& bitstring) const;
    bool empty() const { return total_ == 0; }

    const std::map<std::string, std::uint64_t>& counts() const { return counts_; }
    std::map<std::string, double> probabilities() const;

    // Bitstring with the highest count; ties go to the lexicographically
    // smallest. Throws InvalidArgumentError on an empty histogram.
    std::string most_likely() const;

  private:
    std::map<std::string, std::uint64_t> counts_;
    std::uint64_t total_ = 0;
    std::size_t width_ = 0;
};

// `width` characters, most significant bit first.
std::string to_bitstring(std::uint64_t value, std::size_t width);

std::uint64_t bitstring_value(const std::string& bitstring);

// record.bits[j] becomes bit j of the outcome.
std::string bitstring_from_record(const MeasurementRecord& record);
