#pragma once

#include "circuit.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace service {

struct CircuitRecord {
    std::string id;
    // Gate tokens as supplied by the caller.
    std::vector<std::string> tokens;
    Circuit circuit;
};

// Append-only, in-memory store of created circuits. Records are immutable
// once added and may be read concurrently.
class CircuitRegistry {
  public:
    CircuitRegistry();

    // Stores the circuit and returns its id ("circuit-1", "circuit-2", ...).
    std::string add(std::vector<std::string> tokens, Circuit circuit);

    // Throws quantum_lab::NotFoundError for an unknown id.
    std::shared_ptr<const CircuitRecord> get(const std::string& id) const;

    // Records in creation order.
    std::vector<std::shared_ptr<const CircuitRecord>> list() const;

    std::size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const CircuitRecord>> records_;
    std::vector<std::shared_ptr<const CircuitRecord>> ordered_;
    std::size_t id_counter_ = 0;
};

}  // namespace service
