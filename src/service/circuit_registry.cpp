#include "service/circuit_registry.hpp"

#include "errors.hpp"

#include <utility>

namespace service {

CircuitRegistry::CircuitRegistry() = default;

std::string CircuitRegistry::add(std::vector<std::string> tokens, Circuit circuit) {
    // Listing order matches id order.
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = "circuit-" + std::to_string(++id_counter_);
    auto record = std::make_shared<const CircuitRecord>(
        CircuitRecord{id, std::move(tokens), std::move(circuit)});
    records_.emplace(id, record);
    ordered_.push_back(std::move(record));
    return id;
}

std::shared_ptr<const CircuitRecord> CircuitRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = records_.find(id);
    if (it == records_.end()) {
        throw quantum_lab::NotFoundError("Circuit " + id + " not found");
    }
    return it->second;
}

std::vector<std::shared_ptr<const CircuitRecord>> CircuitRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ordered_;
}

std::size_t CircuitRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ordered_.size();
}

}  // namespace service
