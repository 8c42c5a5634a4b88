#pragma once

#include "../anim/error.hpp"
#include "../anim/layer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace splinerig::core::drivers {

using anim::Diagnostics;
using anim::LayerSpec;

// Rejects self-driving layers, duplicate names and out-of-range easing,
// timing or driver values. Throws EngineError.
void validateLayers(const std::vector<LayerSpec>& layers);

// Directed graph over layer names; edge driver -> driven. Built fresh for every
// resolution request, nodes kept in layer insertion order.
class DriverGraph {
public:
    // Drivers naming an unknown layer are dropped with a MissingDriver diagnostic.
    static DriverGraph build(const std::vector<LayerSpec>& layers, Diagnostics& diagnostics);

    std::size_t size() const { return nodes_.size(); }
    const std::vector<std::string>& nodes() const { return nodes_; }
    std::optional<std::size_t> indexOf(const std::string& name) const;
    const std::vector<std::size_t>& dependents(std::size_t node) const { return edges_[node]; }
    std::optional<std::size_t> driverOf(std::size_t node) const { return driverOf_[node]; }
    std::size_t edgeCount() const;

    std::size_t addNode(const std::string& name);
    void addEdge(std::size_t driver, std::size_t driven);

    // First cycle found by DFS, as node names with the entry node repeated at the end.
    std::optional<std::vector<std::string>> findCycle() const;

    // Kahn order with a FIFO queue, ties broken by insertion order.
    // Throws EngineError(Cycle) if the graph is not acyclic.
    std::vector<std::size_t> topologicalOrder() const;

private:
    std::vector<std::string> nodes_{};
    std::unordered_map<std::string, std::size_t> index_{};
    std::vector<std::vector<std::size_t>> edges_{};
    std::vector<std::optional<std::size_t>> driverOf_{};

    bool visit(std::size_t node, std::vector<int>& state, std::vector<std::size_t>& parent,
               std::vector<std::string>& cycle) const;
};

std::string formatCycle(const std::vector<std::string>& cycle);

} // namespace splinerig::core::drivers
