#include "driver_graph.hpp"

#include "../debug_log.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <unordered_set>

namespace splinerig::core::drivers {

using anim::EngineError;
using anim::ErrorKind;

namespace {
constexpr int kUnvisited = 0;
constexpr int kOnStack = 1;
constexpr int kDone = 2;

bool inRange(double v, double lo, double hi) {
    return std::isfinite(v) && v >= lo && v <= hi;
}

void rejectParameter(const LayerSpec& layer, const std::string& what) {
    throw EngineError(ErrorKind::InvalidParameter, layer.name, "layer '" + layer.name + "': " + what);
}

// Easing, timing and driver values must be finite and inside their documented ranges.
void validateParameters(const LayerSpec& layer) {
    if (!std::isfinite(layer.easing.strength) || !(layer.easing.strength > 0.0)) {
        rejectParameter(layer, "easing strength must be positive, got " + std::to_string(layer.easing.strength));
    }
    if (!inRange(layer.timing.acceleration, -1.0, 1.0)) {
        rejectParameter(layer, "acceleration must lie in [-1, 1], got " + std::to_string(layer.timing.acceleration));
    }
    if (!std::isfinite(layer.scale)) rejectParameter(layer, "scale must be finite");
    for (const auto& p : layer.rawPoints) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) rejectParameter(layer, "control point is not finite");
    }
    if (!layer.driver) return;
    if (!inRange(layer.driver->smooth, 0.0, 1.0)) {
        rejectParameter(layer, "driver smooth must lie in [0, 1], got " + std::to_string(layer.driver->smooth));
    }
    if (!std::isfinite(layer.driver->rotateDegrees) || !std::isfinite(layer.driver->deltaScale)) {
        rejectParameter(layer, "driver rotate and d_scale must be finite");
    }
}

} // namespace

void validateLayers(const std::vector<LayerSpec>& layers) {
    std::unordered_set<std::string> seen;
    for (const auto& layer : layers) {
        if (!seen.insert(layer.name).second) {
            throw EngineError(ErrorKind::DuplicateName, layer.name,
                              "layer name '" + layer.name + "' is used more than once");
        }
        if (layer.driver && layer.driver->target == layer.name) {
            throw EngineError(ErrorKind::SelfDrive, layer.name,
                              "layer '" + layer.name + "' cannot drive itself");
        }
        validateParameters(layer);
    }
}

DriverGraph DriverGraph::build(const std::vector<LayerSpec>& layers, Diagnostics& diagnostics) {
    validateLayers(layers);
    DriverGraph graph;
    for (const auto& layer : layers) graph.addNode(layer.name);

    for (const auto& layer : layers) {
        if (!layer.driver || layer.driver->target.empty()) continue;
        auto driver = graph.indexOf(layer.driver->target);
        if (!driver) {
            anim::report(diagnostics, ErrorKind::MissingDriver, layer.name,
                         "driver layer '" + layer.driver->target + "' not found; rendering undriven");
            continue;
        }
        graph.addEdge(*driver, *graph.indexOf(layer.name));
    }
    SPLR_DBG_LOG("driver graph nodes=%zu edges=%zu", graph.size(), graph.edgeCount());
    return graph;
}

std::optional<std::size_t> DriverGraph::indexOf(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::size_t DriverGraph::edgeCount() const {
    std::size_t n = 0;
    for (const auto& e : edges_) n += e.size();
    return n;
}

std::size_t DriverGraph::addNode(const std::string& name) {
    if (auto existing = indexOf(name)) return *existing;
    const std::size_t idx = nodes_.size();
    nodes_.push_back(name);
    index_.emplace(name, idx);
    edges_.emplace_back();
    driverOf_.emplace_back();
    return idx;
}

void DriverGraph::addEdge(std::size_t driver, std::size_t driven) {
    auto& out = edges_[driver];
    if (std::find(out.begin(), out.end(), driven) != out.end()) return;
    out.push_back(driven);
    driverOf_[driven] = driver;
}

bool DriverGraph::visit(std::size_t node, std::vector<int>& state, std::vector<std::size_t>& parent,
                        std::vector<std::string>& cycle) const {
    state[node] = kOnStack;
    for (std::size_t next : edges_[node]) {
        if (state[next] == kUnvisited) {
            parent[next] = node;
            if (visit(next, state, parent, cycle)) return true;
        } else if (state[next] == kOnStack) {
            // walk parents back from node to the re-entered node
            std::vector<std::string> path{nodes_[next]};
            for (std::size_t cur = node; cur != next; cur = parent[cur]) {
                path.push_back(nodes_[cur]);
            }
            path.push_back(nodes_[next]);
            std::reverse(path.begin(), path.end());
            cycle = std::move(path);
            return true;
        }
    }
    state[node] = kDone;
    return false;
}

std::optional<std::vector<std::string>> DriverGraph::findCycle() const {
    std::vector<int> state(nodes_.size(), kUnvisited);
    std::vector<std::size_t> parent(nodes_.size(), 0);
    std::vector<std::string> cycle;
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        if (state[i] != kUnvisited) continue;
        if (visit(i, state, parent, cycle)) return cycle;
    }
    return std::nullopt;
}

std::vector<std::size_t> DriverGraph::topologicalOrder() const {
    if (auto cycle = findCycle()) {
        throw EngineError(ErrorKind::Cycle, cycle->empty() ? std::string{} : cycle->front(),
                          "circular driver chain detected: " + formatCycle(*cycle), *cycle);
    }

    std::vector<std::size_t> indegree(nodes_.size(), 0);
    for (const auto& out : edges_) {
        for (std::size_t next : out) ++indegree[next];
    }
    std::deque<std::size_t> queue;
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        if (indegree[i] == 0) queue.push_back(i);
    }

    std::vector<std::size_t> order;
    order.reserve(nodes_.size());
    while (!queue.empty()) {
        const std::size_t node = queue.front();
        queue.pop_front();
        order.push_back(node);
        for (std::size_t next : edges_[node]) {
            if (--indegree[next] == 0) queue.push_back(next);
        }
    }

    if (order.size() != nodes_.size()) {
        throw EngineError(ErrorKind::Cycle, "",
                          "failed to resolve driver ordering: " + std::to_string(nodes_.size() - order.size()) +
                              " layer(s) left unordered");
    }
    return order;
}

std::string formatCycle(const std::vector<std::string>& cycle) {
    std::string out;
    for (std::size_t i = 0; i < cycle.size(); ++i) {
        if (i) out += " -> ";
        out += cycle[i];
    }
    return out;
}

} // namespace splinerig::core::drivers
