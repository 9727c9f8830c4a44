#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "domain/domain_model.hpp"

namespace et::mirror::domain {

struct GraphEdge {
    std::string source;
    std::string target;
};

// Directed graph over job names.
//
// Nodes keep first-seen insertion order (only affects display order).
// Edges are unique: adding an existing (source, target) pair is a no-op.
// Cycles are allowed here; only the layout rejects them.
class JobGraph {
public:
    JobGraph() = default;

    // Returns true if the node was newly added.
    bool addNode(const std::string& name);

    // Adds missing endpoints as nodes. Returns true if the edge was newly added.
    bool addEdge(const std::string& source, const std::string& target);

    bool hasNode(const std::string& name) const;
    bool hasEdge(const std::string& source, const std::string& target) const;

    const std::vector<std::string>& nodes() const noexcept {
        return nodes_;
    }
    const std::vector<GraphEdge>& edges() const noexcept {
        return edges_;
    }

    std::size_t nodeCount() const noexcept { return nodes_.size(); }
    std::size_t edgeCount() const noexcept { return edges_.size(); }
    bool        empty() const noexcept { return nodes_.empty(); }

    // Neighbours in edge insertion order. Unknown names yield an empty list.
    std::vector<std::string> predecessors(const std::string& name) const;
    std::vector<std::string> successors(const std::string& name) const;

private:
    std::size_t indexOf(const std::string& name) const;
    std::size_t ensureNode(const std::string& name);

    std::vector<std::string>                     nodes_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<GraphEdge>                       edges_;
    std::vector<std::vector<std::size_t>>        preds_;
    std::vector<std::vector<std::size_t>>        succs_;
};

// Nodes that were created only because a trigger named them: they have no
// job record in the snapshot, hence no status and no history. Returned in
// graph order.
std::vector<std::string> findImplicitNodes(const JobGraph& graph, const std::vector<Job>& jobs);

} // namespace et::mirror::domain
