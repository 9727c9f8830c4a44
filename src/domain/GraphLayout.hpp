#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "domain/JobGraph.hpp"
#include "domain/domain_model.hpp"

namespace et::mirror::domain {

struct NodePosition {
    double x{0.0};
    double y{0.0};
};

struct LayoutResult {
    bool  ok{false};
    Error error;

    std::unordered_map<std::string, int>          levels;
    std::unordered_map<std::string, NodePosition> positions;

    // layers[level] lists the nodes of that column, top to bottom.
    std::vector<std::vector<std::string>> layers;
};

// Longest-path layering for left-to-right display.
//
// level(n) = 0 without predecessors, otherwise 1 + max(level(p)).
// Within a column nodes keep graph (first-seen) order.
// Columns sit at x = level * horizontalSpacing; nodes of a column are spread
// vertically around y = 0, verticalSpacing apart.
//
// A cycle (including a self-loop) fails with ErrorKind::CyclicGraph and the
// cycle path in the message. An empty graph is ok=true with empty maps.
LayoutResult computeHierarchicalLayout(const JobGraph& graph,
                                       const LayoutSettings& settings = {});

} // namespace et::mirror::domain
