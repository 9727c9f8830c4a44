#include "domain/GraphLayout.hpp"

#include <algorithm>
#include <cstddef>

namespace et::mirror::domain {

namespace {

enum class Mark {
    Unseen,
    Visiting,
    Done
};

struct Frame {
    std::string              node;
    std::vector<std::string> preds;
    std::size_t              next{0};
    int                      maxPredLevel{-1};
};

// Stack frames run from a node towards its predecessors, so the edge-direction
// cycle is the reversed frame chain closed by the repeated node.
std::string describeCycle(const std::vector<Frame>& stack, const std::string& repeated) {
    std::size_t start = 0;
    for (std::size_t i = 0; i < stack.size(); ++i) {
        if (stack[i].node == repeated) {
            start = i;
            break;
        }
    }

    std::string out = repeated;
    for (std::size_t i = stack.size(); i > start; --i) {
        out += " -> ";
        out += stack[i - 1].node;
    }
    return out;
}

} // namespace

LayoutResult computeHierarchicalLayout(const JobGraph& graph, const LayoutSettings& settings) {
    LayoutResult res;

    std::unordered_map<std::string, Mark> marks;
    marks.reserve(graph.nodeCount());

    std::vector<Frame> stack;

    for (const auto& root : graph.nodes()) {
        if (marks[root] == Mark::Done) {
            continue;
        }

        marks[root] = Mark::Visiting;
        stack.push_back({root, graph.predecessors(root)});

        while (!stack.empty()) {
            Frame& top = stack.back();

            if (top.next < top.preds.size()) {
                const std::string pred = top.preds[top.next++];
                const Mark mark = marks[pred];

                if (mark == Mark::Done) {
                    top.maxPredLevel = std::max(top.maxPredLevel, res.levels[pred]);
                    continue;
                }
                if (mark == Mark::Visiting) {
                    res.ok = false;
                    res.error = makeError(ErrorKind::CyclicGraph,
                                          "dependency cycle detected: " + describeCycle(stack, pred));
                    res.levels.clear();
                    return res;
                }

                marks[pred] = Mark::Visiting;
                stack.push_back({pred, graph.predecessors(pred)});
                continue;
            }

            const int level = top.maxPredLevel + 1;
            res.levels[top.node] = level;
            marks[top.node] = Mark::Done;
            stack.pop_back();

            if (!stack.empty()) {
                stack.back().maxPredLevel = std::max(stack.back().maxPredLevel, level);
            }
        }
    }

    // Columns list their nodes in graph (first-seen) order.
    for (const auto& node : graph.nodes()) {
        const auto level = static_cast<std::size_t>(res.levels[node]);
        if (res.layers.size() <= level) {
            res.layers.resize(level + 1);
        }
        res.layers[level].push_back(node);
    }

    for (std::size_t level = 0; level < res.layers.size(); ++level) {
        const auto& column = res.layers[level];
        const double x = static_cast<double>(level) * settings.horizontalSpacing;
        const double count = static_cast<double>(column.size());

        for (std::size_t i = 0; i < column.size(); ++i) {
            const double y = (static_cast<double>(i) - count / 2.0 + 0.5) * settings.verticalSpacing;
            res.positions[column[i]] = NodePosition{x, y};
        }
    }

    res.ok = true;
    return res;
}

} // namespace et::mirror::domain
