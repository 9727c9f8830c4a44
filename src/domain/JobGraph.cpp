#include "domain/JobGraph.hpp"

#include <algorithm>
#include <unordered_set>

namespace et::mirror::domain {

namespace {

constexpr std::size_t kNoNode = static_cast<std::size_t>(-1);

} // namespace

std::size_t JobGraph::indexOf(const std::string& name) const {
    const auto it = index_.find(name);
    return it == index_.end() ? kNoNode : it->second;
}

std::size_t JobGraph::ensureNode(const std::string& name) {
    const auto existing = indexOf(name);
    if (existing != kNoNode) {
        return existing;
    }

    const std::size_t idx = nodes_.size();
    nodes_.push_back(name);
    index_.emplace(name, idx);
    preds_.emplace_back();
    succs_.emplace_back();
    return idx;
}

bool JobGraph::addNode(const std::string& name) {
    const std::size_t before = nodes_.size();
    ensureNode(name);
    return nodes_.size() != before;
}

bool JobGraph::addEdge(const std::string& source, const std::string& target) {
    const std::size_t s = ensureNode(source);
    const std::size_t t = ensureNode(target);

    auto& out = succs_[s];
    if (std::find(out.begin(), out.end(), t) != out.end()) {
        return false;
    }

    out.push_back(t);
    preds_[t].push_back(s);
    edges_.push_back({source, target});
    return true;
}

bool JobGraph::hasNode(const std::string& name) const {
    return indexOf(name) != kNoNode;
}

bool JobGraph::hasEdge(const std::string& source, const std::string& target) const {
    const auto s = indexOf(source);
    const auto t = indexOf(target);
    if (s == kNoNode || t == kNoNode) {
        return false;
    }
    const auto& out = succs_[s];
    return std::find(out.begin(), out.end(), t) != out.end();
}

std::vector<std::string> JobGraph::predecessors(const std::string& name) const {
    std::vector<std::string> out;
    const auto idx = indexOf(name);
    if (idx == kNoNode) {
        return out;
    }
    out.reserve(preds_[idx].size());
    for (const auto p : preds_[idx]) {
        out.push_back(nodes_[p]);
    }
    return out;
}

std::vector<std::string> JobGraph::successors(const std::string& name) const {
    std::vector<std::string> out;
    const auto idx = indexOf(name);
    if (idx == kNoNode) {
        return out;
    }
    out.reserve(succs_[idx].size());
    for (const auto s : succs_[idx]) {
        out.push_back(nodes_[s]);
    }
    return out;
}

std::vector<std::string> findImplicitNodes(const JobGraph& graph, const std::vector<Job>& jobs) {
    std::unordered_set<std::string> known;
    known.reserve(jobs.size());
    for (const auto& job : jobs) {
        known.insert(job.name);
    }

    std::vector<std::string> implicit;
    for (const auto& node : graph.nodes()) {
        if (known.find(node) == known.end()) {
            implicit.push_back(node);
        }
    }
    return implicit;
}

} // namespace et::mirror::domain
