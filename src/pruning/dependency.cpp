#include "maskalloc/pruning/dependency.hpp"
#include "maskalloc/errors.hpp"
#include <numeric>
#include <unordered_set>

namespace maskalloc {
namespace pruning {

namespace {

bool has_prunable_weight(const Graph& graph, const Node& node) {
    return node.is_prunable() && node.inputs().size() >= 2 &&
           graph.has_initializer(node.inputs()[1]);
}

/// Minimal union-find keyed by insertion index
class DisjointSets {
public:
    size_t add() {
        parent_.push_back(parent_.size());
        return parent_.size() - 1;
    }

    size_t find(size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(size_t a, size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        // Lower index wins so sets keep topological order
        if (b < a) std::swap(a, b);
        parent_[b] = a;
    }

private:
    std::vector<size_t> parent_;
};

} // anonymous namespace

StaticDependencyResolver::StaticDependencyResolver(DependencySets channel_sets,
                                                   GroupFactors group_factors)
    : channel_sets_(std::move(channel_sets))
    , group_factors_(std::move(group_factors))
{}

GraphDependencyResolver::GraphDependencyResolver(std::shared_ptr<const Graph> graph)
    : graph_(std::move(graph))
{
    if (!graph_) {
        throw ConfigError("Dependency tracing requires a graph");
    }
    if (graph_->reference_input() == nullptr) {
        throw ConfigError("Dependency tracing requires a reference input with a concrete shape");
    }
}

std::vector<std::string> GraphDependencyResolver::nearest_prunable_producers(
    const std::string& tensor_name) const {

    std::vector<std::string> result;
    std::unordered_set<std::string> visited;
    std::vector<std::string> pending{tensor_name};

    while (!pending.empty()) {
        std::string tensor = pending.back();
        pending.pop_back();

        const std::string* producer = graph_->get_producer(tensor);
        if (producer == nullptr || !visited.insert(*producer).second) {
            continue;
        }

        const Node* node = graph_->get_node(*producer);
        if (node == nullptr) {
            continue;
        }
        if (has_prunable_weight(*graph_, *node)) {
            result.push_back(node->name());
            continue;
        }
        // Only activations flow through; weights never have producers
        for (const auto& input : node->inputs()) {
            if (!graph_->has_initializer(input)) {
                pending.push_back(input);
            }
        }
    }
    return result;
}

std::optional<size_t> GraphDependencyResolver::producer_output_rank(
    const std::string& layer) const {
    // Conv and Gemm outputs have the rank of their weight
    const Node* node = graph_->get_node(layer);
    if (node == nullptr || node->inputs().size() < 2) {
        return std::nullopt;
    }
    auto weight = graph_->get_initializer(node->inputs()[1]);
    if (!weight) {
        return std::nullopt;
    }
    return weight->get().ndim();
}

DependencySets GraphDependencyResolver::channel_dependency_sets() const {
    auto order = graph_->topological_sort();

    DisjointSets sets;
    std::unordered_map<std::string, size_t> index;
    std::vector<std::string> names;
    for (const auto& node : order) {
        if (has_prunable_weight(*graph_, *node)) {
            index[node->name()] = sets.add();
            names.push_back(node->name());
        }
    }

    for (const auto& node : order) {
        if (!node->merges_channels()) {
            continue;
        }
        std::vector<std::string> producers;
        for (const auto& input : node->inputs()) {
            if (graph_->has_initializer(input)) {
                continue;
            }
            auto found = nearest_prunable_producers(input);
            producers.insert(producers.end(), found.begin(), found.end());
        }
        if (producers.empty() || !node->merges_channels(producer_output_rank(producers[0]))) {
            continue;
        }
        for (size_t i = 1; i < producers.size(); ++i) {
            sets.unite(index.at(producers[0]), index.at(producers[i]));
        }
    }

    DependencySets result;
    std::unordered_map<size_t, size_t> slot;
    for (size_t i = 0; i < names.size(); ++i) {
        size_t root = sets.find(i);
        auto it = slot.find(root);
        if (it == slot.end()) {
            slot[root] = result.size();
            result.push_back({names[i]});
        } else {
            result[it->second].push_back(names[i]);
        }
    }
    return result;
}

GroupFactors GraphDependencyResolver::group_dependency_factors() const {
    GroupFactors factors;
    auto merge = [&factors](const std::string& name, int64_t group) {
        auto it = factors.find(name);
        factors[name] = it == factors.end() ? group : std::lcm(it->second, group);
    };

    for (const auto& node : graph_->topological_sort()) {
        if (!node->is_convolution() || !has_prunable_weight(*graph_, *node)) {
            continue;
        }
        int64_t group = node->get_attr<int64_t>("group", 1);
        if (group <= 0) {
            throw ConfigError("Convolution group must be positive, got " +
                              std::to_string(group), node->name());
        }
        merge(node->name(), group);
        if (group > 1 && !node->inputs().empty()) {
            // Grouped input channels constrain whoever produces them
            for (const auto& parent : nearest_prunable_producers(node->inputs()[0])) {
                merge(parent, group);
            }
        }
    }
    return factors;
}

} // namespace pruning
} // namespace maskalloc
