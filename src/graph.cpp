#include "maskalloc/graph.hpp"
#include "maskalloc/errors.hpp"
#include <queue>
#include <unordered_set>

namespace maskalloc {

Graph::Graph(std::string name)
    : name_(std::move(name))
{
}

void Graph::add_node(std::shared_ptr<Node> node) {
    if (!node) {
        throw std::invalid_argument("Cannot add null node to graph");
    }
    if (node_map_.count(node->name()) > 0) {
        throw std::invalid_argument(
            "Node '" + node->name() + "' already exists in graph");
    }

    nodes_.push_back(node);
    node_map_[node->name()] = node;

    for (const auto& output : node->outputs()) {
        tensor_producers_[output] = node->name();
    }
}

Node* Graph::get_node(const std::string& name) {
    auto it = node_map_.find(name);
    return it != node_map_.end() ? it->second.get() : nullptr;
}

const Node* Graph::get_node(const std::string& name) const {
    auto it = node_map_.find(name);
    return it != node_map_.end() ? it->second.get() : nullptr;
}

void Graph::add_input(const TensorInfo& info) {
    inputs_.push_back(info);
}

const TensorInfo* Graph::reference_input() const {
    for (const auto& input : inputs_) {
        if (!input.shape.empty() && !input.is_dynamic()) {
            return &input;
        }
    }
    return nullptr;
}

void Graph::add_initializer(const std::string& name, Tensor tensor) {
    initializers_[name] = std::move(tensor);
}

std::optional<std::reference_wrapper<const Tensor>> Graph::get_initializer(const std::string& name) const {
    auto it = initializers_.find(name);
    if (it != initializers_.end()) {
        return std::cref(it->second);
    }
    return std::nullopt;
}

const std::string* Graph::get_producer(const std::string& tensor_name) const {
    auto it = tensor_producers_.find(tensor_name);
    return it != tensor_producers_.end() ? &it->second : nullptr;
}

std::vector<std::string> Graph::get_consumers(const std::string& tensor_name) const {
    std::vector<std::string> consumers;
    for (const auto& node : nodes_) {
        for (const auto& input : node->inputs()) {
            if (input == tensor_name) {
                consumers.push_back(node->name());
                break;
            }
        }
    }
    return consumers;
}

std::vector<std::shared_ptr<Node>> Graph::topological_sort() const {
    std::unordered_map<std::string, int> in_degree;
    std::unordered_map<std::string, std::vector<std::string>> dependents;

    for (const auto& node : nodes_) {
        in_degree[node->name()] = 0;
        dependents[node->name()] = {};
    }

    for (const auto& node : nodes_) {
        for (const auto& input : node->inputs()) {
            auto producer = get_producer(input);
            if (producer && in_degree.count(*producer)) {
                in_degree[node->name()]++;
                dependents[*producer].push_back(node->name());
            }
        }
    }

    // Kahn's algorithm, seeded in insertion order so the result is deterministic
    std::queue<std::string> queue;
    for (const auto& node : nodes_) {
        if (in_degree[node->name()] == 0) {
            queue.push(node->name());
        }
    }

    std::vector<std::shared_ptr<Node>> result;
    result.reserve(nodes_.size());

    while (!queue.empty()) {
        std::string name = queue.front();
        queue.pop();
        result.push_back(node_map_.at(name));

        for (const auto& dep : dependents[name]) {
            in_degree[dep]--;
            if (in_degree[dep] == 0) {
                queue.push(dep);
            }
        }
    }

    if (result.size() != nodes_.size()) {
        throw ValidationError({"Graph contains a cycle"});
    }

    return result;
}

std::vector<std::string> Graph::validate() const {
    std::vector<std::string> errors;
    std::unordered_set<std::string> available;

    for (const auto& input : inputs_) {
        available.insert(input.name);
    }
    for (const auto& [name, _] : initializers_) {
        available.insert(name);
    }

    std::vector<std::shared_ptr<Node>> sorted;
    try {
        sorted = topological_sort();
    } catch (const ValidationError& e) {
        return e.errors();
    }

    for (const auto& node : sorted) {
        for (const auto& input : node->inputs()) {
            if (available.find(input) == available.end()) {
                errors.push_back(
                    "Node '" + node->name() + "' input '" + input + "' not found");
            }
        }
        for (const auto& output : node->outputs()) {
            available.insert(output);
        }
    }

    return errors;
}

} // namespace maskalloc
