#pragma once

#include "maskalloc/node.hpp"
#include "maskalloc/tensor.hpp"
#include "maskalloc/types.hpp"
#include <memory>
#include <vector>
#include <unordered_map>
#include <string>
#include <optional>
#include <functional>

namespace maskalloc {

/// Traced model topology: nodes, graph inputs and weight initializers
class Graph {
public:
    explicit Graph(std::string name = "");

    const std::string& name() const { return name_; }
    size_t num_nodes() const { return nodes_.size(); }

    // Node management
    void add_node(std::shared_ptr<Node> node);
    Node* get_node(const std::string& name);
    const Node* get_node(const std::string& name) const;
    const std::vector<std::shared_ptr<Node>>& nodes() const { return nodes_; }

    // Input management
    void add_input(const TensorInfo& info);
    const std::vector<TensorInfo>& inputs() const { return inputs_; }

    /// First graph input whose shape is fully concrete (the reference input)
    const TensorInfo* reference_input() const;

    // Initializers (weights, biases)
    void add_initializer(const std::string& name, Tensor tensor);

    /// Get initializer by name (returns nullopt if not found)
    std::optional<std::reference_wrapper<const Tensor>> get_initializer(const std::string& name) const;

    bool has_initializer(const std::string& name) const {
        return initializers_.count(name) > 0;
    }

    // Tensor producer tracking
    const std::string* get_producer(const std::string& tensor_name) const;
    std::vector<std::string> get_consumers(const std::string& tensor_name) const;

    // Graph operations
    std::vector<std::shared_ptr<Node>> topological_sort() const;
    std::vector<std::string> validate() const;

private:
    std::string name_;
    std::vector<std::shared_ptr<Node>> nodes_;
    std::unordered_map<std::string, std::shared_ptr<Node>> node_map_;
    std::vector<TensorInfo> inputs_;
    std::unordered_map<std::string, Tensor> initializers_;
    std::unordered_map<std::string, std::string> tensor_producers_;
};

} // namespace maskalloc
