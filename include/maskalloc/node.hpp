#pragma once

#include "maskalloc/types.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <variant>
#include <optional>

namespace maskalloc {

/// Attribute value type
using AttributeValue = std::variant<
    int64_t,
    float,
    std::string,
    std::vector<int64_t>
>;

/// One operation of a traced model topology
class Node {
public:
    Node() = default;

    Node(std::string name,
         std::string op_type,
         std::vector<std::string> inputs,
         std::vector<std::string> outputs);

    // Accessors
    const std::string& name() const { return name_; }
    const std::string& op_type() const { return op_type_; }
    const std::vector<std::string>& inputs() const { return inputs_; }
    const std::vector<std::string>& outputs() const { return outputs_; }
    const std::unordered_map<std::string, AttributeValue>& attributes() const {
        return attributes_;
    }

    // Attribute access with default value
    template<typename T>
    T get_attr(const std::string& name, const T& default_value) const;

    // Attribute access returning optional
    template<typename T>
    std::optional<T> get_attr(const std::string& name) const;

    void set_attr(const std::string& name, AttributeValue value);
    bool has_attr(const std::string& name) const;

    /// Layer with a prunable weight (Conv, ConvTranspose, Gemm, MatMul, Linear)
    bool is_prunable() const;

    /// Conv or ConvTranspose
    bool is_convolution() const;

    /// Channel-merging op whose operands must keep identical channels.
    /// A negative Concat axis is resolved against output_rank; without a
    /// rank it is counted as merging.
    bool merges_channels(std::optional<size_t> output_rank = std::nullopt) const;

private:
    std::string name_;
    std::string op_type_;
    std::vector<std::string> inputs_;
    std::vector<std::string> outputs_;
    std::unordered_map<std::string, AttributeValue> attributes_;
};

// Template implementations
template<typename T>
T Node::get_attr(const std::string& name, const T& default_value) const {
    auto it = attributes_.find(name);
    if (it == attributes_.end()) {
        return default_value;
    }
    if (auto* val = std::get_if<T>(&it->second)) {
        return *val;
    }
    return default_value;
}

template<typename T>
std::optional<T> Node::get_attr(const std::string& name) const {
    auto it = attributes_.find(name);
    if (it == attributes_.end()) {
        return std::nullopt;
    }
    if (auto* val = std::get_if<T>(&it->second)) {
        return *val;
    }
    return std::nullopt;
}

} // namespace maskalloc
