#include "maskalloc/node.hpp"
#include <unordered_set>

namespace maskalloc {

Node::Node(std::string name,
           std::string op_type,
           std::vector<std::string> inputs,
           std::vector<std::string> outputs)
    : name_(std::move(name))
    , op_type_(std::move(op_type))
    , inputs_(std::move(inputs))
    , outputs_(std::move(outputs))
{
}

void Node::set_attr(const std::string& name, AttributeValue value) {
    attributes_[name] = std::move(value);
}

bool Node::has_attr(const std::string& name) const {
    return attributes_.count(name) > 0;
}

bool Node::is_prunable() const {
    static const std::unordered_set<std::string> prunable_ops = {
        "Conv", "ConvTranspose", "Gemm", "MatMul", "Linear"
    };
    return prunable_ops.count(op_type_) > 0;
}

bool Node::is_convolution() const {
    return op_type_ == "Conv" || op_type_ == "ConvTranspose";
}

bool Node::merges_channels(std::optional<size_t> output_rank) const {
    static const std::unordered_set<std::string> elementwise_ops = {
        "Add", "Sub", "Mul", "Sum"
    };
    if (elementwise_ops.count(op_type_) > 0) {
        return true;
    }
    // Concatenation along the channel axis keeps operands independent
    if (op_type_ == "Concat") {
        int64_t axis = get_attr<int64_t>("axis", 1);
        if (axis < 0) {
            if (!output_rank.has_value()) {
                return true;
            }
            axis += static_cast<int64_t>(*output_rank);
        }
        return axis != 1;
    }
    return false;
}

} // namespace maskalloc
