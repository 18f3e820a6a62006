#include "maskalloc/tensor.hpp"
#include "maskalloc/types.hpp"
#include <cstdlib>
#include <algorithm>
#include <stdexcept>
#include <limits>
#include <new>

#ifdef _WIN32
#include <malloc.h>
#define aligned_alloc(alignment, size) _aligned_malloc(size, alignment)
#define aligned_free(ptr) _aligned_free(ptr)
#else
#define aligned_free(ptr) std::free(ptr)
#endif

namespace maskalloc {

namespace {

constexpr size_t kAlignment = 64;

/// Reject negative dimensions
void validate_shape(const std::vector<int64_t>& shape) {
    for (size_t i = 0; i < shape.size(); ++i) {
        if (shape[i] < 0) {
            throw std::invalid_argument(
                "Negative dimension at axis " + std::to_string(i) +
                ": " + std::to_string(shape[i]));
        }
    }
}

/// aligned_alloc requires the size to be a multiple of the alignment
std::shared_ptr<void> allocate_aligned(size_t bytes) {
    size_t padded = (bytes + kAlignment - 1) / kAlignment * kAlignment;
    void* ptr = aligned_alloc(kAlignment, padded);
    if (!ptr) {
        throw std::bad_alloc();
    }
    return std::shared_ptr<void>(ptr, [](void* p) { aligned_free(p); });
}

} // anonymous namespace

Tensor::Tensor(const std::vector<int64_t>& shape, DType dtype)
    : shape_(shape)
    , dtype_(dtype)
{
    validate_shape(shape_);

    size_t bytes = size_bytes();
    if (bytes > 0) {
        owned_data_ = allocate_aligned(bytes);
        data_ = owned_data_.get();
        std::memset(data_, 0, bytes);
    }
}

Tensor::Tensor(const Tensor& other)
    : shape_(other.shape_)
    , dtype_(other.dtype_)
{
    if (other.is_valid()) {
        size_t bytes = size_bytes();
        owned_data_ = allocate_aligned(bytes);
        data_ = owned_data_.get();
        std::memcpy(data_, other.data_, bytes);
    }
}

Tensor::Tensor(Tensor&& other) noexcept
    : data_(other.data_)
    , shape_(std::move(other.shape_))
    , dtype_(other.dtype_)
    , owned_data_(std::move(other.owned_data_))
{
    other.data_ = nullptr;
}

Tensor& Tensor::operator=(const Tensor& other) {
    if (this != &other) {
        Tensor tmp(other);
        std::swap(data_, tmp.data_);
        std::swap(shape_, tmp.shape_);
        std::swap(dtype_, tmp.dtype_);
        std::swap(owned_data_, tmp.owned_data_);
    }
    return *this;
}

Tensor& Tensor::operator=(Tensor&& other) noexcept {
    if (this != &other) {
        data_ = other.data_;
        shape_ = std::move(other.shape_);
        dtype_ = other.dtype_;
        owned_data_ = std::move(other.owned_data_);
        other.data_ = nullptr;
    }
    return *this;
}

Tensor Tensor::from_values(const std::vector<int64_t>& shape,
                           const std::vector<float>& values) {
    Tensor result(shape, DType::Float32);
    if (static_cast<int64_t>(values.size()) != result.num_elements()) {
        throw std::invalid_argument(
            "Value count " + std::to_string(values.size()) +
            " does not match shape " + shape_to_string(shape));
    }
    if (!values.empty()) {
        std::copy(values.begin(), values.end(), result.data_ptr<float>());
    }
    return result;
}

Tensor Tensor::full(const std::vector<int64_t>& shape, float value) {
    Tensor result(shape, DType::Float32);
    result.fill(value);
    return result;
}

int64_t Tensor::num_elements() const {
    if (shape_.empty()) return 0;
    return checked_product(shape_);
}

size_t Tensor::size_bytes() const {
    int64_t elements = num_elements();
    size_t elem_size = dtype_size(dtype_);
    if (elements > 0 && static_cast<size_t>(elements) > std::numeric_limits<size_t>::max() / elem_size) {
        throw std::overflow_error("Tensor size in bytes would overflow");
    }
    return static_cast<size_t>(elements) * elem_size;
}

Tensor Tensor::clone() const {
    return Tensor(*this);
}

void Tensor::zero() {
    if (is_valid()) {
        std::memset(data_, 0, size_bytes());
    }
}

Tensor Tensor::reshape(const std::vector<int64_t>& new_shape) const {
    validate_shape(new_shape);

    int64_t new_total = checked_product(new_shape);

    if (new_total != num_elements()) {
        throw std::invalid_argument(
            "Cannot reshape tensor: element count mismatch (" +
            std::to_string(new_total) + " vs " + std::to_string(num_elements()) + ")");
    }

    Tensor result = clone();
    result.shape_ = new_shape;
    return result;
}

std::vector<float> Tensor::to_vector() const {
    if (dtype_ != DType::Float32) {
        throw std::invalid_argument("to_vector() requires a float32 tensor, got " +
                                    dtype_name(dtype_));
    }
    const float* ptr = data_ptr<float>();
    int64_t n = num_elements();
    if (n == 0 || ptr == nullptr) {
        return {};
    }
    return std::vector<float>(ptr, ptr + n);
}

} // namespace maskalloc
