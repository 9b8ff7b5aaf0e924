// tex2tensor: texture to tensor converter
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include "compute/compute_backend.hpp"
#include "compute/compute_shader.hpp"
#include "image_buffer.hpp"
#include "services/conversion_event_service.hpp"
#include "t2t_types.hpp"

namespace t2t {

// Non-owning view over a converter's host tensor, row-major (H, W, C).
// Valid until the next convert() or dispose() on the converter.
class TensorView {
public:
    TensorView() = default;
    TensorView(const void* data, size_t size, DataType type,
               int width, int height, int channels)
        : data_(data), size_(size), type_(type),
          width_(width), height_(height), channels_(channels) {}

    const uint8_t* data() const { return static_cast<const uint8_t*>(data_); }
    const void* raw_data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    DataType element_type() const { return type_; }
    int width() const { return width_; }
    int height() const { return height_; }
    int channels() const { return channels_; }
    size_t element_count() const {
        const size_t elem = data_type_size(type_);
        return elem ? size_ / elem : 0;
    }

    // Typed access. T must have the size of the element type.
    template <typename T>
    const T* as() const {
        static_assert(std::is_arithmetic<T>::value && std::is_trivially_copyable<T>::value,
                      "TensorView::as requires a scalar element type");
        if (sizeof(T) != data_type_size(type_)) {
            throw ConvertError(ConvertErrc::InvalidParameter,
                               std::string("TensorView::as: element type is ") + data_type_name(type_));
        }
        return static_cast<const T*>(data_);
    }

    template <typename T>
    T at(int y, int x, int c) const {
        return as<T>()[(static_cast<size_t>(y) * width_ + x) * channels_ + c];
    }

private:
    const void* data_ = nullptr;
    size_t size_ = 0;
    DataType type_ = DataType::FLOAT32;
    int width_ = 0;
    int height_ = 0;
    int channels_ = 0;
};

/**
 * @brief Converts an image into a tensor with an arbitrary affine transform,
 *        on whatever device the backend drives.
 *
 * Lifecycle: constructed -> convert()* -> disposed. convert() blocks until the
 * readback has finished. One instance must not be used from several threads
 * at once; use one converter per thread instead. Calling convert() after
 * dispose() throws ConvertError(Disposed).
 */
class TEX2TENSOR_API TextureToTensor {
public:
    struct Options {
        std::shared_ptr<const ComputeShader> shader; // null selects default_tensor_shader()
        std::string kernel = kTensorKernelF32;
        int width = 0;
        int height = 0;
        int channels = 0;
        DataType input_type = DataType::FLOAT32;
    };

    // @throws ConvertError (InvalidConfig, KernelNotFound) on invalid options.
    TextureToTensor(std::shared_ptr<ComputeBackend> backend, const Options& options);
    ~TextureToTensor();

    TextureToTensor(const TextureToTensor&) = delete;
    TextureToTensor& operator=(const TextureToTensor&) = delete;

    // A failed readback is logged and reported through events() and
    // last_readback(); the returned view then holds unspecified content.
    TensorView convert(const ImageBuffer& input, const Matrix4& transform);
    TensorView convert(const ImageBuffer& input, AspectMode aspect_mode);

    Matrix4 aspect_scaled_matrix(const ImageBuffer& input, AspectMode aspect_mode) const;

    // Releases every device resource. Safe to call more than once.
    void dispose();
    bool is_disposed() const { return disposed_; }

    // Intermediate RGBA8 surface written by the last dispatch.
    const ImageBuffer& texture() const { return texture_; }
    const Matrix4& transform_matrix() const { return transform_matrix_; }

    int width() const { return width_; }
    int height() const { return height_; }
    int channels() const { return channels_; }
    DataType element_type() const { return type_; }
    size_t byte_size() const { return byte_size_; }

    const ReadbackResult& last_readback() const { return last_readback_; }
    ConversionEventService& events() { return events_; }

private:
    void ensure_alive() const;

    std::shared_ptr<ComputeBackend> backend_;
    std::shared_ptr<const ComputeShader> shader_;
    std::unique_ptr<ComputeProgram> program_;
    int kernel_ = -1;

    int width_ = 0;
    int height_ = 0;
    int channels_ = 0;
    DataType type_ = DataType::FLOAT32;
    size_t byte_size_ = 0;

    ImageBuffer texture_;
    GpuBuffer tensor_buffer_;
    std::vector<uint8_t> tensor_;

    Matrix4 transform_matrix_ = Matrix4::eye();
    ReadbackResult last_readback_;
    ConversionEventService events_;
    uint64_t sequence_ = 0;
    bool disposed_ = false;
};

} // namespace t2t
