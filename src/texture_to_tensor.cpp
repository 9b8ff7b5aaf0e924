#include "texture_to_tensor.hpp"

#include <chrono>
#include <exception>
#include <iostream>

#include "aspect_transform.hpp"

namespace t2t {

namespace {

int ceil_div(int value, int divisor) {
    return (value + divisor - 1) / divisor;
}

}  // namespace

TextureToTensor::TextureToTensor(std::shared_ptr<ComputeBackend> backend, const Options& options)
    : backend_(std::move(backend)),
      shader_(options.shader ? options.shader : default_tensor_shader()),
      width_(options.width),
      height_(options.height),
      channels_(options.channels),
      type_(options.input_type) {
    if (!backend_) {
        throw ConvertError(ConvertErrc::InvalidConfig, "TextureToTensor requires a compute backend");
    }
    const int kernel_index = shader_->find_kernel(options.kernel);
    if (kernel_index < 0) {
        throw ConvertError(ConvertErrc::KernelNotFound,
                           "Kernel '" + options.kernel + "' not found in shader '" + shader_->name() + "'");
    }
    if (width_ <= 0) throw ConvertError(ConvertErrc::InvalidConfig, "Width must be greater than 0");
    if (height_ <= 0) throw ConvertError(ConvertErrc::InvalidConfig, "Height must be greater than 0");
    if (channels_ < 1 || channels_ > 4) {
        throw ConvertError(ConvertErrc::InvalidConfig, "Channels must be 1 to 4");
    }
    const size_t stride = data_type_size(type_);
    if (stride == 0) {
        throw ConvertError(ConvertErrc::InvalidConfig, "Element type must be a fixed-size scalar");
    }

    const KernelEntry& entry = shader_->kernel(kernel_index);
    if (entry.element_type != type_) {
        throw ConvertError(ConvertErrc::InvalidConfig,
                           "Kernel '" + entry.name + "' writes " + data_type_name(entry.element_type) +
                               " but the converter was configured for " + data_type_name(type_));
    }
    if (entry.thread_group_size != cv::Vec3i(kTensorThreadGroupSize, kTensorThreadGroupSize, 1)) {
        throw ConvertError(ConvertErrc::InvalidConfig,
                           "Kernel '" + entry.name + "' is not authored for 8x8x1 work groups");
    }

    const size_t length = static_cast<size_t>(width_) * height_ * channels_;
    byte_size_ = length * stride;

    texture_ = backend_->create_texture(width_, height_, 4, DataType::UINT8, /*random_write*/ true);
    tensor_buffer_ = backend_->create_structured_buffer(length, stride);
    tensor_.assign(byte_size_, 0);

    program_ = backend_->load_program(shader_);
    kernel_ = program_->find_kernel(options.kernel);
    if (kernel_ < 0) {
        throw ConvertError(ConvertErrc::KernelNotFound,
                           "Backend '" + backend_->name() + "' cannot resolve kernel '" + options.kernel + "'");
    }

    // Constant for the converter's lifetime
    program_->set_ints("_OutputSize", width_, height_);
    program_->set_buffer(kernel_, "_OutputTensor", tensor_buffer_);
    program_->set_texture(kernel_, "_OutputTex", texture_, 0);
}

TextureToTensor::~TextureToTensor() { dispose(); }

void TextureToTensor::dispose() {
    if (disposed_) return;
    disposed_ = true;
    // The program holds references to the bound resources; drop it first.
    program_.reset();
    texture_ = ImageBuffer{};
    tensor_buffer_ = GpuBuffer{};
    std::vector<uint8_t>().swap(tensor_);
    backend_.reset();
}

void TextureToTensor::ensure_alive() const {
    if (disposed_) {
        throw ConvertError(ConvertErrc::Disposed, "TextureToTensor used after dispose()");
    }
}

TensorView TextureToTensor::convert(const ImageBuffer& input, const Matrix4& transform) {
    ensure_alive();
    if (input.empty()) {
        throw ConvertError(ConvertErrc::InvalidInput, "convert: input image is empty");
    }

    auto start = std::chrono::high_resolution_clock::now();

    program_->set_texture(kernel_, "_InputTex", input, 0);
    program_->set_matrix("_TransformMatrix", transform);
    try {
        program_->dispatch(kernel_,
                           ceil_div(width_, kTensorThreadGroupSize),
                           ceil_div(height_, kTensorThreadGroupSize),
                           1);
    } catch (const std::exception&) {
        program_->clear_texture(kernel_, "_InputTex");
        throw;
    }
    // The caller owns the input pixels; do not hold them past this call.
    program_->clear_texture(kernel_, "_InputTex");
    transform_matrix_ = transform;

    // TODO: non-blocking readback that hands the view to a completion callback
    last_readback_ = backend_->readback(tensor_buffer_, tensor_.data(), tensor_.size());
    ++sequence_;

    double ms = std::chrono::duration<double, std::milli>(
                    std::chrono::high_resolution_clock::now() - start).count();
    if (!last_readback_) {
        std::cerr << "Error: GPU readback error detected on backend '" << backend_->name()
                  << "': " << last_readback_.message << std::endl;
        events_.push(sequence_, ConversionEventService::ConversionEvent::READBACK_ERROR,
                     last_readback_.message, ms);
    } else {
        events_.push(sequence_, ConversionEventService::ConversionEvent::CONVERTED, "", ms);
    }

    return TensorView(tensor_.data(), tensor_.size(), type_, width_, height_, channels_);
}

TensorView TextureToTensor::convert(const ImageBuffer& input, AspectMode aspect_mode) {
    ensure_alive();
    if (input.empty()) {
        throw ConvertError(ConvertErrc::InvalidInput, "convert: input image is empty");
    }
    return convert(input, aspect_scaled_matrix(input, aspect_mode));
}

Matrix4 TextureToTensor::aspect_scaled_matrix(const ImageBuffer& input, AspectMode aspect_mode) const {
    return get_aspect_scaled_matrix(input.width, input.height, width_, height_, aspect_mode);
}

} // namespace t2t
