#include "compute/compute_shader.hpp"
#include "compute/tensor_kernels.hpp"

#include <string>

namespace t2t {

const ImageBuffer& KernelArgs::texture(const std::string& name) const {
    auto it = textures.find(name);
    if (it == textures.end()) {
        throw ConvertError(ConvertErrc::MissingBinding, "Texture parameter not bound: " + name);
    }
    return it->second;
}

const GpuBuffer& KernelArgs::buffer(const std::string& name) const {
    auto it = buffers.find(name);
    if (it == buffers.end()) {
        throw ConvertError(ConvertErrc::MissingBinding, "Buffer parameter not bound: " + name);
    }
    return it->second;
}

cv::Vec2i KernelArgs::int_pair(const std::string& name) const {
    auto it = ints.find(name);
    if (it == ints.end()) {
        throw ConvertError(ConvertErrc::MissingBinding, "Integer parameter not set: " + name);
    }
    return it->second;
}

const Matrix4& KernelArgs::matrix(const std::string& name) const {
    auto it = matrices.find(name);
    if (it == matrices.end()) {
        throw ConvertError(ConvertErrc::MissingBinding, "Matrix parameter not set: " + name);
    }
    return it->second;
}

void ComputeShader::add_kernel(KernelEntry entry) {
    if (entry.name.empty()) {
        throw ConvertError(ConvertErrc::InvalidParameter, "Kernel entry point requires a name");
    }
    if (find_kernel(entry.name) >= 0) {
        throw ConvertError(ConvertErrc::InvalidParameter,
                           "Duplicate kernel '" + entry.name + "' in shader '" + name_ + "'");
    }
    kernels_.push_back(std::move(entry));
}

int ComputeShader::find_kernel(const std::string& kernel_name) const {
    for (size_t i = 0; i < kernels_.size(); ++i) {
        if (kernels_[i].name == kernel_name) return static_cast<int>(i);
    }
    return -1;
}

const KernelEntry& ComputeShader::kernel(int index) const {
    if (index < 0 || static_cast<size_t>(index) >= kernels_.size()) {
        throw ConvertError(ConvertErrc::KernelNotFound,
                           "Kernel index " + std::to_string(index) + " out of range in shader '" + name_ + "'");
    }
    return kernels_[static_cast<size_t>(index)];
}

std::vector<std::string> ComputeShader::kernel_names() const {
    std::vector<std::string> names;
    names.reserve(kernels_.size());
    for (const auto& k : kernels_) names.push_back(k.name);
    return names;
}

static std::shared_ptr<const ComputeShader> build_default_tensor_shader() {
    auto shader = std::make_shared<ComputeShader>("texture_to_tensor");

    KernelEntry f32;
    f32.name = kTensorKernelF32;
    f32.element_type = DataType::FLOAT32;
    f32.host_impl = kernels::texture_to_tensor_f32;
    shader->add_kernel(std::move(f32));

    KernelEntry u8;
    u8.name = kTensorKernelU8;
    u8.element_type = DataType::UINT8;
    u8.host_impl = kernels::texture_to_tensor_u8;
    shader->add_kernel(std::move(u8));

    return shader;
}

std::shared_ptr<const ComputeShader> default_tensor_shader() {
    static const std::shared_ptr<const ComputeShader> shader = build_default_tensor_shader();
    return shader;
}

} // namespace t2t
