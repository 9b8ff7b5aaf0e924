// tex2tensor compute: shader = named set of kernel entry points
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "image_buffer.hpp"
#include "t2t_types.hpp"

namespace t2t {

// Work-group edge the tensor kernels are authored for. Converters size their
// dispatch grid with it; it is not configurable at runtime.
constexpr int kTensorThreadGroupSize = 8;

constexpr const char* kTensorKernelF32 = "texture_to_tensor_f32";
constexpr const char* kTensorKernelU8 = "texture_to_tensor_u8";

// Resources visible to one kernel dispatch. Lookups throw
// ConvertError(MissingBinding) when a parameter was never set.
struct KernelArgs {
    std::unordered_map<std::string, ImageBuffer> textures;
    std::unordered_map<std::string, GpuBuffer> buffers;
    std::unordered_map<std::string, cv::Vec2i> ints;
    std::unordered_map<std::string, Matrix4> matrices;

    const ImageBuffer& texture(const std::string& name) const;
    const GpuBuffer& buffer(const std::string& name) const;
    cv::Vec2i int_pair(const std::string& name) const;
    const Matrix4& matrix(const std::string& name) const;
};

// Body of one kernel thread, invoked with its global thread id.
using ThreadFunc = std::function<void(const cv::Vec3i& thread_id)>;

// Host implementation of a kernel. Called once per dispatch on the issuing
// thread: resolves and validates the bindings (and may throw), then returns
// the per-thread body.
using HostKernel = std::function<ThreadFunc(const KernelArgs& args)>;

struct KernelEntry {
    std::string name;
    DataType element_type = DataType::FLOAT32; // type written to the output tensor
    cv::Vec3i thread_group_size{kTensorThreadGroupSize, kTensorThreadGroupSize, 1};
    HostKernel host_impl; // used by the CPU backend; GPU backends map `name` to their own pipeline
};

class ComputeShader {
public:
    explicit ComputeShader(std::string name) : name_(std::move(name)) {}

    void add_kernel(KernelEntry entry);

    // Index of the entry point, or -1 when the shader has no such kernel.
    int find_kernel(const std::string& kernel_name) const;
    const KernelEntry& kernel(int index) const;
    size_t kernel_count() const { return kernels_.size(); }
    std::vector<std::string> kernel_names() const;

    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::vector<KernelEntry> kernels_;
};

/**
 * @brief Process-wide texture-to-tensor shader.
 * @note Built on the first call (thread-safe, exactly once) and never mutated
 *       afterwards, so every converter may share it. Binding state is kept in
 *       each converter's ComputeProgram, not in the shader.
 */
std::shared_ptr<const ComputeShader> default_tensor_shader();

} // namespace t2t
