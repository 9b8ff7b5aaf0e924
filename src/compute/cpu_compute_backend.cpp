#include "compute/cpu_compute_backend.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "adapter/buffer_adapter_opencv.hpp"

namespace t2t {

namespace {

class CpuComputeProgram : public ComputeProgram {
public:
    explicit CpuComputeProgram(std::shared_ptr<const ComputeShader> shader)
        : shader_(std::move(shader)), kernel_args_(shader_->kernel_count()) {}

    int find_kernel(const std::string& name) const override {
        return shader_->find_kernel(name);
    }

    void set_texture(int kernel, const std::string& name,
                     const ImageBuffer& image, int mip_level) override {
        if (mip_level != 0) {
            throw ConvertError(ConvertErrc::InvalidParameter,
                               "CPU backend textures have no mip chain (requested level " +
                                   std::to_string(mip_level) + ")");
        }
        if (image.device != Device::CPU) {
            throw ConvertError(ConvertErrc::InvalidInput,
                               "Texture '" + name + "' is not resident on the CPU device");
        }
        args_for(kernel).textures[name] = image;
    }

    void set_buffer(int kernel, const std::string& name, const GpuBuffer& buffer) override {
        if (buffer.device != Device::CPU) {
            throw ConvertError(ConvertErrc::InvalidInput,
                               "Buffer '" + name + "' is not resident on the CPU device");
        }
        args_for(kernel).buffers[name] = buffer;
    }

    void clear_texture(int kernel, const std::string& name) override {
        args_for(kernel).textures.erase(name);
    }

    void set_ints(const std::string& name, int x, int y) override {
        ints_[name] = cv::Vec2i(x, y);
    }

    void set_matrix(const std::string& name, const Matrix4& m) override {
        matrices_[name] = m;
    }

    void dispatch(int kernel, int groups_x, int groups_y, int groups_z) override {
        const KernelEntry& entry = shader_->kernel(kernel);
        if (groups_x <= 0 || groups_y <= 0 || groups_z <= 0) {
            throw ConvertError(ConvertErrc::InvalidParameter,
                               "Dispatch of '" + entry.name + "' requires positive group counts");
        }
        if (!entry.host_impl) {
            throw ConvertError(ConvertErrc::KernelNotFound,
                               "Kernel '" + entry.name + "' has no host implementation");
        }

        KernelArgs args = args_for(kernel);
        args.ints = ints_;
        args.matrices = matrices_;

        // Resolving the bindings may throw; keep that on the issuing thread.
        const ThreadFunc body = entry.host_impl(args);

        const cv::Vec3i group = entry.thread_group_size;
        const int groups_xy = groups_x * groups_y;
        const int total = groups_xy * groups_z;
        cv::parallel_for_(cv::Range(0, total), [&](const cv::Range& range) {
            for (int g = range.start; g < range.end; ++g) {
                const int gz = g / groups_xy;
                const int gy = (g % groups_xy) / groups_x;
                const int gx = g % groups_x;
                for (int tz = 0; tz < group[2]; ++tz)
                    for (int ty = 0; ty < group[1]; ++ty)
                        for (int tx = 0; tx < group[0]; ++tx)
                            body(cv::Vec3i(gx * group[0] + tx, gy * group[1] + ty, gz * group[2] + tz));
            }
        });
    }

private:
    KernelArgs& args_for(int kernel) {
        (void)shader_->kernel(kernel); // range check
        return kernel_args_[static_cast<size_t>(kernel)];
    }

    std::shared_ptr<const ComputeShader> shader_;
    std::vector<KernelArgs> kernel_args_; // textures/buffers, per kernel
    std::unordered_map<std::string, cv::Vec2i> ints_;
    std::unordered_map<std::string, Matrix4> matrices_;
};

}  // namespace

ImageBuffer CpuComputeBackend::create_texture(int width, int height, int channels,
                                              DataType type, bool random_write) {
    (void)random_write; // host memory is always writable
    if (width <= 0 || height <= 0) {
        throw ConvertError(ConvertErrc::InvalidParameter, "Texture size must be positive");
    }
    cv::Mat storage(height, width, toCvType(type, channels), cv::Scalar::all(0));
    return fromCvMat(storage);
}

GpuBuffer CpuComputeBackend::create_structured_buffer(size_t count, size_t stride) {
    if (count == 0 || stride == 0) {
        throw ConvertError(ConvertErrc::InvalidParameter, "Structured buffer requires count > 0 and stride > 0");
    }
    GpuBuffer buffer;
    buffer.count = count;
    buffer.stride = stride;
    buffer.device = Device::CPU;
    buffer.data = std::shared_ptr<void>(new uint8_t[count * stride](),
                                        [](void* p) { delete[] static_cast<uint8_t*>(p); });
    return buffer;
}

std::unique_ptr<ComputeProgram> CpuComputeBackend::load_program(
    std::shared_ptr<const ComputeShader> shader) {
    if (!shader) {
        throw ConvertError(ConvertErrc::InvalidConfig, "load_program: shader is null");
    }
    return std::make_unique<CpuComputeProgram>(std::move(shader));
}

ReadbackResult CpuComputeBackend::readback(const GpuBuffer& buffer, void* dst, size_t size) {
    if (buffer.empty() || !buffer.data) {
        return {false, "readback: buffer has been released"};
    }
    if (buffer.device != Device::CPU) {
        return {false, "readback: buffer does not belong to the CPU device"};
    }
    if (!dst || size != buffer.byte_size()) {
        return {false, "readback: destination size " + std::to_string(size) +
                           " does not match buffer size " + std::to_string(buffer.byte_size())};
    }
    std::memcpy(dst, buffer.data.get(), size);
    return {};
}

} // namespace t2t
