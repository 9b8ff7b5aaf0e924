#pragma once

#include "compute/compute_backend.hpp"

namespace t2t {

// Host reference backend. Kernels run through their host implementation, one
// work group per cv::parallel_for_ slot. Dispatch returns after every group
// finished, so readback never waits.
class CpuComputeBackend : public ComputeBackend {
public:
    std::string name() const override { return "cpu"; }
    Device device() const override { return Device::CPU; }

    ImageBuffer create_texture(int width, int height, int channels,
                               DataType type, bool random_write) override;
    GpuBuffer create_structured_buffer(size_t count, size_t stride) override;

    std::unique_ptr<ComputeProgram> load_program(
        std::shared_ptr<const ComputeShader> shader) override;

    ReadbackResult readback(const GpuBuffer& buffer, void* dst, size_t size) override;
};

} // namespace t2t
