// tex2tensor compute: backend capability interface
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "compute/compute_shader.hpp"
#include "image_buffer.hpp"
#include "t2t_types.hpp"

namespace t2t {

// Outcome of a blocking readback. A failed readback leaves the destination in
// an unspecified state.
struct ReadbackResult {
    bool ok = true;
    std::string message;

    explicit operator bool() const { return ok; }
};

// Per-owner binding state of a loaded shader. Each converter holds its own
// program, so two converters never observe each other's parameters.
class ComputeProgram {
public:
    virtual ~ComputeProgram() = default;

    virtual int find_kernel(const std::string& name) const = 0;

    virtual void set_texture(int kernel, const std::string& name,
                             const ImageBuffer& image, int mip_level = 0) = 0;
    virtual void set_buffer(int kernel, const std::string& name, const GpuBuffer& buffer) = 0;
    // Drops a texture binding; no-op when `name` is not bound.
    virtual void clear_texture(int kernel, const std::string& name) = 0;
    virtual void set_ints(const std::string& name, int x, int y) = 0;
    virtual void set_matrix(const std::string& name, const Matrix4& m) = 0;

    // Issues groups_x * groups_y * groups_z work groups of the kernel's
    // thread group size.
    virtual void dispatch(int kernel, int groups_x, int groups_y, int groups_z) = 0;
};

class ComputeBackend {
public:
    virtual ~ComputeBackend() = default;

    virtual std::string name() const = 0;
    virtual Device device() const = 0;

    virtual ImageBuffer create_texture(int width, int height, int channels,
                                       DataType type, bool random_write) = 0;
    virtual GpuBuffer create_structured_buffer(size_t count, size_t stride) = 0;

    virtual std::unique_ptr<ComputeProgram> load_program(
        std::shared_ptr<const ComputeShader> shader) = 0;

    // Copies `buffer` into `dst` once every previously dispatched write to it
    // has completed. Blocks the caller; no timeout.
    virtual ReadbackResult readback(const GpuBuffer& buffer, void* dst, size_t size) = 0;
};

} // namespace t2t
