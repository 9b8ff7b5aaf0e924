#pragma once

#include "compute/compute_shader.hpp"

namespace t2t {
namespace kernels {

// Host implementations of the texture-to-tensor entry points.
//
// Parameters: _InputTex, _OutputTex (RGBA8, random write), _OutputTensor,
// _OutputSize (W,H), _TransformMatrix. Thread (x,y) samples the input at
// M * ((x+0.5)/W, (y+0.5)/H, 0, 1) with bilinear clamp-to-edge filtering;
// samples falling outside [0,1] read as opaque black. The RGBA result goes to
// _OutputTex and its first C channels to _OutputTensor[(y*W + x)*C + c],
// C being the tensor length divided by W*H.
ThreadFunc texture_to_tensor_f32(const KernelArgs& args);
ThreadFunc texture_to_tensor_u8(const KernelArgs& args);

// Input texel at integer coordinates, expanded to RGBA in [0,1].
cv::Vec4f read_texel(const ImageBuffer& image, int x, int y);

// Bilinear clamp-to-edge sample at normalized (u, v); texel centers sit at
// (i + 0.5) / size.
cv::Vec4f sample_bilinear(const ImageBuffer& image, float u, float v);

} // namespace kernels
} // namespace t2t
