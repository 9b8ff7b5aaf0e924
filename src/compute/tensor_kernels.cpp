#include "compute/tensor_kernels.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>

namespace t2t {
namespace kernels {

namespace {

template <typename T>
float load_scalar(const uint8_t* p) {
    T v;
    std::memcpy(&v, p, sizeof(T));
    return static_cast<float>(v);
}

float load_normalized(const uint8_t* p, DataType type) {
    switch (type) {
        case DataType::UINT8:   return load_scalar<uint8_t>(p) / 255.0f;
        case DataType::INT8:    return std::max(load_scalar<int8_t>(p) / 127.0f, -1.0f);
        case DataType::UINT16:  return load_scalar<uint16_t>(p) / 65535.0f;
        case DataType::INT16:   return std::max(load_scalar<int16_t>(p) / 32767.0f, -1.0f);
        case DataType::FLOAT32: return load_scalar<float>(p);
        case DataType::FLOAT64: return load_scalar<double>(p);
    }
    return 0.0f;
}

size_t row_step(const ImageBuffer& image) {
    if (image.step) return image.step;
    return static_cast<size_t>(image.width) * image.channels * data_type_size(image.type);
}

void validate_input(const ImageBuffer& input) {
    if (input.empty() || !input.data) {
        throw ConvertError(ConvertErrc::InvalidInput, "_InputTex has no pixel data");
    }
    if (input.device != Device::CPU) {
        throw ConvertError(ConvertErrc::InvalidInput, "_InputTex is not host accessible");
    }
    if (input.channels < 1 || input.channels > 4) {
        throw ConvertError(ConvertErrc::InvalidInput,
                           "_InputTex has unsupported channel count " + std::to_string(input.channels));
    }
    if (data_type_size(input.type) == 0) {
        throw ConvertError(ConvertErrc::InvalidInput, "_InputTex has unsupported element type");
    }
}

template <typename T>
T to_element(float v);

template <>
float to_element<float>(float v) { return v; }

template <>
uint8_t to_element<uint8_t>(float v) { return cv::saturate_cast<uint8_t>(v * 255.0f); }

template <typename T>
ThreadFunc make_tensor_kernel(const KernelArgs& args) {
    const ImageBuffer input = args.texture("_InputTex");
    const ImageBuffer out_tex = args.texture("_OutputTex");
    const GpuBuffer tensor = args.buffer("_OutputTensor");
    const cv::Vec2i size = args.int_pair("_OutputSize");
    const Matrix4 m = args.matrix("_TransformMatrix");

    validate_input(input);

    const int w = size[0];
    const int h = size[1];
    if (w <= 0 || h <= 0) {
        throw ConvertError(ConvertErrc::InvalidParameter, "_OutputSize must be positive");
    }
    if (!out_tex.data || out_tex.type != DataType::UINT8 || out_tex.channels != 4 ||
        out_tex.width < w || out_tex.height < h) {
        throw ConvertError(ConvertErrc::InvalidParameter,
                           "_OutputTex must be an RGBA8 surface covering _OutputSize");
    }
    if (!tensor.data || tensor.stride != sizeof(T)) {
        throw ConvertError(ConvertErrc::InvalidParameter,
                           "_OutputTensor stride does not match the kernel element size");
    }
    const size_t pixels = static_cast<size_t>(w) * h;
    const int channels = static_cast<int>(tensor.count / pixels);
    if (tensor.count % pixels != 0 || channels < 1 || channels > 4) {
        throw ConvertError(ConvertErrc::InvalidParameter,
                           "_OutputTensor length must be W*H*C with C in [1,4]");
    }

    uint8_t* tex_base = static_cast<uint8_t*>(out_tex.data.get());
    const size_t tex_step = row_step(out_tex);
    T* dst = static_cast<T*>(tensor.data.get());

    return [=](const cv::Vec3i& id) {
        const int x = id[0];
        const int y = id[1];
        if (x >= w || y >= h) return;

        const float u = (x + 0.5f) / w;
        const float v = (y + 0.5f) / h;
        const cv::Vec4f p = m * cv::Vec4f(u, v, 0.0f, 1.0f);

        cv::Vec4f c(0.0f, 0.0f, 0.0f, 1.0f);
        if (p[0] >= 0.0f && p[0] <= 1.0f && p[1] >= 0.0f && p[1] <= 1.0f) {
            c = sample_bilinear(input, p[0], p[1]);
        }

        uint8_t* texel = tex_base + static_cast<size_t>(y) * tex_step + static_cast<size_t>(x) * 4;
        for (int i = 0; i < 4; ++i) texel[i] = cv::saturate_cast<uint8_t>(c[i] * 255.0f);

        T* out = dst + (static_cast<size_t>(y) * w + x) * channels;
        for (int i = 0; i < channels; ++i) out[i] = to_element<T>(c[i]);
    };
}

}  // namespace

cv::Vec4f read_texel(const ImageBuffer& image, int x, int y) {
    const size_t elem = data_type_size(image.type);
    const uint8_t* row = static_cast<const uint8_t*>(image.data.get()) + static_cast<size_t>(y) * row_step(image);
    const uint8_t* px = row + static_cast<size_t>(x) * image.channels * elem;

    float c[4] = {0.0f, 0.0f, 0.0f, 1.0f};
    const int n = std::min(image.channels, 4);
    for (int i = 0; i < n; ++i) c[i] = load_normalized(px + i * elem, image.type);
    if (image.channels == 1) c[1] = c[2] = c[0];
    return cv::Vec4f(c[0], c[1], c[2], c[3]);
}

cv::Vec4f sample_bilinear(const ImageBuffer& image, float u, float v) {
    const float fx = u * image.width - 0.5f;
    const float fy = v * image.height - 0.5f;
    const int ix = static_cast<int>(std::floor(fx));
    const int iy = static_cast<int>(std::floor(fy));
    const float ax = fx - ix;
    const float ay = fy - iy;

    const int x0 = std::clamp(ix, 0, image.width - 1);
    const int x1 = std::clamp(ix + 1, 0, image.width - 1);
    const int y0 = std::clamp(iy, 0, image.height - 1);
    const int y1 = std::clamp(iy + 1, 0, image.height - 1);

    const cv::Vec4f t00 = read_texel(image, x0, y0);
    const cv::Vec4f t10 = read_texel(image, x1, y0);
    const cv::Vec4f t01 = read_texel(image, x0, y1);
    const cv::Vec4f t11 = read_texel(image, x1, y1);

    return t00 * ((1.0f - ax) * (1.0f - ay)) + t10 * (ax * (1.0f - ay)) +
           t01 * ((1.0f - ax) * ay) + t11 * (ax * ay);
}

ThreadFunc texture_to_tensor_f32(const KernelArgs& args) {
    return make_tensor_kernel<float>(args);
}

ThreadFunc texture_to_tensor_u8(const KernelArgs& args) {
    return make_tensor_kernel<uint8_t>(args);
}

} // namespace kernels
} // namespace t2t
