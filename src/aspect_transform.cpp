#include "aspect_transform.hpp"

#include <string>

namespace t2t {

Matrix4 translate_matrix(float tx, float ty, float tz) {
    return Matrix4(1, 0, 0, tx,
                   0, 1, 0, ty,
                   0, 0, 1, tz,
                   0, 0, 0, 1);
}

Matrix4 scale_matrix(float sx, float sy, float sz) {
    return Matrix4(sx, 0,  0,  0,
                   0,  sy, 0,  0,
                   0,  0,  sz, 0,
                   0,  0,  0,  1);
}

cv::Vec2f get_aspect_scale(float src_aspect, float dst_aspect, AspectMode mode) {
    const bool src_wider = src_aspect > dst_aspect;
    switch (mode) {
        case AspectMode::None:
            return cv::Vec2f(1.0f, 1.0f);
        case AspectMode::Fit:
            return src_wider ? cv::Vec2f(1.0f, src_aspect / dst_aspect)
                             : cv::Vec2f(dst_aspect / src_aspect, 1.0f);
        case AspectMode::Fill:
            return src_wider ? cv::Vec2f(dst_aspect / src_aspect, 1.0f)
                             : cv::Vec2f(1.0f, src_aspect / dst_aspect);
    }
    throw ConvertError(ConvertErrc::InvalidAspectMode,
                       "Unknown aspect mode: " + std::to_string(static_cast<int>(mode)));
}

Matrix4 get_aspect_scaled_matrix(int src_width, int src_height,
                                 int dst_width, int dst_height,
                                 AspectMode mode) {
    if (src_width <= 0 || src_height <= 0 || dst_width <= 0 || dst_height <= 0) {
        throw ConvertError(ConvertErrc::InvalidParameter,
                           "Aspect matrix requires positive source and destination sizes.");
    }
    const float src_aspect = static_cast<float>(src_width) / src_height;
    const float dst_aspect = static_cast<float>(dst_width) / dst_height;
    const cv::Vec2f scale = get_aspect_scale(src_aspect, dst_aspect, mode);

    // Recenter on the origin, scale, move back into [0,1] texture space.
    static const Matrix4 push = translate_matrix(-0.5f, -0.5f);
    static const Matrix4 pop = translate_matrix(0.5f, 0.5f);
    return pop * scale_matrix(scale[0], scale[1]) * push;
}

} // namespace t2t
