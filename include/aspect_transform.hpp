// tex2tensor: aspect-ratio aware affine transforms
#pragma once

#include "t2t_types.hpp"

namespace t2t {

Matrix4 translate_matrix(float tx, float ty, float tz = 0.0f);
Matrix4 scale_matrix(float sx, float sy, float sz = 1.0f);

/**
 * @brief Scale factor that reconciles a source aspect ratio with a destination one.
 * @param src_aspect source width / height.
 * @param dst_aspect destination width / height.
 * @return (sx, sy) applied in normalized texture space.
 * @throws ConvertError (InvalidAspectMode) for a mode outside the enum.
 */
cv::Vec2f get_aspect_scale(float src_aspect, float dst_aspect, AspectMode mode);

/**
 * @brief Matrix mapping output normalized coordinates to input normalized
 *        coordinates for the given policy. Scaling pivots on (0.5, 0.5).
 * @throws ConvertError (InvalidParameter) for non-positive sizes.
 */
Matrix4 get_aspect_scaled_matrix(int src_width, int src_height,
                                 int dst_width, int dst_height,
                                 AspectMode mode);

} // namespace t2t
