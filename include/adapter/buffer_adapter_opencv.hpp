#pragma once

#include "image_buffer.hpp"
#include <opencv2/core.hpp>

namespace t2t {

/**
 * @brief Map an element type and channel count to the OpenCV type code.
 * @throws ConvertError (InvalidInput) for channel counts outside [1,4].
 */
int toCvType(DataType type, int channels);

/**
 * @brief Wrap a CPU-resident ImageBuffer as a cv::Mat header.
 * @note Zero-copy: the returned Mat aliases buffer.data. The caller must keep
 *       the buffer alive while the Mat is in use.
 * @throws ConvertError (InvalidInput) if the buffer has no CPU pixels.
 */
cv::Mat toCvMat(const ImageBuffer& buffer);

/**
 * @brief Wrap a cv::Mat as an ImageBuffer.
 * @note Zero-copy. The buffer shares the Mat's reference count through the
 *       deleter of buffer.data, so the pixels outlive the original Mat.
 */
ImageBuffer fromCvMat(const cv::Mat& mat);

} // namespace t2t
