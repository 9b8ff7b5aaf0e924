#include "adapter/buffer_adapter_opencv.hpp"
#include "t2t_types.hpp"

#include <string>

namespace t2t {

static DataType fromCvDepth(int cv_type) {
    switch (CV_MAT_DEPTH(cv_type)) {
        case CV_8U:  return DataType::UINT8;
        case CV_8S:  return DataType::INT8;
        case CV_16U: return DataType::UINT16;
        case CV_16S: return DataType::INT16;
        case CV_32F: return DataType::FLOAT32;
        case CV_64F: return DataType::FLOAT64;
        default:
            throw ConvertError(ConvertErrc::InvalidInput,
                               "Unsupported cv::Mat depth for ImageBuffer conversion");
    }
}

int toCvType(DataType type, int channels) {
    if (channels < 1 || channels > 4) {
        throw ConvertError(ConvertErrc::InvalidInput,
                           "Unsupported channel count: " + std::to_string(channels));
    }
    switch (type) {
        case DataType::UINT8:   return CV_8UC(channels);
        case DataType::INT8:    return CV_8SC(channels);
        case DataType::UINT16:  return CV_16UC(channels);
        case DataType::INT16:   return CV_16SC(channels);
        case DataType::FLOAT32: return CV_32FC(channels);
        case DataType::FLOAT64: return CV_64FC(channels);
    }
    throw ConvertError(ConvertErrc::InvalidInput, "Unsupported data type for OpenCV conversion");
}

cv::Mat toCvMat(const ImageBuffer& buffer) {
    if (!buffer.data || buffer.device != Device::CPU) {
        throw ConvertError(ConvertErrc::InvalidInput, "toCvMat: Buffer has no CPU pixel data.");
    }
    int type = toCvType(buffer.type, buffer.channels);
    size_t step = buffer.step ? buffer.step : cv::Mat::AUTO_STEP;
    return cv::Mat(buffer.height, buffer.width, type, buffer.data.get(), step);
}

ImageBuffer fromCvMat(const cv::Mat& mat) {
    ImageBuffer buffer;
    buffer.width = mat.cols;
    buffer.height = mat.rows;
    buffer.channels = mat.channels();
    buffer.type = fromCvDepth(mat.type());
    buffer.device = Device::CPU;
    buffer.step = mat.step;

    // The lambda holds a copy of the Mat header; as long as buffer.data is
    // alive the Mat's reference count keeps the pixels allocated.
    buffer.data = std::shared_ptr<void>(mat.data, [mat_ref = mat](void*) {});
    return buffer;
}

} // namespace t2t
