#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace t2t {

// Pixel / tensor element type, independent of any imaging library.
enum class DataType {
    UINT8, INT8, UINT16, INT16, FLOAT32, FLOAT64
};

// Where the memory behind a buffer lives.
enum class Device {
    CPU,
    GPU,
};

// Size in bytes of one element; 0 for a value outside the enum.
size_t data_type_size(DataType type);
const char* data_type_name(DataType type);
DataType parse_data_type(const std::string& s);

// Library-independent image descriptor. Inputs, intermediate surfaces and
// previews are all passed around in this form.
struct ImageBuffer {
    int width = 0;
    int height = 0;
    int channels = 0;
    DataType type = DataType::FLOAT32;
    Device device = Device::CPU;
    size_t step = 0; // bytes per row

    // Pixel memory. The deleter keeps whatever owns the memory alive
    // (a cv::Mat, a backend allocation, ...).
    std::shared_ptr<void> data = nullptr;

    // Backend specific handle (e.g. a GPU texture object).
    std::shared_ptr<void> context = nullptr;

    bool empty() const { return width <= 0 || height <= 0 || (!data && !context); }
};

// Structured buffer: `count` elements of `stride` bytes each.
struct GpuBuffer {
    size_t count = 0;
    size_t stride = 0;
    Device device = Device::CPU;
    std::shared_ptr<void> data = nullptr;
    std::shared_ptr<void> context = nullptr;

    size_t byte_size() const { return count * stride; }
    bool empty() const { return byte_size() == 0 || (!data && !context); }
};

} // namespace t2t
