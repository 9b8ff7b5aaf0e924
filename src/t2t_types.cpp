#include "t2t_types.hpp"
#include "image_buffer.hpp"

#include <algorithm>
#include <cctype>

namespace t2t {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const char* aspect_mode_name(AspectMode mode) {
    switch (mode) {
        case AspectMode::None: return "none";
        case AspectMode::Fit:  return "fit";
        case AspectMode::Fill: return "fill";
    }
    return "unknown";
}

AspectMode parse_aspect_mode(const std::string& s) {
    const std::string v = to_lower(s);
    if (v == "none" || v == "stretch") return AspectMode::None;
    if (v == "fit" || v == "letterbox") return AspectMode::Fit;
    if (v == "fill" || v == "crop") return AspectMode::Fill;
    throw ConvertError(ConvertErrc::InvalidAspectMode, "Unknown aspect mode: '" + s + "'");
}

size_t data_type_size(DataType type) {
    switch (type) {
        case DataType::UINT8:   return 1;
        case DataType::INT8:    return 1;
        case DataType::UINT16:  return 2;
        case DataType::INT16:   return 2;
        case DataType::FLOAT32: return 4;
        case DataType::FLOAT64: return 8;
    }
    return 0;
}

const char* data_type_name(DataType type) {
    switch (type) {
        case DataType::UINT8:   return "uint8";
        case DataType::INT8:    return "int8";
        case DataType::UINT16:  return "uint16";
        case DataType::INT16:   return "int16";
        case DataType::FLOAT32: return "float32";
        case DataType::FLOAT64: return "float64";
    }
    return "unknown";
}

DataType parse_data_type(const std::string& s) {
    const std::string v = to_lower(s);
    if (v == "uint8" || v == "byte") return DataType::UINT8;
    if (v == "int8") return DataType::INT8;
    if (v == "uint16") return DataType::UINT16;
    if (v == "int16") return DataType::INT16;
    if (v == "float32" || v == "float" || v == "fp32") return DataType::FLOAT32;
    if (v == "float64" || v == "double") return DataType::FLOAT64;
    throw ConvertError(ConvertErrc::InvalidConfig, "Unknown element type: '" + s + "'");
}

} // namespace t2t
