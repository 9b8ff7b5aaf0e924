#pragma once
#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>

namespace t2t {

#if defined(_WIN32)
    #if defined(TEX2TENSOR_LIB_BUILD)
        #define TEX2TENSOR_API __declspec(dllexport)
    #else
        #define TEX2TENSOR_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(TEX2TENSOR_LIB_BUILD)
        #define TEX2TENSOR_API __attribute__((visibility("default")))
    #else
        #define TEX2TENSOR_API
    #endif
#endif

enum class ConvertErrc {
    InvalidConfig = 1, KernelNotFound, InvalidAspectMode,
    InvalidParameter, InvalidInput, MissingBinding, Disposed,
};
struct TEX2TENSOR_API ConvertError : public std::runtime_error {
    ConvertError(ConvertErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    ConvertErrc code() const noexcept { return code_; }
private:
    ConvertErrc code_;
};

// 4x4 matrices follow the column-vector convention: p' = M * p.
using Matrix4 = cv::Matx44f;

// How a source/destination aspect mismatch is resolved.
enum class AspectMode {
    None, // stretch
    Fit,  // letterbox, whole source visible
    Fill  // crop, destination fully covered
};

const char* aspect_mode_name(AspectMode mode);
AspectMode parse_aspect_mode(const std::string& s);

} // namespace t2t
