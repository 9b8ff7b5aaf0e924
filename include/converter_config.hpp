// Converter configuration definition and YAML I/O declarations
#pragma once

#include <string>

#include "texture_to_tensor.hpp"

namespace t2t {

struct ConverterConfig {
    std::string loaded_config_path;
    std::string kernel = kTensorKernelF32;
    int width = 224;
    int height = 224;
    int channels = 3;
    std::string input_type = "float32";
    std::string aspect_mode = "fit";
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const ConverterConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists. Unreadable files
// leave the defaults in place and print a warning.
// If `config_path` is the default "converter.yaml" and does not exist, create it with defaults.
void load_or_create_config(const std::string& config_path, ConverterConfig& config);

// @throws ConvertError (InvalidConfig) for an unknown input_type.
TextureToTensor::Options to_options(const ConverterConfig& config);

// @throws ConvertError (InvalidAspectMode) for an unknown aspect_mode.
AspectMode config_aspect_mode(const ConverterConfig& config);

} // namespace t2t
