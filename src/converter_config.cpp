// Converter configuration YAML read/write implementation
#include "converter_config.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>

#include "param_utils.hpp"

namespace fs = std::filesystem;

namespace t2t {

bool write_config_to_file(const ConverterConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "tex2tensor converter configuration.";
    root["kernel"] = config.kernel;
    root["width"] = config.width;
    root["height"] = config.height;
    root["channels"] = config.channels;
    root["input_type"] = config.input_type;
    root["aspect_mode"] = config.aspect_mode;

    std::ofstream fout(path);
    if (!fout) return false;
    fout << root;
    return static_cast<bool>(fout);
}

void load_or_create_config(const std::string& config_path, ConverterConfig& config) {
    if (fs::exists(config_path)) {
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            config.kernel = as_str(root, "kernel", config.kernel);
            config.width = as_int_flexible(root, "width", config.width);
            config.height = as_int_flexible(root, "height", config.height);
            config.channels = as_int_flexible(root, "channels", config.channels);
            config.input_type = as_str(root, "input_type", config.input_type);
            config.aspect_mode = as_str(root, "aspect_mode", config.aspect_mode);
            config.loaded_config_path = fs::absolute(config_path).string();
            std::cout << "Loaded configuration from '" << config_path << "'." << std::endl;
        } catch (const YAML::Exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
    } else if (config_path == "converter.yaml") {
        std::cout << "Configuration file 'converter.yaml' not found. Creating a default one." << std::endl;
        if (write_config_to_file(config, "converter.yaml")) {
            config.loaded_config_path = fs::absolute("converter.yaml").string();
        }
    } else {
        std::cerr << "Warning: Config file '" << config_path
                  << "' not found. Using default settings." << std::endl;
    }
}

TextureToTensor::Options to_options(const ConverterConfig& config) {
    TextureToTensor::Options options;
    options.kernel = config.kernel;
    options.width = config.width;
    options.height = config.height;
    options.channels = config.channels;
    options.input_type = parse_data_type(config.input_type);
    return options;
}

AspectMode config_aspect_mode(const ConverterConfig& config) {
    return parse_aspect_mode(config.aspect_mode);
}

} // namespace t2t
