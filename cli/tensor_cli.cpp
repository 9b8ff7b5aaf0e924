// FILE: cli/tensor_cli.cpp
#include <getopt.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "adapter/buffer_adapter_opencv.hpp"
#include "compute/cpu_compute_backend.hpp"
#include "converter_config.hpp"
#include "texture_to_tensor.hpp"

using namespace t2t;

static void print_cli_help() {
    std::cout
        << "Usage: tex2tensor_cli -i <image> [options]\n"
        << "Converts an image into a row-major (H, W, C) tensor.\n\n"
        << "  -i, --image <path>     input image (any format cv::imread reads)\n"
        << "  -c, --config <path>    converter config YAML (default: converter.yaml)\n"
        << "  -a, --aspect <mode>    none | fit | fill (overrides the config)\n"
        << "  -o, --output <path>    write the raw tensor bytes to <path>\n"
        << "  -p, --preview <path>   write the intermediate RGBA surface as an image\n"
        << "  -h, --help             show this help\n"
        << "\nKernels (config key `kernel`):\n";
    for (const auto& name : default_tensor_shader()->kernel_names()) {
        std::cout << "  " << name << "\n";
    }
}

// cv::imread yields gray, BGR or BGRA; the kernels expect RGBA order.
static cv::Mat to_rgba(const cv::Mat& img) {
    cv::Mat rgba;
    switch (img.channels()) {
        case 1: cv::cvtColor(img, rgba, cv::COLOR_GRAY2RGBA); break;
        case 3: cv::cvtColor(img, rgba, cv::COLOR_BGR2RGBA); break;
        case 4: cv::cvtColor(img, rgba, cv::COLOR_BGRA2RGBA); break;
        default:
            throw ConvertError(ConvertErrc::InvalidInput,
                               "Unsupported channel count " + std::to_string(img.channels()));
    }
    return rgba;
}

int main(int argc, char** argv) {
    std::string config_path = "converter.yaml";
    std::string image_path;
    std::string output_path;
    std::string preview_path;
    std::optional<std::string> aspect_override;

    const char* const short_opts = "hi:c:a:o:p:";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'}, {"image", required_argument, nullptr, 'i'},
        {"config", required_argument, nullptr, 'c'}, {"aspect", required_argument, nullptr, 'a'},
        {"output", required_argument, nullptr, 'o'}, {"preview", required_argument, nullptr, 'p'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'h': print_cli_help(); return 0;
        case 'i': image_path = optarg; break;
        case 'c': config_path = optarg; break;
        case 'a': aspect_override = optarg; break;
        case 'o': output_path = optarg; break;
        case 'p': preview_path = optarg; break;
        default: print_cli_help(); return 1;
        }
    }
    if (image_path.empty()) {
        std::cerr << "Error: no input image; use -i <path>.\n";
        print_cli_help();
        return 1;
    }

    ConverterConfig config;
    load_or_create_config(config_path, config);

    try {
        cv::Mat img = cv::imread(image_path, cv::IMREAD_UNCHANGED);
        if (img.empty()) {
            std::cerr << "Error: Failed to read image: " << image_path << "\n";
            return 2;
        }
        ImageBuffer input = fromCvMat(to_rgba(img));

        AspectMode mode = aspect_override ? parse_aspect_mode(*aspect_override)
                                          : config_aspect_mode(config);

        auto backend = std::make_shared<CpuComputeBackend>();
        TextureToTensor converter(backend, to_options(config));

        auto start = std::chrono::high_resolution_clock::now();
        TensorView tensor = converter.convert(input, mode);
        double ms = std::chrono::duration<double, std::milli>(
                        std::chrono::high_resolution_clock::now() - start).count();

        if (!converter.last_readback()) {
            std::cerr << "Warning: tensor content is unreliable for this frame.\n";
        }

        if (!output_path.empty()) {
            std::ofstream fout(output_path, std::ios::binary);
            fout.write(static_cast<const char*>(tensor.raw_data()),
                       static_cast<std::streamsize>(tensor.size()));
            if (!fout) {
                std::cerr << "Error: Failed to write tensor to '" << output_path << "'.\n";
                return 2;
            }
            std::cout << "Saved tensor to " << output_path << "\n";
        }

        if (!preview_path.empty()) {
            cv::Mat bgra;
            cv::cvtColor(toCvMat(converter.texture()), bgra, cv::COLOR_RGBA2BGRA);
            if (!cv::imwrite(preview_path, bgra)) {
                std::cerr << "Error: Failed to write preview to '" << preview_path << "'.\n";
                return 2;
            }
            std::cout << "Saved preview to " << preview_path << "\n";
        }

        std::cout << img.cols << "x" << img.rows << " -> "
                  << tensor.width() << "x" << tensor.height() << "x" << tensor.channels()
                  << " " << data_type_name(tensor.element_type())
                  << " (" << tensor.size() << " bytes, aspect " << aspect_mode_name(mode)
                  << ") in " << ms << " ms" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
