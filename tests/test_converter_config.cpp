#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "converter_config.hpp"

namespace fs = std::filesystem;

namespace {

fs::path scratch_file(const std::string& name) {
  fs::path dir = fs::temp_directory_path() / "tex2tensor_tests";
  fs::create_directories(dir);
  return dir / name;
}

}  // namespace

TEST(ConverterConfigTest, WriteThenLoadRestoresEveryField) {
  t2t::ConverterConfig written;
  written.kernel = t2t::kTensorKernelU8;
  written.width = 320;
  written.height = 192;
  written.channels = 4;
  written.input_type = "uint8";
  written.aspect_mode = "fill";

  fs::path path = scratch_file("roundtrip.yaml");
  ASSERT_TRUE(t2t::write_config_to_file(written, path.string()));

  t2t::ConverterConfig loaded;
  t2t::load_or_create_config(path.string(), loaded);
  EXPECT_EQ(loaded.kernel, written.kernel);
  EXPECT_EQ(loaded.width, 320);
  EXPECT_EQ(loaded.height, 192);
  EXPECT_EQ(loaded.channels, 4);
  EXPECT_EQ(loaded.input_type, "uint8");
  EXPECT_EQ(loaded.aspect_mode, "fill");
  EXPECT_EQ(loaded.loaded_config_path, fs::absolute(path).string());

  t2t::TextureToTensor::Options options = t2t::to_options(loaded);
  EXPECT_EQ(options.input_type, t2t::DataType::UINT8);
  EXPECT_EQ(options.width, 320);
  EXPECT_EQ(t2t::config_aspect_mode(loaded), t2t::AspectMode::Fill);
}

TEST(ConverterConfigTest, MissingKeysKeepDefaults) {
  fs::path path = scratch_file("partial.yaml");
  {
    std::ofstream out(path);
    out << "width: 96\nheight: not_a_number\n";
  }
  t2t::ConverterConfig config;
  t2t::load_or_create_config(path.string(), config);
  EXPECT_EQ(config.width, 96);
  EXPECT_EQ(config.height, 224);
  EXPECT_EQ(config.channels, 3);
  EXPECT_EQ(config.kernel, t2t::kTensorKernelF32);
}

TEST(ConverterConfigTest, UnparsableFileFallsBackToDefaults) {
  fs::path path = scratch_file("broken.yaml");
  {
    std::ofstream out(path);
    out << "width: [1, 2\n";
  }
  t2t::ConverterConfig config;
  ASSERT_NO_THROW(t2t::load_or_create_config(path.string(), config));
  EXPECT_EQ(config.width, 224);
  EXPECT_TRUE(config.loaded_config_path.empty());
}

TEST(ConverterConfigTest, UnknownNamesAreConfigurationErrors) {
  t2t::ConverterConfig config;
  config.input_type = "complex64";
  try {
    t2t::to_options(config);
    FAIL() << "expected ConvertError";
  } catch (const t2t::ConvertError& e) {
    EXPECT_EQ(e.code(), t2t::ConvertErrc::InvalidConfig);
  }

  config.input_type = "float32";
  config.aspect_mode = "zoom";
  EXPECT_THROW(t2t::config_aspect_mode(config), t2t::ConvertError);
}
