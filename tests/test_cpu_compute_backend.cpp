#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "compute/cpu_compute_backend.hpp"
#include "compute/tensor_kernels.hpp"

using t2t::ConvertErrc;
using t2t::ConvertError;
using t2t::CpuComputeBackend;
using t2t::DataType;

namespace {

template <typename Fn>
std::optional<ConvertErrc> error_code_of(Fn&& fn) {
  try {
    fn();
  } catch (const ConvertError& e) {
    return e.code();
  }
  return std::nullopt;
}

}  // namespace

TEST(CpuComputeBackendTest, AllocatesZeroedResources) {
  CpuComputeBackend backend;
  EXPECT_EQ(backend.device(), t2t::Device::CPU);

  t2t::GpuBuffer buffer = backend.create_structured_buffer(12, sizeof(float));
  EXPECT_EQ(buffer.byte_size(), 48u);
  const auto* bytes = static_cast<const uint8_t*>(buffer.data.get());
  for (size_t i = 0; i < buffer.byte_size(); ++i) EXPECT_EQ(bytes[i], 0);

  t2t::ImageBuffer tex = backend.create_texture(7, 5, 4, DataType::UINT8, true);
  EXPECT_EQ(tex.width, 7);
  EXPECT_EQ(tex.height, 5);
  EXPECT_EQ(tex.channels, 4);
  EXPECT_GE(tex.step, 28u);

  EXPECT_THROW(backend.create_structured_buffer(0, 4), ConvertError);
  EXPECT_THROW(backend.create_texture(0, 5, 4, DataType::UINT8, true), ConvertError);
}

TEST(CpuComputeBackendTest, ReadbackCopiesOrReportsAnError) {
  CpuComputeBackend backend;
  t2t::GpuBuffer buffer = backend.create_structured_buffer(4, 1);
  static_cast<uint8_t*>(buffer.data.get())[2] = 42;

  std::vector<uint8_t> host(4, 0);
  t2t::ReadbackResult ok = backend.readback(buffer, host.data(), host.size());
  EXPECT_TRUE(ok.ok);
  EXPECT_EQ(host[2], 42);

  std::vector<uint8_t> small(3, 0);
  t2t::ReadbackResult mismatch = backend.readback(buffer, small.data(), small.size());
  EXPECT_FALSE(mismatch.ok);
  EXPECT_FALSE(mismatch.message.empty());

  t2t::ReadbackResult released = backend.readback(t2t::GpuBuffer{}, host.data(), host.size());
  EXPECT_FALSE(released.ok);
}

TEST(CpuComputeBackendTest, DispatchValidatesBindingsOnTheCallingThread) {
  CpuComputeBackend backend;
  auto program = backend.load_program(t2t::default_tensor_shader());
  int kernel = program->find_kernel(t2t::kTensorKernelF32);
  ASSERT_GE(kernel, 0);
  EXPECT_EQ(program->find_kernel("missing"), -1);

  EXPECT_EQ(error_code_of([&] { program->dispatch(kernel, 1, 1, 1); }),
            ConvertErrc::MissingBinding);
  EXPECT_EQ(error_code_of([&] { program->dispatch(kernel, 0, 1, 1); }),
            ConvertErrc::InvalidParameter);
  EXPECT_EQ(error_code_of([&] { program->dispatch(17, 1, 1, 1); }),
            ConvertErrc::KernelNotFound);

  t2t::ImageBuffer tex = backend.create_texture(8, 8, 4, DataType::UINT8, true);
  EXPECT_EQ(error_code_of([&] { program->set_texture(kernel, "_OutputTex", tex, 1); }),
            ConvertErrc::InvalidParameter);

  EXPECT_THROW(backend.load_program(nullptr), ConvertError);
}

TEST(CpuComputeBackendTest, DispatchRunsEveryThreadOfEveryGroupOnce) {
  std::atomic<int> visits{0};
  auto shader = std::make_shared<t2t::ComputeShader>("count");
  t2t::KernelEntry entry;
  entry.name = "count";
  entry.thread_group_size = cv::Vec3i(4, 2, 1);
  entry.host_impl = [&visits](const t2t::KernelArgs&) -> t2t::ThreadFunc {
    return [&visits](const cv::Vec3i&) { visits.fetch_add(1); };
  };
  shader->add_kernel(std::move(entry));

  CpuComputeBackend backend;
  auto program = backend.load_program(shader);
  program->dispatch(0, 3, 2, 2);
  EXPECT_EQ(visits.load(), 3 * 2 * 2 * 4 * 2);
}

TEST(CpuComputeBackendTest, ProgramsDoNotShareParameters) {
  CpuComputeBackend backend;
  auto shader = std::make_shared<t2t::ComputeShader>("echo_size");
  cv::Vec2i seen(0, 0);
  t2t::KernelEntry entry;
  entry.name = "echo_size";
  entry.host_impl = [&seen](const t2t::KernelArgs& args) -> t2t::ThreadFunc {
    seen = args.int_pair("_OutputSize");
    return [](const cv::Vec3i&) {};
  };
  shader->add_kernel(std::move(entry));

  auto a = backend.load_program(shader);
  auto b = backend.load_program(shader);
  a->set_ints("_OutputSize", 3, 4);
  b->set_ints("_OutputSize", 9, 9);
  a->dispatch(0, 1, 1, 1);
  EXPECT_EQ(seen, cv::Vec2i(3, 4));
  b->dispatch(0, 1, 1, 1);
  EXPECT_EQ(seen, cv::Vec2i(9, 9));
}

TEST(CpuComputeBackendTest, ClearedTextureIsNoLongerBound) {
  CpuComputeBackend backend;
  auto shader = std::make_shared<t2t::ComputeShader>("read");
  t2t::KernelEntry entry;
  entry.name = "read";
  entry.host_impl = [](const t2t::KernelArgs& args) -> t2t::ThreadFunc {
    args.texture("_InputTex");
    return [](const cv::Vec3i&) {};
  };
  shader->add_kernel(std::move(entry));

  auto program = backend.load_program(shader);
  t2t::ImageBuffer tex = backend.create_texture(2, 2, 4, DataType::UINT8, false);
  const long refs = tex.data.use_count();
  program->set_texture(0, "_InputTex", tex);
  EXPECT_GT(tex.data.use_count(), refs);
  EXPECT_NO_THROW(program->dispatch(0, 1, 1, 1));

  program->clear_texture(0, "_InputTex");
  EXPECT_EQ(tex.data.use_count(), refs);
  EXPECT_EQ(error_code_of([&] { program->dispatch(0, 1, 1, 1); }),
            ConvertErrc::MissingBinding);
  EXPECT_NO_THROW(program->clear_texture(0, "_InputTex"));
}

TEST(ComputeShaderTest, RejectsDuplicateAndUnnamedKernels) {
  t2t::ComputeShader shader("dup");
  t2t::KernelEntry entry;
  entry.name = "k";
  shader.add_kernel(entry);
  EXPECT_THROW(shader.add_kernel(entry), ConvertError);
  EXPECT_THROW(shader.add_kernel(t2t::KernelEntry{}), ConvertError);
  EXPECT_EQ(shader.kernel_count(), 1u);
}

TEST(ComputeShaderTest, DefaultShaderExposesTensorKernels) {
  auto shader = t2t::default_tensor_shader();
  ASSERT_TRUE(shader);
  int f32 = shader->find_kernel(t2t::kTensorKernelF32);
  int u8 = shader->find_kernel(t2t::kTensorKernelU8);
  ASSERT_GE(f32, 0);
  ASSERT_GE(u8, 0);
  EXPECT_EQ(shader->kernel(f32).element_type, DataType::FLOAT32);
  EXPECT_EQ(shader->kernel(u8).element_type, DataType::UINT8);
  EXPECT_EQ(shader->kernel_names(),
            (std::vector<std::string>{t2t::kTensorKernelF32, t2t::kTensorKernelU8}));
  EXPECT_EQ(shader->kernel(f32).thread_group_size,
            cv::Vec3i(t2t::kTensorThreadGroupSize, t2t::kTensorThreadGroupSize, 1));
}

TEST(TensorKernelsTest, BilinearSampleBlendsNeighbours) {
  cv::Mat img(1, 2, CV_8UC1);
  img.at<uint8_t>(0, 0) = 0;
  img.at<uint8_t>(0, 1) = 255;
  t2t::ImageBuffer buffer;
  buffer.width = 2;
  buffer.height = 1;
  buffer.channels = 1;
  buffer.type = DataType::UINT8;
  buffer.step = img.step;
  buffer.data = std::shared_ptr<void>(img.data, [img](void*) {});

  EXPECT_NEAR(t2t::kernels::sample_bilinear(buffer, 0.5f, 0.5f)[0], 0.5f, 1e-6f);
  EXPECT_NEAR(t2t::kernels::sample_bilinear(buffer, 0.25f, 0.5f)[0], 0.0f, 1e-6f);
  // Clamp to edge beyond the last texel center.
  EXPECT_NEAR(t2t::kernels::sample_bilinear(buffer, 1.0f, 0.5f)[0], 1.0f, 1e-6f);
  EXPECT_NEAR(t2t::kernels::read_texel(buffer, 1, 0)[3], 1.0f, 1e-6f);
}
