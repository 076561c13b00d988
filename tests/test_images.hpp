// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_images.hpp
 *
 * Synthetic images and PNG fixtures for tests. Include from one
 * translation unit per test executable.
 */

#ifndef PATCHPCA_TESTS_TEST_IMAGES_HPP
#define PATCHPCA_TESTS_TEST_IMAGES_HPP

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>
#pragma GCC diagnostic pop

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace patchpca::test {

namespace fs = std::filesystem;

/// Fresh empty directory under the gtest temp dir.
inline fs::path makeTempDir(const std::string& name) {
  fs::path dir = fs::path(testing::TempDir()) / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

/// Interleaved 8-bit pixels filled from a uniform generator.
inline std::vector<std::uint8_t> randomPixels(int width, int height,
                                              int channels,
                                              unsigned seed = 1) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<std::uint8_t> pixels(static_cast<size_t>(width) * height *
                                   channels);
  for (auto& p : pixels) p = static_cast<std::uint8_t>(dist(gen));
  return pixels;
}

inline void writePng(const fs::path& path, int width, int height,
                     int channels, const std::vector<std::uint8_t>& pixels) {
  ASSERT_TRUE(stbi_write_png(path.string().c_str(), width, height, channels,
                             pixels.data(), width * channels))
      << "failed to write " << path;
}

inline void writeSolidPng(const fs::path& path, int width, int height,
                          std::uint8_t value) {
  std::vector<std::uint8_t> pixels(static_cast<size_t>(width) * height * 3,
                                   value);
  writePng(path, width, height, 3, pixels);
}

}  // namespace patchpca::test

#endif  // PATCHPCA_TESTS_TEST_IMAGES_HPP
