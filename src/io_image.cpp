// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * io_image.cpp
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wsign-compare"
#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#pragma GCC diagnostic pop

#include "patchpca/io/image.hpp"

#include <spdlog/spdlog.h>

#include <memory>

#include "patchpca/exceptions.hpp"
#include "patchpca/types.hpp"

namespace patchpca {

Image imageFromPixels(const std::uint8_t* pixels, int width, int height,
                      int channels) {
  Image img;
  img.width = width;
  img.height = height;
  img.channels = channels;

  const size_t count = static_cast<size_t>(width) * height * channels;
  img.data.resize(count);
  for (size_t i = 0; i < count; ++i) {
    img.data[i] = static_cast<float>(pixels[i]) / 255.0f;
  }
  return img;
}

namespace io {

Image loadImageRgb(const std::string& filename) {
  int width = 0;
  int height = 0;
  int file_channels = 0;

  using PixelBuffer = std::unique_ptr<stbi_uc, decltype(&stbi_image_free)>;
  PixelBuffer pixels(stbi_load(filename.c_str(), &width, &height,
                               &file_channels, kChannels),
                     &stbi_image_free);
  if (!pixels) {
    const char* reason = stbi_failure_reason();
    throw ImageLoadError("ImageIO", "Failed to decode '" + filename + "': " +
                                        (reason ? reason : "unknown error"));
  }

  spdlog::debug("[ImageIO] {} ({}x{}, {} channel(s) in file)", filename,
                width, height, file_channels);

  return imageFromPixels(pixels.get(), width, height, kChannels);
}

}  // namespace io
}  // namespace patchpca
