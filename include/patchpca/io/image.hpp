// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * image.hpp
 *
 * Normalized raster used for patch sampling, and PNG/JPEG/BMP decoding
 * into it.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef PATCHPCA_IO_IMAGE_HPP
#define PATCHPCA_IO_IMAGE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace patchpca {

/// Interleaved raster with channel values normalized to [0, 1].
struct Image {
  int width = 0;
  int height = 0;
  int channels = 0;
  std::vector<float> data;  // row-major, channels interleaved

  float at(int row, int col, int channel) const {
    return data[(static_cast<size_t>(row) * width + col) * channels + channel];
  }
};

/// Build an Image from 8-bit interleaved pixels (value / 255).
Image imageFromPixels(const std::uint8_t* pixels, int width, int height,
                      int channels);

namespace io {

/**
 * @brief Decode an image file as 3-channel RGB.
 *
 * Grayscale and alpha inputs are converted by the decoder. The decoded
 * buffer is released before returning.
 *
 * @throws ImageLoadError if the file cannot be read or decoded
 */
Image loadImageRgb(const std::string& filename);

}  // namespace io
}  // namespace patchpca

#endif  // PATCHPCA_IO_IMAGE_HPP
