// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * patch_sampler.hpp
 *
 * Random 3x8x8 block sampling from a directory of training images.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef PATCHPCA_SAMPLING_PATCH_SAMPLER_HPP
#define PATCHPCA_SAMPLING_PATCH_SAMPLER_HPP

#include <cstddef>
#include <random>
#include <string>
#include <vector>

#include "patchpca/config/sampling.hpp"
#include "patchpca/io/image.hpp"
#include "patchpca/types.hpp"

namespace patchpca {

/**
 * @brief List regular files in a directory whose extension matches.
 *
 * Not recursive. Matching is case-insensitive; extensions include the dot.
 * The result is sorted lexicographically so that sampling with a fixed
 * seed is reproducible.
 *
 * @throws NoInputError if the path is not an existing directory
 */
std::vector<std::string> listTrainingImages(
    const std::string& dir,
    const std::vector<std::string>& extensions = {".png"});

/// True if the image can yield at least one block: 3 channels, at least
/// kBlockSize in both directions, and a positive sample count.
bool isSampleable(const Image& img, int samples);

/// Flatten the block at (top, left) channel-major into a kPatchDim vector.
Eigen::VectorXd extractPatch(const Image& img, int top, int left);

/**
 * @brief Draw random blocks from one image.
 *
 * All top rows are drawn before all left columns; offsets are uniform over
 * every position where the block fits.
 *
 * @return samples x kPatchDim, or 0 x kPatchDim if !isSampleable(img, samples)
 */
PatchBlock samplePatches(const Image& img, int samples, std::mt19937& rng);

/// Per-run sampling counters.
struct SamplingStats {
  size_t images_found = 0;
  size_t images_sampled = 0;
  size_t images_skipped = 0;
  size_t total_patches = 0;
};

/**
 * @brief Samples every training image of a directory with one generator.
 *
 * The generator is seeded once at construction; images are decoded one at
 * a time and released before the next is opened.
 */
class PatchSampler {
 public:
  /// @throws std::invalid_argument if cfg.seed is outside [0, 2^32 - 1]
  explicit PatchSampler(const config::Sampling& cfg);

  /**
   * @brief Sample all recognized images in cfg.train_dir.
   *
   * Images that yield no patches are left out of the result.
   *
   * @throws NoInputError if no recognized image file exists
   * @throws ImageLoadError if a recognized file cannot be decoded
   */
  PatchBlocks sampleDirectory();

  /// Sample one already-decoded image with the shared generator.
  PatchBlock sampleImage(const Image& img);

  const SamplingStats& stats() const { return stats_; }

 private:
  config::Sampling cfg_;
  std::mt19937 rng_;
  SamplingStats stats_;
};

}  // namespace patchpca

#endif  // PATCHPCA_SAMPLING_PATCH_SAMPLER_HPP
