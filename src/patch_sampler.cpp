// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * patch_sampler.cpp
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "patchpca/sampling/patch_sampler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

#include "patchpca/exceptions.hpp"
#include "patchpca/utils/string_utils.hpp"

namespace fs = std::filesystem;

namespace patchpca {

namespace {

bool hasExtension(const fs::path& path,
                  const std::vector<std::string>& extensions) {
  const std::string ext = utils::toLower(path.extension().string());
  return std::any_of(extensions.begin(), extensions.end(),
                     [&](const std::string& e) {
                       return utils::toLower(e) == ext;
                     });
}

}  // namespace

std::vector<std::string> listTrainingImages(
    const std::string& dir, const std::vector<std::string>& extensions) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw NoInputError("PatchSampler",
                       "Training directory '" + dir + "' does not exist");
  }

  std::vector<std::string> files;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;
    if (!hasExtension(entry.path(), extensions)) continue;
    files.push_back(entry.path().string());
  }
  std::sort(files.begin(), files.end());
  return files;
}

bool isSampleable(const Image& img, int samples) {
  return img.channels == kChannels && img.height >= kBlockSize &&
         img.width >= kBlockSize && samples > 0;
}

Eigen::VectorXd extractPatch(const Image& img, int top, int left) {
  Eigen::VectorXd patch(kPatchDim);
  int i = 0;
  for (int c = 0; c < kChannels; ++c) {
    for (int r = 0; r < kBlockSize; ++r) {
      for (int x = 0; x < kBlockSize; ++x) {
        patch(i++) = static_cast<double>(img.at(top + r, left + x, c));
      }
    }
  }
  return patch;
}

PatchBlock samplePatches(const Image& img, int samples, std::mt19937& rng) {
  if (!isSampleable(img, samples)) {
    return PatchBlock(0, kPatchDim);
  }

  std::uniform_int_distribution<int> row_dist(0, img.height - kBlockSize);
  std::uniform_int_distribution<int> col_dist(0, img.width - kBlockSize);

  std::vector<int> tops(samples);
  std::vector<int> lefts(samples);
  for (auto& t : tops) t = row_dist(rng);
  for (auto& l : lefts) l = col_dist(rng);

  PatchBlock block(samples, kPatchDim);
  for (int i = 0; i < samples; ++i) {
    block.row(i) = extractPatch(img, tops[i], lefts[i]).transpose();
  }
  return block;
}

namespace {

std::mt19937::result_type checkedSeed(std::int64_t seed) {
  if (seed < config::kMinSeed || seed > config::kMaxSeed) {
    throw std::invalid_argument("sampling.seed (" + std::to_string(seed) +
                                ") must be in [0, " +
                                std::to_string(config::kMaxSeed) + "]");
  }
  return static_cast<std::mt19937::result_type>(seed);
}

}  // namespace

PatchSampler::PatchSampler(const config::Sampling& cfg)
    : cfg_(cfg), rng_(checkedSeed(cfg.seed)) {}

PatchBlock PatchSampler::sampleImage(const Image& img) {
  return samplePatches(img, cfg_.samples_per_image, rng_);
}

PatchBlocks PatchSampler::sampleDirectory() {
  const auto files = listTrainingImages(cfg_.train_dir, cfg_.extensions);
  if (files.empty()) {
    throw NoInputError("PatchSampler",
                       "No image files found in '" + cfg_.train_dir + "'");
  }

  stats_ = SamplingStats{};
  stats_.images_found = files.size();
  spdlog::info("[PatchSampler] {} image(s) in '{}', {} sample(s) per image",
               files.size(), cfg_.train_dir, cfg_.samples_per_image);

  PatchBlocks blocks;
  for (const auto& file : files) {
    PatchBlock block;
    {
      const Image img = io::loadImageRgb(file);
      if (!isSampleable(img, cfg_.samples_per_image)) {
        spdlog::debug("[PatchSampler] Skipping {} ({}x{}x{})", file,
                      img.width, img.height, img.channels);
        ++stats_.images_skipped;
        continue;
      }
      block = sampleImage(img);
    }

    spdlog::debug("[PatchSampler] {}: {} patch(es)", file, block.rows());
    stats_.total_patches += static_cast<size_t>(block.rows());
    ++stats_.images_sampled;
    blocks.push_back(std::move(block));
  }

  spdlog::info("[PatchSampler] {} patch(es) from {} image(s), {} skipped",
               stats_.total_patches, stats_.images_sampled,
               stats_.images_skipped);
  return blocks;
}

}  // namespace patchpca
