// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef PATCHPCA_CONFIG_SAMPLING_HPP
#define PATCHPCA_CONFIG_SAMPLING_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace patchpca::config {

// Generator seeds are 32-bit; wider values would alias.
inline constexpr std::int64_t kMinSeed = 0;
inline constexpr std::int64_t kMaxSeed = 4294967295;  // 2^32 - 1

struct Sampling {
  std::string train_dir = "data";
  int samples_per_image = 1024;  // <= 0 draws nothing from an image
  std::int64_t seed = 0;  // [kMinSeed, kMaxSeed]
  std::vector<std::string> extensions = {".png"};  // case-insensitive
};

}  // namespace patchpca::config

#endif  // PATCHPCA_CONFIG_SAMPLING_HPP
