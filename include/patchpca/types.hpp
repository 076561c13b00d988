// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * types.hpp
 *
 * Patch geometry constants and matrix aliases shared by sampling,
 * estimation and export.
 */

#ifndef PATCHPCA_TYPES_HPP
#define PATCHPCA_TYPES_HPP

#include <Eigen/Core>
#include <vector>

namespace patchpca {

constexpr int kBlockSize = 8;
constexpr int kChannels = 3;

/// Length of a flattened patch vector (channel-major, then row, then column).
constexpr int kPatchDim = kChannels * kBlockSize * kBlockSize;

/// Patches drawn from one image, one row per patch (N x kPatchDim).
using PatchBlock = Eigen::MatrixXd;

/// Per-image patch blocks in enumeration order.
using PatchBlocks = std::vector<PatchBlock>;

}  // namespace patchpca

#endif  // PATCHPCA_TYPES_HPP
