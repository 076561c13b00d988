// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef PATCHPCA_CONFIG_PCA_HPP
#define PATCHPCA_CONFIG_PCA_HPP

namespace patchpca::config {

struct Pca {
  int num_components = 8;       // K, exported eigenvectors [1, kPatchDim]
  bool canonical_sign = true;   // largest-magnitude entry made positive
};

}  // namespace patchpca::config

#endif  // PATCHPCA_CONFIG_PCA_HPP
