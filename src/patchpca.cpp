// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * patchpca.cpp
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "patchpca/patchpca.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace patchpca {

TrainingResult trainBasis(const config::Sampling& sampling,
                          const config::Pca& pca) {
  TrainingResult result;

  PatchSampler sampler(sampling);
  const PatchBlocks blocks = sampler.sampleDirectory();
  result.sampling = sampler.stats();

  result.pca = fitPca(blocks, pca.canonical_sign);
  return result;
}

TrainingResult run(const Config& cfg) {
  auto result = trainBasis(cfg.sampling, cfg.pca);

  const int k = cfg.pca.num_components;
  const Eigen::VectorXd ratio = explainedVarianceRatio(result.pca.eigenvalues);
  const int shown = std::clamp(k, 0, static_cast<int>(ratio.size()));
  for (int i = 0; i < shown; ++i) {
    spdlog::info("[Pipeline] component {}: eigenvalue {:.6e}, explained {:.2f}%",
                 i, result.pca.eigenvalues(i), 100.0 * ratio(i));
  }
  if (shown > 0) {
    spdlog::info("[Pipeline] top {} component(s) explain {:.2f}% of variance",
                 shown, 100.0 * ratio.head(shown).sum());
  }

  io::writeBasisSource(result.pca.mean, result.pca.eigenvectors, k,
                       cfg.output);
  return result;
}

}  // namespace patchpca
