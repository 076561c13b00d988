// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * patchpca.hpp
 *
 * patchpca: PCA basis training for 3x8x8 RGB patches.
 *
 * Pipeline: sample patches → mean/covariance → ordered eigenbasis →
 * C source export of the mean and the top-K eigenvectors.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef PATCHPCA_PATCHPCA_HPP
#define PATCHPCA_PATCHPCA_HPP

// Configs
#include "patchpca/config/patchpca.hpp"

// Data types
#include "patchpca/exceptions.hpp"
#include "patchpca/types.hpp"

// Stages
#include "patchpca/io/basis_source.hpp"
#include "patchpca/io/image.hpp"
#include "patchpca/pca/pca_estimator.hpp"
#include "patchpca/sampling/patch_sampler.hpp"

namespace patchpca {

/// Outcome of one training run.
struct TrainingResult {
  PcaResult pca;
  SamplingStats sampling;
};

/**
 * @brief Sample the training directory and estimate the eigenbasis.
 *
 * Deterministic for a fixed configuration and file set.
 *
 * @throws NoInputError, ImageLoadError, NoSamplesError,
 *         InsufficientSamplesError, NumericalError
 */
TrainingResult trainBasis(const config::Sampling& sampling,
                          const config::Pca& pca);

/**
 * @brief trainBasis() followed by export of cfg.pca.num_components
 * eigenvectors to cfg.output.path.
 *
 * The output file is only written once every earlier stage succeeded.
 */
TrainingResult run(const Config& cfg);

}  // namespace patchpca

#endif  // PATCHPCA_PATCHPCA_HPP
