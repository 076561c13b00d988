// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * pca_estimator.hpp
 *
 * Mean, sample covariance and ordered eigenbasis of sampled patches.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef PATCHPCA_PCA_PCA_ESTIMATOR_HPP
#define PATCHPCA_PCA_PCA_ESTIMATOR_HPP

#include <Eigen/Core>
#include <cstddef>

#include "patchpca/types.hpp"

namespace patchpca {

/// @brief PCA result over all sampled patches
struct PcaResult {
  Eigen::VectorXd mean;          // kPatchDim
  Eigen::VectorXd eigenvalues;   // Descending order (largest first)
  Eigen::MatrixXd eigenvectors;  // Column i corresponds to eigenvalue i
  size_t num_samples = 0;
};

/**
 * @brief Concatenate per-image blocks into one sample matrix.
 *
 * @throws NoSamplesError if the blocks hold no rows at all
 * @throws InsufficientSamplesError if fewer than 2 rows in total
 * @throws ShapeError if a block is not kPatchDim wide
 */
Eigen::MatrixXd stackPatches(const PatchBlocks& blocks);

/**
 * @brief Unbiased sample covariance (divides by N - 1).
 *
 * The result is exactly symmetric.
 */
Eigen::MatrixXd computeCovariance(const Eigen::MatrixXd& samples,
                                  const Eigen::VectorXd& mean);

/**
 * @brief Symmetric eigendecomposition, eigenpairs in descending order.
 *
 * Eigenvalues that compare equal keep the solver's relative order.
 *
 * @throws NumericalError on non-finite input or solver failure
 */
void decomposeSymmetric(const Eigen::MatrixXd& cov, Eigen::VectorXd& values,
                        Eigen::MatrixXd& vectors);

/// Negate each column whose largest-magnitude entry is negative.
void canonicalizeSigns(Eigen::MatrixXd& vectors);

/// eigenvalue / trace per component; all zero for a zero-trace spectrum.
Eigen::VectorXd explainedVarianceRatio(const Eigen::VectorXd& eigenvalues);

/**
 * @brief Full estimation: stack, mean, covariance, ordered eigenbasis.
 *
 * @param canonical_sign apply canonicalizeSigns() to the eigenvectors
 */
PcaResult fitPca(const PatchBlocks& blocks, bool canonical_sign = false);

}  // namespace patchpca

#endif  // PATCHPCA_PCA_PCA_ESTIMATOR_HPP
