// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * pca_estimator.cpp
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "patchpca/pca/pca_estimator.hpp"

#include <spdlog/spdlog.h>

#include <Eigen/Eigenvalues>
#include <algorithm>
#include <chrono>
#include <numeric>
#include <string>
#include <vector>

#include "patchpca/exceptions.hpp"

namespace patchpca {

Eigen::MatrixXd stackPatches(const PatchBlocks& blocks) {
  Eigen::Index rows = 0;
  for (const auto& block : blocks) {
    if (block.rows() > 0 && block.cols() != kPatchDim) {
      throw ShapeError("PcaEstimator",
                       "Patch block has " + std::to_string(block.cols()) +
                           " columns, expected " + std::to_string(kPatchDim));
    }
    rows += block.rows();
  }

  if (rows == 0) {
    throw NoSamplesError(
        "PcaEstimator",
        "No patches were sampled. Check image sizes and samples per image.");
  }
  if (rows < 2) {
    throw InsufficientSamplesError(
        "PcaEstimator", "Need at least 2 patches to compute covariance, got " +
                            std::to_string(rows));
  }

  Eigen::MatrixXd samples(rows, kPatchDim);
  Eigen::Index offset = 0;
  for (const auto& block : blocks) {
    if (block.rows() == 0) continue;
    samples.middleRows(offset, block.rows()) = block;
    offset += block.rows();
  }
  return samples;
}

Eigen::MatrixXd computeCovariance(const Eigen::MatrixXd& samples,
                                  const Eigen::VectorXd& mean) {
  const Eigen::Index n = samples.rows();
  const Eigen::Index d = samples.cols();

  const Eigen::MatrixXd centered = samples.rowwise() - mean.transpose();

  // Accumulate the lower triangle only, then mirror it
  Eigen::MatrixXd lower = Eigen::MatrixXd::Zero(d, d);
  lower.selfadjointView<Eigen::Lower>().rankUpdate(
      centered.transpose(), 1.0 / static_cast<double>(n - 1));

  Eigen::MatrixXd cov = lower.selfadjointView<Eigen::Lower>();
  return cov;
}

void decomposeSymmetric(const Eigen::MatrixXd& cov, Eigen::VectorXd& values,
                        Eigen::MatrixXd& vectors) {
  if (!cov.allFinite()) {
    throw NumericalError("PcaEstimator",
                         "Covariance matrix contains non-finite values");
  }

  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(cov);
  if (solver.info() != Eigen::Success) {
    throw NumericalError("PcaEstimator",
                         "Symmetric eigendecomposition did not converge");
  }

  // Solver returns ascending order
  const Eigen::VectorXd& asc_values = solver.eigenvalues();
  const Eigen::MatrixXd& asc_vectors = solver.eigenvectors();

  std::vector<Eigen::Index> order(asc_values.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&](Eigen::Index a, Eigen::Index b) {
                     return asc_values(a) > asc_values(b);
                   });

  values.resize(asc_values.size());
  vectors.resize(asc_vectors.rows(), asc_vectors.cols());
  for (size_t i = 0; i < order.size(); ++i) {
    const auto idx = static_cast<Eigen::Index>(i);
    values(idx) = asc_values(order[i]);
    vectors.col(idx) = asc_vectors.col(order[i]);
  }
}

void canonicalizeSigns(Eigen::MatrixXd& vectors) {
  for (Eigen::Index c = 0; c < vectors.cols(); ++c) {
    Eigen::Index pivot = 0;
    vectors.col(c).cwiseAbs().maxCoeff(&pivot);
    if (vectors(pivot, c) < 0.0) vectors.col(c) = -vectors.col(c);
  }
}

Eigen::VectorXd explainedVarianceRatio(const Eigen::VectorXd& eigenvalues) {
  const double total = eigenvalues.sum();
  if (!(total > 0.0)) return Eigen::VectorXd::Zero(eigenvalues.size());
  return eigenvalues / total;
}

PcaResult fitPca(const PatchBlocks& blocks, bool canonical_sign) {
  const Eigen::MatrixXd samples = stackPatches(blocks);

  PcaResult result;
  result.num_samples = static_cast<size_t>(samples.rows());
  result.mean = samples.colwise().mean().transpose();

  auto t_start = std::chrono::steady_clock::now();
  const Eigen::MatrixXd cov = computeCovariance(samples, result.mean);
  auto t_cov = std::chrono::steady_clock::now();

  decomposeSymmetric(cov, result.eigenvalues, result.eigenvectors);
  if (canonical_sign) canonicalizeSigns(result.eigenvectors);
  auto t_eig = std::chrono::steady_clock::now();

  using ms = std::chrono::duration<double, std::milli>;
  spdlog::info(
      "[PcaEstimator] {} samples: covariance {:.1f} ms, eigensolver {:.1f} ms",
      result.num_samples, ms(t_cov - t_start).count(),
      ms(t_eig - t_cov).count());
  spdlog::debug("[PcaEstimator] Total variance {:.6e}, largest eigenvalue {:.6e}",
                result.eigenvalues.sum(), result.eigenvalues(0));

  return result;
}

}  // namespace patchpca
