// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * basis_source.hpp
 *
 * C source export of the patch mean and the leading eigenvectors, in the
 * layout the nanostream encoder links against:
 *
 *   #include "nanostream.h"
 *
 *   #include <stdint.h>
 *
 *   const float nanostream_mean[192] = {
 *     m0, m1, ...
 *   };
 *
 *   const float nanostream_eigen_values[K][192] = {
 *     { v00, v01, ... },
 *     ...
 *   };
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef PATCHPCA_IO_BASIS_SOURCE_HPP
#define PATCHPCA_IO_BASIS_SOURCE_HPP

#include <Eigen/Core>
#include <string>

#include "patchpca/config/output.hpp"

namespace patchpca {
namespace io {

/// Single-precision C literal with 9 fractional digits, e.g. "1.234567890e-01f".
std::string formatFloatLiteral(float value);

/**
 * @brief Check mean (kPatchDim), eigenvectors (kPatchDim x kPatchDim) and
 * k in [1, kPatchDim].
 *
 * @throws ShapeError on any violation
 */
void validateBasis(const Eigen::VectorXd& mean,
                   const Eigen::MatrixXd& eigenvectors, int k);

/**
 * @brief Render the generated source text.
 *
 * Row r of the basis array is eigenvector column r. Values are cast to
 * float before formatting.
 *
 * @throws ShapeError (see validateBasis)
 */
std::string renderBasisSource(const Eigen::VectorXd& mean,
                              const Eigen::MatrixXd& eigenvectors, int k,
                              const config::Output& cfg = {});

/**
 * @brief Render and write to cfg.path, replacing any existing file.
 *
 * Missing parent directories are created. Nothing is touched on disk if
 * validation fails. The text goes to "<path>.tmp" first and is renamed over
 * cfg.path, so a failed write leaves any previous file intact.
 *
 * @throws ShapeError (see validateBasis)
 * @throws ExportError if the directory or file cannot be written
 */
void writeBasisSource(const Eigen::VectorXd& mean,
                      const Eigen::MatrixXd& eigenvectors, int k,
                      const config::Output& cfg = {});

}  // namespace io
}  // namespace patchpca

#endif  // PATCHPCA_IO_BASIS_SOURCE_HPP
