// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * io_basis_source.cpp
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "patchpca/io/basis_source.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "patchpca/exceptions.hpp"
#include "patchpca/types.hpp"

namespace fs = std::filesystem;

namespace patchpca {
namespace io {

namespace detail {

// ", "-separated literals of v(0..n-1)
template <typename Vector>
void appendLiterals(std::string& out, const Vector& v) {
  for (Eigen::Index i = 0; i < v.size(); ++i) {
    if (i > 0) out += ", ";
    out += formatFloatLiteral(static_cast<float>(v(i)));
  }
}

fs::path temporaryPathFor(const fs::path& path) {
  fs::path tmp = path;
  tmp += ".tmp";
  return tmp;
}

void discard(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    spdlog::warn("[BasisExport] Could not remove {}: {}", path.string(),
                 ec.message());
  }
}

}  // namespace detail

std::string formatFloatLiteral(float value) {
  // Widen first so the digits are those of the stored float
  return fmt::format("{:.9e}f", static_cast<double>(value));
}

void validateBasis(const Eigen::VectorXd& mean,
                   const Eigen::MatrixXd& eigenvectors, int k) {
  if (mean.size() != kPatchDim) {
    throw ShapeError("BasisExport", "mean must have " +
                                        std::to_string(kPatchDim) +
                                        " entries, got " +
                                        std::to_string(mean.size()));
  }
  if (eigenvectors.rows() != kPatchDim || eigenvectors.cols() != kPatchDim) {
    throw ShapeError("BasisExport",
                     "eigenvectors must be " + std::to_string(kPatchDim) +
                         "x" + std::to_string(kPatchDim) + ", got " +
                         std::to_string(eigenvectors.rows()) + "x" +
                         std::to_string(eigenvectors.cols()));
  }
  if (k < 1 || k > kPatchDim) {
    throw ShapeError("BasisExport", "k must be in [1, " +
                                        std::to_string(kPatchDim) +
                                        "], got " + std::to_string(k));
  }
}

std::string renderBasisSource(const Eigen::VectorXd& mean,
                              const Eigen::MatrixXd& eigenvectors, int k,
                              const config::Output& cfg) {
  validateBasis(mean, eigenvectors, k);

  std::string out;
  out.reserve(static_cast<size_t>(k + 1) * kPatchDim * 18 + 256);

  out += "#include \"" + cfg.header_include + "\"\n";
  out += "\n";
  out += "#include <stdint.h>\n";
  out += "\n";

  out += fmt::format("const float {}[{}] = {{\n", cfg.mean_symbol, kPatchDim);
  out += "  ";
  detail::appendLiterals(out, mean);
  out += "\n};\n";
  out += "\n";

  out += fmt::format("const float {}[{}][{}] = {{\n", cfg.basis_symbol, k,
                     kPatchDim);
  for (int r = 0; r < k; ++r) {
    out += "  { ";
    detail::appendLiterals(out, eigenvectors.col(r));
    out += " },\n";
  }
  out += "};\n";

  return out;
}

void writeBasisSource(const Eigen::VectorXd& mean,
                      const Eigen::MatrixXd& eigenvectors, int k,
                      const config::Output& cfg) {
  // Render before touching the filesystem
  const std::string text = renderBasisSource(mean, eigenvectors, k, cfg);

  const fs::path path(cfg.path);
  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      throw ExportError("BasisExport", "Cannot create directory '" +
                                           path.parent_path().string() +
                                           "': " + ec.message());
    }
  }

  // Write a sibling first so a failed write never replaces the destination
  const fs::path tmp_path = detail::temporaryPathFor(path);
  {
    std::ofstream os(tmp_path, std::ios::binary | std::ios::trunc);
    if (!os) {
      throw ExportError("BasisExport", "Cannot open '" + tmp_path.string() +
                                           "' for writing");
    }
    os.write(text.data(), static_cast<std::streamsize>(text.size()));
    os.close();
    if (!os) {
      detail::discard(tmp_path);
      throw ExportError("BasisExport", "Write failed for " + tmp_path.string());
    }
  }

  std::error_code ec;
  fs::rename(tmp_path, path, ec);
  if (ec) {
    detail::discard(tmp_path);
    throw ExportError("BasisExport", "Cannot replace '" + cfg.path +
                                         "': " + ec.message());
  }

  spdlog::info("[BasisExport] Wrote mean and {} eigenvector(s) to {}", k,
               cfg.path);
}

}  // namespace io
}  // namespace patchpca
