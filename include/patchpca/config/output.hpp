// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * output.hpp
 *
 * Generated source settings. The defaults match the declarations in the
 * nanostream encoder and should only be changed together with it.
 */

#ifndef PATCHPCA_CONFIG_OUTPUT_HPP
#define PATCHPCA_CONFIG_OUTPUT_HPP

#include <string>

namespace patchpca::config {

struct Output {
  std::string path = "nanostream_eigen.c";
  std::string header_include = "nanostream.h";
  std::string mean_symbol = "nanostream_mean";
  std::string basis_symbol = "nanostream_eigen_values";
};

}  // namespace patchpca::config

#endif  // PATCHPCA_CONFIG_OUTPUT_HPP
