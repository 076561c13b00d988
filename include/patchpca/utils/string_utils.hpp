// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef PATCHPCA_UTILS_STRING_UTILS_HPP
#define PATCHPCA_UTILS_STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <string>

namespace patchpca::utils {

/// ASCII lowercase copy (file extensions, log level names).
inline std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

}  // namespace patchpca::utils

#endif  // PATCHPCA_UTILS_STRING_UTILS_HPP
