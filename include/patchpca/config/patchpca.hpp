// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef PATCHPCA_CONFIG_PATCHPCA_HPP
#define PATCHPCA_CONFIG_PATCHPCA_HPP

#include <string>

namespace YAML {
class Node;
}

#include "patchpca/config/output.hpp"
#include "patchpca/config/pca.hpp"
#include "patchpca/config/sampling.hpp"

namespace patchpca {

namespace config {

struct Logging {
  std::string level = "info";  // trace, debug, info, warn, error, off
};

}  // namespace config

/// Training configuration for patchpca.
struct Config {
  config::Sampling sampling;
  config::Pca pca;
  config::Output output;
  config::Logging logging;
};

/// With validate = false the values are taken as read; call validateConfig()
/// once overrides have been applied.
Config parseConfig(const YAML::Node& root, bool validate = true);
Config loadConfig(const std::string& path, bool validate = true);

/// Fatal checks and clamping. Already applied by parseConfig/loadConfig;
/// call again after applying overrides to a loaded Config.
void validateConfig(Config& cfg);

/// Apply cfg.logging.level to the default spdlog logger.
void applyLogLevel(const config::Logging& cfg);

}  // namespace patchpca

#endif  // PATCHPCA_CONFIG_PATCHPCA_HPP
