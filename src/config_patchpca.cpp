// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_patchpca.cpp
 *
 * YAML configuration loading.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <stdexcept>

#include "patchpca/config/patchpca.hpp"
#include "patchpca/types.hpp"
#include "patchpca/utils/string_utils.hpp"

namespace patchpca {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

bool parseLogLevel(const std::string& name, spdlog::level::level_enum& out) {
  const std::string s = utils::toLower(name);
  if (s == "trace") out = spdlog::level::trace;
  else if (s == "debug") out = spdlog::level::debug;
  else if (s == "info") out = spdlog::level::info;
  else if (s == "warn" || s == "warning") out = spdlog::level::warn;
  else if (s == "error") out = spdlog::level::err;
  else if (s == "off") out = spdlog::level::off;
  else return false;
  return true;
}

Config parse(const YAML::Node& root) {
  Config cfg;

  if (auto n = root["sampling"]) {
    load(n, "train_dir", cfg.sampling.train_dir);
    load(n, "samples_per_image", cfg.sampling.samples_per_image);
    load(n, "seed", cfg.sampling.seed);
    load(n, "extensions", cfg.sampling.extensions);
  }

  if (auto n = root["pca"]) {
    load(n, "num_components", cfg.pca.num_components);
    load(n, "canonical_sign", cfg.pca.canonical_sign);
  }

  if (auto n = root["output"]) {
    load(n, "path", cfg.output.path);
    load(n, "header_include", cfg.output.header_include);
    load(n, "mean_symbol", cfg.output.mean_symbol);
    load(n, "basis_symbol", cfg.output.basis_symbol);
  }

  if (auto n = root["logging"]) {
    load(n, "level", cfg.logging.level);
  }

  return cfg;
}

}  // namespace detail

void validateConfig(Config& cfg) {
  // --- Fatal: values the pipeline cannot run with ---
  if (cfg.pca.num_components < 1 || cfg.pca.num_components > kPatchDim) {
    throw std::invalid_argument("pca.num_components (" +
                                std::to_string(cfg.pca.num_components) +
                                ") must be in [1, " +
                                std::to_string(kPatchDim) + "]");
  }
  if (cfg.sampling.seed < config::kMinSeed ||
      cfg.sampling.seed > config::kMaxSeed) {
    throw std::invalid_argument("sampling.seed (" +
                                std::to_string(cfg.sampling.seed) +
                                ") must be in [0, " +
                                std::to_string(config::kMaxSeed) + "]");
  }
  if (cfg.sampling.train_dir.empty()) {
    throw std::invalid_argument("sampling.train_dir must not be empty");
  }
  if (cfg.output.path.empty()) {
    throw std::invalid_argument("output.path must not be empty");
  }
  if (cfg.output.header_include.empty() || cfg.output.mean_symbol.empty() ||
      cfg.output.basis_symbol.empty()) {
    throw std::invalid_argument(
        "output: header_include, mean_symbol and basis_symbol must not be "
        "empty");
  }

  // --- Non-fatal: warn and fix up ---
  if (cfg.sampling.samples_per_image <= 0) {
    spdlog::warn(
        "[Config] sampling.samples_per_image ({}) is not positive, no patches "
        "will be drawn",
        cfg.sampling.samples_per_image);
  }

  auto& exts = cfg.sampling.extensions;
  exts.erase(std::remove(exts.begin(), exts.end(), std::string()), exts.end());
  if (exts.empty()) {
    spdlog::warn("[Config] sampling.extensions is empty, defaulting to .png");
    exts = {".png"};
  }
  for (auto& ext : exts) {
    if (ext.front() != '.') ext.insert(ext.begin(), '.');
    ext = utils::toLower(ext);
  }

  spdlog::level::level_enum level;
  if (!detail::parseLogLevel(cfg.logging.level, level)) {
    spdlog::warn("[Config] Unknown logging.level '{}', defaulting to info",
                 cfg.logging.level);
    cfg.logging.level = "info";
  }
}

void applyLogLevel(const config::Logging& cfg) {
  spdlog::level::level_enum level;
  if (!detail::parseLogLevel(cfg.level, level)) level = spdlog::level::info;
  spdlog::set_level(level);
}

Config parseConfig(const YAML::Node& root, bool validate) {
  auto cfg = detail::parse(root);
  if (validate) validateConfig(cfg);
  return cfg;
}

Config loadConfig(const std::string& path, bool validate) {
  try {
    return parseConfig(YAML::LoadFile(path), validate);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace patchpca
