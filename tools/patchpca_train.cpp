// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * patchpca_train: train the 3x8x8 patch basis and export it as C source.
 *
 * Pipeline: list images → sample patches → covariance → eigenbasis → export
 *
 * Usage:
 *   ./patchpca_train [--config cfg.yaml] [--train_dir data]
 *                    [--n_per_image 1024] [--seed 0] [--k 8]
 *                    [--output nanostream_eigen.c]
 *
 * Example:
 *   ./patchpca_train --train_dir images --k 8 --output gen/nanostream_eigen.c
 */

#include <spdlog/spdlog.h>

#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include <patchpca/patchpca.hpp>

using namespace patchpca;

namespace {

void printUsage(const char* prog) {
  std::cerr
      << "Usage: " << prog << " [options]\n"
      << "  --config <file>       YAML config (defaults otherwise)\n"
      << "  --train_dir <dir>     training images (default: data)\n"
      << "  --n_per_image <n>     patches per image (default: 1024)\n"
      << "  --seed <s>            random seed (default: 0)\n"
      << "  --k <k>               exported components, 1..192 (default: 8)\n"
      << "  --output <path>       generated C file (default: "
         "nanostream_eigen.c)\n";
}

struct Overrides {
  std::optional<std::string> config_path;
  std::optional<std::string> train_dir;
  std::optional<int> n_per_image;
  std::optional<long long> seed;
  std::optional<int> k;
  std::optional<std::string> output;
};

// Whole-string integer parse; throws std::invalid_argument / out_of_range
template <typename T>
T parseInteger(const std::string& flag, const std::string& text) {
  size_t pos = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &pos);
  } catch (const std::invalid_argument&) {
    throw std::invalid_argument(flag + ": '" + text + "' is not an integer");
  } catch (const std::out_of_range&) {
    throw std::out_of_range(flag + ": '" + text + "' is out of range");
  }
  if (pos != text.size()) {
    throw std::invalid_argument(flag + ": '" + text + "' is not an integer");
  }
  if (value < static_cast<long long>(std::numeric_limits<T>::min()) ||
      value > static_cast<long long>(std::numeric_limits<T>::max())) {
    throw std::out_of_range(flag + ": '" + text + "' is out of range");
  }
  return static_cast<T>(value);
}

}  // namespace

int main(int argc, char** argv) {
  Overrides ov;
  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--help" || arg == "-h") {
        printUsage(argv[0]);
        return 0;
      }
      if (i + 1 >= argc) {
        throw std::invalid_argument("missing value for " + arg);
      }
      const std::string value = argv[++i];
      if (arg == "--config") ov.config_path = value;
      else if (arg == "--train_dir") ov.train_dir = value;
      else if (arg == "--n_per_image") ov.n_per_image = parseInteger<int>(arg, value);
      else if (arg == "--seed") ov.seed = parseInteger<long long>(arg, value);
      else if (arg == "--k") ov.k = parseInteger<int>(arg, value);
      else if (arg == "--output") ov.output = value;
      else throw std::invalid_argument("unknown option " + arg);
    }
  } catch (const std::exception& e) {
    std::cerr << "patchpca_train: " << e.what() << "\n";
    printUsage(argv[0]);
    return 2;
  }

  try {
    // Overrides first, then a single validation of the merged result
    Config cfg =
        ov.config_path ? loadConfig(*ov.config_path, false) : Config{};
    if (ov.train_dir) cfg.sampling.train_dir = *ov.train_dir;
    if (ov.n_per_image) cfg.sampling.samples_per_image = *ov.n_per_image;
    if (ov.seed) cfg.sampling.seed = *ov.seed;
    if (ov.k) cfg.pca.num_components = *ov.k;
    if (ov.output) cfg.output.path = *ov.output;
    validateConfig(cfg);
    applyLogLevel(cfg.logging);

    const auto result = run(cfg);
    spdlog::info("Saved {} component(s) from {} patch(es) to {}",
                 cfg.pca.num_components, result.pca.num_samples,
                 cfg.output.path);
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  return 0;
}
