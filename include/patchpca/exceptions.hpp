// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * exceptions.hpp
 *
 * Exception hierarchy for basis training.
 *
 * Every error is fatal for the run. The stage that raised it is kept
 * separately from the message so callers can report either.
 *
 *   Error (base)
 *   ├── NoInputError             - no recognized image files
 *   ├── ImageLoadError           - recognized file could not be decoded
 *   ├── NoSamplesError           - every image was skipped
 *   ├── InsufficientSamplesError - fewer than 2 patches overall
 *   ├── NumericalError           - eigensolver failed or non-finite input
 *   ├── ShapeError               - mean/basis shape or K out of range
 *   └── ExportError              - output could not be written
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef PATCHPCA_EXCEPTIONS_HPP
#define PATCHPCA_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace patchpca {

/**
 * @brief Base exception for training errors
 */
class Error : public std::runtime_error {
 public:
  Error(const std::string& stage_name, const std::string& message)
      : std::runtime_error("[" + stage_name + "] " + message),
        stage_name_(stage_name),
        message_(message) {}

  const std::string& getStage() const { return stage_name_; }
  const std::string& getMessage() const { return message_; }

 private:
  std::string stage_name_;
  std::string message_;
};

class NoInputError : public Error {
 public:
  using Error::Error;
};

class ImageLoadError : public Error {
 public:
  using Error::Error;
};

class NoSamplesError : public Error {
 public:
  using Error::Error;
};

class InsufficientSamplesError : public Error {
 public:
  using Error::Error;
};

class NumericalError : public Error {
 public:
  using Error::Error;
};

class ShapeError : public Error {
 public:
  using Error::Error;
};

class ExportError : public Error {
 public:
  using Error::Error;
};

}  // namespace patchpca

#endif  // PATCHPCA_EXCEPTIONS_HPP
