// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_basis_source.cpp
 *
 * Tests for float literal formatting and the generated C source layout.
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <iterator>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "patchpca/exceptions.hpp"
#include "patchpca/io/basis_source.hpp"
#include "patchpca/types.hpp"

using namespace patchpca;
namespace fs = std::filesystem;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

std::string readFile(const fs::path& path) {
  std::ifstream is(path, std::ios::binary);
  std::stringstream ss;
  ss << is.rdbuf();
  return ss.str();
}

std::vector<std::string> splitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream is(text);
  std::string line;
  while (std::getline(is, line)) lines.push_back(line);
  return lines;
}

size_t countOccurrences(const std::string& text, const std::string& token) {
  size_t count = 0;
  for (size_t pos = text.find(token); pos != std::string::npos;
       pos = text.find(token, pos + token.size())) {
    ++count;
  }
  return count;
}

class BasisSourceTest : public ::testing::Test {
 protected:
  Eigen::VectorXd mean;
  Eigen::MatrixXd eigenvectors;
  fs::path tmp_dir;

  void SetUp() override {
    mean = Eigen::VectorXd::Constant(kPatchDim, 0.5);
    eigenvectors = Eigen::MatrixXd::Identity(kPatchDim, kPatchDim);
    tmp_dir = fs::path(testing::TempDir()) / "basis_source";
    fs::remove_all(tmp_dir);
  }

  void TearDown() override { fs::remove_all(tmp_dir); }

  config::Output outputAt(const fs::path& path) const {
    config::Output cfg;
    cfg.path = path.string();
    return cfg;
  }
};

}  // namespace

// ─── Literal formatting ──────────────────────────────────────────────────────

TEST(FloatLiteralTest, FixedScientificWithSuffix) {
  EXPECT_EQ(io::formatFloatLiteral(0.0f), "0.000000000e+00f");
  EXPECT_EQ(io::formatFloatLiteral(1.0f), "1.000000000e+00f");
  EXPECT_EQ(io::formatFloatLiteral(0.5f), "5.000000000e-01f");
  EXPECT_EQ(io::formatFloatLiteral(-0.25f), "-2.500000000e-01f");
  EXPECT_EQ(io::formatFloatLiteral(255.0f), "2.550000000e+02f");
}

TEST(FloatLiteralTest, DigitsOfStoredFloat) {
  EXPECT_EQ(io::formatFloatLiteral(0.123456789f), "1.234567910e-01f");
  EXPECT_EQ(io::formatFloatLiteral(1.0f / 3.0f), "3.333333433e-01f");
  EXPECT_EQ(io::formatFloatLiteral(1e-20f), "9.999999683e-21f");
}

// ─── Validation ──────────────────────────────────────────────────────────────

TEST_F(BasisSourceTest, RejectsComponentCountOutOfRange) {
  const fs::path out = tmp_dir / "k_range.c";

  EXPECT_THROW(io::writeBasisSource(mean, eigenvectors, 0, outputAt(out)),
               ShapeError);
  EXPECT_THROW(io::writeBasisSource(mean, eigenvectors, kPatchDim + 1,
                                    outputAt(out)),
               ShapeError);
  EXPECT_FALSE(fs::exists(out));
  EXPECT_FALSE(fs::exists(tmp_dir));
}

TEST_F(BasisSourceTest, RejectsWrongShapes) {
  EXPECT_THROW(io::renderBasisSource(Eigen::VectorXd::Zero(kPatchDim - 1),
                                     eigenvectors, 1),
               ShapeError);
  EXPECT_THROW(io::renderBasisSource(
                   mean, Eigen::MatrixXd::Identity(kPatchDim, 8), 1),
               ShapeError);
  EXPECT_THROW(io::renderBasisSource(
                   mean, Eigen::MatrixXd::Identity(8, kPatchDim), 1),
               ShapeError);
}

TEST_F(BasisSourceTest, AcceptsFullRange) {
  EXPECT_NO_THROW(io::renderBasisSource(mean, eigenvectors, 1));
  EXPECT_NO_THROW(io::renderBasisSource(mean, eigenvectors, kPatchDim));
}

// ─── Layout ──────────────────────────────────────────────────────────────────

TEST_F(BasisSourceTest, ExactLayout) {
  const std::string text = io::renderBasisSource(mean, eigenvectors, 2);

  std::string mean_values;
  std::string row0;
  std::string row1;
  for (int i = 0; i < kPatchDim; ++i) {
    const std::string sep = i > 0 ? ", " : "";
    mean_values += sep + "5.000000000e-01f";
    row0 += sep + (i == 0 ? "1.000000000e+00f" : "0.000000000e+00f");
    row1 += sep + (i == 1 ? "1.000000000e+00f" : "0.000000000e+00f");
  }

  const std::string expected =
      "#include \"nanostream.h\"\n"
      "\n"
      "#include <stdint.h>\n"
      "\n"
      "const float nanostream_mean[192] = {\n"
      "  " + mean_values + "\n"
      "};\n"
      "\n"
      "const float nanostream_eigen_values[2][192] = {\n"
      "  { " + row0 + " },\n"
      "  { " + row1 + " },\n"
      "};\n";

  EXPECT_EQ(text, expected);
}

TEST_F(BasisSourceTest, RowsAreEigenvectorColumns) {
  Eigen::MatrixXd v = Eigen::MatrixXd::Zero(kPatchDim, kPatchDim);
  v(5, 0) = -1.0;  // column 0 has its only entry at row 5
  v(0, 1) = 0.25;
  const std::string text = io::renderBasisSource(mean, v, 2);

  const auto lines = splitLines(text);
  ASSERT_EQ(lines.size(), 12u);
  EXPECT_EQ(lines[9].find("-1.000000000e+00f"),
            std::string("  { ").size() + 5 * std::string("0.000000000e+00f, ").size());
  EXPECT_EQ(lines[10].rfind("  { 2.500000000e-01f, ", 0), 0u);
}

TEST_F(BasisSourceTest, LiteralCounts) {
  const int k = 8;
  const std::string text = io::renderBasisSource(mean, eigenvectors, k);
  const auto lines = splitLines(text);

  // 4 header lines, mean block (3) + blank, basis header, k rows, closing
  ASSERT_EQ(lines.size(), static_cast<size_t>(4 + 4 + 1 + k + 1));
  EXPECT_EQ(countOccurrences(lines[5], "f"), static_cast<size_t>(kPatchDim));
  for (int r = 0; r < k; ++r) {
    EXPECT_EQ(countOccurrences(lines[9 + r], "e"), static_cast<size_t>(kPatchDim))
        << "row " << r;
  }
  EXPECT_EQ(lines[8], "const float nanostream_eigen_values[8][192] = {");
  EXPECT_EQ(lines.back(), "};");
}

TEST_F(BasisSourceTest, CustomSymbols) {
  config::Output cfg;
  cfg.header_include = "codec.h";
  cfg.mean_symbol = "codec_mean";
  cfg.basis_symbol = "codec_basis";

  const std::string text = io::renderBasisSource(mean, eigenvectors, 3, cfg);

  EXPECT_EQ(text.rfind("#include \"codec.h\"\n", 0), 0u);
  EXPECT_NE(text.find("const float codec_mean[192] = {\n"), std::string::npos);
  EXPECT_NE(text.find("const float codec_basis[3][192] = {\n"),
            std::string::npos);
}

// ─── Writing ─────────────────────────────────────────────────────────────────

TEST_F(BasisSourceTest, CreatesParentDirectories) {
  const fs::path out = tmp_dir / "nested" / "deeper" / "nanostream_eigen.c";

  io::writeBasisSource(mean, eigenvectors, 4, outputAt(out));

  ASSERT_TRUE(fs::exists(out));
  EXPECT_EQ(readFile(out), io::renderBasisSource(mean, eigenvectors, 4));
}

TEST_F(BasisSourceTest, OverwritesExistingFile) {
  const fs::path out = tmp_dir / "nanostream_eigen.c";
  fs::create_directories(tmp_dir);
  {
    std::ofstream os(out);
    os << std::string(20 * kPatchDim * kPatchDim, 'x');
  }

  io::writeBasisSource(mean, eigenvectors, 1, outputAt(out));

  EXPECT_EQ(readFile(out), io::renderBasisSource(mean, eigenvectors, 1));
}

TEST_F(BasisSourceTest, UnwritableDestinationThrows) {
  fs::create_directories(tmp_dir);
  const fs::path blocker = tmp_dir / "blocker";
  std::ofstream(blocker) << "regular file";

  EXPECT_THROW(io::writeBasisSource(mean, eigenvectors, 1,
                                    outputAt(blocker / "out.c")),
               ExportError);
  EXPECT_THROW(io::writeBasisSource(mean, eigenvectors, 1, outputAt(tmp_dir)),
               ExportError);

  fs::path leftover = tmp_dir;
  leftover += ".tmp";
  EXPECT_FALSE(fs::exists(leftover));
}

TEST_F(BasisSourceTest, FailedWriteKeepsPreviousFile) {
  const fs::path out = tmp_dir / "nanostream_eigen.c";
  fs::create_directories(tmp_dir);
  std::ofstream(out) << "previous";

  // Staging file cannot be created
  fs::create_directories(tmp_dir / "nanostream_eigen.c.tmp");

  EXPECT_THROW(io::writeBasisSource(mean, eigenvectors, 2, outputAt(out)),
               ExportError);
  EXPECT_EQ(readFile(out), "previous");
}

TEST_F(BasisSourceTest, NoStagingFileLeftAfterWrite) {
  const fs::path out = tmp_dir / "nanostream_eigen.c";

  io::writeBasisSource(mean, eigenvectors, 2, outputAt(out));

  EXPECT_TRUE(fs::exists(out));
  EXPECT_FALSE(fs::exists(tmp_dir / "nanostream_eigen.c.tmp"));
  EXPECT_EQ(std::distance(fs::directory_iterator(tmp_dir),
                          fs::directory_iterator()),
            1);
}
