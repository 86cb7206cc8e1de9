/**
 * @file svd_reducer.cpp
 * @brief Deterministic randomized truncated SVD
 */

#include "embeddings/svd_reducer.h"

#include <Eigen/Eigenvalues>
#include <Eigen/QR>

#include <algorithm>
#include <cmath>
#include <random>

#include "utils/binary_io.h"

namespace finrag::embeddings {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

// Singular values below this fraction of the largest are treated as zero
constexpr double kRankTolerance = 1e-6;

/**
 * @brief Orthonormal basis of the column space of `matrix` (thin Q)
 */
Eigen::MatrixXd OrthonormalBasis(const Eigen::MatrixXd& matrix) {
  Eigen::HouseholderQR<Eigen::MatrixXd> qr(matrix);
  return qr.householderQ() * Eigen::MatrixXd::Identity(matrix.rows(), matrix.cols());
}

}  // namespace

SvdReducer::SvdReducer(uint32_t dimension, uint32_t oversampling, uint32_t power_iterations, uint32_t seed)
    : dimension_(dimension), oversampling_(oversampling), power_iterations_(power_iterations), seed_(seed) {}

SvdReducer::SparseMatrix SvdReducer::BuildMatrix(const std::vector<SparseRow>& rows, size_t n_terms) {
  std::vector<Eigen::Triplet<double>> triplets;
  for (size_t row = 0; row < rows.size(); ++row) {
    for (size_t i = 0; i < rows[row].indices.size(); ++i) {
      triplets.emplace_back(static_cast<int>(row), static_cast<int>(rows[row].indices[i]), rows[row].values[i]);
    }
  }
  SparseMatrix matrix(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(n_terms));
  matrix.setFromTriplets(triplets.begin(), triplets.end());
  return matrix;
}

Expected<void, Error> SvdReducer::Fit(const SparseMatrix& matrix) {
  const Eigen::Index n_docs = matrix.rows();
  const Eigen::Index n_terms = matrix.cols();
  if (n_docs == 0 || n_terms == 0 || matrix.nonZeros() == 0) {
    return MakeUnexpected(MakeError(ErrorCode::kEmbeddingEmptyCorpus, "Cannot fit SVD on an empty matrix"));
  }

  const Eigen::Index min_side = std::min(n_docs, n_terms);
  const Eigen::Index target_rank = std::min<Eigen::Index>(min_side, dimension_);
  const Eigen::Index sketch = std::min<Eigen::Index>(min_side, target_rank + oversampling_);

  // Seeded Gaussian test matrix
  std::mt19937 rng(seed_);
  std::normal_distribution<double> normal(0.0, 1.0);
  Eigen::MatrixXd omega(n_terms, sketch);
  for (Eigen::Index col = 0; col < sketch; ++col) {
    for (Eigen::Index row = 0; row < n_terms; ++row) {
      omega(row, col) = normal(rng);
    }
  }

  Eigen::MatrixXd basis = OrthonormalBasis(matrix * omega);
  for (uint32_t iter = 0; iter < power_iterations_; ++iter) {
    Eigen::MatrixXd projected = OrthonormalBasis(matrix.transpose() * basis);
    basis = OrthonormalBasis(matrix * projected);
  }

  // B = Q^T X is small (sketch x n_terms); its right singular vectors come from
  // the eigen decomposition of B B^T.
  Eigen::MatrixXd b_transpose = matrix.transpose() * basis;  // n_terms x sketch
  Eigen::MatrixXd gram = b_transpose.transpose() * b_transpose;
  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(gram);
  if (solver.info() != Eigen::Success) {
    return MakeUnexpected(MakeError(ErrorCode::kInternalError, "Eigen decomposition did not converge"));
  }

  // Eigenvalues come back ascending
  const Eigen::VectorXd& eigenvalues = solver.eigenvalues();
  const double sigma_max = std::sqrt(std::max(0.0, eigenvalues(sketch - 1)));

  std::vector<Eigen::VectorXd> columns;
  singular_values_.clear();
  for (Eigen::Index i = sketch - 1; i >= 0 && static_cast<Eigen::Index>(columns.size()) < target_rank; --i) {
    const double sigma = std::sqrt(std::max(0.0, eigenvalues(i)));
    if (sigma <= kRankTolerance * sigma_max || sigma == 0.0) {
      break;
    }
    Eigen::VectorXd component = b_transpose * solver.eigenvectors().col(i) / sigma;

    // Sign convention: largest-magnitude entry positive
    Eigen::Index max_index = 0;
    component.cwiseAbs().maxCoeff(&max_index);
    if (component(max_index) < 0.0) {
      component = -component;
    }
    columns.push_back(std::move(component));
    singular_values_.push_back(sigma);
  }

  components_.resize(n_terms, static_cast<Eigen::Index>(columns.size()));
  for (size_t col = 0; col < columns.size(); ++col) {
    components_.col(static_cast<Eigen::Index>(col)) = columns[col].cast<float>();
  }
  return {};
}

std::vector<float> SvdReducer::Transform(const SparseRow& row) const {
  std::vector<float> output(dimension_, 0.0F);
  const Eigen::Index rank = components_.cols();
  for (size_t i = 0; i < row.indices.size(); ++i) {
    const auto term = static_cast<Eigen::Index>(row.indices[i]);
    if (term >= components_.rows()) {
      continue;
    }
    for (Eigen::Index col = 0; col < rank; ++col) {
      output[static_cast<size_t>(col)] += row.values[i] * components_(term, col);
    }
  }
  return output;
}

bool SvdReducer::Serialize(std::ostream& output_stream) const {
  auto rows = static_cast<uint32_t>(components_.rows());
  auto cols = static_cast<uint32_t>(components_.cols());
  if (!utils::WriteBinary(output_stream, dimension_) || !utils::WriteBinary(output_stream, rows) ||
      !utils::WriteBinary(output_stream, cols)) {
    return false;
  }
  // Column-major, matching Eigen's storage
  std::vector<float> data(components_.data(), components_.data() + components_.size());
  if (!utils::WriteFloats(output_stream, data)) {
    return false;
  }
  auto sv_count = static_cast<uint32_t>(singular_values_.size());
  if (!utils::WriteBinary(output_stream, sv_count)) {
    return false;
  }
  for (double sigma : singular_values_) {
    if (!utils::WriteBinary(output_stream, sigma)) {
      return false;
    }
  }
  return true;
}

Expected<void, Error> SvdReducer::Deserialize(std::istream& input_stream) {
  uint32_t dimension = 0;
  uint32_t rows = 0;
  uint32_t cols = 0;
  if (!utils::ReadBinary(input_stream, dimension) || !utils::ReadBinary(input_stream, rows) ||
      !utils::ReadBinary(input_stream, cols)) {
    return MakeUnexpected(MakeError(ErrorCode::kEmbeddingModelCorrupted, "Failed to read SVD header"));
  }
  if (cols > dimension) {
    return MakeUnexpected(MakeError(ErrorCode::kEmbeddingModelCorrupted, "SVD rank exceeds dimension"));
  }

  std::vector<float> data;
  if (!utils::ReadFloats(input_stream, data) ||
      data.size() != static_cast<size_t>(rows) * static_cast<size_t>(cols)) {
    return MakeUnexpected(MakeError(ErrorCode::kEmbeddingModelCorrupted, "SVD component data truncated"));
  }

  uint32_t sv_count = 0;
  if (!utils::ReadBinary(input_stream, sv_count) || sv_count != cols) {
    return MakeUnexpected(MakeError(ErrorCode::kEmbeddingModelCorrupted, "Singular value count mismatch"));
  }
  std::vector<double> singular_values(sv_count);
  for (auto& sigma : singular_values) {
    if (!utils::ReadBinary(input_stream, sigma)) {
      return MakeUnexpected(MakeError(ErrorCode::kEmbeddingModelCorrupted, "Failed to read singular values"));
    }
  }

  dimension_ = dimension;
  components_ = Eigen::Map<const Eigen::MatrixXf>(data.data(), rows, cols);
  singular_values_ = std::move(singular_values);
  return {};
}

}  // namespace finrag::embeddings
